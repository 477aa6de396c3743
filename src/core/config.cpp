#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".panepipe";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

// Overlay a scalar if the key is present.
template <typename T>
static void overlay(const YAML::Node& node, const char* key, T& out) {
    if (node && node[key] && !node[key].IsNull()) {
        out = node[key].as<T>();
    }
}

static void parse_agent(const YAML::Node& node, AgentSettings& a) {
    // `agent: claude` shorthand sets the command only
    if (node.IsScalar()) {
        a.command = node.as<std::string>();
        return;
    }
    overlay(node, "command", a.command);
    overlay(node, "prompt_char", a.prompt_char);
    overlay(node, "prompt_visible_lines", a.prompt_visible_lines);
    overlay(node, "clear_command", a.clear_command);

    if (node["process_names"]) {
        const auto& names = node["process_names"];
        a.process_names.clear();
        if (names.IsSequence()) {
            for (const auto& n : names) a.process_names.push_back(n.as<std::string>());
        } else if (names.IsScalar()) {
            a.process_names.push_back(names.as<std::string>());
        }
    }
}

static void parse_timing(const YAML::Node& node, TimingSettings& t) {
    overlay(node, "idle_timeout", t.idle_timeout);
    overlay(node, "max_wait", t.max_wait);
    overlay(node, "poll_interval", t.poll_interval);
    overlay(node, "submit_delay", t.submit_delay);
    overlay(node, "clear_settle", t.clear_settle);
    overlay(node, "startup_timeout", t.startup_timeout);
    overlay(node, "startup_wait", t.startup_wait);
    overlay(node, "startup_settle", t.startup_settle);
    overlay(node, "initial_delay", t.initial_delay);
    overlay(node, "marker_settle", t.marker_settle);
    overlay(node, "idle_fallback_factor", t.idle_fallback_factor);
}

static void parse_pane(const YAML::Node& node, PaneSettings& p) {
    overlay(node, "scrollback", p.scrollback);
    overlay(node, "width", p.width);
    overlay(node, "height", p.height);
}

static Result<Config> parse_root(const YAML::Node& root) {
    Config config;
    PipeSettings& s = config.settings();

    if (!root || root.IsNull()) {
        return Result<Config>::Ok(config);
    }
    if (!root.IsMap()) {
        return Result<Config>::Err("top level must be a mapping");
    }

    try {
        overlay(root, "session", s.session);
        if (root["agent"]) parse_agent(root["agent"], s.agent);
        if (root["timing"]) parse_timing(root["timing"], s.timing);
        if (root["pane"]) parse_pane(root["pane"], s.pane);
        if (root["marker"] && root["marker"].IsScalar()) {
            s.marker = root["marker"].as<std::string>();
        }
        overlay(root, "lock", s.lock);
        overlay(root, "lock_timeout", s.lock_timeout);
        overlay(root, "lock_dir", s.lock_dir);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("bad value: {}", e.what()));
    }

    auto valid = config.validate();
    if (valid.is_err()) return Result<Config>::Err(valid.error);
    return Result<Config>::Ok(config);
}

Result<Config> Config::from_yaml(const std::string& text) {
    try {
        return parse_root(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("YAML parse error: {}", e.what()));
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return Result<Config>::Err("Failed to read " + path.string());
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("{}: {}", path.string(), e.what()));
    }

    auto result = parse_root(root);
    if (result.is_err()) {
        return Result<Config>::Err(fmt::format("{}: {}", path.string(), result.error));
    }
    result.value.source_ = path;
    return result;
}

Result<Config> Config::load(const std::optional<fs::path>& path) {
    Config config;

    if (path) {
        auto r = load_file(*path);
        if (r.is_err()) return r;
        config = r.value;
    } else if (fs::exists(get_global_config_path())) {
        auto r = load_file(get_global_config_path());
        if (r.is_err()) return r;
        config = r.value;
    }

    auto env = config.apply_env(platform::env);
    if (env.is_err()) return Result<Config>::Err(env.error);
    return Result<Config>::Ok(config);
}

Result<void> Config::apply_env(const EnvLookup& lookup) {
    if (auto v = lookup("PANEPIPE_SESSION")) settings_.session = *v;
    if (auto v = lookup("PANEPIPE_AGENT_CMD")) settings_.agent.command = *v;
    if (auto v = lookup("PANEPIPE_MARKER")) settings_.marker = *v;

    if (auto v = lookup("PANEPIPE_IDLE_TIMEOUT")) {
        if (!parse_double(*v, settings_.timing.idle_timeout))
            return Result<void>::Err("PANEPIPE_IDLE_TIMEOUT is not a number: " + *v);
    }
    if (auto v = lookup("PANEPIPE_MAX_WAIT")) {
        if (!parse_double(*v, settings_.timing.max_wait))
            return Result<void>::Err("PANEPIPE_MAX_WAIT is not a number: " + *v);
    }
    return validate();
}

Result<void> Config::validate() const {
    const auto& s = settings_;
    const auto& t = s.timing;

    if (s.session.empty())
        return Result<void>::Err("session name is empty");
    if (s.session.find_first_of(":.") != std::string::npos)
        return Result<void>::Err("session name may not contain ':' or '.': " + s.session);
    if (trimmed(s.agent.command).empty())
        return Result<void>::Err("agent command is empty");
    if (s.marker && trimmed(*s.marker).empty())
        return Result<void>::Err("marker is empty");

    struct { const char* name; double value; } positive[] = {
        {"idle_timeout", t.idle_timeout},
        {"max_wait", t.max_wait},
        {"poll_interval", t.poll_interval},
        {"startup_timeout", t.startup_timeout},
    };
    for (const auto& p : positive) {
        if (!(p.value > 0))
            return Result<void>::Err(fmt::format("{} must be positive (got {})", p.name, p.value));
    }
    if (t.submit_delay < 0 || t.clear_settle < 0 || t.initial_delay < 0 || t.marker_settle < 0
            || t.startup_wait < 0 || t.startup_settle < 0)
        return Result<void>::Err("delays may not be negative");
    if (t.startup_wait >= t.startup_timeout)
        return Result<void>::Err(fmt::format("startup_wait ({}) must be below startup_timeout ({})",
                                             t.startup_wait, t.startup_timeout));
    if (t.idle_fallback_factor < 1.0)
        return Result<void>::Err("idle_fallback_factor must be at least 1");
    if (t.idle_timeout >= t.max_wait)
        return Result<void>::Err(fmt::format("idle_timeout ({}) must be below max_wait ({})",
                                             t.idle_timeout, t.max_wait));
    if (s.pane.scrollback < 0)
        return Result<void>::Err("scrollback may not be negative");
    if (s.pane.width <= 0 || s.pane.height <= 0)
        return Result<void>::Err("pane size must be positive");
    if (s.lock_timeout < 0)
        return Result<void>::Err("lock_timeout may not be negative");
    return Result<void>::Ok();
}
