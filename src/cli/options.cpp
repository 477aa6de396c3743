#include "options.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

Result<CliOptions> parse_cli(const std::vector<std::string>& args) {
    CliOptions opts;
    bool only_words = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];

        if (only_words || a.empty() || a[0] != '-' || a == "-") {
            opts.message_words.push_back(a);
            continue;
        }
        if (a == "--") { only_words = true; continue; }

        // Split --flag=value
        std::string flag = a;
        std::optional<std::string> inline_value;
        auto eq = a.find('=');
        if (a.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            flag = a.substr(0, eq);
            inline_value = a.substr(eq + 1);
        }

        auto take_value = [&](std::string& out) -> bool {
            if (inline_value) { out = *inline_value; return true; }
            if (i + 1 >= args.size()) return false;
            out = args[++i];
            return true;
        };

        std::string value;
        if (flag == "-v" || flag == "--verbose") {
            opts.verbose = true;
        } else if (flag == "-h" || flag == "--help") {
            opts.help = true;
        } else if (flag == "--version") {
            opts.version = true;
        } else if (flag == "-c" || flag == "--config") {
            if (!take_value(value)) return Result<CliOptions>::Err(flag + " needs a path");
            opts.config_path = value;
        } else if (flag == "-s" || flag == "--session") {
            if (!take_value(value)) return Result<CliOptions>::Err(flag + " needs a name");
            opts.session = value;
        } else if (flag == "-a" || flag == "--agent") {
            if (!take_value(value)) return Result<CliOptions>::Err(flag + " needs a command");
            opts.agent_cmd = value;
        } else if (flag == "--idle" || flag == "--timeout") {
            double seconds = 0;
            if (!take_value(value) || !parse_double(value, seconds) || seconds <= 0)
                return Result<CliOptions>::Err(flag + " needs a positive number of seconds");
            if (flag == "--idle") opts.idle_timeout = seconds;
            else opts.max_wait = seconds;
        } else {
            return Result<CliOptions>::Err("Unknown option: " + a);
        }
    }
    return Result<CliOptions>::Ok(opts);
}

void apply_cli(const CliOptions& opts, PipeSettings& settings) {
    if (opts.session) settings.session = *opts.session;
    if (opts.agent_cmd) settings.agent.command = *opts.agent_cmd;
    if (opts.idle_timeout) settings.timing.idle_timeout = *opts.idle_timeout;
    if (opts.max_wait) settings.timing.max_wait = *opts.max_wait;
}

std::string message_from_args(const CliOptions& opts) {
    std::string msg;
    for (const auto& w : opts.message_words) {
        if (!msg.empty()) msg += ' ';
        msg += w;
    }
    return msg;
}

std::string usage_text(const std::string& program) {
    std::string out;
    out += theme::bold(fmt::format("{} {}", PANEPIPE_NAME, PANEPIPE_VERSION)) + "\n";
    out += theme::dim("  Send a prompt to an interactive AI agent running in tmux; print its answer.") + "\n\n";
    out += "Usage:\n";
    out += fmt::format("    {} [options] <message>\n", program);
    out += fmt::format("    <some-command> | {} [options]\n\n", program);
    out += "Options:\n";
    out += theme::kv("-v, --verbose", "Progress and pane dumps on stderr");
    out += theme::kv("-s, --session NAME", "tmux session to use (default: panepipe)");
    out += theme::kv("-a, --agent CMD", "Command that starts the agent (default: claude)");
    out += theme::kv("--idle SECONDS", "Quiet time that counts as completion (default: 5)");
    out += theme::kv("--timeout SECONDS", "Give up after this long (default: 300)");
    out += theme::kv("-c, --config PATH", "Config file (default: " + get_global_config_path().string() + ")");
    out += theme::kv("-h, --help", "Show this help");
    out += theme::kv("--version", "Show version");
    return out;
}
