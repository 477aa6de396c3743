#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include <unistd.h>
#include "cli/options.hpp"
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "core/utils.hpp"
#include "pipe/agent_pipe.hpp"
#include "platform/clock.hpp"
#include "platform/platform.hpp"
#include "tmux/tmux_multiplexer.hpp"
#include <fmt/format.h>

static constexpr int EXIT_USAGE = 2;

static std::string program_name(const char* argv0) {
    std::string p = argv0 ? argv0 : PANEPIPE_NAME;
    auto slash = p.rfind('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

int main(int argc, char** argv) {
    theme::set_color(platform::is_tty(STDERR_FILENO));
    const std::string program = program_name(argc > 0 ? argv[0] : nullptr);

    auto parsed = parse_cli(std::vector<std::string>(argv + 1, argv + argc));
    if (parsed.is_err()) {
        std::cerr << theme::fail(parsed.error) << usage_text(program);
        return EXIT_USAGE;
    }
    const CliOptions& opts = parsed.value;
    set_verbose(opts.verbose);

    if (opts.version) {
        std::cout << PANEPIPE_NAME << " " << PANEPIPE_VERSION << "\n";
        return 0;
    }
    if (opts.help) {
        std::cerr << usage_text(program);
        return 0;
    }

    std::string message = message_from_args(opts);
    if (message.empty()) {
        if (platform::is_tty(STDIN_FILENO)) {
            std::cerr << usage_text(program);
            return EXIT_USAGE;
        }
        message.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        trim(message);
    }
    if (message.empty()) {
        std::cerr << theme::fail("empty message");
        return EXIT_USAGE;
    }

    auto config = Config::load(opts.config_path);
    if (config.is_err()) {
        std::cerr << theme::fail("config: " + config.error);
        return exit_code_for(ErrorKind::ConfigError);
    }
    PipeSettings settings = config.value.settings();
    apply_cli(opts, settings);
    {
        Config merged;
        merged.settings() = settings;
        auto valid = merged.validate();
        if (valid.is_err()) {
            std::cerr << theme::fail("config: " + valid.error);
            return exit_code_for(ErrorKind::ConfigError);
        }
    }
    if (config.value.source()) {
        pipe_status("config: " + config.value.source()->string());
    }

    try {
        TmuxMultiplexer mux(settings.pane.width, settings.pane.height);
        platform::SteadyClock clock;
        AgentPipe pipe(settings, mux, clock);

        std::string answer = pipe.run(message);
        std::cout << answer << "\n";
        std::cout.flush();
        return 0;
    } catch (const PipeError& e) {
        pipe_log(fmt::format("{}: {}", error_kind_name(e.kind()), e.what()));
        std::cerr << theme::fail(e.what());
        if (is_verbose() && !e.detail().empty()) {
            std::cerr << theme::dim(fmt::format("[{}] {}:", PANEPIPE_NAME, error_kind_name(e.kind())))
                      << "\n" << e.detail() << "\n";
        }
        return exit_code_for(e.kind());
    } catch (const std::exception& e) {
        pipe_log(std::string("unexpected error: ") + e.what());
        std::cerr << theme::fail(std::string("unexpected error: ") + e.what());
        return 1;
    }
}
