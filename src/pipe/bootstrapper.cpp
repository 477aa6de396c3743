#include "bootstrapper.hpp"
#include "chrome.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

SessionBootstrapper::SessionBootstrapper(TerminalMultiplexer& mux, platform::Clock& clock,
                                         BootstrapOptions options)
    : mux_(mux), clock_(clock), options_(std::move(options)) {}

bool SessionBootstrapper::agent_running(const Session& session) {
    return mux_.has_running_command(session, options_.process_names);
}

bool SessionBootstrapper::ensure_agent_running(const Session& session,
                                               const std::string& agent_cmd) {
    if (agent_running(session)) {
        pipe_log(fmt::format("bootstrap: agent already running in '{}'", session.name));
        return false;
    }

    pipe_status(fmt::format("starting {}...", agent_cmd));
    mux_.send_keys(session, agent_cmd, false);
    clock_.sleep(options_.submit_delay);
    mux_.send_key(session, "Enter");

    const auto start = clock_.now();
    if (options_.startup_wait.count() > 0) clock_.sleep(options_.startup_wait);

    std::string previous;
    platform::Clock::duration stable_since{0};
    bool have_previous = false;

    while (clock_.now() - start < options_.startup_timeout) {
        clock_.sleep(options_.poll_interval);

        if (!agent_running(session)) continue;

        std::string snapshot = mux_.capture_pane(session);
        if (chrome::prompt_visible(snapshot, options_.prompt_char, options_.prompt_visible_lines)) {
            pipe_status("agent prompt is up");
            return true;
        }

        const auto now = clock_.now();
        std::string norm = chrome::normalize_snapshot(snapshot);
        if (!have_previous || norm != previous) {
            previous = std::move(norm);
            stable_since = now;
            have_previous = true;
            continue;
        }
        if (!previous.empty() && now - stable_since >= options_.startup_settle) {
            pipe_status("agent output settled");
            return true;
        }
    }

    throw PipeError(ErrorKind::AgentStartTimeout,
                    fmt::format("'{}' did not start within {:.0f}s", agent_cmd,
                                options_.startup_timeout.count() / 1000.0));
}
