#include "agent_pipe.hpp"
#include "bootstrapper.hpp"
#include "chrome.hpp"
#include "output_sanitizer.hpp"
#include "prompt_submitter.hpp"
#include "sentinel.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/session_lock.hpp>
#include <fmt/format.h>

using platform::seconds_to_ms;

AgentPipe::AgentPipe(PipeSettings settings, TerminalMultiplexer& mux, platform::Clock& clock)
    : settings_(std::move(settings)), mux_(mux), clock_(clock) {}

DetectorOptions AgentPipe::detector_options() const {
    const auto& t = settings_.timing;
    DetectorOptions o;
    o.poll_interval = seconds_to_ms(t.poll_interval);
    o.idle_timeout = seconds_to_ms(t.idle_timeout);
    o.max_wait = seconds_to_ms(t.max_wait);
    o.initial_delay = seconds_to_ms(t.initial_delay);
    o.marker_settle = seconds_to_ms(t.marker_settle);
    o.idle_fallback_factor = t.idle_fallback_factor;
    return o;
}

PipeReply AgentPipe::ask(const std::string& message) {
    pipe_status(fmt::format("connecting to tmux session '{}'...", settings_.session));

    if (!settings_.lock) {
        return exchange(mux_.ensure_session(settings_.session), message);
    }

    auto lock_path = SessionLock::path_for(settings_.session, settings_.lock_dir);
    SessionLock lock(lock_path, seconds_to_ms(settings_.lock_timeout), clock_);
    if (lock.open_failed()) {
        throw PipeError(ErrorKind::SessionError,
                        fmt::format("cannot open lock file {}: {}", lock_path.string(), lock.open_error()));
    }
    if (!lock.held()) {
        throw PipeError(ErrorKind::SessionBusy,
                        fmt::format("session '{}' is in use by another invocation (lock {})",
                                    settings_.session, lock_path.string()));
    }
    return exchange(mux_.ensure_session(settings_.session), message);
}

PipeReply AgentPipe::exchange(const Session& session, const std::string& message) {
    const auto& agent = settings_.agent;
    const auto& t = settings_.timing;

    BootstrapOptions boot;
    boot.process_names = agent.process_names;
    boot.prompt_char = agent.prompt_char;
    boot.prompt_visible_lines = agent.prompt_visible_lines;
    boot.submit_delay = seconds_to_ms(t.submit_delay);
    boot.poll_interval = seconds_to_ms(t.poll_interval);
    boot.startup_timeout = seconds_to_ms(t.startup_timeout);
    boot.startup_wait = seconds_to_ms(t.startup_wait);
    boot.startup_settle = seconds_to_ms(t.startup_settle);
    bool launched = SessionBootstrapper(mux_, clock_, boot).ensure_agent_running(session, agent.command);

    SubmitOptions sub;
    sub.clear_command = agent.clear_command;
    sub.clear_settle = seconds_to_ms(t.clear_settle);
    sub.submit_delay = seconds_to_ms(t.submit_delay);
    sub.scrollback = settings_.pane.scrollback;

    const std::string marker = settings_.marker ? *settings_.marker : generate_marker();
    pipe_log(fmt::format("marker: {}", marker));
    std::string baseline = PromptSubmitter(mux_, clock_, sub).submit(session, message, marker);

    pipe_status("waiting for response...");
    CompletionDetector detector(detector_options(), clock_);
    const std::string prompt_char = agent.prompt_char;
    const int window = agent.prompt_visible_lines;
    // The capture ends with the visible region, where the input prompt lives.
    detector.set_ready_check([prompt_char, window](const std::string& snapshot) {
        return chrome::prompt_visible(snapshot, prompt_char, window);
    });

    const int scrollback = settings_.pane.scrollback;
    CompletionOutcome outcome = detector.wait(
        [&] { return mux_.capture_pane(session, scrollback); }, baseline, marker);
    pipe_status(fmt::format("completed via {} after {:.1f}s",
                            completion_kind_name(outcome.kind),
                            outcome.elapsed.count() / 1000.0));

    SanitizeContext ctx;
    ctx.marker = marker;
    ctx.prompt = message;
    ctx.baseline = baseline;
    ctx.prompt_char = agent.prompt_char;
    OutputSanitizer sanitizer(ctx);

    if (outcome.kind == CompletionKind::TimedOut) {
        pipe_dump("pane at timeout", outcome.snapshot);
        std::string partial = sanitizer.sanitize(outcome.snapshot);
        throw PipeError(ErrorKind::TimedOut,
                        fmt::format("timed out waiting for response after {:.0f}s",
                                    outcome.elapsed.count() / 1000.0),
                        partial.empty() ? outcome.snapshot : partial);
    }

    std::string answer = sanitizer.sanitize(outcome.snapshot);
    if (answer.empty()) {
        pipe_dump("raw pane", outcome.snapshot);
        throw PipeError(ErrorKind::EmptyResponse, "agent response was empty after cleanup",
                        outcome.snapshot);
    }
    return PipeReply{answer, outcome.kind, outcome.elapsed, launched};
}
