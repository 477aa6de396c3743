#include "tmux_multiplexer.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

TmuxMultiplexer::TmuxMultiplexer(int width, int height)
    : runner_(platform::run_command), width_(width), height_(height) {}

TmuxMultiplexer::TmuxMultiplexer(Runner runner, std::string binary, int width, int height)
    : runner_(std::move(runner)), binary_(std::move(binary)),
      width_(width), height_(height) {}

std::string TmuxMultiplexer::session_target(const std::string& name) {
    return "=" + name;
}

std::string TmuxMultiplexer::pane_target(const std::string& name) {
    return "=" + name + ":";
}

const std::string& TmuxMultiplexer::binary() {
    if (binary_.empty()) {
        auto found = platform::find_executable(TMUX_BINARY);
        if (!found) {
            throw PipeError(ErrorKind::SessionUnavailable,
                            "tmux is not installed or not executable (searched PATH)");
        }
        binary_ = found->string();
        pipe_logf("tmux: using {}", binary_);
    }
    return binary_;
}

CommandResult TmuxMultiplexer::run(const std::vector<std::string>& args,
                                   const std::string& stdin_data) {
    const std::string& bin = binary();
    CommandResult r = runner_(bin, args, stdin_data);
    // 127: exec failed in the child
    if (r.exit_code == 127) {
        throw PipeError(ErrorKind::SessionUnavailable,
                        fmt::format("could not execute {}", bin), r.stderr_data);
    }
    return r;
}

CommandResult TmuxMultiplexer::run_checked(const std::string& what,
                                           const std::vector<std::string>& args,
                                           const std::string& stdin_data) {
    CommandResult r = run(args, stdin_data);
    if (r.failed()) {
        pipe_logf("tmux {} failed: exit={} stderr={}", what, r.exit_code,
                  r.stderr_data.substr(0, LOG_SNIPPET_CHARS));
        std::string cause = trimmed(r.stderr_data);
        throw PipeError(ErrorKind::SessionError,
                        fmt::format("tmux {} failed (exit {}){}", what, r.exit_code,
                                    cause.empty() ? "" : ": " + cause),
                        r.stderr_data);
    }
    return r;
}

Session TmuxMultiplexer::ensure_session(const std::string& name) {
    auto has = run({"has-session", "-t", session_target(name)});
    if (has.success()) {
        pipe_logf("tmux: reusing session '{}'", name);
        return Session{name};
    }

    auto created = run({"new-session", "-d", "-s", name,
                        "-x", std::to_string(width_), "-y", std::to_string(height_)});
    if (created.success()) {
        pipe_status(fmt::format("created tmux session '{}'", name));
        return Session{name};
    }

    // Another invocation may have created it between the two calls.
    if (run({"has-session", "-t", session_target(name)}).success()) {
        return Session{name};
    }

    std::string cause = trimmed(created.stderr_data);
    throw PipeError(ErrorKind::SessionUnavailable,
                    fmt::format("could not create tmux session '{}'{}", name,
                                cause.empty() ? "" : ": " + cause),
                    created.stderr_data);
}

void TmuxMultiplexer::send_keys(const Session& session, const std::string& text, bool submit) {
    if (!text.empty()) {
        run_checked("send-keys", {"send-keys", "-t", pane_target(session.name), "-l", "--", text});
    }
    if (submit) send_key(session, "Enter");
}

void TmuxMultiplexer::send_key(const Session& session, const std::string& key) {
    run_checked("send-keys", {"send-keys", "-t", pane_target(session.name), key});
}

void TmuxMultiplexer::paste_text(const Session& session, const std::string& text) {
    // One buffer per session: buffers are server-global
    const std::string buffer = fmt::format("{}-{}", TMUX_PASTE_BUFFER, session.name);
    run_checked("load-buffer", {"load-buffer", "-b", buffer, "-"}, text);
    run_checked("paste-buffer", {"paste-buffer", "-p", "-d", "-b", buffer,
                                 "-t", pane_target(session.name)});
}

std::string TmuxMultiplexer::capture_pane(const Session& session, int scrollback) {
    std::vector<std::string> args = {"capture-pane", "-p", "-J", "-t", pane_target(session.name)};
    if (scrollback > 0) {
        args.push_back("-S");
        args.push_back(std::to_string(-scrollback));
    }
    return run_checked("capture-pane", args).stdout_data;
}

std::string TmuxMultiplexer::current_command(const Session& session) {
    auto r = run_checked("display-message",
                         {"display-message", "-p", "-t", pane_target(session.name),
                          "#{pane_current_command}"});
    return to_lower(trimmed(r.stdout_data));
}
