#pragma once

#include <string>
#include <vector>

// A named persistent terminal session. The pane addressed is the session's
// active pane; every operation names its session explicitly.
struct Session {
    std::string name;
};

// Control interface to a terminal multiplexer.
//
// All operations throw PipeError{SessionError} when the underlying control
// call fails, and are never retried here; callers decide.
class TerminalMultiplexer {
public:
    virtual ~TerminalMultiplexer() = default;

    // Create the session if absent (idempotent).
    // Throws PipeError{SessionUnavailable} if the multiplexer cannot be run.
    virtual Session ensure_session(const std::string& name) = 0;

    // Type literal text into the pane, optionally followed by a separate Enter.
    virtual void send_keys(const Session& session, const std::string& text, bool submit) = 0;

    // Press a single named key ("Enter", "Escape", "C-c").
    virtual void send_key(const Session& session, const std::string& key) = 0;

    // Paste text as one bracketed-paste block. Newlines inside do not submit.
    virtual void paste_text(const Session& session, const std::string& text) = 0;

    // Pane text, joined across wraps, including up to `scrollback` history lines.
    virtual std::string capture_pane(const Session& session, int scrollback = 0) = 0;

    // Foreground command of the pane, lower-cased (e.g. "zsh", "node").
    virtual std::string current_command(const Session& session) = 0;

    // True if the foreground command contains any of the patterns.
    bool has_running_command(const Session& session, const std::vector<std::string>& patterns);
};
