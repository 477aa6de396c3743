#pragma once

#include <stdexcept>
#include <string>

// Failure kinds of a single invocation. Each maps to its own exit status.
enum class ErrorKind {
    SessionUnavailable,   // tmux missing or not executable
    SessionError,         // a tmux control call exited nonzero
    AgentStartTimeout,
    SubmitFailed,
    TimedOut,
    EmptyResponse,
    SessionBusy,          // advisory session lock not acquired in time
    ConfigError,
};

const char* error_kind_name(ErrorKind kind);

// Process exit status for a failure kind (never 0, never 2 which is usage).
int exit_code_for(ErrorKind kind);

class PipeError : public std::runtime_error {
public:
    PipeError(ErrorKind kind, const std::string& message, std::string detail = "")
        : std::runtime_error(message), kind_(kind), detail_(std::move(detail)) {}

    ErrorKind kind() const { return kind_; }

    // Diagnostic payload: partial output for TimedOut, raw snapshot for
    // EmptyResponse, stderr of the failing control call for SessionError.
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};
