#include "errors.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SessionUnavailable: return "SessionUnavailable";
        case ErrorKind::SessionError:       return "SessionError";
        case ErrorKind::AgentStartTimeout:  return "AgentStartTimeout";
        case ErrorKind::SubmitFailed:       return "SubmitFailed";
        case ErrorKind::TimedOut:           return "TimedOut";
        case ErrorKind::EmptyResponse:      return "EmptyResponse";
        case ErrorKind::SessionBusy:        return "SessionBusy";
        case ErrorKind::ConfigError:        return "ConfigError";
    }
    return "Unknown";
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SessionUnavailable: return 3;
        case ErrorKind::SessionError:       return 4;
        case ErrorKind::AgentStartTimeout:  return 5;
        case ErrorKind::SubmitFailed:       return 6;
        case ErrorKind::TimedOut:           return 7;
        case ErrorKind::EmptyResponse:      return 8;
        case ErrorKind::SessionBusy:        return 9;
        case ErrorKind::ConfigError:        return 10;
    }
    return 1;
}
