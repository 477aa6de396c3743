#pragma once

#include <string>
#include <optional>
#include <vector>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// External command execution result
struct CommandResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Configuration structures
struct AgentSettings {
    std::string command = "claude";
    std::vector<std::string> process_names = {"node", "claude"};
    std::string prompt_char = "\xe2\x9d\xaf";    // ❯
    int prompt_visible_lines = 8;
    std::string clear_command = "/clear";
};

// All durations in seconds.
struct TimingSettings {
    double idle_timeout = 5.0;
    double max_wait = 300.0;
    double poll_interval = 0.5;
    double submit_delay = 0.6;
    double clear_settle = 1.0;
    double startup_timeout = 30.0;
    double startup_wait = 5.0;       // after launching, before looking for the prompt
    double startup_settle = 1.0;     // unchanged output this long counts as started
    double initial_delay = 3.0;
    double marker_settle = 1.0;
    double idle_fallback_factor = 3.0;
};

struct PaneSettings {
    int scrollback = 10000;
    int width = 200;
    int height = 50;
};

struct PipeSettings {
    std::string session = "panepipe";
    AgentSettings agent;
    TimingSettings timing;
    PaneSettings pane;
    std::optional<std::string> marker;           // static marker; random per request if unset
    bool lock = true;
    double lock_timeout = 330.0;
    std::string lock_dir;                        // empty: $TMPDIR
};

