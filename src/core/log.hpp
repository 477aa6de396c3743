#pragma once

#include <string>
#include <fmt/format.h>

// Debug log: $TMPDIR/panepipe_debug.log, one timestamped line per call.
std::string pipe_log_path();

// Verbose mode mirrors status lines onto stderr as "[panepipe] msg".
void set_verbose(bool verbose);
bool is_verbose();

// Append to the debug log only.
void pipe_log(const std::string& msg);

// Progress/status line: debug log, plus stderr when verbose.
void pipe_status(const std::string& msg);

// Multi-line dump (pane snapshots). Written only in verbose mode.
void pipe_dump(const std::string& label, const std::string& text);

template <typename... Args>
void pipe_logf(fmt::format_string<Args...> f, Args&&... args) {
    pipe_log(fmt::format(f, std::forward<Args>(args)...));
}
