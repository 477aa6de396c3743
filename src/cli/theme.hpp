#pragma once

#include <string>
#include <fmt/format.h>

// Diagnostic styling for stderr. Colors are dropped when stderr is not a TTY.
namespace theme {

namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string RED       = "\033[91m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Set once from main() after checking isatty(STDERR_FILENO).
void set_color(bool enabled);
bool color_enabled();

inline std::string paint(const std::string& code, const std::string& s) {
    return color_enabled() ? code + s + color::RESET : s;
}

inline std::string blue(const std::string& s)  { return paint(color::BLUE, s); }
inline std::string bold(const std::string& s)  { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)   { return paint(color::DIM, s); }
inline std::string red(const std::string& s)   { return paint(color::RED, s); }

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return red("x ") + msg + "\n";
}

// Key-value row for usage panels
inline std::string kv(const std::string& key, const std::string& value) {
    return "    " + blue(fmt::format("{:<24}", key)) + dim(value) + "\n";
}

} // namespace theme
