#pragma once

#include <string>
#include <vector>

// Safe floating-point parse. Returns false if the whole string is not a number.
bool parse_double(const std::string& s, double& out);

// ASCII lower-casing.
std::string to_lower(std::string s);

// Split on '\n'. A trailing newline does not produce an extra empty element.
std::vector<std::string> split_lines(const std::string& text);

std::string join_lines(const std::vector<std::string>& lines);

// Collapse every run of whitespace into a single space and trim the ends.
std::string collapse_whitespace(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
