#include "sentinel.hpp"
#include "chrome.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cstdint>

std::string generate_marker() {
    static std::mt19937 rng(std::random_device{}());
    return generate_marker(rng);
}

std::string generate_marker(std::mt19937& rng) {
    std::uniform_int_distribution<uint32_t> dist;
    return fmt::format(MARKER_FORMAT, dist(rng));
}

std::string marker_instruction(const std::string& marker) {
    return fmt::format(MARKER_INSTRUCTION, marker);
}

std::string build_marker_prompt(const std::string& prompt, const std::string& marker) {
    std::string body = prompt;
    while (!body.empty() && (body.back() == '\n' || body.back() == '\r'
                          || body.back() == ' ' || body.back() == '\t'))
        body.pop_back();

    if (body.find('\n') == std::string::npos) {
        return body + " " + marker_instruction(marker);
    }
    return body + "\n\n" + marker_instruction(marker);
}

bool is_marker_line(const std::string& line, const std::string& marker) {
    if (marker.empty() || line.find(marker) == std::string::npos) return false;
    return chrome::line_core(line) == marker;
}

int count_marker_lines(const std::string& snapshot, const std::string& marker) {
    if (marker.empty()) return 0;
    std::string text = chrome::strip_ansi(snapshot);
    if (text.find(marker) == std::string::npos) return 0;
    int count = 0;
    for (const auto& line : split_lines(text)) {
        if (is_marker_line(line, marker)) count++;
    }
    return count;
}
