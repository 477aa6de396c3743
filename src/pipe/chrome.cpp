#include "chrome.hpp"
#include <core/utils.hpp>
#include <cstring>

namespace chrome {

// ── Glyph tables (UTF-8) ──────────────────────────────────────

static const char* const BULLETS[] = {
    "\xe2\x97\x8f",     // ● U+25CF
    "\xe2\x8f\xba",     // ⏺ U+23FA
    "\xe2\x8e\xbf",     // ⎿ U+23BF
};

struct Spinner {
    const char* glyph;
    bool list_like;     // also a Markdown list bullet
};

static const Spinner SPINNERS[] = {
    {"\xe2\x9c\xbb", false},    // ✻ U+273B
    {"\xe2\x9c\xbd", false},    // ✽ U+273D
    {"\xe2\x9c\xb6", false},    // ✶ U+2736
    {"\xe2\x9c\xb3", false},    // ✳ U+2733
    {"\xe2\x9c\xa2", false},    // ✢ U+2722
    {"\xe2\x88\x97", false},    // ∗ U+2217
    {"\xc2\xb7", true},         // · U+00B7
    {"\xe2\x80\xa2", true},     // • U+2022
    {"*", true},
};

static const char* const ELLIPSIS = "\xe2\x80\xa6";    // … U+2026

static const char* const HINTS[] = {
    "? for shortcuts",
    "? for",
    "shortcuts",
};

static bool starts_with_at(const std::string& s, size_t i, const char* prefix) {
    size_t n = std::strlen(prefix);
    return s.size() >= i + n && s.compare(i, n, prefix) == 0;
}

static bool is_space(char c) {
    return c == ' ' || c == '\t';
}

// ── Escapes ───────────────────────────────────────────────────

std::string strip_ansi(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    const size_t n = text.size();
    for (size_t i = 0; i < n; ) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == 0x1b) {
            if (i + 1 >= n) { i++; continue; }
            char kind = text[i + 1];
            if (kind == '[') {
                // CSI: parameters/intermediates, then a final byte in 0x40..0x7e
                size_t j = i + 2;
                while (j < n && !(text[j] >= 0x40 && text[j] <= 0x7e)) j++;
                i = (j < n) ? j + 1 : n;
            } else if (kind == ']' || kind == 'P' || kind == '_' || kind == '^') {
                // OSC/DCS/APC/PM: terminated by BEL or ST (ESC \)
                size_t j = i + 2;
                while (j < n) {
                    if (text[j] == '\x07') { j++; break; }
                    if (text[j] == 0x1b && j + 1 < n && text[j + 1] == '\\') { j += 2; break; }
                    j++;
                }
                i = j;
            } else {
                i += 2;
            }
        } else if (c == '\r') {
            i++;
        } else if ((c < 0x20 && c != '\n' && c != '\t') || c == 0x7f) {
            i++;
        } else {
            out += text[i++];
        }
    }
    return out;
}

// ── Borders ───────────────────────────────────────────────────

size_t border_glyph_len(const std::string& s, size_t i) {
    if (i + 3 > s.size()) return 0;
    auto b0 = static_cast<unsigned char>(s[i]);
    auto b1 = static_cast<unsigned char>(s[i + 1]);
    auto b2 = static_cast<unsigned char>(s[i + 2]);
    if (b0 != 0xe2 || b2 < 0x80 || b2 > 0xbf) return 0;
    // U+2500..U+257F -> E2 94 80 .. E2 95 BF ; U+2580..U+259F -> E2 96 80 .. E2 96 9F
    if (b1 == 0x94 || b1 == 0x95) return 3;
    if (b1 == 0x96 && b2 <= 0x9f) return 3;
    return 0;
}

std::string strip_border_edges(const std::string& line) {
    size_t begin = 0;
    size_t end = line.size();

    while (begin < end) {
        if (is_space(line[begin])) { begin++; continue; }
        size_t g = border_glyph_len(line, begin);
        if (g == 0) break;
        begin += g;
    }
    while (end > begin) {
        if (is_space(line[end - 1])) { end--; continue; }
        if (end >= begin + 3 && border_glyph_len(line, end - 3) == 3) { end -= 3; continue; }
        break;
    }
    if (begin == 0 && end == line.size()) return line;

    // No leading border: keep the indentation, trim only the right edge.
    size_t lead = line.find_first_not_of(" \t");
    if (lead != std::string::npos && border_glyph_len(line, lead) == 0) {
        return line.substr(0, end);
    }
    return line.substr(begin, end - begin);
}

bool is_border_line(const std::string& line) {
    bool any = false;
    for (size_t i = 0; i < line.size(); ) {
        if (is_space(line[i])) { i++; continue; }
        size_t g = border_glyph_len(line, i);
        if (g == 0) return false;
        any = true;
        i += g;
    }
    return any;
}

// ── Bullets ───────────────────────────────────────────────────

std::string strip_bullet(const std::string& line, bool& stripped) {
    stripped = false;
    size_t i = line.find_first_not_of(" \t");
    if (i == std::string::npos) return line;
    for (const char* b : BULLETS) {
        if (starts_with_at(line, i, b)) {
            size_t after = i + std::strlen(b);
            if (after < line.size() && line[after] == ' ') after++;
            stripped = true;
            return line.substr(0, i) + line.substr(after);
        }
    }
    return line;
}

// ── Status / hints / prompt ───────────────────────────────────

bool is_status_line(const std::string& line) {
    if (line.find("esc to interrupt") != std::string::npos) return true;

    std::string t = trimmed(line);
    const Spinner* spinner = nullptr;
    for (const auto& sp : SPINNERS) {
        if (starts_with_at(t, 0, sp.glyph)) {
            spinner = &sp;
            break;
        }
    }
    if (!spinner) return false;

    size_t i = std::strlen(spinner->glyph);
    while (i < t.size() && is_space(t[i])) i++;
    size_t word_start = i;
    while (i < t.size()) {
        char c = t[i];
        bool word = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-' || c == '\'';
        if (!word) break;
        i++;
    }
    if (i == word_start) return false;
    std::string word = t.substr(word_start, i - word_start);

    size_t after;
    if (starts_with_at(t, i, ELLIPSIS)) after = i + std::strlen(ELLIPSIS);
    else if (starts_with_at(t, i, "...")) after = i + 3;
    else return false;

    while (after < t.size() && is_space(t[after])) after++;
    bool status = after < t.size() && t[after] == '(';
    if (!status && after != t.size()) return false;

    // "* Wait..." is a list item; the agent's own spinner words are gerunds
    // ("Thinking", "Compacting") or carry a "(12s ..." status.
    if (spinner->list_like && !status) {
        return word.size() > 3 && word.compare(word.size() - 3, 3, "ing") == 0;
    }
    return true;
}

bool is_hint_line(const std::string& line) {
    std::string t = trimmed(strip_border_edges(line));
    for (const char* h : HINTS) {
        if (t == h) return true;
    }
    return false;
}

bool is_prompt_line(const std::string& line, const std::string& prompt_char) {
    std::string t = trimmed(strip_border_edges(line));
    return t == ">" || (!prompt_char.empty() && t == prompt_char);
}

std::string line_core(const std::string& line) {
    bool unused = false;
    return trimmed(strip_bullet(strip_border_edges(line), unused));
}

bool prompt_visible(const std::string& snapshot, const std::string& prompt_char, int window) {
    auto lines = split_lines(strip_ansi(snapshot));
    while (!lines.empty() && trimmed(lines.back()).empty()) lines.pop_back();

    int seen = 0;
    for (auto it = lines.rbegin(); it != lines.rend() && seen < window; ++it) {
        if (trimmed(*it).empty()) continue;
        if (is_prompt_line(*it, prompt_char)) return true;
        seen++;
    }
    return false;
}

std::string normalize_snapshot(const std::string& snapshot) {
    std::vector<std::string> kept;
    for (auto& line : split_lines(strip_ansi(snapshot))) {
        if (is_status_line(line)) continue;
        auto last = line.find_last_not_of(" \t");
        kept.push_back(last == std::string::npos ? "" : line.substr(0, last + 1));
    }
    while (!kept.empty() && kept.back().empty()) kept.pop_back();
    return join_lines(kept);
}

} // namespace chrome
