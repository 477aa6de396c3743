#pragma once

#include <string>
#include <vector>

// Line-level recognizers for the agent front-end's decorative output.
//
// Decorative glyph allowlist:
//   borders   U+2500..U+257F box drawing, U+2580..U+259F block elements
//   bullets   ● U+25CF, ⏺ U+23FA, ⎿ U+23BF   (response markers, stripped)
//   spinners  ✻ ✽ ✶ ✳ ✢ ∗ · • *           (status lines, dropped when the
//             glyph is followed by one word ending in "…" or "...", optionally
//             followed by a "(...)" status; after the list-bullet glyphs
//             · • * the word must end in "ing" unless the status is present)
// plus any line mentioning "esc to interrupt", and the shortcut hints.
namespace chrome {

// Remove escape sequences (CSI, OSC, two-byte ESC) and control bytes other
// than '\n' and '\t'. "\r\n" becomes "\n".
std::string strip_ansi(const std::string& text);

// Length of the border glyph starting at s[i], or 0.
size_t border_glyph_len(const std::string& s, size_t i);

// Remove leading and trailing border glyphs (and the spaces next to them).
std::string strip_border_edges(const std::string& line);

// Non-empty line made only of border glyphs and whitespace.
bool is_border_line(const std::string& line);

// Remove one leading response bullet, keeping the indentation before it.
// `stripped` tells whether a bullet was found.
std::string strip_bullet(const std::string& line, bool& stripped);

// Spinner/progress line ("✻ Thinking… (3s · esc to interrupt)").
bool is_status_line(const std::string& line);

// "? for shortcuts" and friends.
bool is_hint_line(const std::string& line);

// Empty input prompt: the prompt glyph (or ">") with nothing typed after it.
bool is_prompt_line(const std::string& line, const std::string& prompt_char);

// Line text with borders, bullet and surrounding whitespace removed.
std::string line_core(const std::string& line);

// True if the agent's empty input prompt is among the last `window` non-blank lines.
bool prompt_visible(const std::string& snapshot, const std::string& prompt_char, int window);

// Snapshot reduced to its substantive content for change detection:
// escapes removed, status lines dropped, trailing whitespace and trailing
// blank lines removed. Spinner animation does not change the result.
std::string normalize_snapshot(const std::string& snapshot);

} // namespace chrome
