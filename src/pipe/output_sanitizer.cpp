#include "output_sanitizer.hpp"
#include "chrome.hpp"
#include "sentinel.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>

static const char* const PASTE_PLACEHOLDER = "[Pasted text";

// ── Echo recognition ────────────────────────────────────────────

// Whitespace-collapsed start of the first non-blank prompt line, cut on a
// UTF-8 boundary.
static std::string echo_needle(const std::string& prompt) {
    for (const auto& line : split_lines(prompt)) {
        std::string c = collapse_whitespace(line);
        if (c.empty()) continue;
        size_t n = c.size();
        if (n > static_cast<size_t>(PROMPT_ECHO_NEEDLE_CHARS)) {
            n = PROMPT_ECHO_NEEDLE_CHARS;
            while (n > 0 && (static_cast<unsigned char>(c[n]) & 0xc0) == 0x80) n--;
        }
        return trimmed(c.substr(0, n));
    }
    return "";
}

static std::string last_word(const std::string& s) {
    std::string t = trimmed(s);
    auto sp = t.find_last_of(" \t");
    return sp == std::string::npos ? t : t.substr(sp + 1);
}

static std::string first_word(const std::string& s) {
    std::string t = trimmed(s);
    return t.substr(0, t.find_first_of(" \t"));
}

// A line carrying the marker inside the echoed instruction: the word before
// or after the marker matches the instruction text around it.
static bool has_inline_marker(const std::string& line, const SanitizeContext& ctx) {
    if (ctx.marker.empty()) return false;
    size_t pos = line.find(ctx.marker);
    if (pos == std::string::npos || is_marker_line(line, ctx.marker)) return false;

    std::string instruction = marker_instruction(ctx.marker);
    size_t at = instruction.find(ctx.marker);
    std::string before = last_word(instruction.substr(0, at));
    std::string after = first_word(instruction.substr(at + ctx.marker.size()));

    return (!before.empty() && last_word(line.substr(0, pos)) == before)
        || (!after.empty() && first_word(line.substr(pos + ctx.marker.size())) == after);
}

// Offset in the collapsed line where the prompt echo begins: where the needle
// occurs, or (for an echo the agent wrapped) where a long enough start of it
// follows the prompt glyph. npos if the line is not an echo.
static size_t echo_start(const std::string& collapsed, const std::string& needle,
                         const std::string& prompt_char) {
    if (needle.empty()) return std::string::npos;
    size_t at = collapsed.find(needle);
    if (at != std::string::npos) return at;

    for (const std::string& glyph : {std::string(">"), prompt_char}) {
        if (glyph.empty() || collapsed.compare(0, glyph.size(), glyph) != 0) continue;
        size_t head_at = collapsed.find_first_not_of(' ', glyph.size());
        if (head_at == std::string::npos) return std::string::npos;
        std::string head = collapsed.substr(head_at);
        if (head.size() >= static_cast<size_t>(ECHO_WRAP_MIN_CHARS)
                && needle.compare(0, head.size(), head) == 0)
            return head_at;
        return std::string::npos;
    }
    return std::string::npos;
}

static bool has_needle(const std::string& line, const std::string& needle,
                       const std::string& prompt_char) {
    return echo_start(collapse_whitespace(line), needle, prompt_char) != std::string::npos;
}

static size_t common_prefix(const std::string& a, size_t a_from, const std::string& b) {
    size_t n = 0;
    while (a_from + n < a.size() && n < b.size() && a[a_from + n] == b[n]) n++;
    return n;
}

static bool is_paste_placeholder(const std::string& line) {
    return chrome::line_core(line).find(PASTE_PLACEHOLDER) != std::string::npos;
}

namespace transforms {

Lines strip_ansi(const Lines& lines, const SanitizeContext&) {
    Lines out;
    out.reserve(lines.size());
    for (const auto& line : lines) out.push_back(chrome::strip_ansi(line));
    return out;
}

Lines slice_new_output(const Lines& lines, const SanitizeContext& ctx) {
    if (ctx.baseline.empty()) return lines;
    Lines base = split_lines(chrome::strip_ansi(ctx.baseline));

    size_t common = 0;
    while (common < lines.size() && common < base.size() && lines[common] == base[common])
        common++;
    // Identical to the baseline: nothing new, but keep the text for diagnosis.
    if (common == lines.size()) return lines;
    return Lines(lines.begin() + common, lines.end());
}

Lines slice_response(const Lines& lines, const SanitizeContext& ctx) {
    size_t anchor = lines.size();

    for (size_t i = 0; i < lines.size() && anchor == lines.size(); i++) {
        if (has_inline_marker(lines[i], ctx)) anchor = i;
    }
    std::string needle = echo_needle(ctx.prompt);
    for (size_t i = 0; i < lines.size() && anchor == lines.size(); i++) {
        if (has_needle(lines[i], needle, ctx.prompt_char)) anchor = i;
    }
    for (size_t i = 0; i < lines.size() && anchor == lines.size(); i++) {
        if (is_paste_placeholder(lines[i])) anchor = i;
    }

    // A marker line before the echo belongs to an earlier exchange.
    size_t start = (anchor == lines.size()) ? 0 : anchor;
    size_t end = lines.size();
    for (size_t i = start; i < lines.size(); i++) {
        if (is_marker_line(lines[i], ctx.marker)) {
            end = i;
            break;
        }
    }
    return Lines(lines.begin() + start, lines.begin() + end);
}

Lines strip_echo(const Lines& lines, const SanitizeContext& ctx) {
    if (lines.empty()) return lines;

    const std::string& first = lines[0];
    if (has_inline_marker(first, ctx) || is_paste_placeholder(first)) {
        return Lines(lines.begin() + 1, lines.end());
    }
    std::string head = collapse_whitespace(first);
    size_t at = echo_start(head, echo_needle(ctx.prompt), ctx.prompt_char);
    if (at == std::string::npos) return lines;

    // Follow the echo through its wrapped lines: each continuation must be
    // the next stretch of the submitted text, in order.
    std::string echo = collapse_whitespace(
        ctx.marker.empty() ? ctx.prompt : build_marker_prompt(ctx.prompt, ctx.marker));
    size_t covered = common_prefix(head, at, echo);

    size_t last_echo = 0;
    for (size_t i = 1; i < lines.size() && covered < echo.size(); i++) {
        bool bullet = false;
        chrome::strip_bullet(lines[i], bullet);
        if (bullet) break;

        std::string core = collapse_whitespace(chrome::line_core(lines[i]));
        if (core.empty()) continue;
        if (has_inline_marker(lines[i], ctx)) {
            last_echo = i;
            break;
        }

        while (covered < echo.size() && echo[covered] == ' ') covered++;
        if (echo.compare(covered, core.size(), core) != 0) break;
        covered += core.size();
        last_echo = i;
    }
    return Lines(lines.begin() + last_echo + 1, lines.end());
}

Lines strip_marker(const Lines& lines, const SanitizeContext& ctx) {
    if (ctx.marker.empty()) return lines;
    Lines out;
    for (const auto& line : lines) {
        if (line.find(ctx.marker) == std::string::npos) {
            out.push_back(line);
            continue;
        }
        std::string cleaned = line;
        size_t pos;
        while ((pos = cleaned.find(ctx.marker)) != std::string::npos)
            cleaned.erase(pos, ctx.marker.size());
        if (chrome::line_core(cleaned).empty()) break;
        auto last = cleaned.find_last_not_of(" \t");
        out.push_back(cleaned.substr(0, last + 1));
    }
    return out;
}

Lines strip_chrome(const Lines& lines, const SanitizeContext& ctx) {
    Lines out;
    for (const auto& line : lines) {
        if (chrome::is_border_line(line)) continue;
        if (chrome::is_prompt_line(line, ctx.prompt_char)) continue;
        if (chrome::is_hint_line(line)) continue;
        if (chrome::is_status_line(line)) continue;
        out.push_back(chrome::strip_border_edges(line));
    }
    return out;
}

Lines strip_bullets(const Lines& lines, const SanitizeContext&) {
    Lines out;
    bool in_block = false;
    for (const auto& line : lines) {
        bool stripped = false;
        std::string text = chrome::strip_bullet(line, stripped);
        if (stripped) {
            in_block = true;
            out.push_back(text);
            continue;
        }
        if (in_block) {
            if (line.compare(0, 2, "  ") == 0) {
                out.push_back(line.substr(2));
                continue;
            }
            if (!trimmed(line).empty()) in_block = false;
        }
        out.push_back(line);
    }
    return out;
}

Lines collapse_blank_runs(const Lines& lines, const SanitizeContext&) {
    Lines out;
    bool prev_blank = false;
    for (const auto& line : lines) {
        auto last = line.find_last_not_of(" \t");
        if (last == std::string::npos) {
            if (!prev_blank) out.push_back("");
            prev_blank = true;
            continue;
        }
        out.push_back(line.substr(0, last + 1));
        prev_blank = false;
    }
    return out;
}

} // namespace transforms

// ── OutputSanitizer ─────────────────────────────────────────────

OutputSanitizer::OutputSanitizer(SanitizeContext ctx) : ctx_(std::move(ctx)) {}

const std::vector<Transform>& OutputSanitizer::pipeline() {
    static const std::vector<Transform> steps = {
        {"strip-ansi",          transforms::strip_ansi},
        {"slice-new-output",    transforms::slice_new_output},
        {"slice-response",      transforms::slice_response},
        {"strip-echo",          transforms::strip_echo},
        {"strip-marker",        transforms::strip_marker},
        {"strip-chrome",        transforms::strip_chrome},
        {"strip-bullets",       transforms::strip_bullets},
        {"collapse-blank-runs", transforms::collapse_blank_runs},
    };
    return steps;
}

std::string OutputSanitizer::sanitize(const std::string& raw) const {
    Lines lines = split_lines(raw);
    for (const auto& step : pipeline()) {
        lines = step.apply(lines, ctx_);
    }
    return trimmed(join_lines(lines));
}

std::string sanitize(const std::string& raw, const std::string& marker,
                     const std::string& prompt) {
    SanitizeContext ctx;
    ctx.marker = marker;
    ctx.prompt = prompt;
    return OutputSanitizer(std::move(ctx)).sanitize(raw);
}
