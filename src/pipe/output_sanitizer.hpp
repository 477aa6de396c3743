#pragma once

#include <functional>
#include <string>
#include <vector>

// Inputs shared by every transform of one request.
struct SanitizeContext {
    std::string marker;
    std::string prompt;                          // user prompt, without the marker instruction
    std::string baseline;                        // pane captured just before submission
    std::string prompt_char = "\xe2\x9d\xaf";    // ❯
};

using Lines = std::vector<std::string>;

// A named, independently testable step of the sanitizing pipeline.
struct Transform {
    const char* name;
    std::function<Lines(const Lines&, const SanitizeContext&)> apply;
};

// Individual transforms, in pipeline order.
namespace transforms {

// Escape sequences and control bytes.
Lines strip_ansi(const Lines& lines, const SanitizeContext& ctx);

// Drop the leading lines the pane shared with the baseline (output that
// predates this request).
Lines slice_new_output(const Lines& lines, const SanitizeContext& ctx);

// Keep the region from the prompt echo (inclusive) up to the first marker
// line after it (exclusive). The echo is the first line carrying the marker
// inline, else the first line containing the start of the prompt, else the
// agent's "[Pasted text" placeholder. Without an echo the region starts at 0.
Lines slice_response(const Lines& lines, const SanitizeContext& ctx);

// If the region opens with the prompt echo, drop it with its wrapped
// continuation lines (through the line carrying the marker instruction).
Lines strip_echo(const Lines& lines, const SanitizeContext& ctx);

// Remove inline marker text. A line that held nothing else ends the answer.
Lines strip_marker(const Lines& lines, const SanitizeContext& ctx);

// Drop border, empty-prompt, hint and spinner lines; unwrap bordered text.
Lines strip_chrome(const Lines& lines, const SanitizeContext& ctx);

// Remove response bullets and the two-column indent of their continuation lines.
Lines strip_bullets(const Lines& lines, const SanitizeContext& ctx);

// Trailing whitespace per line; runs of blank lines become one blank line.
Lines collapse_blank_runs(const Lines& lines, const SanitizeContext& ctx);

} // namespace transforms

class OutputSanitizer {
public:
    explicit OutputSanitizer(SanitizeContext ctx);

    // Clean answer, trimmed. Empty means nothing substantive was found.
    std::string sanitize(const std::string& raw) const;

    // The fixed pipeline, in application order.
    static const std::vector<Transform>& pipeline();

private:
    SanitizeContext ctx_;
};

// Convenience wrapper for a single call.
std::string sanitize(const std::string& raw, const std::string& marker,
                     const std::string& prompt = "");
