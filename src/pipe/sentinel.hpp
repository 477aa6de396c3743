#pragma once

#include <string>
#include <random>

// Sentinel marker protocol.
// The marker is appended to the prompt as an instruction; the agent prints it
// on its own line once the answer is complete. A marker line in the pane is a
// line whose text, after borders and response bullet are removed, equals the
// marker exactly, so the echoed instruction never counts.

// Random per-request marker, e.g. "<<<DONE-7f3a09c1>>>".
std::string generate_marker();
std::string generate_marker(std::mt19937& rng);

// "(When done, print <marker> on its own line)"
std::string marker_instruction(const std::string& marker);

// Prompt plus instruction. Single-line prompts get the instruction after a
// space; multi-line prompts get it as a separate trailing paragraph.
std::string build_marker_prompt(const std::string& prompt, const std::string& marker);

bool is_marker_line(const std::string& line, const std::string& marker);

// Number of marker lines in a snapshot (escape sequences ignored).
int count_marker_lines(const std::string& snapshot, const std::string& marker);
