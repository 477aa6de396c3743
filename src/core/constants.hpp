#pragma once

// ── Identity ────────────────────────────────────────────────
constexpr const char* PANEPIPE_NAME    = "panepipe";
constexpr const char* PANEPIPE_VERSION = "0.4.0";

// ── tmux ────────────────────────────────────────────────────
constexpr const char* TMUX_BINARY      = "tmux";
constexpr const char* TMUX_PASTE_BUFFER = "panepipe";    // paste buffer prefix, suffixed with the session name

// ── Marker instruction ──────────────────────────────────────
// Appended to the prompt. {} is replaced by the marker.
constexpr const char* MARKER_INSTRUCTION = "(When done, print {} on its own line)";
constexpr const char* MARKER_FORMAT      = "<<<DONE-{:08x}>>>";

// ── Prompt echo ─────────────────────────────────────────────
constexpr int PROMPT_ECHO_NEEDLE_CHARS = 60;    // prefix of the prompt used to find its echo
constexpr int ECHO_WRAP_MIN_CHARS       = 20;    // shortest wrapped echo head accepted

// ── Logging ─────────────────────────────────────────────────
constexpr const char* DEBUG_LOG_FILE   = "panepipe_debug.log";
constexpr int LOG_SNIPPET_CHARS        = 500;   // truncation for command output in the debug log

// ── Locking ─────────────────────────────────────────────────
constexpr int LOCK_RETRY_MS            = 100;
