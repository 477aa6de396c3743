#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory (honours TMPDIR).
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// True if the given file descriptor is attached to a terminal.
bool is_tty(int fd);

// Locate an executable by name: absolute/relative paths are checked directly,
// bare names are searched in PATH. Returns nullopt if not found or not executable.
std::optional<std::filesystem::path> find_executable(const std::string& name);

// Read an environment variable. Unset and empty are both nullopt.
std::optional<std::string> env(const char* name);

} // namespace platform
