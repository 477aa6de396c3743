#pragma once

#include <string>
#include <optional>
#include <functional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    using EnvLookup = std::function<std::optional<std::string>(const char*)>;

    // Defaults < ~/.panepipe/config.yaml (or `path`) < PANEPIPE_* environment.
    // A missing file is not an error.
    static Result<Config> load(const std::optional<fs::path>& path = std::nullopt);

    // Parse one YAML document on top of the defaults.
    static Result<Config> from_yaml(const std::string& text);
    static Result<Config> load_file(const fs::path& path);

    // Environment overrides (PANEPIPE_SESSION, PANEPIPE_AGENT_CMD,
    // PANEPIPE_IDLE_TIMEOUT, PANEPIPE_MAX_WAIT, PANEPIPE_MARKER).
    Result<void> apply_env(const EnvLookup& lookup);

    // Range and consistency checks; run after every override layer.
    Result<void> validate() const;

    const PipeSettings& settings() const { return settings_; }
    PipeSettings& settings() { return settings_; }

    // Source file, if one was read.
    const std::optional<fs::path>& source() const { return source_; }

public:
    Config() = default;

private:
    PipeSettings settings_;
    std::optional<fs::path> source_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
