#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

// Parsed command line. Flags override config; positional args form the message.
struct CliOptions {
    bool verbose = false;
    bool help = false;
    bool version = false;
    std::optional<std::string> config_path;
    std::optional<std::string> session;
    std::optional<std::string> agent_cmd;
    std::optional<double> idle_timeout;
    std::optional<double> max_wait;
    std::vector<std::string> message_words;
};

// argv[1..]. Errors name the offending flag.
Result<CliOptions> parse_cli(const std::vector<std::string>& args);

// Write flag overrides into the settings.
void apply_cli(const CliOptions& opts, PipeSettings& settings);

// Positional words joined by spaces.
std::string message_from_args(const CliOptions& opts);

std::string usage_text(const std::string& program);
