#pragma once

#include <string>
#include <core/types.hpp>
#include <platform/clock.hpp>
#include <tmux/multiplexer.hpp>
#include "completion_detector.hpp"

struct PipeReply {
    std::string answer;
    CompletionKind completion;
    platform::Clock::duration elapsed;
    bool launched_agent = false;
};

// One request/response cycle against the agent in a persistent session:
// ensure session -> ensure agent -> reset + submit -> wait -> sanitize.
// The session and the agent are left running for the next call.
class AgentPipe {
public:
    AgentPipe(PipeSettings settings, TerminalMultiplexer& mux, platform::Clock& clock);

    // Throws PipeError; TimedOut and EmptyResponse carry the pane text as detail.
    PipeReply ask(const std::string& message);

    // ask() returning just the answer.
    std::string run(const std::string& message) { return ask(message).answer; }

    const PipeSettings& settings() const { return settings_; }

private:
    PipeSettings settings_;
    TerminalMultiplexer& mux_;
    platform::Clock& clock_;

    DetectorOptions detector_options() const;
    PipeReply exchange(const Session& session, const std::string& message);
};
