#pragma once

#include <string>
#include <platform/clock.hpp>
#include <tmux/multiplexer.hpp>

struct SubmitOptions {
    std::string clear_command = "/clear";       // empty disables the reset
    platform::Clock::duration clear_settle{1000};
    platform::Clock::duration submit_delay{600};
    int scrollback = 10000;
};

// Resets the conversation and types the prompt (with the marker instruction)
// into the pane.
class PromptSubmitter {
public:
    PromptSubmitter(TerminalMultiplexer& mux, platform::Clock& clock, SubmitOptions options = {});

    // Returns the baseline snapshot taken after the reset, before the prompt
    // was sent. Any delivery failure is rethrown as PipeError{SubmitFailed}.
    std::string submit(const Session& session, const std::string& prompt,
                       const std::string& marker);

private:
    TerminalMultiplexer& mux_;
    platform::Clock& clock_;
    SubmitOptions options_;

    // Type text, wait submit_delay, press Enter.
    void send_and_enter(const Session& session, const std::string& text);
};
