#pragma once

#include <string>
#include <vector>
#include <platform/clock.hpp>
#include <tmux/multiplexer.hpp>

struct BootstrapOptions {
    std::vector<std::string> process_names = {"node", "claude"};
    std::string prompt_char = "\xe2\x9d\xaf";    // ❯
    int prompt_visible_lines = 8;
    platform::Clock::duration submit_delay{600};
    platform::Clock::duration poll_interval{500};
    platform::Clock::duration startup_timeout{30000};
    platform::Clock::duration startup_wait{5000};
    platform::Clock::duration startup_settle{1000};
};

// Makes sure the agent runs in the session's pane, launching it if needed.
class SessionBootstrapper {
public:
    SessionBootstrapper(TerminalMultiplexer& mux, platform::Clock& clock,
                        BootstrapOptions options = {});

    // No-op if the agent is already the pane's foreground process. Otherwise
    // types agent_cmd + Enter, waits startup_wait, then polls until the agent
    // shows its input prompt or its output stays unchanged for startup_settle.
    // Returns true if it had to launch the agent.
    // Throws PipeError{AgentStartTimeout} if it never comes up.
    bool ensure_agent_running(const Session& session, const std::string& agent_cmd);

    bool agent_running(const Session& session);

private:
    TerminalMultiplexer& mux_;
    platform::Clock& clock_;
    BootstrapOptions options_;
};
