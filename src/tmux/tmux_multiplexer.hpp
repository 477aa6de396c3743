#pragma once

#include <functional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "multiplexer.hpp"

// TmuxMultiplexer: drives tmux through its command-line client.
//
//   ensure_session   has-session -t =NAME   /  new-session -d -s NAME -x W -y H
//   send_keys        send-keys -t =NAME: -l -- TEXT   (+ send-keys Enter)
//   paste_text       load-buffer -b BUF -  (stdin)  +  paste-buffer -p -d -b BUF
//   capture_pane     capture-pane -p -J -t =NAME: [-S -N]
//   current_command  display-message -p -t =NAME: '#{pane_current_command}'
//
// The command runner is injectable so argument construction can be tested
// without a tmux server.
class TmuxMultiplexer : public TerminalMultiplexer {
public:
    using Runner = std::function<CommandResult(const std::string& program,
                                               const std::vector<std::string>& args,
                                               const std::string& stdin_data)>;

    // Uses platform::run_command and locates `tmux` in PATH on first use.
    TmuxMultiplexer(int width = 200, int height = 50);

    TmuxMultiplexer(Runner runner, std::string binary, int width = 200, int height = 50);

    Session ensure_session(const std::string& name) override;
    void send_keys(const Session& session, const std::string& text, bool submit) override;
    void send_key(const Session& session, const std::string& key) override;
    void paste_text(const Session& session, const std::string& text) override;
    std::string capture_pane(const Session& session, int scrollback = 0) override;
    std::string current_command(const Session& session) override;

    // Targets: exact session match, and that session's active pane.
    static std::string session_target(const std::string& name);
    static std::string pane_target(const std::string& name);

private:
    Runner runner_;
    std::string binary_;
    int width_;
    int height_;

    // Resolve the binary or throw SessionUnavailable.
    const std::string& binary();

    CommandResult run(const std::vector<std::string>& args, const std::string& stdin_data = "");

    // run() that throws SessionError on nonzero exit.
    CommandResult run_checked(const std::string& what,
                              const std::vector<std::string>& args,
                              const std::string& stdin_data = "");
};
