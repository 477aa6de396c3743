#include "multiplexer.hpp"
#include <core/utils.hpp>

bool TerminalMultiplexer::has_running_command(const Session& session,
                                              const std::vector<std::string>& patterns) {
    std::string cmd = current_command(session);
    if (cmd.empty()) return false;
    for (const auto& p : patterns) {
        if (!p.empty() && cmd.find(to_lower(p)) != std::string::npos)
            return true;
    }
    return false;
}
