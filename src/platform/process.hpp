#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Run a program to completion (no shell involved) and collect its output.
// stdin_data, if non-empty, is written to the child's stdin, which is then closed.
// exit_code is 127 if the program could not be executed and -1 if it was
// killed by a signal or could not be started at all (stderr_data says why).
CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& stdin_data = "");

} // namespace platform
