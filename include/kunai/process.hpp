#pragma once

#include <kunai/result.hpp>
#include <string>
#include <vector>

namespace kunai {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// Returns a Spawn error when the program cannot be started at all (including
// exec failure in the child), and a Timeout error when timeout_seconds > 0
// elapses first. timeout_seconds == 0 waits for as long as the child runs.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 0);

// "prog arg1 arg2" for log and error messages
std::string command_line(const std::vector<std::string>& args);

} // namespace kunai
