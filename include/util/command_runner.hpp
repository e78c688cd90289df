#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace ykmon::util {

struct CommandResult {
    enum class Status {
        Exited,
        NotFound,
        TimedOut,
    };

    Status status{Status::Exited};
    int exit_code{-1};
    std::string stdout_text;
    std::string stderr_text;
};

// Runs argv[0] (looked up in PATH) without a shell. The child is killed once the
// timeout elapses. Throws std::system_error when the process cannot be spawned.
CommandResult run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

}  // namespace ykmon::util
