#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <vector>

struct ProcessResult {
    int exit_code = -1;     // -1 when killed by a signal
    bool timed_out = false;
    std::string out;
    std::string err;
};

namespace subprocess {

// Runs argv[0] from PATH with stdin closed and stdout/stderr captured. A
// child still running at the deadline is killed with SIGKILL and reaped.
// Only setup failures (pipe, fork, poll) are errors.
std::expected<ProcessResult, std::string>
    run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

} // namespace subprocess
