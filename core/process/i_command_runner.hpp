#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace mup1gw {
namespace process {

enum class RunStatus {
    EXITED,        // Process ran to completion (any exit code)
    TIMED_OUT,     // Deadline hit, process group killed
    SPAWN_FAILED   // Pipes, fork or exec failed; see error
};

struct RunResult {
    RunStatus status = RunStatus::SPAWN_FAILED;
    int exit_code = -1;  // Exit status, or 128 + signal number when killed by a signal
    std::string stdout_text;
    std::string stderr_text;
    std::string error;
    std::chrono::milliseconds duration{0};

    bool succeeded() const { return status == RunStatus::EXITED && exit_code == 0; }
};

// Interface for CommandRunner to enable mocking
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    // Runs argv[0] (PATH lookup, no shell) with argv[1..] and blocks until exit or timeout
    virtual RunResult run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) = 0;
};

}  // namespace process
}  // namespace mup1gw
