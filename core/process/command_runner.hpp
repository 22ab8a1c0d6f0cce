#pragma once

#include "i_command_runner.hpp"

namespace mup1gw {
namespace process {

// CommandRunner executes one short-lived child per call
// Responsibilities:
// - Spawn argv without a shell, stdin from /dev/null
// - Capture stdout and stderr until EOF and exit
// - Kill the child's process group when the deadline passes
// - Report exec failures (ENOENT, EACCES, ...) instead of a bare exit code
// Stateless; one instance may be shared by concurrent request threads.
class CommandRunner : public ICommandRunner {
public:
    CommandRunner() = default;

    CommandRunner(const CommandRunner &) = delete;
    CommandRunner &operator=(const CommandRunner &) = delete;

    RunResult run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) override;
};

}  // namespace process
}  // namespace mup1gw
