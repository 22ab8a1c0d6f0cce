#include "command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "logging/logger.hpp"

namespace mup1gw {
namespace process {

namespace {
constexpr size_t kReadChunk = 4096;
constexpr int kPollSliceMs = 50;
constexpr int kExecFailedExitCode = 127;

void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Reads until the pipe would block. Closes fd on EOF or a hard error.
void drain(int &fd, std::string &out) {
    char buffer[kReadChunk];
    while (fd >= 0) {
        ssize_t bytes = read(fd, buffer, sizeof(buffer));
        if (bytes > 0) {
            out.append(buffer, static_cast<size_t>(bytes));
            continue;
        }
        if (bytes < 0 && errno == EINTR) {
            continue;
        }
        if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        close_fd(fd);
    }
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

pid_t wait_blocking(pid_t pid, int &status) {
    pid_t result;
    do {
        result = waitpid(pid, &status, 0);
    } while (result < 0 && errno == EINTR);
    return result;
}

void kill_group(pid_t pid) {
    // The child leads its own process group; fall back to the pid if setpgid lost a race
    if (kill(-pid, SIGKILL) < 0) {
        kill(pid, SIGKILL);
    }
}
}  // namespace

RunResult CommandRunner::run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) {
    RunResult result;
    const auto start = std::chrono::steady_clock::now();

    if (argv.empty() || argv[0].empty()) {
        result.error = "Empty command line";
        return result;
    }

    // Everything the child touches is prepared before fork
    std::vector<char *> c_args;
    c_args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        c_args.push_back(const_cast<char *>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    // O_CLOEXEC keeps these out of children forked concurrently by other requests
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        close_fd(exec_pipe[0]);
        close_fd(exec_pipe[1]);
    };

    if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 || pipe2(exec_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("Failed to create pipes: ") + std::strerror(errno);
        close_all();
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("Fork failed: ") + std::strerror(errno);
        close_all();
        return result;
    }

    if (pid == 0) {
        // Child process: async-signal-safe calls only
        setpgid(0, 0);

        // Ignored dispositions survive exec; the tool expects default SIGPIPE
        signal(SIGPIPE, SIG_DFL);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0 && devnull != STDIN_FILENO) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        execvp(c_args[0], c_args.data());

        // exec_pipe closes on a successful exec; getting here means it failed
        int exec_errno = errno;
        ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(kExecFailedExitCode);
    }

    // Parent process
    setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    LOG_DEBUG("[Process] Spawned " << argv[0] << " (PID=" << pid << ")");

    int exec_errno = 0;
    ssize_t exec_bytes;
    do {
        exec_bytes = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (exec_bytes < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    int status = 0;
    if (exec_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        wait_blocking(pid, status);
        close_all();
        result.error = "Failed to execute '" + argv[0] + "': " + std::strerror(exec_errno);
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        return result;
    }

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    out_pipe[0] = -1;
    err_pipe[0] = -1;
    fcntl(out_fd, F_SETFL, fcntl(out_fd, F_GETFL) | O_NONBLOCK);
    fcntl(err_fd, F_SETFL, fcntl(err_fd, F_GETFL) | O_NONBLOCK);

    const auto deadline = start + timeout;
    bool exited = false;

    while (true) {
        if (!exited) {
            pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                exited = true;
            } else if (waited < 0 && errno != EINTR) {
                result.error = std::string("waitpid failed: ") + std::strerror(errno);
                kill_group(pid);
                wait_blocking(pid, status);
                close_fd(out_fd);
                close_fd(err_fd);
                result.duration =
                    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
                return result;
            }
        }

        // Done once the child is reaped and both pipes reached EOF
        if (exited && out_fd < 0 && err_fd < 0) {
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            LOG_WARN("[Process] " << argv[0] << " (PID=" << pid << ") exceeded " << timeout.count()
                                  << "ms, killing process group");
            kill_group(pid);
            if (!exited) {
                wait_blocking(pid, status);
            }
            drain(out_fd, result.stdout_text);
            drain(err_fd, result.stderr_text);
            close_fd(out_fd);
            close_fd(err_fd);
            result.status = RunStatus::TIMED_OUT;
            result.exit_code = -1;
            result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - start);
            return result;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        const int slice_ms = static_cast<int>(std::min<long long>(kPollSliceMs, std::max<long long>(1, remaining)));

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_fd >= 0) {
            fds[nfds++] = {out_fd, POLLIN, 0};
        }
        if (err_fd >= 0) {
            fds[nfds++] = {err_fd, POLLIN, 0};
        }

        if (nfds == 0) {
            // Output closed, child not reaped yet
            poll(nullptr, 0, std::min(slice_ms, 10));
            continue;
        }

        int ready = poll(fds, nfds, slice_ms);
        if (ready < 0 && errno != EINTR) {
            result.error = std::string("poll failed: ") + std::strerror(errno);
            kill_group(pid);
            if (!exited) {
                wait_blocking(pid, status);
            }
            close_fd(out_fd);
            close_fd(err_fd);
            result.duration =
                std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
            return result;
        }
        if (ready > 0) {
            drain(out_fd, result.stdout_text);
            drain(err_fd, result.stderr_text);
        }
    }

    result.status = RunStatus::EXITED;
    result.exit_code = decode_wait_status(status);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    LOG_DEBUG("[Process] " << argv[0] << " (PID=" << pid << ") exited with " << result.exit_code << " after "
                           << result.duration.count() << "ms");
    return result;
}

}  // namespace process
}  // namespace mup1gw
