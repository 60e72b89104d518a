/**
 * @file process_runner.cpp
 * @brief fork/exec child execution with pipe capture, deadline and cancellation
 *
 * **Execution Workflow**:
 * 1. Create stdout, stderr and exec-status pipes, all CLOEXEC
 * 2. fork(); the child moves into its own process group and execvp()s
 * 3. A failed exec writes errno into the status pipe and exits 127
 * 4. The parent polls the output pipes in short slices, checking the
 *    deadline and the cancellation token between slices
 * 5. On deadline or cancellation the whole process group gets SIGKILL
 * 6. waitpid() collects the exit status
 *
 * Killing the group matters for the control utility, which may fork
 * helpers that would otherwise keep the pipes open.
 *
 * @date 2025
 */

#include "vmsandbox/control/process_runner.hpp"
#include "vmsandbox/core/cancellation.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vmsandbox {
namespace control {

namespace {

constexpr int kPollSliceMs = 50;
constexpr std::chrono::seconds kKillGrace{2};

void AppendLimited(std::string& dst, const char* src, ssize_t n, std::size_t limit) {
    if (n <= 0 || dst.size() >= limit) {
        return;
    }
    std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), limit - dst.size());
    dst.append(src, take);
}

void ClosePipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

// Returns false once the descriptor reached EOF or failed
bool DrainOnce(int fd, std::string& dst, std::size_t limit) {
    char buffer[4096];
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        AppendLimited(dst, buffer, n, limit);
        return true;
    }
    if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
        return true;
    }
    return false;
}

} // anonymous namespace

ProcessResult RunProcess(const ProcessSpec& spec) {
    ProcessResult result;

    if (spec.argv.empty()) {
        result.spawn_failed = true;
        result.error_message = "Empty command";
        return result;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    // CLOEXEC on every end, so children forked by other threads cannot hold them
    // open; dup2() clears the flag on the child's stdout and stderr
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        result.spawn_failed = true;
        result.error_message = std::string("pipe2() failed: ") + std::strerror(errno);
        ClosePipe(out_pipe);
        ClosePipe(err_pipe);
        ClosePipe(status_pipe);
        return result;
    }

    // Prepare argv before fork; the child must not allocate
    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    auto start_time = std::chrono::steady_clock::now();

    pid_t pid = fork();
    if (pid < 0) {
        result.spawn_failed = true;
        result.error_message = std::string("fork() failed: ") + std::strerror(errno);
        ClosePipe(out_pipe);
        ClosePipe(err_pipe);
        ClosePipe(status_pipe);
        return result;
    }

    if (pid == 0) {
        setpgid(0, 0);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        close(status_pipe[0]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        execvp(argv[0], argv.data());

        int exec_errno = errno;
        ssize_t ignored = write(status_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    // Parent
    setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);
    out_pipe[1] = err_pipe[1] = status_pipe[1] = -1;

    int exec_errno = 0;
    ssize_t status_bytes = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    close(status_pipe[0]);
    status_pipe[0] = -1;

    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        ClosePipe(out_pipe);
        ClosePipe(err_pipe);
        result.spawn_failed = true;
        result.error_message = "Cannot execute " + spec.argv[0] + ": " + std::strerror(exec_errno);
        return result;
    }

    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    const auto deadline = start_time + spec.timeout;
    bool out_open = true;
    bool err_open = true;
    bool killed = false;
    std::chrono::steady_clock::time_point killed_at;

    while (out_open || err_open) {
        if (killed && std::chrono::steady_clock::now() - killed_at > kKillGrace) {
            // A descendant left the process group and still holds the pipes
            break;
        }
        if (!killed) {
            if (spec.cancel != nullptr && spec.cancel->IsCancelled()) {
                spdlog::warn("Cancellation requested, killing {} (pid {})", spec.argv[0], pid);
                kill(-pid, SIGKILL);
                result.cancelled = true;
                killed = true;
                killed_at = std::chrono::steady_clock::now();
            } else if (std::chrono::steady_clock::now() >= deadline) {
                spdlog::warn("⏱ Timeout reached ({} ms), killing {} (pid {})",
                             spec.timeout.count(), spec.argv[0], pid);
                kill(-pid, SIGKILL);
                result.timed_out = true;
                killed = true;
                killed_at = std::chrono::steady_clock::now();
            }
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_open) {
            fds[count++] = {out_pipe[0], POLLIN, 0};
        }
        if (err_open) {
            fds[count++] = {err_pipe[0], POLLIN, 0};
        }

        int ready = poll(fds, count, kPollSliceMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (fds[i].fd == out_pipe[0]) {
                out_open = DrainOnce(out_pipe[0], result.stdout_output, spec.max_output_bytes);
            } else {
                err_open = DrainOnce(err_pipe[0], result.stderr_output, spec.max_output_bytes);
            }
        }
    }

    ClosePipe(out_pipe);
    ClosePipe(err_pipe);

    // Output is closed but the child may still be running
    int status = 0;
    while (true) {
        pid_t waited = waitpid(pid, &status, killed ? 0 : WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            break;
        }
        if (waited == 0) {
            if (spec.cancel != nullptr && spec.cancel->IsCancelled()) {
                kill(-pid, SIGKILL);
                result.cancelled = true;
                killed = true;
            } else if (std::chrono::steady_clock::now() >= deadline) {
                kill(-pid, SIGKILL);
                result.timed_out = true;
                killed = true;
            } else {
                poll(nullptr, 0, kPollSliceMs);
            }
        }
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    spdlog::debug("{} exited with {} after {} ms", spec.argv[0], result.exit_code, result.duration.count());
    return result;
}

} // namespace control
} // namespace vmsandbox
