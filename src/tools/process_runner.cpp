#include "tools/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <vector>
#include "core/logging/logger.hpp"

namespace gemini_mcp::tools {

using core::errors::ErrorCategory;
using core::errors::ServerError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void set_cloexec(const int fd) {
    const int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void drain_pipe(int& fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            close_fd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        close_fd(fd);
        return;
    }
}

// Blocks until the child either execs (EOF on the CLOEXEC pipe) or reports
// the errno of a failed exec. Returns 0 on a successful exec.
int await_exec_status(const int fd) {
    char buffer[sizeof(int)];
    std::size_t received = 0;
    while (received < sizeof(buffer)) {
        const ssize_t n = read(fd, buffer + received, sizeof(buffer) - received);
        if (n > 0) {
            received += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    if (received != sizeof(buffer)) {
        return 0;
    }
    int child_errno = 0;
    std::memcpy(&child_errno, buffer, sizeof(child_errno));
    return child_errno;
}

// Once the child is reaped its pid may be reused, so only the group is
// signalled; the group lives on while any descendant does.
void kill_process_group(const pid_t pid, const bool child_reaped) {
    if (kill(-pid, SIGKILL) != 0 && !child_reaped) {
        static_cast<void>(kill(pid, SIGKILL));
    }
}

std::string describe_errno(const int error_number) {
    return std::system_category().message(error_number);
}

}  // namespace

core::errors::Result<ProcessCapture> PosixProcessRunner::run(
    const ProcessRequest& request) const {
    if (request.executable.empty()) {
        return ServerError{ErrorCategory::Input, "Executable cannot be empty.",
                           "empty_executable"};
    }

    if (request.cancel_token && request.cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Command cancelled before start.";
        return capture;
    }

    // argv is built before fork(); the child must not allocate.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(request.arguments.size() + 1);
    argv_storage.push_back(request.executable);
    for (const auto& argument : request.arguments) {
        argv_storage.push_back(argument);
    }
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& argument : argv_storage) {
        argv.push_back(argument.data());
    }
    argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 || pipe(exec_pipe) != 0) {
        const int saved_errno = errno;
        for (int* fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0],
                        &stderr_pipe[1], &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
        return ServerError{ErrorCategory::Internal,
                           "Failed to create process pipes: " +
                               describe_errno(saved_errno),
                           "pipe_creation_failed"};
    }
    for (const int fd : {stdout_pipe[0], stderr_pipe[0], exec_pipe[0], exec_pipe[1]}) {
        set_cloexec(fd);
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const int saved_errno = errno;
        for (int* fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0],
                        &stderr_pipe[1], &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
        return ServerError{ErrorCategory::Internal,
                           "Failed to fork process: " + describe_errno(saved_errno),
                           "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        const int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            static_cast<void>(dup2(null_fd, STDIN_FILENO));
            static_cast<void>(close(null_fd));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(exec_pipe[0]));

        struct sigaction default_action {};
        default_action.sa_handler = SIG_DFL;
        static_cast<void>(sigaction(SIGPIPE, &default_action, nullptr));
        execvp(argv[0], argv.data());

        const int exec_errno = errno;
        static_cast<void>(write(exec_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    const int exec_errno = await_exec_status(exec_pipe[0]);
    close_fd(exec_pipe[0]);
    if (exec_errno != 0) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        return ServerError{ErrorCategory::Execution,
                           "Failed to launch '" + request.executable +
                               "': " + describe_errno(exec_errno),
                           "process_launch_failed"};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        // Checked even after the child exits: a background descendant can
        // hold the pipes open long after its parent is gone.
        if (request.cancel_token && request.cancel_token->load() &&
            !capture.cancelled && !capture.timed_out) {
            capture.cancelled = true;
            kill_process_group(pid, child_exited);
        }

        const auto now = std::chrono::steady_clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 now - started)
                                 .count();
        if (!capture.timed_out && !capture.cancelled && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms)) {
            capture.timed_out = true;
            LOG_DEBUG("Process " + std::to_string(pid) + " exceeded " +
                      std::to_string(request.timeout_ms) + "ms, killing");
            kill_process_group(pid, child_exited);
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // A killed child may leave a descendant holding the pipes open.
        if (child_exited && (capture.timed_out || capture.cancelled)) {
            break;
        }
    }

    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }
    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace gemini_mcp::tools
