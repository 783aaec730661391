#include "process/posix_process_runner.hpp"

#include <chrono>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace gitmcp::process {

using core::errors::ErrorCategory;
using core::errors::GitMcpError;

namespace {

// Written by the child to the status pipe when it cannot reach exec.
struct LaunchFailure {
    enum Stage : int { EnterDirectory = 1, Exec = 2 };
    int stage = 0;
    int error_number = 0;
};

void close_pipe(int fds[2]) {
    if (fds[0] != -1) {
        static_cast<void>(close(fds[0]));
        fds[0] = -1;
    }
    if (fds[1] != -1) {
        static_cast<void>(close(fds[1]));
        fds[1] = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
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
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

[[noreturn]] void fail_in_child(const int status_fd, const int stage,
                                const int exit_code) {
    LaunchFailure failure;
    failure.stage = stage;
    failure.error_number = errno;
    static_cast<void>(write(status_fd, &failure, sizeof(failure)));
    _exit(exit_code);
}

// Blocks until the child either execs (pipe closes via O_CLOEXEC) or reports
// why it could not.
bool read_launch_failure(const int status_fd, LaunchFailure& failure) {
    while (true) {
        const ssize_t n = read(status_fd, &failure, sizeof(failure));
        if (n == static_cast<ssize_t>(sizeof(failure))) {
            return true;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return false;
    }
}

int wait_for_exit(const pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

core::errors::Result<ExecutionResult> PosixProcessRunner::run(
    const CommandInvocation& invocation) {
    if (invocation.program.empty()) {
        return GitMcpError{ErrorCategory::Input, "Program name cannot be empty.",
                           "launch_failed"};
    }

    std::vector<std::string> argv_storage;
    argv_storage.reserve(invocation.arguments.size() + 1);
    argv_storage.push_back(invocation.program);
    for (const auto& argument : invocation.arguments) {
        argv_storage.push_back(argument);
    }
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const std::string cwd = invocation.working_directory.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        return GitMcpError{ErrorCategory::Internal,
                           "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        return GitMcpError{ErrorCategory::Internal, "Failed to fork process.",
                           "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(close(status_pipe[0]));
        if (chdir(cwd.c_str()) != 0) {
            fail_in_child(status_pipe[1], LaunchFailure::EnterDirectory, 126);
        }
        const int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd != -1) {
            static_cast<void>(dup2(null_fd, STDIN_FILENO));
            static_cast<void>(close(null_fd));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        execvp(argv[0], argv.data());
        fail_in_child(status_pipe[1], LaunchFailure::Exec, 127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(status_pipe[1]));

    LaunchFailure failure;
    const bool launch_failed = read_launch_failure(status_pipe[0], failure);
    static_cast<void>(close(status_pipe[0]));
    if (launch_failed) {
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(wait_for_exit(pid));

        const std::string reason =
            std::generic_category().message(failure.error_number);
        if (failure.stage == LaunchFailure::EnterDirectory) {
            return GitMcpError{ErrorCategory::Execution,
                               "Cannot use working directory '" + cwd + "': " + reason,
                               "invalid_working_directory"};
        }
        return GitMcpError{ErrorCategory::Execution,
                           "Failed to launch '" + invocation.program + "': " + reason,
                           "launch_failed",
                           "Check that the program is installed and on PATH."};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ExecutionResult capture;
    bool stdout_open = true;
    bool stderr_open = true;

    while (stdout_open || stderr_open) {
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

        static_cast<void>(poll(fds, nfds, -1));

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);
    }

    capture.exit_code = wait_for_exit(pid);

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace gitmcp::process
