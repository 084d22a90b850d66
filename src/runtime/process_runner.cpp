#include "runtime/process_runner.hpp"

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include "protocol/command_contract.hpp"

namespace cmdgate::runtime {

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

// Reads what is available; bytes past `limit` are read and dropped.
void drain_pipe(int& fd, std::string& out, const std::size_t limit, bool& truncated) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const auto count = static_cast<std::size_t>(n);
            const std::size_t room = out.size() < limit ? limit - out.size() : 0;
            if (count > room) {
                truncated = true;
            }
            out.append(buffer, count < room ? count : room);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        close_fd(fd);
        return;
    }
}

// Writes as much pending stdin as the pipe accepts; closes it when done.
void feed_stdin(int& fd, const std::string& text, std::size_t& offset) {
    if (fd < 0) {
        return;
    }
    while (offset < text.size()) {
        const ssize_t n = write(fd, text.data() + offset, text.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        break;  // EPIPE: the child stopped reading
    }
    close_fd(fd);
}

void close_pair(int pipe_fds[2]) {
    close_fd(pipe_fds[0]);
    close_fd(pipe_fds[1]);
}

}  // namespace

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    if (request.cancel_token && request.cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Command cancelled before start.";
        return capture;
    }

    // A child that exits before reading its stdin must not kill us.
    static const bool kSigpipeIgnored = [] {
        std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    static_cast<void>(kSigpipeIgnored);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int stdin_pipe[2] = {-1, -1};
    // Close-on-exec so children forked concurrently by other workers never
    // inherit these ends and hold our EOF back.
    const bool pipes_ok =
        pipe2(stdout_pipe, O_CLOEXEC) == 0 && pipe2(stderr_pipe, O_CLOEXEC) == 0 &&
        (!request.stdin_text.has_value() || pipe2(stdin_pipe, O_CLOEXEC) == 0);
    if (!pipes_ok) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(stdin_pipe);
        return core::errors::GateError{core::errors::ErrorCategory::Internal,
                                       "Failed to create process pipes.",
                                       "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(stdin_pipe);
        return core::errors::GateError{core::errors::ErrorCategory::Internal,
                                       "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (chdir(request.working_directory.c_str()) != 0) {
            _exit(126);
        }
        if (stdin_pipe[0] >= 0) {
            static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        } else {
            const int null_fd = open("/dev/null", O_RDONLY);
            if (null_fd >= 0) {
                static_cast<void>(dup2(null_fd, STDIN_FILENO));
                static_cast<void>(close(null_fd));
            }
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(stdin_pipe);
        std::signal(SIGPIPE, SIG_DFL);
        execl("/bin/sh", "sh", "-c", request.command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    // Set on both sides so kill(-pid) works whichever runs first.
    static_cast<void>(setpgid(pid, pid));

    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(stdin_pipe[0]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);
    if (stdin_pipe[1] >= 0) {
        set_nonblocking(stdin_pipe[1]);
    }

    ProcessCapture capture;
    const std::string stdin_text = request.stdin_text.value_or("");
    std::size_t stdin_offset = 0;
    bool child_exited = false;
    int status = 0;

    while (stdout_pipe[0] >= 0 || stderr_pipe[0] >= 0 || !child_exited) {
        if (request.cancel_token && request.cancel_token->load() && !child_exited &&
            !capture.cancelled) {
            capture.cancelled = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!capture.timed_out && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms) && !child_exited) {
            capture.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (stdout_pipe[0] >= 0) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_pipe[0] >= 0) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stdin_pipe[1] >= 0) {
            fds[nfds].fd = stdin_pipe[1];
            fds[nfds].events = POLLOUT;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        feed_stdin(stdin_pipe[1], stdin_text, stdin_offset);
        drain_pipe(stdout_pipe[0], capture.stdout_text, request.max_output_bytes,
                   capture.stdout_truncated);
        drain_pipe(stderr_pipe[0], capture.stderr_text, request.max_output_bytes,
                   capture.stderr_truncated);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                close_fd(stdin_pipe[1]);
            }
        }

        // Pipes still held by a leftover background job of the group.
        const bool overdue = request.timeout_ms > 0 &&
                             elapsed > static_cast<std::int64_t>(request.timeout_ms);
        if (child_exited && (capture.timed_out || capture.cancelled || overdue)) {
            static_cast<void>(kill(-pid, SIGKILL));
            close_fd(stdout_pipe[0]);
            close_fd(stderr_pipe[0]);
        }
    }

    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }
    close_fd(stdin_pipe[1]);

    if (capture.timed_out) {
        capture.exit_code = protocol::kTimeoutExitCode;
    } else if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    capture.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return capture;
}

}  // namespace cmdgate::runtime
