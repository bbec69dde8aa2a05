#include "exec/process_executor.hpp"

#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

using Clock = std::chrono::steady_clock;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags >= 0) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

/// Kill the child's whole process group and reap the child
void kill_and_reap(pid_t pid) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
    int status;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

/// Drain everything currently readable from fd. Returns false once the
/// write end is closed.
bool drain(int fd, OutputStream stream, ExecutionResult& result, const OutputSink& sink) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            std::string chunk(buf, static_cast<size_t>(n));
            result.output += chunk;
            if (sink) sink(stream, chunk);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

} // namespace

ProcessExecutor::ProcessExecutor(std::string shell) : shell_(std::move(shell)) {}

ExecutionResult ProcessExecutor::run(const std::string& command,
                                     int timeout_ms,
                                     const OutputSink& sink) const {
    ExecutionResult result;
    result.command = command;
    if (timeout_ms <= 0) timeout_ms = kDefaultTimeoutMs;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // reports exec failure; closed by a successful exec

    auto fail_spawn = [&](const std::string& what) {
        result.success = false;
        result.error = what + ": " + std::strerror(errno);
        result.output = result.error;
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    };

    if (pipe(out_pipe) != 0) return fail_spawn("pipe failed");
    if (pipe(err_pipe) != 0) return fail_spawn("pipe failed");
    if (pipe(exec_pipe) != 0) return fail_spawn("pipe failed");
    set_cloexec(exec_pipe[1]);

    pid_t pid = fork();
    if (pid < 0) {
        return fail_spawn("fork failed");
    }

    if (pid == 0) {
        // Child: own process group so a timeout can take down everything it spawned
        setpgid(0, 0);

        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        close(exec_pipe[0]);

        execl(shell_.c_str(), shell_.c_str(), "-c", command.c_str(), static_cast<char*>(nullptr));

        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        result.success = false;
        result.error = "Failed to start " + shell_ + ": " + std::strerror(exec_errno);
        result.output = result.error;
        return result;
    }

    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    bool timed_out = false;

    while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms <= 0) {
            timed_out = true;
            break;
        }

        struct pollfd fds[2];
        int nfds = 0;
        int* owners[2];
        OutputStream streams[2];
        if (out_pipe[0] >= 0) {
            fds[nfds] = {out_pipe[0], POLLIN, 0};
            owners[nfds] = &out_pipe[0];
            streams[nfds] = OutputStream::Stdout;
            ++nfds;
        }
        if (err_pipe[0] >= 0) {
            fds[nfds] = {err_pipe[0], POLLIN, 0};
            owners[nfds] = &err_pipe[0];
            streams[nfds] = OutputStream::Stderr;
            ++nfds;
        }

        int ret = poll(fds, static_cast<nfds_t>(nfds), wait_ms < 100 ? wait_ms : 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;

        for (int i = 0; i < nfds; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                if (!drain(fds[i].fd, streams[i], result, sink)) {
                    close_fd(*owners[i]);
                }
            }
        }
    }

    int status = 0;
    bool reaped = false;
    while (!timed_out) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
            break;
        }
        if (w < 0 && errno != EINTR) {
            break;
        }
        if (remaining_ms(deadline) <= 0) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    if (timed_out) {
        kill_and_reap(pid);
        result.success = false;
        result.timed_out = true;
        result.exit_code = -1;
        result.error = "Timeout exceeded";
        return result;
    }

    if (!reaped) {
        result.success = false;
        result.error = std::string("waitpid failed: ") + std::strerror(errno);
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.error = "Terminated by signal " + std::to_string(WTERMSIG(status));
    }
    result.success = WIFEXITED(status) && result.exit_code == 0;
    return result;
}
