#include "platform/posix/posix_shell_executor.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <optional>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return status;
}

// Reaps the child unless it outlives `deadline`; std::nullopt on timeout.
std::optional<int> wait_child_until(pid_t pid, std::chrono::steady_clock::time_point deadline) {
    int status = 0;
    while (true) {
        pid_t ret = ::waitpid(pid, &status, WNOHANG);
        if (ret == pid) return status;
        if (ret < 0 && errno != EINTR) return -1;
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

} // namespace

std::expected<std::string, std::string>
PosixShellExecutor::run(const std::string& command, std::chrono::milliseconds timeout) {
    int pipefd[2];
    if (::pipe(pipefd) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(errno_message("fork()"));
    }

    if (pid == 0) {
        // Child: own process group, stdout into the pipe, stderr discarded
        ::setpgid(0, 0);
        ::close(pipefd[0]);
        ::dup2(pipefd[1], STDOUT_FILENO);
        ::close(pipefd[1]);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    // Parent: avoid racing the child's own setpgid
    ::setpgid(pid, pid);
    ::close(pipefd[1]);

    std::string output;
    std::array<char, 4096> buf{};
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timed_out = false;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        pollfd pfd{.fd = pipefd[0], .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) {
            timed_out = true;
            break;
        }

        ssize_t n = ::read(pipefd[0], buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break; // EOF
        output.append(buf.data(), static_cast<size_t>(n));
    }
    ::close(pipefd[0]);

    // stdout may close long before the command exits
    std::optional<int> reaped;
    if (!timed_out) {
        reaped = wait_child_until(pid, deadline);
        timed_out = !reaped;
    }

    if (timed_out) {
        ::kill(-pid, SIGKILL);
        wait_child(pid);
        return std::unexpected(std::format("timed out after {}ms", timeout.count()));
    }

    int status = *reaped;
    if (status < 0) {
        return std::unexpected(errno_message("waitpid()"));
    }
    if (WIFSIGNALED(status)) {
        return std::unexpected("killed by signal " + std::to_string(WTERMSIG(status)));
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected("exited with code " + std::to_string(WEXITSTATUS(status)));
    }

    return output;
}
