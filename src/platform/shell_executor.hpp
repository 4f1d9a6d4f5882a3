#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <string>

class ShellExecutor {
public:
    virtual ~ShellExecutor() = default;

    // Runs `command` through the system shell and returns its stdout.
    // A non-zero exit status, a spawn failure or hitting `timeout` is an error.
    virtual std::expected<std::string, std::string>
        run(const std::string& command, std::chrono::milliseconds timeout) = 0;
};

namespace platform {

// Executor for the host OS (POSIX /bin/sh or Windows cmd.exe).
std::unique_ptr<ShellExecutor> make_shell_executor();

} // namespace platform
