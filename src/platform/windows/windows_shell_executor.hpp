#pragma once

#include "platform/shell_executor.hpp"

// Runs commands with cmd.exe /d /s /c, capturing stdout through an
// anonymous pipe. A command that outlives its timeout is terminated.
class WindowsShellExecutor : public ShellExecutor {
public:
    std::expected<std::string, std::string>
        run(const std::string& command, std::chrono::milliseconds timeout) override;
};
