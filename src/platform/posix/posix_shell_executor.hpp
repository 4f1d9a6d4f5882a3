#pragma once

#include "platform/shell_executor.hpp"

// Runs commands with /bin/sh -c in their own process group so that a
// timed-out pipeline is killed as a whole.
class PosixShellExecutor : public ShellExecutor {
public:
    std::expected<std::string, std::string>
        run(const std::string& command, std::chrono::milliseconds timeout) override;
};
