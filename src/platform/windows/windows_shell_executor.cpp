#include "platform/windows/windows_shell_executor.hpp"

#include <array>
#include <format>
#include <vector>

#define WIN32_LEAN_AND_MEAN
#include <windows.h>

namespace {

std::string last_error(const char* what) {
    return std::format("{} failed: error {}", what, ::GetLastError());
}

// Moves whatever is buffered in the pipe into `out` without blocking.
void drain(HANDLE pipe, std::string& out) {
    std::array<char, 4096> buf{};
    DWORD available = 0;
    while (::PeekNamedPipe(pipe, nullptr, 0, nullptr, &available, nullptr) && available > 0) {
        DWORD n = 0;
        DWORD want = available < buf.size() ? available : static_cast<DWORD>(buf.size());
        if (!::ReadFile(pipe, buf.data(), want, &n, nullptr) || n == 0) return;
        out.append(buf.data(), n);
    }
}

} // namespace

std::expected<std::string, std::string>
WindowsShellExecutor::run(const std::string& command, std::chrono::milliseconds timeout) {
    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE read_end = nullptr;
    HANDLE write_end = nullptr;
    if (!::CreatePipe(&read_end, &write_end, &sa, 0)) {
        return std::unexpected(last_error("CreatePipe"));
    }
    ::SetHandleInformation(read_end, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdOutput = write_end;
    si.hStdError = nullptr;
    si.hStdInput = nullptr;

    std::string cmdline = "cmd.exe /d /s /c \"" + command + "\"";
    std::vector<char> mutable_cmd(cmdline.begin(), cmdline.end());
    mutable_cmd.push_back('\0');

    PROCESS_INFORMATION pi{};
    if (!::CreateProcessA(nullptr, mutable_cmd.data(), nullptr, nullptr, TRUE,
                          CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi)) {
        auto err = last_error("CreateProcess");
        ::CloseHandle(read_end);
        ::CloseHandle(write_end);
        return std::unexpected(err);
    }
    ::CloseHandle(write_end);
    ::CloseHandle(pi.hThread);

    std::string output;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timed_out = false;

    while (true) {
        drain(read_end, output);
        if (::WaitForSingleObject(pi.hProcess, 50) == WAIT_OBJECT_0) break;
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }
    }

    if (timed_out) {
        ::TerminateProcess(pi.hProcess, 1);
        ::WaitForSingleObject(pi.hProcess, 1000);
    }
    drain(read_end, output);

    DWORD exit_code = 0;
    ::GetExitCodeProcess(pi.hProcess, &exit_code);
    ::CloseHandle(pi.hProcess);
    ::CloseHandle(read_end);

    if (timed_out) {
        return std::unexpected(std::format("timed out after {}ms", timeout.count()));
    }
    if (exit_code != 0) {
        return std::unexpected(std::format("exited with code {}", exit_code));
    }
    return output;
}
