#include "platform/os_version.hpp"
#include "platform/windows/windows_shell_executor.hpp"

#include <format>

#define WIN32_LEAN_AND_MEAN
#include <windows.h>

namespace platform {

std::unique_ptr<ShellExecutor> make_shell_executor() {
    return std::make_unique<WindowsShellExecutor>();
}

HostInfo host_info() {
    HostInfo info;
    info.os = Platform::Windows;

    // GetVersionEx lies to unmanifested processes; ntdll does not.
    using RtlGetVersionFn = LONG(WINAPI*)(OSVERSIONINFOW*);
    if (HMODULE ntdll = ::GetModuleHandleW(L"ntdll.dll")) {
        auto fn = reinterpret_cast<RtlGetVersionFn>(::GetProcAddress(ntdll, "RtlGetVersion"));
        OSVERSIONINFOW v{};
        v.dwOSVersionInfoSize = sizeof(v);
        if (fn && fn(&v) == 0) {
            info.release = std::format("{}.{}.{}", v.dwMajorVersion, v.dwMinorVersion,
                                       v.dwBuildNumber);
        }
    }

    SYSTEM_INFO si{};
    ::GetNativeSystemInfo(&si);
    switch (si.wProcessorArchitecture) {
        case PROCESSOR_ARCHITECTURE_AMD64: info.arch = "x86_64"; break;
        case PROCESSOR_ARCHITECTURE_ARM64: info.arch = "arm64"; break;
        case PROCESSOR_ARCHITECTURE_INTEL: info.arch = "x86"; break;
        default: info.arch = "unknown"; break;
    }
    return info;
}

} // namespace platform
