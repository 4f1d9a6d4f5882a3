#include "platform/platform_strategy.hpp"

#include "platform/unix_strategy.hpp"
#include "platform/windows_strategy.hpp"

std::unique_ptr<PlatformStrategy> make_strategy(platform::Platform os, ShellExecutor& shell,
                                                std::chrono::milliseconds tool_probe_timeout) {
    if (os == platform::Platform::Windows) {
        return std::make_unique<WindowsStrategy>();
    }
    return std::make_unique<UnixStrategy>(os, shell, tool_probe_timeout);
}
