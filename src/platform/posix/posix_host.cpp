#include "platform/os_version.hpp"
#include "platform/posix/posix_shell_executor.hpp"

#include <fstream>
#include <sstream>
#include <sys/utsname.h>

namespace platform {

std::unique_ptr<ShellExecutor> make_shell_executor() {
    return std::make_unique<PosixShellExecutor>();
}

HostInfo host_info() {
    HostInfo info;
    info.os = current();

    utsname uts{};
    if (::uname(&uts) == 0) {
        info.release = uts.release;
        info.arch = uts.machine;
    }

    if (info.os == Platform::Linux) {
        std::ifstream f("/etc/os-release");
        if (f.is_open()) {
            std::stringstream ss;
            ss << f.rdbuf();
            info.distro = pretty_name(ss.str());
        }
    }
    return info;
}

} // namespace platform
