#include <catch2/catch.hpp>

#include "platform/wsl.hpp"
#include "fakes.hpp"

using platform::Platform;

TEST_CASE("WSL detection", "[wsl]") {
    const std::string wsl2 =
        "Linux version 5.15.167.4-microsoft-standard-WSL2 (root@1) (gcc 11.2.0) #1 SMP\n";
    const std::string wsl1 = "Linux version 4.4.0-19041-Microsoft (Microsoft@Microsoft.com)\n";
    const std::string only_wsl = "Linux version 6.6.0-custom-wsl #1 SMP\n";
    const std::string native = "Linux version 6.8.0-45-generic (buildd@lcy02) #45-Ubuntu SMP\n";

    SECTION("KernelSignatures") {
        REQUIRE(wsl::is_wsl_kernel(Platform::Linux, wsl2));
        REQUIRE(wsl::is_wsl_kernel(Platform::Linux, wsl1));
        REQUIRE(wsl::is_wsl_kernel(Platform::Linux, only_wsl));
        REQUIRE_FALSE(wsl::is_wsl_kernel(Platform::Linux, native));
        REQUIRE_FALSE(wsl::is_wsl_kernel(Platform::Linux, ""));
    }

    SECTION("NeverOutsideLinux") {
        REQUIRE_FALSE(wsl::is_wsl_kernel(Platform::Windows, wsl2));
        REQUIRE_FALSE(wsl::is_wsl_kernel(Platform::MacOS, wsl2));
    }

    SECTION("ResolverReadsVersionFile") {
        TmpFile version(wsl2);
        WslBridgeResolver linux_resolver(Platform::Linux, version.path, "/nonexistent");
        REQUIRE(linux_resolver.is_wsl());

        WslBridgeResolver mac_resolver(Platform::MacOS, version.path, "/nonexistent");
        REQUIRE_FALSE(mac_resolver.is_wsl());
    }

    SECTION("MissingVersionFileIsNotWsl") {
        WslBridgeResolver r(Platform::Linux, "/nonexistent/version", "/nonexistent");
        REQUIRE_FALSE(r.is_wsl());
    }
}

TEST_CASE("WSL host bridge address", "[wsl]") {

    SECTION("FirstNameserver") {
        REQUIRE(wsl::first_nameserver("nameserver 192.168.1.1\n") == "192.168.1.1");
        REQUIRE(wsl::first_nameserver(
                    "# This file was automatically generated by WSL.\n"
                    "# nameserver 10.0.0.9\n"
                    "search lan\n"
                    "nameserver 172.29.16.1\n"
                    "nameserver 8.8.8.8\n") == "172.29.16.1");
    }

    SECTION("NoNameserverLine") {
        REQUIRE_FALSE(wsl::first_nameserver("search lan\noptions ndots:0\n").has_value());
        REQUIRE_FALSE(wsl::first_nameserver("nameserver fe80::1\n").has_value());
        REQUIRE_FALSE(wsl::first_nameserver("").has_value());
    }

    SECTION("ResolverReadsResolvConf") {
        TmpFile resolv("nameserver 172.29.16.1\n");
        WslBridgeResolver r(Platform::Linux, "/nonexistent", resolv.path);
        REQUIRE(r.host_bridge_address() == "172.29.16.1");
    }

    SECTION("UnreadableResolvConf") {
        WslBridgeResolver r(Platform::Linux, "/nonexistent", "/nonexistent/resolv.conf");
        REQUIRE_FALSE(r.host_bridge_address().has_value());
    }
}
