#include <catch2/catch.hpp>

#include "discovery/ambient_discovery.hpp"
#include "platform/unix_strategy.hpp"
#include "platform/windows_strategy.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;
using platform::Platform;

TEST_CASE("AmbientDiscovery", "[ambient]") {
    FakeShell shell;
    FakeGateway gateway;
    WslBridgeResolver native(Platform::Linux, "/nonexistent/version", "/nonexistent/resolv");
    Config cfg;

    SECTION("SkipsCandidatesWithoutPortsAndContinues") {
        UnixStrategy strategy(Platform::Linux, shell, 100ms);
        shell.on("command -v lsof", std::string{});
        shell.on("[c]srf_token",
                 std::string("11 1 helper --extension_server_port --csrf_token=t1\n"
                             "12 1 unrelated --csrf_token=t9\n"
                             "13 1 ls --extension_server_port --csrf_token=t2\n"));
        shell.on("-p 13", std::string("ls 13 u 10u IPv4 0x1 0t0 TCP 127.0.0.1:45013 (LISTEN)\n"));
        gateway.accept("127.0.0.1", 45013, "t2");

        AmbientDiscovery ambient(cfg, strategy, shell, gateway, native);
        auto candidates = ambient.locate();
        REQUIRE(candidates.size() == 2);

        auto result = ambient.run();
        REQUIRE(result.found());
        REQUIRE(result.candidate->pid == 13);
        REQUIRE(result.endpoint->port == 45013);
        REQUIRE(result.attempts == 1);
        REQUIRE(gateway.calls.size() == 1);
    }

    SECTION("SinglePassWhenNothingFound") {
        UnixStrategy strategy(Platform::Linux, shell, 100ms);
        AmbientDiscovery ambient(cfg, strategy, shell, gateway, native);
        auto result = ambient.run();

        REQUIRE_FALSE(result.found());
        REQUIRE(result.probes.empty());
        REQUIRE(shell.count("[c]srf_token") == 1);
    }

    SECTION("WindowsJsonPayload") {
        WindowsStrategy strategy;
        WslBridgeResolver windows(Platform::Windows);
        shell.on("$sign = 'csrf_token'",
                 std::string(R"({"ProcessId":900,"ParentProcessId":4,"CommandLine":)"
                             R"("C:\\ide\\ls.exe --extension_server_port=45900 --csrf_token=w1"})"));
        gateway.accept("127.0.0.1", 45900, "w1");

        AmbientDiscovery ambient(cfg, strategy, shell, gateway, windows);
        auto result = ambient.run();
        REQUIRE(result.found());
        REQUIRE(result.candidate->pid == 900);
        REQUIRE(result.endpoint->host == "127.0.0.1");
    }
}
