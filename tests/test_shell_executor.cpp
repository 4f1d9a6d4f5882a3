#include <catch2/catch.hpp>

#include "platform/posix/posix_shell_executor.hpp"
#include "platform/port_tool_cache.hpp"

#include <chrono>

using namespace std::chrono_literals;

TEST_CASE("PosixShellExecutor", "[shell]") {
    PosixShellExecutor shell;

    SECTION("CapturesStdout") {
        auto out = shell.run("printf 'a\\nb\\n'", 2000ms);
        REQUIRE(out.has_value());
        REQUIRE(*out == "a\nb\n");
    }

    SECTION("PipelinesRunThroughShell") {
        auto out = shell.run("printf '1 one\\n2 two\\n' | grep '[t]wo'", 2000ms);
        REQUIRE(out.has_value());
        REQUIRE(*out == "2 two\n");
    }

    SECTION("StderrNotCaptured") {
        auto out = shell.run("echo visible; echo hidden 1>&2", 2000ms);
        REQUIRE(out.has_value());
        REQUIRE(*out == "visible\n");
    }

    SECTION("NonZeroExitIsError") {
        auto out = shell.run("exit 3", 2000ms);
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error() == "exited with code 3");
    }

    SECTION("TimeoutKillsCommand") {
        auto start = std::chrono::steady_clock::now();
        auto out = shell.run("sleep 10 | cat", 200ms);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().find("timed out") != std::string::npos);
        REQUIRE(elapsed < 5s);
    }

    SECTION("TimeoutAfterStdoutClosed") {
        auto start = std::chrono::steady_clock::now();
        auto out = shell.run("exec >/dev/null; sleep 3", 200ms);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error() == "timed out after 200ms");
        REQUIRE(elapsed < 2s);
    }

    SECTION("ToolProbeAgainstRealShell") {
        PortToolCache cache(shell, 1000ms);
        REQUIRE_FALSE(cache.probed());
        auto first = cache.tool();
        REQUIRE(cache.probed());
        REQUIRE(cache.tool() == first);
    }
}
