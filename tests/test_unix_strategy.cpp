#include <catch2/catch.hpp>

#include "platform/unix_strategy.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;

TEST_CASE("UnixStrategy", "[unix]") {
    FakeShell shell;

    SECTION("CandidateCommandExcludesGrepItself") {
        UnixStrategy s(platform::Platform::Linux, shell, 100ms);
        auto cmd = s.list_candidates_command("language_server_linux_x64");
        REQUIRE(cmd == "ps -A -ww -o pid,ppid,args | grep '[l]anguage_server_linux_x64'");
        REQUIRE(cmd.find("language_server_linux_x64") == std::string::npos);
    }

    SECTION("SignatureCommand") {
        UnixStrategy s(platform::Platform::MacOS, shell, 100ms);
        REQUIRE(s.list_signature_command("csrf_token") ==
                "ps -A -ww -o pid,ppid,args | grep '[c]srf_token'");
    }

    SECTION("ParseCandidates") {
        UnixStrategy s(platform::Platform::Linux, shell, 100ms);
        auto records = s.parse_candidates(
            "  4242     1 /opt/ls --extension_server_port=45000 --csrf_token=abc\n"
            "\n"
            "garbage line\n"
            "  77  4242 /usr/bin/other   with   spaces\n");
        REQUIRE(records.has_value());
        REQUIRE(records->size() == 2);
        REQUIRE((*records)[0].pid == 4242);
        REQUIRE((*records)[0].ppid == 1);
        REQUIRE((*records)[0].command_line ==
                "/opt/ls --extension_server_port=45000 --csrf_token=abc");
        REQUIRE((*records)[1].pid == 77);
        REQUIRE((*records)[1].command_line == "/usr/bin/other   with   spaces");
    }

    SECTION("EmptyOutputIsNoRecords") {
        UnixStrategy s(platform::Platform::Linux, shell, 100ms);
        auto records = s.parse_candidates("");
        REQUIRE(records.has_value());
        REQUIRE(records->empty());
    }

    SECTION("MacOSAlwaysUsesLsofWithoutProbing") {
        UnixStrategy s(platform::Platform::MacOS, shell, 100ms);
        REQUIRE(s.list_ports_command(4242) ==
                "lsof -nP -a -iTCP -sTCP:LISTEN -p 4242 2>/dev/null");
        REQUIRE(shell.commands.empty());
        REQUIRE_FALSE(s.tool_cache().probed());
    }

    SECTION("LinuxUsesFirstAvailableTool") {
        shell.on("command -v ss", std::string{});
        UnixStrategy s(platform::Platform::Linux, shell, 100ms);

        REQUIRE(s.list_ports_command(4242) == "ss -tlnp 2>/dev/null | grep \"pid=4242,\"");
        REQUIRE(shell.count("command -v lsof") == 1);
        REQUIRE(shell.count("command -v ss") == 1);
        REQUIRE(shell.count("command -v netstat") == 0);
    }

    SECTION("ToolChoiceIsMemoized") {
        shell.on("command -v netstat", std::string{});
        UnixStrategy s(platform::Platform::Linux, shell, 100ms);

        auto first = s.list_ports_command(1);
        auto second = s.list_ports_command(2);
        REQUIRE(first == "netstat -tulpn 2>/dev/null | grep -w 1");
        REQUIRE(second == "netstat -tulpn 2>/dev/null | grep -w 2");
        REQUIRE(shell.commands.size() == 3);
    }

    SECTION("NoToolFallsBackToChain") {
        UnixStrategy s(platform::Platform::Linux, shell, 100ms);
        auto cmd = s.list_ports_command(4242);
        REQUIRE(cmd.find("ss -tlnp") != std::string::npos);
        REQUIRE(cmd.find(" || lsof ") != std::string::npos);
        REQUIRE(cmd.find(" || netstat ") != std::string::npos);

        // "none found" is remembered as well
        s.list_ports_command(4243);
        REQUIRE(shell.commands.size() == 3);
    }

    SECTION("SeparateInstancesProbeSeparately") {
        shell.on("command -v lsof", std::string{});
        UnixStrategy a(platform::Platform::Linux, shell, 100ms);
        UnixStrategy b(platform::Platform::Linux, shell, 100ms);
        a.list_ports_command(1);
        b.list_ports_command(1);
        REQUIRE(shell.count("command -v lsof") == 2);
    }
}
