#include <catch2/catch.hpp>

#include "platform/windows_strategy.hpp"

TEST_CASE("WindowsStrategy", "[windows]") {
    WindowsStrategy s;

    SECTION("CandidateCommandFiltersByName") {
        auto cmd = s.list_candidates_command("language_server_windows_x64.exe");
        REQUIRE(cmd.starts_with("chcp 65001 >nul && powershell"));
        REQUIRE(cmd.find("$n = 'language_server_windows_x64.exe'") != std::string::npos);
        REQUIRE(cmd.find("Get-CimInstance Win32_Process -Filter $f") != std::string::npos);
        REQUIRE(cmd.find("Get-WmiObject") != std::string::npos);
        REQUIRE(cmd.find("ConvertTo-Json -Compress") != std::string::npos);
    }

    SECTION("ProcessNameQuotesAreEscaped") {
        auto cmd = s.list_candidates_command("it's.exe");
        REQUIRE(cmd.find("$n = 'it''s.exe'") != std::string::npos);
    }

    SECTION("SignatureCommandSearchesAllProcesses") {
        auto cmd = s.list_signature_command("csrf_token");
        REQUIRE(cmd.find("$sign = 'csrf_token'") != std::string::npos);
        REQUIRE(cmd.find("-Filter") == std::string::npos);
        REQUIRE(cmd.find("-match $sign") != std::string::npos);
    }

    SECTION("PortCommandQueriesOwningProcess") {
        auto cmd = s.list_ports_command(4242);
        REQUIRE(cmd.find("-OwningProcess 4242") != std::string::npos);
        REQUIRE(cmd.find("|| netstat -ano | findstr \"4242\"") != std::string::npos);
    }

    SECTION("JsonArray") {
        auto records = s.parse_candidates(
            R"([{"ProcessId":4242,"ParentProcessId":100,"CommandLine":"ls.exe --csrf_token=a"},)"
            R"({"ProcessId":4243,"ParentProcessId":100,"CommandLine":null}])");
        REQUIRE(records.has_value());
        REQUIRE(records->size() == 1);
        REQUIRE((*records)[0].pid == 4242);
        REQUIRE((*records)[0].ppid == 100);
        REQUIRE((*records)[0].command_line == "ls.exe --csrf_token=a");
    }

    SECTION("SingleObjectInsteadOfArray") {
        auto records = s.parse_candidates(
            R"({"ProcessId":4242,"ParentProcessId":100,"CommandLine":"ls.exe"})");
        REQUIRE(records.has_value());
        REQUIRE(records->size() == 1);
        REQUIRE((*records)[0].pid == 4242);
    }

    SECTION("BannerBeforePayload") {
        auto records = s.parse_candidates(
            "Active code page: 65001\r\n"
            "Loading personal profile {took 120ms}\r\n"
            R"([{"ProcessId":7,"ParentProcessId":1,"CommandLine":"ls.exe"}])"
            "\r\n");
        REQUIRE(records.has_value());
        REQUIRE(records->size() == 1);
        REQUIRE((*records)[0].pid == 7);
    }

    SECTION("NoMatchesIsEmptyNotError") {
        auto empty_array = s.parse_candidates("[]\r\n");
        REQUIRE(empty_array.has_value());
        REQUIRE(empty_array->empty());

        auto nothing = s.parse_candidates("  \r\n");
        REQUIRE(nothing.has_value());
        REQUIRE(nothing->empty());
    }

    SECTION("ZeroPidSkipped") {
        auto records = s.parse_candidates(
            R"([{"ProcessId":0,"ParentProcessId":0,"CommandLine":"System Idle"}])");
        REQUIRE(records.has_value());
        REQUIRE(records->empty());
    }

    SECTION("LegacyCsv") {
        auto records = s.parse_candidates(
            "\r\n"
            "Node,CommandLine,ParentProcessId,ProcessId\r\n"
            "DESKTOP,\"C:\\ls.exe\" --csrf_token=abc,--x=1,2,100,4242\r\n"
            "DESKTOP,,100,4243\r\n");
        REQUIRE(records.has_value());
        REQUIRE(records->size() == 1);
        REQUIRE((*records)[0].pid == 4242);
        REQUIRE((*records)[0].ppid == 100);
        REQUIRE((*records)[0].command_line == "\"C:\\ls.exe\" --csrf_token=abc,--x=1,2");
    }

    SECTION("CsvRowMentioningProcessIdIsKept") {
        auto records = s.parse_csv(
            "Node,CommandLine,ParentProcessId,ProcessId\r\n"
            "DESKTOP,C:\\ls.exe --processid=7 --csrf_token=abc,100,4242\r\n"
            "DESKTOP,C:\\other.exe --ProcessId 9,100,4243\r\n");
        REQUIRE(records.has_value());
        REQUIRE(records->size() == 2);
        REQUIRE((*records)[0].pid == 4242);
        REQUIRE((*records)[0].command_line == "C:\\ls.exe --processid=7 --csrf_token=abc");
        REQUIRE((*records)[1].pid == 4243);
    }

    SECTION("UnrecognizedOutputIsNull") {
        REQUIRE_FALSE(s.parse_candidates("Access is denied.\r\n").has_value());
        REQUIRE_FALSE(s.parse_csv("no commas here").has_value());
    }

    SECTION("PortsFromBothFormats") {
        auto ports = s.parse_ports(
            "45001\r\n"
            "  TCP    127.0.0.1:45000        0.0.0.0:0              LISTENING       4242\r\n",
            4242);
        REQUIRE(ports == std::vector<int>{45000, 45001});
    }
}
