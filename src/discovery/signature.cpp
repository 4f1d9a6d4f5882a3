#include "discovery/signature.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>

namespace signature {

namespace {

std::string to_lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// 0 when missing or not a valid TCP port.
int extract_port(const std::string& command_line) {
    static const std::regex re(R"(--extension_server_port[=\s]+["']?(\d+))");
    std::smatch m;
    if (!std::regex_search(command_line, m, re)) return 0;

    auto digits = m[1].str();
    int port = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), port);
    if (ec != std::errc{} || port <= 0 || port > 65535) return 0;
    return port;
}

// --app_data_dir takes a path, so the value runs to the next quote or space.
std::optional<std::string> app_data_dir(const std::string& command_line) {
    static const std::regex re(R"re(--app_data_dir[=\s]+(?:"([^"]*)"|'([^']*)'|(\S+)))re");
    std::smatch m;
    if (!std::regex_search(command_line, m, re)) return std::nullopt;
    for (size_t i = 1; i <= 3; i++) {
        if (m[i].matched) return m[i].str();
    }
    return std::nullopt;
}

std::string value_pattern(std::string_view marker) {
    static const std::regex special(R"([.^$|()\[\]{}*+?\\])");
    std::string escaped = std::regex_replace(std::string(marker), special, R"(\$&)");
    // A leading '-' would be the next flag, not a value.
    return escaped + R"re([=\s]+["']?([A-Za-z0-9_.][A-Za-z0-9\-_.]*)["']?)re";
}

std::optional<std::string> search_value(const std::string& text, const std::regex& re) {
    std::smatch m;
    if (!std::regex_search(text, m, re)) return std::nullopt;
    return m[1].str();
}

} // namespace

std::optional<std::string> argument_value(std::string_view command_line, std::string_view marker) {
    std::string text(command_line);
    if (marker == kTokenMarker) {
        static const std::regex re(value_pattern(kTokenMarker));
        return search_value(text, re);
    }
    if (marker == kWorkspaceMarker) {
        static const std::regex re(value_pattern(kWorkspaceMarker));
        return search_value(text, re);
    }
    return search_value(text, std::regex(value_pattern(marker)));
}

std::optional<ServerCandidate> extract(const ProcessRecord& record, const MatchOptions& options) {
    const auto& cmd = record.command_line;
    if (cmd.find(kPortMarker) == std::string::npos ||
        cmd.find(kTokenMarker) == std::string::npos) {
        return std::nullopt;
    }

    auto token = argument_value(cmd, kTokenMarker);
    if (!token || token->empty()) return std::nullopt;

    if (options.strict) {
        auto dir = app_data_dir(cmd);
        if (!dir || to_lower(*dir).find(to_lower(options.product_name)) == std::string::npos) {
            return std::nullopt;
        }
    }

    return ServerCandidate{
        .pid = record.pid,
        .ppid = record.ppid,
        .port = extract_port(cmd),
        .token = std::move(*token),
        .workspace_id = argument_value(cmd, kWorkspaceMarker),
    };
}

std::vector<ServerCandidate> extract_all(const std::vector<ProcessRecord>& records,
                                         const MatchOptions& options) {
    std::vector<ServerCandidate> candidates;
    for (const auto& record : records) {
        if (record.pid <= 0) continue;
        if (auto c = extract(record, options)) candidates.push_back(std::move(*c));
    }
    return candidates;
}

} // namespace signature
