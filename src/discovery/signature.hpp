#pragma once

#include "discovery/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace signature {

// Argument names the language server is launched with.
inline constexpr std::string_view kPortMarker = "--extension_server_port";
inline constexpr std::string_view kTokenMarker = "--csrf_token";
inline constexpr std::string_view kWorkspaceMarker = "--workspace_id";
inline constexpr std::string_view kAppDataMarker = "--app_data_dir";

// Substring every server command line contains, whatever the binary is called.
inline constexpr std::string_view kAmbientSignature = "csrf_token";

struct MatchOptions {
    // Require --app_data_dir to name the product.
    bool strict = true;
    std::string product_name = "antigravity";
};

// Value of `--name=value` / `--name value`, quotes stripped. Token charset only.
std::optional<std::string> argument_value(std::string_view command_line, std::string_view marker);

std::optional<ServerCandidate> extract(const ProcessRecord& record, const MatchOptions& options);

// Candidates in the order the records were enumerated.
std::vector<ServerCandidate> extract_all(const std::vector<ProcessRecord>& records,
                                         const MatchOptions& options);

} // namespace signature
