#pragma once

#include <string>

namespace platform {

// Per-user configuration directory, empty when it cannot be determined.
std::string config_dir();

} // namespace platform
