#pragma once

#include <string>

namespace platform {

enum class Platform { Windows, MacOS, Linux };

Platform current();
const char* name(Platform p);

// Binary name of the language server shipped for this OS and CPU.
std::string default_process_name(Platform p);

} // namespace platform
