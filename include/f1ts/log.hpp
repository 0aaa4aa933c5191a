#pragma once
#include <string>

namespace f1ts {

// Colour console logger with pattern "[%H:%M:%S.%e] [%^%l%$] %v" as the spdlog default.
// Unknown level names fall back to info (with a warning).
void init_logging(const std::string& level = "info");

} // namespace f1ts
