#include <f1ts/log.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace f1ts {

void init_logging(const std::string& level) {
  auto logger = spdlog::get("f1ts");
  if (!logger) logger = spdlog::stdout_color_mt("f1ts");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  const auto lvl = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  if (lvl == spdlog::level::off && level != "off") {
    spdlog::set_level(spdlog::level::info);
    spdlog::warn("unknown log level '{}', using info", level);
    return;
  }
  spdlog::set_level(lvl);
}

} // namespace f1ts
