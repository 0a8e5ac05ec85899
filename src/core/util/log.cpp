#include "core/util/log.hpp"

#include <memory>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace permaweb::util {

void init_logging(std::string_view level) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("permaweb", console_sink);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%^[%H:%M:%S.%e] [%l] %v%$");

  const spdlog::level::level_enum parsed = spdlog::level::from_str(std::string{level});
  if (parsed == spdlog::level::off && level != "off") {
    spdlog::set_level(spdlog::level::info);
    spdlog::warn("Unknown log level '{}', using info", level);
    return;
  }
  spdlog::set_level(parsed);
}

}  // namespace permaweb::util
