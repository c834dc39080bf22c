#include <labelcheck/app/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <string>

namespace labelcheck::app {

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view level) {
  std::string lowered(level);
  for (char& c : lowered) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (lowered == "trace") return spdlog::level::trace;
  if (lowered == "debug") return spdlog::level::debug;
  if (lowered == "info") return spdlog::level::info;
  if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
  if (lowered == "error") return spdlog::level::err;
  return std::nullopt;
}

void init_logging(std::string_view level) {
  auto logger = spdlog::get("labelcheck");
  if (!logger) {
    logger = spdlog::stdout_color_mt("labelcheck");
  }
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_default_logger(logger);

  const auto parsed = parse_log_level(level);
  spdlog::set_level(parsed.value_or(spdlog::level::info));
  if (!parsed) {
    spdlog::warn("Invalid log level '{}', defaulting to info", level);
  }
}

}  // namespace labelcheck::app
