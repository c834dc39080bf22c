#pragma once

#include <spdlog/common.h>
#include <optional>
#include <string_view>

namespace labelcheck::app {

/// "trace" | "debug" | "info" | "warn" | "error" (case-insensitive); nullopt otherwise.
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view level);

/// Install a colour stdout logger named "labelcheck" as the spdlog default.
/// An unknown level falls back to info and logs a warning.
void init_logging(std::string_view level);

}  // namespace labelcheck::app
