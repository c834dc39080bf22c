#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace labelcheck::text {

/// Parses a complete decimal number ("40", "+12.5", "-3", "4e1").
/// Returns nullopt on empty input or trailing garbage; never throws.
[[nodiscard]] std::optional<double> parse_number(std::string_view text) noexcept;

/// Shortest round-trip decimal form; integral values keep a trailing ".0"
/// ("40.0", "40.5", "0.1").
[[nodiscard]] std::string format_number(double value);

}  // namespace labelcheck::text
