#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace labelcheck::text {

/// Inclusive range a percentage must fall in to be kept; others are OCR noise.
inline constexpr double kMinPercentage = 0.0;
inline constexpr double kMaxPercentage = 100.0;

/// Values of every "<number><optional spaces>%" in text, in order of first
/// occurrence. Values outside [0, 100] are dropped. Case-insensitive.
[[nodiscard]] std::vector<double> extract_percentages(std::string_view text);

/// Volume candidates formatted "<magnitude> <unit>", unit as matched.
/// Patterns are scanned in fixed order (ml, then fl oz/oz, then l); a magnitude
/// matched by several patterns is reported once per pattern.
[[nodiscard]] std::vector<std::string> extract_volumes(std::string_view text);

}  // namespace labelcheck::text
