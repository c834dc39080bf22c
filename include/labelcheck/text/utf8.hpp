#pragma once

#include <cstddef>
#include <string_view>

namespace labelcheck::text {

/// Number of code points in UTF-8 text (continuation bytes are not counted).
[[nodiscard]] std::size_t code_point_count(std::string_view text) noexcept;

/// Longest prefix holding at most max_code_points code points; never splits a
/// multi-byte sequence.
[[nodiscard]] std::string_view code_point_prefix(std::string_view text,
                                                 std::size_t max_code_points) noexcept;

}  // namespace labelcheck::text
