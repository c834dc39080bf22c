#pragma once

#include <string>
#include <string_view>

namespace labelcheck::text {

/// Canonical comparable form of UTF-8 text: Unicode lowercased (root locale,
/// full case mapping), every whitespace run collapsed to one ASCII space,
/// leading/trailing whitespace removed. Idempotent.
[[nodiscard]] std::string normalize(std::string_view text);

/// Substring test on already-normalized text. An empty needle is contained.
[[nodiscard]] bool contains(std::string_view haystack, std::string_view needle) noexcept;

/// Unicode whitespace: the ASCII set, the separators (U+00A0, U+2000..U+200A,
/// U+3000, ...) and the information separators U+001C..U+001F, U+0085.
[[nodiscard]] bool is_space(char32_t c) noexcept;

/// View of UTF-8 text without leading/trailing Unicode whitespace.
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

}  // namespace labelcheck::text
