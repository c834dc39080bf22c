#pragma once

#include <labelcheck/core/check_result.hpp>
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace labelcheck::check {

/// Largest |label - expected| accepted for alcohol content, in percentage points.
inline constexpr double kAlcoholTolerance = 0.5;

/// Share of expected tokens that must appear on the label for a partial match.
inline constexpr double kTokenMatchRatio = 0.7;

inline constexpr std::string_view kWarningPhrase = "government warning";
inline constexpr std::array<std::string_view, 4> kWarningKeyPhrases = {
    "pregnant",
    "driving",
    "operating machinery",
    "health problems",
};
inline constexpr std::size_t kMinWarningKeyPhrases = 2;

// All matchers accept raw or normalized label text and never throw.
// Only an absent or empty expected value counts as not provided; a
// whitespace-only value is checked like any other.

/// Brand name / product class: contiguous substring, or at least 70% of the
/// whitespace-delimited tokens of a multi-token value found individually.
[[nodiscard]] core::MatchOutcome match_text_field(
    std::string_view label_text,
    std::optional<std::string_view> expected,
    std::string_view field_name);

/// Form alcohol value with every '%' and ASCII whitespace removed and any
/// surrounding Unicode whitespace trimmed; nullopt if the rest is not a number.
[[nodiscard]] std::optional<double> parse_alcohol_value(std::string_view raw);

/// Alcohol by volume: any label percentage within kAlcoholTolerance.
[[nodiscard]] core::MatchOutcome match_alcohol_content(
    std::string_view label_text,
    std::optional<std::string_view> expected);

/// Net contents: normalized expected value and a label volume candidate
/// contain one another. Not provided -> matched ("not required").
[[nodiscard]] core::MatchOutcome match_net_contents(
    std::string_view label_text,
    std::optional<std::string_view> expected);

/// Government warning: the literal phrase, or at least two key phrases.
[[nodiscard]] core::MatchOutcome detect_government_warning(std::string_view label_text);

}  // namespace labelcheck::check
