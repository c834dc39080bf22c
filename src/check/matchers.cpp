#include <labelcheck/check/matchers.hpp>
#include <labelcheck/text/extractors.hpp>
#include <labelcheck/text/normalizer.hpp>
#include <labelcheck/text/number.hpp>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace labelcheck::check {

namespace {

bool provided(std::optional<std::string_view> value) noexcept {
  return value.has_value() && !value->empty();
}

std::vector<std::string_view> split_tokens(std::string_view normalized) {
  std::vector<std::string_view> tokens;
  std::size_t pos = 0;
  while (pos < normalized.size()) {
    const auto next = normalized.find(' ', pos);
    const auto end = next == std::string_view::npos ? normalized.size() : next;
    if (end > pos) tokens.push_back(normalized.substr(pos, end - pos));
    pos = end + 1;
  }
  return tokens;
}

std::string with_field(std::string_view field_name, std::string_view suffix) {
  std::string out(field_name);
  out += suffix;
  return out;
}

}  // namespace

core::MatchOutcome match_text_field(std::string_view label_text,
                                    std::optional<std::string_view> expected,
                                    std::string_view field_name) {
  if (!provided(expected)) {
    return {false, with_field(field_name, " not provided in form")};
  }

  const std::string label = text::normalize(label_text);
  const std::string wanted = text::normalize(*expected);

  if (text::contains(label, wanted)) {
    return {true, with_field(field_name, " found on label")};
  }

  // OCR may drop or garble one word of a multi-word value.
  const auto tokens = split_tokens(wanted);
  if (tokens.size() > 1) {
    std::size_t found = 0;
    for (const auto token : tokens) {
      if (text::contains(label, token)) ++found;
    }
    if (static_cast<double>(found) >= static_cast<double>(tokens.size()) * kTokenMatchRatio) {
      return {true, with_field(field_name, " partially matched")};
    }
  }

  return {false, with_field(field_name, " not found on label")};
}

std::optional<double> parse_alcohol_value(std::string_view raw) {
  std::string cleaned;
  cleaned.reserve(raw.size());
  for (const char c : raw) {
    const auto byte = static_cast<unsigned char>(c);
    if (c == '%' || (byte < 0x80 && text::is_space(byte))) continue;
    cleaned.push_back(c);
  }
  return text::parse_number(text::trim(cleaned));
}

core::MatchOutcome match_alcohol_content(std::string_view label_text,
                                         std::optional<std::string_view> expected) {
  if (!provided(expected)) {
    return {false, "Alcohol content not provided"};
  }

  const auto wanted = parse_alcohol_value(*expected);
  if (!wanted) {
    return {false, "Invalid alcohol content: " + std::string(*expected)};
  }
  const std::string wanted_str = text::format_number(*wanted);

  const auto found = text::extract_percentages(label_text);
  if (found.empty()) {
    return {false, "Alcohol content not found on label (expected " + wanted_str + "%)"};
  }

  for (const double value : found) {
    if (std::fabs(value - *wanted) <= kAlcoholTolerance) {
      return {true, "Alcohol content matches: " + text::format_number(value) + "%"};
    }
  }

  return {false, "Alcohol content mismatch: found " + text::format_number(found.front()) +
                     "%, expected " + wanted_str + "%"};
}

core::MatchOutcome match_net_contents(std::string_view label_text,
                                      std::optional<std::string_view> expected) {
  if (!provided(expected)) {
    return {true, "Net contents not required"};
  }

  const auto candidates = text::extract_volumes(label_text);
  if (candidates.empty()) {
    return {false, "Net contents not found on label (expected " + std::string(*expected) + ")"};
  }

  // Containment in either direction; "750 ml" and "750ml" are not unit-stripped,
  // so differing spacing does not match.
  const std::string wanted = text::normalize(*expected);
  for (const auto& candidate : candidates) {
    const std::string found = text::normalize(candidate);
    if (text::contains(found, wanted) || text::contains(wanted, found)) {
      return {true, "Net contents matches: " + candidate};
    }
  }

  return {false, "Net contents mismatch: found " + candidates.front() + ", expected " +
                     std::string(*expected)};
}

core::MatchOutcome detect_government_warning(std::string_view label_text) {
  const std::string label = text::normalize(label_text);
  if (text::contains(label, kWarningPhrase)) {
    return {true, "Government warning found on label"};
  }

  std::size_t found = 0;
  for (const auto phrase : kWarningKeyPhrases) {
    if (text::contains(label, phrase)) ++found;
  }
  if (found >= kMinWarningKeyPhrases) {
    return {true, "Government warning partially found"};
  }

  return {false, "Government warning not found on label"};
}

}  // namespace labelcheck::check
