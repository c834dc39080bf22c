#include <labelcheck/text/extractors.hpp>
#include <labelcheck/text/normalizer.hpp>
#include <labelcheck/text/number.hpp>
#include <array>
#include <regex>
#include <string>

namespace labelcheck::text {

namespace {

const std::regex& percentage_pattern() {
  static const std::regex re(R"((\d+(?:\.\d+)?)\s*%)");
  return re;
}

const std::array<std::regex, 3>& volume_patterns() {
  static const std::array<std::regex, 3> patterns = {
      std::regex(R"((\d+(?:\.\d+)?)\s*(ml))"),
      std::regex(R"((\d+(?:\.\d+)?)\s*(fl\s*oz|oz))"),
      std::regex(R"((\d+(?:\.\d+)?)\s*(l))"),
  };
  return patterns;
}

}  // namespace

std::vector<double> extract_percentages(std::string_view text) {
  const std::string lowered = normalize(text);
  std::vector<double> out;

  const auto& re = percentage_pattern();
  for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), re);
       it != std::sregex_iterator(); ++it) {
    const auto value = parse_number((*it)[1].str());
    if (!value) continue;
    if (*value < kMinPercentage || *value > kMaxPercentage) continue;
    out.push_back(*value);
  }
  return out;
}

std::vector<std::string> extract_volumes(std::string_view text) {
  const std::string lowered = normalize(text);
  std::vector<std::string> out;

  for (const auto& re : volume_patterns()) {
    for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), re);
         it != std::sregex_iterator(); ++it) {
      out.push_back((*it)[1].str() + " " + (*it)[2].str());
    }
  }
  return out;
}

}  // namespace labelcheck::text
