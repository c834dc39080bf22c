#include <labelcheck/core/label_verifier.hpp>
#include <labelcheck/text/normalizer.hpp>
#include <labelcheck/text/utf8.hpp>
#include <chrono>
#include <string>

namespace labelcheck::core {

void LabelVerifier::add_check(std::unique_ptr<IFieldCheck> check) {
  if (check) {
    checks_.push_back(std::move(check));
  }
}

std::string make_preview(std::string_view raw_text, std::size_t preview_chars) {
  if (text::code_point_count(raw_text) <= preview_chars) {
    return std::string(raw_text);
  }
  std::string out(text::code_point_prefix(raw_text, preview_chars));
  out += "...";
  return out;
}

std::expected<VerificationResult, Failure> LabelVerifier::verify(
    std::string_view raw_text,
    const ExpectedFields& expected,
    CheckTimingCallback* timing_cb) const {
  if (checks_.empty()) {
    return std::unexpected(Failure{VerifyError::InvalidConfig, "no field checks registered"});
  }

  if (text::code_point_count(text::trim(raw_text)) < options_.min_text_chars) {
    return std::unexpected(
        Failure{VerifyError::OcrUnreadable, std::string(kUnreadableTextMessage)});
  }

  const LabelText label{raw_text, text::normalize(raw_text)};

  VerificationResult result;
  result.overall_match = true;
  result.extracted_text_preview = make_preview(raw_text, options_.preview_chars);
  result.checks.reserve(checks_.size());

  for (std::size_t i = 0; i < checks_.size(); ++i) {
    const IFieldCheck& check = *checks_[i];
    if (!check.applies(expected)) continue;

    const auto check_start = std::chrono::steady_clock::now();
    MatchOutcome outcome = check.check(label, expected);
    if (timing_cb) {
      const auto check_end = std::chrono::steady_clock::now();
      const double ms = 1e-6 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(check_end - check_start).count());
      (*timing_cb)(i, ms);
    }

    if (!outcome.matched) result.overall_match = false;
    result.checks.push_back({check.field(), outcome.matched, std::move(outcome.message)});
  }

  return result;
}

}  // namespace labelcheck::core
