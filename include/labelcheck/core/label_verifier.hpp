#pragma once

#include <labelcheck/core/check_result.hpp>
#include <labelcheck/core/error.hpp>
#include <labelcheck/core/field_check.hpp>
#include <labelcheck/core/fields.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace labelcheck::core {

/// Callback for per-check timing: (check_index, duration_ms). Optional; pass to verify().
using CheckTimingCallback = std::function<void(std::size_t check_index, double duration_ms)>;

inline constexpr std::string_view kUnreadableTextMessage =
    "Could not read text from image. Please try a clearer image.";

struct VerifierOptions {
  /// Minimum code points of trimmed OCR text; shorter text is unreadable.
  std::size_t min_text_chars{10};
  /// Code points of raw text kept in the preview before "..." is appended.
  std::size_t preview_chars{200};
};

/// Runs field checks in insertion order against one label's OCR text.
class LabelVerifier {
 public:
  explicit LabelVerifier(VerifierOptions options = {}) : options_(options) {}

  void add_check(std::unique_ptr<IFieldCheck> check);

  /// Quality gate, then every applicable check. Fails with OcrUnreadable when
  /// the text is too short and InvalidConfig when no checks are registered;
  /// unmatched fields are reported in the result, never as errors.
  /// Thread-safe: checks are not modified during verify().
  [[nodiscard]] std::expected<VerificationResult, Failure> verify(
      std::string_view raw_text,
      const ExpectedFields& expected,
      CheckTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t check_count() const noexcept { return checks_.size(); }
  [[nodiscard]] const VerifierOptions& options() const noexcept { return options_; }

 private:
  VerifierOptions options_;
  std::vector<std::unique_ptr<IFieldCheck>> checks_;
};

/// First preview_chars code points of raw_text, plus "..." when truncated.
[[nodiscard]] std::string make_preview(std::string_view raw_text, std::size_t preview_chars);

}  // namespace labelcheck::core
