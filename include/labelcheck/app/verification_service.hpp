#pragma once

#include <labelcheck/core/check_result.hpp>
#include <labelcheck/core/error.hpp>
#include <labelcheck/core/fields.hpp>
#include <labelcheck/core/label_verifier.hpp>
#include <labelcheck/core/uploaded_image.hpp>
#include <labelcheck/vision/ocr_backend.hpp>
#include <expected>
#include <optional>
#include <string_view>

namespace labelcheck::app {

inline constexpr std::string_view kNoImageProvided = "No image file provided";
inline constexpr std::string_view kNoImageSelected = "No image file selected";

/// One verification request end to end: input gate, OCR, quality gate,
/// field checks. Every failure comes back as a Failure; nothing escapes.
///
/// The service keeps a reference to the OCR backend (caller keeps ownership).
/// verify() is as thread-safe as the backend's recognize().
class VerificationService {
 public:
  explicit VerificationService(vision::IOcrBackend& ocr, core::VerifierOptions options = {});

  /// Errors: NoImage (absent image, empty filename or zero bytes),
  /// ImageDecodeFailed / OcrFailed (from the backend), OcrUnreadable,
  /// Internal (unexpected exception; detail is its what()).
  [[nodiscard]] std::expected<core::VerificationResult, core::Failure> verify(
      const std::optional<core::UploadedImage>& image,
      const core::ExpectedFields& expected);

  /// Same as verify() for text that was already recognized; skips the input
  /// gate and OCR.
  [[nodiscard]] std::expected<core::VerificationResult, core::Failure> verify_text(
      std::string_view raw_text,
      const core::ExpectedFields& expected) const;

  [[nodiscard]] const core::LabelVerifier& verifier() const noexcept { return verifier_; }

 private:
  vision::IOcrBackend& ocr_;
  core::LabelVerifier verifier_;
};

}  // namespace labelcheck::app
