#include <labelcheck/app/verification_service.hpp>
#include <labelcheck/check/field_checks.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <string>

namespace labelcheck::app {

using core::ExpectedFields;
using core::Failure;
using core::VerificationResult;
using core::VerifyError;

VerificationService::VerificationService(vision::IOcrBackend& ocr, core::VerifierOptions options)
    : ocr_(ocr), verifier_(check::make_label_verifier(options)) {}

std::expected<VerificationResult, Failure> VerificationService::verify(
    const std::optional<core::UploadedImage>& image,
    const ExpectedFields& expected) {
  if (!image) {
    spdlog::warn("verify: request without image");
    return std::unexpected(Failure{VerifyError::NoImage, std::string(kNoImageProvided)});
  }
  if (image->filename.empty() || image->empty()) {
    spdlog::warn("verify: empty upload '{}' ({} bytes)", image->filename, image->bytes.size());
    return std::unexpected(Failure{VerifyError::NoImage, std::string(kNoImageSelected)});
  }

  try {
    auto text = ocr_.recognize(*image);
    if (!text) {
      spdlog::error("verify: OCR failed for '{}': {} ({})", image->filename,
                    core::to_string(text.error().error), text.error().detail);
      return std::unexpected(text.error());
    }
    spdlog::debug("verify: OCR returned {} bytes for '{}'", text->size(), image->filename);
    return verify_text(*text, expected);
  } catch (const std::exception& e) {
    spdlog::error("verify: unexpected error for '{}': {}", image->filename, e.what());
    return std::unexpected(Failure{VerifyError::Internal, e.what()});
  }
}

std::expected<VerificationResult, Failure> VerificationService::verify_text(
    std::string_view raw_text,
    const ExpectedFields& expected) const {
  try {
    core::CheckTimingCallback timing = [](std::size_t index, double ms) {
      spdlog::trace("verify: check {} took {:.3f} ms", index, ms);
    };
    auto result = verifier_.verify(raw_text, expected, &timing);
    if (!result) {
      spdlog::warn("verify: {}: {}", core::to_string(result.error().error), result.error().detail);
      return result;
    }

    for (const auto& c : result->checks) {
      spdlog::debug("verify: {} matched={} ({})", core::display_name(c.field), c.matched,
                    c.message);
    }
    spdlog::info("verify: overall_match={} checks={}", result->overall_match,
                 result->checks.size());
    return result;
  } catch (const std::exception& e) {
    spdlog::error("verify: unexpected error: {}", e.what());
    return std::unexpected(Failure{VerifyError::Internal, e.what()});
  }
}

}  // namespace labelcheck::app
