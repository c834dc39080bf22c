#pragma once

#include <labelcheck/core/error.hpp>
#include <labelcheck/core/frame.hpp>
#include <cstdint>
#include <expected>

namespace labelcheck::vision {

/// Grayscale conversion plus upscaling for OCR.
/// Frames shorter than min_height are scaled up (aspect preserved) so small
/// label print reaches a size the recognizer handles; min_height 0 disables it.
class OcrPreprocessor {
 public:
  explicit OcrPreprocessor(std::uint32_t min_height = 1000);

  /// Returns a Grayscale8 frame. Fails with ImageDecodeFailed on an invalid frame.
  [[nodiscard]] std::expected<labelcheck::core::Frame, labelcheck::core::VerifyError>
  process(const labelcheck::core::Frame& input) const;

  [[nodiscard]] std::uint32_t min_height() const noexcept { return min_height_; }

 private:
  std::uint32_t min_height_;
};

}  // namespace labelcheck::vision
