#pragma once

#include <labelcheck/core/error.hpp>
#include <labelcheck/core/uploaded_image.hpp>
#include <expected>
#include <string>

namespace labelcheck::vision {

/// Abstract OCR engine: encoded label image -> raw UTF-8 text.
/// Errors: ImageDecodeFailed when the bytes are not an image, OcrFailed when
/// recognition itself fails (detail carries the engine's message).
class IOcrBackend {
 public:
  virtual ~IOcrBackend() = default;

  [[nodiscard]] virtual std::expected<std::string, core::Failure> recognize(
      const core::UploadedImage& image) = 0;

  /// Optional: one-time initialization run after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace labelcheck::vision
