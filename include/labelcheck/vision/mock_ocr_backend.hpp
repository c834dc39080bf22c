#pragma once

#include <labelcheck/vision/ocr_backend.hpp>
#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace labelcheck::vision {

/// Returns configured text (or a configured failure) for any image.
/// Used by tests and by the CLI when OCR text is supplied directly.
/// recognize() may run on several threads; set_text()/set_failure() may not.
class MockOcrBackend : public IOcrBackend {
 public:
  MockOcrBackend() = default;
  explicit MockOcrBackend(std::string text) : text_(std::move(text)) {}

  void set_text(std::string text);
  void set_failure(core::Failure failure);

  [[nodiscard]] std::expected<std::string, core::Failure> recognize(
      const core::UploadedImage& image) override;

  [[nodiscard]] std::size_t calls() const noexcept { return calls_.load(); }

 private:
  std::string text_;
  std::optional<core::Failure> failure_;
  std::atomic<std::size_t> calls_{0};
};

}  // namespace labelcheck::vision
