#include <labelcheck/vision/mock_ocr_backend.hpp>

namespace labelcheck::vision {

void MockOcrBackend::set_text(std::string text) {
  text_ = std::move(text);
  failure_.reset();
}

void MockOcrBackend::set_failure(core::Failure failure) {
  failure_ = std::move(failure);
}

std::expected<std::string, core::Failure> MockOcrBackend::recognize(
    const core::UploadedImage& /*image*/) {
  ++calls_;
  if (failure_) {
    return std::unexpected(*failure_);
  }
  return text_;
}

}  // namespace labelcheck::vision
