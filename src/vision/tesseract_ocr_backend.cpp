#include <labelcheck/vision/tesseract_ocr_backend.hpp>

#ifdef LABELCHECK_HAS_TESSERACT

#include <labelcheck/vision/load_image.hpp>
#include <tesseract/baseapi.h>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace labelcheck::vision {

using labelcheck::core::Failure;
using labelcheck::core::Frame;
using labelcheck::core::PixelFormat;
using labelcheck::core::VerifyError;

struct TesseractOcrBackend::Impl {
  tesseract::TessBaseAPI api;
  OcrPreprocessor preprocessor;
  std::string language;
  std::mutex mutex;

  explicit Impl(std::uint32_t min_height) : preprocessor(min_height) {}

  std::expected<std::string, Failure> run(const Frame& gray) {
    std::lock_guard lock(mutex);
    api.SetImage(reinterpret_cast<const unsigned char*>(gray.data().data()),
                 static_cast<int>(gray.width()),
                 static_cast<int>(gray.height()),
                 1,
                 static_cast<int>(gray.stride()));
    std::unique_ptr<char[]> text(api.GetUTF8Text());
    api.Clear();
    if (!text) {
      return std::unexpected(Failure{VerifyError::OcrFailed, "Tesseract returned no text"});
    }
    return std::string(text.get());
  }
};

TesseractOcrBackend::TesseractOcrBackend(std::string tessdata_path,
                                         std::string language,
                                         std::uint32_t min_height)
    : impl_(std::make_unique<Impl>(min_height)) {
  impl_->language = std::move(language);
  const char* datapath = tessdata_path.empty() ? nullptr : tessdata_path.c_str();
  if (impl_->api.Init(datapath, impl_->language.c_str()) != 0) {
    throw std::runtime_error("TesseractOcrBackend: could not initialize language '" +
                             impl_->language + "'" +
                             (datapath ? " from " + tessdata_path : std::string()));
  }
  impl_->api.SetPageSegMode(tesseract::PSM_AUTO);
}

TesseractOcrBackend::~TesseractOcrBackend() {
  if (impl_) impl_->api.End();
}

std::expected<std::string, Failure> TesseractOcrBackend::recognize(
    const core::UploadedImage& image) {
  auto frame = decode_frame(image.bytes);
  if (!frame) {
    return std::unexpected(
        Failure{VerifyError::ImageDecodeFailed, "cannot identify image file '" + image.filename + "'"});
  }

  auto gray = impl_->preprocessor.process(*frame);
  if (!gray) {
    return std::unexpected(Failure{gray.error(), "unsupported pixel layout"});
  }
  return impl_->run(*gray);
}

void TesseractOcrBackend::warmup() {
  constexpr std::uint32_t kSide = 32;
  std::vector<std::byte> blank(static_cast<std::size_t>(kSide) * kSide, std::byte{0xFF});
  const Frame frame(kSide, kSide, PixelFormat::Grayscale8, std::move(blank));
  auto result = impl_->run(frame);
  if (!result) {
    throw std::runtime_error("TesseractOcrBackend: warmup failed: " + result.error().detail);
  }
}

}  // namespace labelcheck::vision

#endif  // LABELCHECK_HAS_TESSERACT
