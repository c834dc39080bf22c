#pragma once

#include <labelcheck/vision/ocr_backend.hpp>
#include <labelcheck/vision/ocr_preprocess.hpp>
#include <cstdint>
#include <memory>
#include <string>

#ifdef LABELCHECK_HAS_TESSERACT

namespace labelcheck::vision {

/// Tesseract OCR backend: decodes the upload with OpenCV, converts it to an
/// upscaled grayscale frame and runs full-page recognition (PSM_AUTO).
///
/// One Tesseract handle serves all calls; recognize() serializes on an
/// internal mutex, so a single backend may be shared by server worker threads.
class TesseractOcrBackend : public IOcrBackend {
 public:
  /// \param tessdata_path Directory holding <language>.traineddata; empty uses
  ///        Tesseract's compiled-in default / TESSDATA_PREFIX.
  /// \param language Tesseract language code(s), e.g. "eng" or "eng+fra".
  /// \param min_height Frames shorter than this are upscaled before recognition.
  /// \throws std::runtime_error if Tesseract cannot be initialized.
  TesseractOcrBackend(std::string tessdata_path,
                      std::string language = "eng",
                      std::uint32_t min_height = 1000);

  ~TesseractOcrBackend() override;

  TesseractOcrBackend(const TesseractOcrBackend&) = delete;
  TesseractOcrBackend& operator=(const TesseractOcrBackend&) = delete;

  [[nodiscard]] std::expected<std::string, core::Failure> recognize(
      const core::UploadedImage& image) override;

  /// Runs recognition on a small blank frame so the first request does not pay
  /// for model loading.
  void warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace labelcheck::vision

#endif  // LABELCHECK_HAS_TESSERACT
