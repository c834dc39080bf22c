#include <labelcheck/vision/ocr_preprocess.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace labelcheck::vision {

using labelcheck::core::Frame;
using labelcheck::core::PixelFormat;
using labelcheck::core::VerifyError;

namespace {

// Bounds the work for tiny thumbnails.
constexpr double kMaxUpscale = 4.0;

}  // namespace

OcrPreprocessor::OcrPreprocessor(std::uint32_t min_height) : min_height_(min_height) {}

std::expected<Frame, VerifyError> OcrPreprocessor::process(const Frame& input) const {
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(VerifyError::ImageDecodeFailed);
  }

  cv::Mat gray;
  switch (input.format()) {
    case PixelFormat::BGR8:
      cv::cvtColor(*mat_in, gray, cv::COLOR_BGR2GRAY);
      break;
    case PixelFormat::BGRA8:
      cv::cvtColor(*mat_in, gray, cv::COLOR_BGRA2GRAY);
      break;
    case PixelFormat::Grayscale8:
    default:
      gray = *mat_in;
      break;
  }

  if (min_height_ > 0 && input.height() < min_height_) {
    const double scale = std::min(kMaxUpscale, static_cast<double>(min_height_) / input.height());
    cv::Mat scaled;
    cv::resize(gray, scaled, cv::Size(), scale, scale, cv::INTER_CUBIC);
    return detail::mat_to_frame(scaled);
  }

  return detail::mat_to_frame(gray);
}

}  // namespace labelcheck::vision
