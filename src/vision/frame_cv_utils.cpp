#include "frame_cv_utils.hpp"
#include <labelcheck/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace labelcheck::vision::detail {

namespace lc = labelcheck::core;

std::optional<cv::Mat> frame_to_mat(const lc::Frame& frame) {
  if (!frame.valid()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  auto* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case lc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, frame.stride());
    case lc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, frame.stride());
    case lc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, frame.stride());
    case lc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

lc::Frame mat_to_frame(const cv::Mat& mat) {
  if (mat.empty() || mat.depth() != CV_8U) return lc::Frame();

  lc::PixelFormat format = lc::PixelFormat::Unknown;
  switch (mat.channels()) {
    case 1:
      format = lc::PixelFormat::Grayscale8;
      break;
    case 3:
      format = lc::PixelFormat::BGR8;
      break;
    case 4:
      format = lc::PixelFormat::BGRA8;
      break;
    default:
      return lc::Frame();
  }

  const std::size_t row_bytes = static_cast<std::size_t>(mat.cols) * mat.elemSize();
  std::vector<std::byte> buffer(row_bytes * static_cast<std::size_t>(mat.rows));
  for (int y = 0; y < mat.rows; ++y) {
    std::memcpy(buffer.data() + row_bytes * static_cast<std::size_t>(y), mat.ptr(y), row_bytes);
  }
  return lc::Frame(static_cast<std::uint32_t>(mat.cols),
                   static_cast<std::uint32_t>(mat.rows),
                   format,
                   std::move(buffer));
}

}  // namespace labelcheck::vision::detail
