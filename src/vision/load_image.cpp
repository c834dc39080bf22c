#include <labelcheck/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace labelcheck::vision {

std::optional<labelcheck::core::Frame> decode_frame(std::span<const std::byte> bytes) {
  if (bytes.empty()) return std::nullopt;

  // imdecode only reads the buffer.
  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::byte*>(bytes.data()));
  cv::Mat mat = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
  if (mat.empty()) return std::nullopt;
  if (mat.depth() == CV_16U) {  // 16-bit PNG/TIFF
    cv::Mat converted;
    mat.convertTo(converted, CV_8U, 1.0 / 256.0);
    mat = converted;
  }

  auto frame = detail::mat_to_frame(mat);
  if (frame.empty()) return std::nullopt;
  return frame;
}

}  // namespace labelcheck::vision
