#pragma once

#include <labelcheck/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace labelcheck::vision::detail {

/// Non-owning cv::Mat view over a Frame. Returns nullopt if the frame is
/// invalid or its format has no 8-bit Mat equivalent.
std::optional<cv::Mat> frame_to_mat(const labelcheck::core::Frame& frame);

/// Copy a continuous or strided 8-bit Mat (1, 3 or 4 channels) into a Frame.
/// Returns an empty Frame for any other Mat type.
labelcheck::core::Frame mat_to_frame(const cv::Mat& mat);

}  // namespace labelcheck::vision::detail
