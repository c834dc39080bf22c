#pragma once

#include <labelcheck/core/frame.hpp>
#include <cstddef>
#include <optional>
#include <span>

namespace labelcheck::vision {

/// Decode encoded image bytes (PNG, JPEG, BMP, TIFF, ...) into a Frame
/// (Grayscale8, BGR8 or BGRA8). Returns nullopt when the bytes are not an image.
std::optional<labelcheck::core::Frame> decode_frame(std::span<const std::byte> bytes);

}  // namespace labelcheck::vision
