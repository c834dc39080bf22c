#include <labelcheck/core/frame.hpp>
#include <cstddef>

namespace labelcheck::core {

std::size_t Frame::bytes_per_pixel(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

bool Frame::valid() const noexcept {
  const std::size_t bpp = bytes_per_pixel(format_);
  if (bpp == 0 || width_ == 0 || height_ == 0) return false;
  return buffer_.size() >= stride() * height_;
}

}  // namespace labelcheck::core
