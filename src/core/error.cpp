#include <labelcheck/core/error.hpp>

namespace labelcheck::core {

std::string_view to_string(VerifyError e) noexcept {
  switch (e) {
    case VerifyError::None:
      return "None";
    case VerifyError::NoImage:
      return "NoImage";
    case VerifyError::ImageDecodeFailed:
      return "ImageDecodeFailed";
    case VerifyError::OcrFailed:
      return "OcrFailed";
    case VerifyError::OcrUnreadable:
      return "OcrUnreadable";
    case VerifyError::InvalidConfig:
      return "InvalidConfig";
    case VerifyError::Internal:
      return "Internal";
  }
  return "Unknown";
}

}  // namespace labelcheck::core
