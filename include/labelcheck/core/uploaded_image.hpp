#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace labelcheck::core {

/// Encoded image as received from the client (PNG, JPEG, ...). Not decoded.
struct UploadedImage {
  std::string filename;
  std::string content_type;
  std::vector<std::byte> bytes;

  [[nodiscard]] bool empty() const noexcept { return bytes.empty(); }
};

}  // namespace labelcheck::core
