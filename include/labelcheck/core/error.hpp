#pragma once

#include <string>
#include <string_view>

namespace labelcheck::core {

/// Request-level error codes; used with std::expected for terminal failures.
/// Field-level problems are never errors (see MatchOutcome).
enum class VerifyError {
  None = 0,
  NoImage,
  ImageDecodeFailed,
  OcrFailed,
  OcrUnreadable,
  InvalidConfig,
  Internal,
};

/// Error code plus detail text (e.g. the OCR engine's own message).
struct Failure {
  VerifyError error{VerifyError::None};
  std::string detail;
};

[[nodiscard]] std::string_view to_string(VerifyError e) noexcept;

}  // namespace labelcheck::core
