#pragma once

#include <labelcheck/core/check_result.hpp>
#include <labelcheck/core/error.hpp>
#include <nlohmann/json.hpp>

namespace labelcheck::app {

/// Wire form of a verification:
/// {"overall_match": bool, "extracted_text_preview": str,
///  "checks": [{"field": str, "matched": bool, "message": str}, ...]}
[[nodiscard]] nlohmann::json to_json(const core::VerificationResult& result);

[[nodiscard]] nlohmann::json to_json(const core::FieldCheckResult& check);

/// HTTP status and JSON body ({"error": str, "details"?: str}) for a failure.
struct ErrorResponse {
  int status{500};
  nlohmann::json body;
};

/// NoImage, OcrUnreadable -> 400; OcrFailed -> 500 "Failed to process image";
/// anything else, an undecodable upload included -> 500 "An error occurred".
[[nodiscard]] ErrorResponse to_error_response(const core::Failure& failure);

}  // namespace labelcheck::app
