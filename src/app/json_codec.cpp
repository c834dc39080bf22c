#include <labelcheck/app/json_codec.hpp>
#include <string>

namespace labelcheck::app {

nlohmann::json to_json(const core::FieldCheckResult& check) {
  return nlohmann::json{
      {"field", std::string(core::display_name(check.field))},
      {"matched", check.matched},
      {"message", check.message},
  };
}

nlohmann::json to_json(const core::VerificationResult& result) {
  nlohmann::json checks = nlohmann::json::array();
  for (const auto& c : result.checks) {
    checks.push_back(to_json(c));
  }
  return nlohmann::json{
      {"overall_match", result.overall_match},
      {"extracted_text_preview", result.extracted_text_preview},
      {"checks", std::move(checks)},
  };
}

ErrorResponse to_error_response(const core::Failure& failure) {
  using core::VerifyError;
  switch (failure.error) {
    case VerifyError::NoImage:
    case VerifyError::OcrUnreadable:
      return {400, nlohmann::json{{"error", failure.detail}}};
    case VerifyError::OcrFailed:
      return {500, nlohmann::json{{"error", "Failed to process image"},
                                  {"details", failure.detail}}};
    case VerifyError::ImageDecodeFailed:
    case VerifyError::None:
    case VerifyError::InvalidConfig:
    case VerifyError::Internal:
    default:
      return {500, nlohmann::json{{"error", "An error occurred"}, {"details", failure.detail}}};
  }
}

}  // namespace labelcheck::app
