#pragma once

#include <labelcheck/core/fields.hpp>
#include <string>
#include <vector>

namespace labelcheck::core {

/// Verdict of one matcher: matched flag plus a human-readable reason.
struct MatchOutcome {
  bool matched{false};
  std::string message;
};

/// Result of checking one field against the label.
struct FieldCheckResult {
  FieldId field{FieldId::BrandName};
  bool matched{false};
  std::string message;
};

/// Result of verifying one label against its form.
/// overall_match is the AND of matched over the checks that ran.
struct VerificationResult {
  bool overall_match{false};
  std::string extracted_text_preview;
  std::vector<FieldCheckResult> checks;
};

}  // namespace labelcheck::core
