#pragma once

#include <labelcheck/core/check_result.hpp>
#include <labelcheck/core/fields.hpp>
#include <string>
#include <string_view>

namespace labelcheck::core {

/// OCR text of one label, raw and normalized once per verification.
struct LabelText {
  std::string_view raw;
  std::string normalized;
};

/// Abstract field check: compares one form field against the label text.
/// Implementations hold no per-request state, so one instance may serve
/// concurrent verifications.
class IFieldCheck {
 public:
  virtual ~IFieldCheck() = default;

  [[nodiscard]] virtual FieldId field() const noexcept = 0;

  /// Whether this check runs for the given form. Default: always.
  [[nodiscard]] virtual bool applies(const ExpectedFields& /*expected*/) const {
    return true;
  }

  [[nodiscard]] virtual MatchOutcome check(const LabelText& label,
                                           const ExpectedFields& expected) const = 0;
};

}  // namespace labelcheck::core
