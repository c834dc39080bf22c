#pragma once

#include <labelcheck/core/field_check.hpp>
#include <labelcheck/core/label_verifier.hpp>

namespace labelcheck::check {

/// Brand name or product class, matched by substring / token overlap.
class TextFieldCheck : public core::IFieldCheck {
 public:
  explicit TextFieldCheck(core::FieldId field) : field_(field) {}

  [[nodiscard]] core::FieldId field() const noexcept override { return field_; }

  [[nodiscard]] core::MatchOutcome check(const core::LabelText& label,
                                         const core::ExpectedFields& expected) const override;

 private:
  core::FieldId field_;
};

class AlcoholContentCheck : public core::IFieldCheck {
 public:
  [[nodiscard]] core::FieldId field() const noexcept override {
    return core::FieldId::AlcoholContent;
  }

  [[nodiscard]] core::MatchOutcome check(const core::LabelText& label,
                                         const core::ExpectedFields& expected) const override;
};

/// Optional field: skipped entirely when the form leaves it empty.
class NetContentsCheck : public core::IFieldCheck {
 public:
  [[nodiscard]] core::FieldId field() const noexcept override {
    return core::FieldId::NetContents;
  }

  [[nodiscard]] bool applies(const core::ExpectedFields& expected) const override;

  [[nodiscard]] core::MatchOutcome check(const core::LabelText& label,
                                         const core::ExpectedFields& expected) const override;
};

/// Label-only check; ignores the form.
class GovernmentWarningCheck : public core::IFieldCheck {
 public:
  [[nodiscard]] core::FieldId field() const noexcept override {
    return core::FieldId::GovernmentWarning;
  }

  [[nodiscard]] core::MatchOutcome check(const core::LabelText& label,
                                         const core::ExpectedFields& expected) const override;
};

/// Verifier with the standard checks in report order: brand name, product
/// class, alcohol content, net contents, government warning.
[[nodiscard]] core::LabelVerifier make_label_verifier(core::VerifierOptions options = {});

}  // namespace labelcheck::check
