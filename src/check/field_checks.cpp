#include <labelcheck/check/field_checks.hpp>
#include <labelcheck/check/matchers.hpp>
#include <memory>

namespace labelcheck::check {

using core::ExpectedFields;
using core::FieldId;
using core::LabelText;
using core::MatchOutcome;

MatchOutcome TextFieldCheck::check(const LabelText& label,
                                   const ExpectedFields& expected) const {
  return match_text_field(label.normalized, expected.get(field_), core::display_name(field_));
}

MatchOutcome AlcoholContentCheck::check(const LabelText& label,
                                        const ExpectedFields& expected) const {
  return match_alcohol_content(label.normalized, expected.get(FieldId::AlcoholContent));
}

bool NetContentsCheck::applies(const ExpectedFields& expected) const {
  return expected.get(FieldId::NetContents).has_value();
}

MatchOutcome NetContentsCheck::check(const LabelText& label,
                                     const ExpectedFields& expected) const {
  return match_net_contents(label.normalized, expected.get(FieldId::NetContents));
}

MatchOutcome GovernmentWarningCheck::check(const LabelText& label,
                                           const ExpectedFields& /*expected*/) const {
  return detect_government_warning(label.normalized);
}

core::LabelVerifier make_label_verifier(core::VerifierOptions options) {
  core::LabelVerifier verifier(options);
  verifier.add_check(std::make_unique<TextFieldCheck>(FieldId::BrandName));
  verifier.add_check(std::make_unique<TextFieldCheck>(FieldId::ProductClass));
  verifier.add_check(std::make_unique<AlcoholContentCheck>());
  verifier.add_check(std::make_unique<NetContentsCheck>());
  verifier.add_check(std::make_unique<GovernmentWarningCheck>());
  return verifier;
}

}  // namespace labelcheck::check
