#include <labelcheck/check/field_checks.hpp>
#include <labelcheck/core/field_check.hpp>
#include <labelcheck/core/label_verifier.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lc = labelcheck::core;

namespace {

const std::string kLabel =
    "Old Barrel Whiskey 40% ALC/VOL 750 mL GOVERNMENT WARNING: (1) women should not "
    "drink alcoholic beverages during pregnancy because of the risk of birth defects. "
    "pregnant (2) impairs your ability to drive a car or operate machinery. driving";

class FixedCheck : public lc::IFieldCheck {
 public:
  FixedCheck(lc::FieldId field, bool matched, bool applies = true)
      : field_(field), matched_(matched), applies_(applies) {}

  lc::FieldId field() const noexcept override { return field_; }
  bool applies(const lc::ExpectedFields&) const override { return applies_; }
  lc::MatchOutcome check(const lc::LabelText& label, const lc::ExpectedFields&) const override {
    return {matched_, "fixed:" + label.normalized.substr(0, 3)};
  }

 private:
  lc::FieldId field_;
  bool matched_;
  bool applies_;
};

lc::ExpectedFields full_form() {
  lc::ExpectedFields f;
  f.brand_name = "Old Barrel";
  f.product_class = "Whiskey";
  f.alcohol_content = "40";
  f.net_contents = "750 ml";
  return f;
}

}  // namespace

TEST(LabelVerifier, EmptyVerifierReturnsInvalidConfig) {
  lc::LabelVerifier v;
  auto result = v.verify(kLabel, full_form());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().error, lc::VerifyError::InvalidConfig);
}

TEST(LabelVerifier, ShortTextIsUnreadable) {
  const auto v = labelcheck::check::make_label_verifier();
  auto result = v.verify("Whisk", full_form());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().error, lc::VerifyError::OcrUnreadable);
  EXPECT_EQ(result.error().detail, lc::kUnreadableTextMessage);
}

TEST(LabelVerifier, GateCountsTrimmedText) {
  const auto v = labelcheck::check::make_label_verifier();
  EXPECT_FALSE(v.verify("   \n123456789\t\t  ", full_form()).has_value());
  EXPECT_TRUE(v.verify("  1234567890  ", full_form()).has_value());
}

TEST(LabelVerifier, AllFieldsMatch) {
  const auto v = labelcheck::check::make_label_verifier();
  auto result = v.verify(kLabel, full_form());
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->overall_match);
  ASSERT_EQ(result->checks.size(), 5u);
  EXPECT_EQ(result->checks[0].field, lc::FieldId::BrandName);
  EXPECT_EQ(result->checks[1].field, lc::FieldId::ProductClass);
  EXPECT_EQ(result->checks[2].field, lc::FieldId::AlcoholContent);
  EXPECT_EQ(result->checks[3].field, lc::FieldId::NetContents);
  EXPECT_EQ(result->checks[4].field, lc::FieldId::GovernmentWarning);
  for (const auto& c : result->checks) {
    EXPECT_TRUE(c.matched) << c.message;
  }
}

TEST(LabelVerifier, AbsentNetContentsIsSkipped) {
  const auto v = labelcheck::check::make_label_verifier();
  auto form = full_form();
  form.net_contents.reset();
  auto result = v.verify("Old Barrel Whiskey 40% GOVERNMENT WARNING", form);
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->overall_match);
  ASSERT_EQ(result->checks.size(), 4u);
  for (const auto& c : result->checks) {
    EXPECT_NE(c.field, lc::FieldId::NetContents);
  }
}

TEST(LabelVerifier, NetContentsMissingOnLabelFailsOverall) {
  const auto v = labelcheck::check::make_label_verifier();
  auto result = v.verify("Old Barrel Whiskey 40% GOVERNMENT WARNING", full_form());
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->overall_match);
  ASSERT_EQ(result->checks.size(), 5u);
  EXPECT_FALSE(result->checks[3].matched);
  EXPECT_EQ(result->checks[3].message, "Net contents not found on label (expected 750 ml)");
}

TEST(LabelVerifier, WhitespaceOnlyNetContentsIsChecked) {
  const auto v = labelcheck::check::make_label_verifier();
  auto form = full_form();
  form.net_contents = "   ";
  auto result = v.verify("Old Barrel Whiskey 40% GOVERNMENT WARNING", form);
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->overall_match);
  ASSERT_EQ(result->checks.size(), 5u);
  EXPECT_EQ(result->checks[3].field, lc::FieldId::NetContents);
  EXPECT_FALSE(result->checks[3].matched);
  EXPECT_EQ(result->checks[3].message, "Net contents not found on label (expected    )");
}

TEST(LabelVerifier, FieldFailuresDoNotAbortRun) {
  const auto v = labelcheck::check::make_label_verifier();
  lc::ExpectedFields form;
  form.alcohol_content = "not a number";
  auto result = v.verify(kLabel, form);
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->overall_match);
  ASSERT_EQ(result->checks.size(), 4u);
  EXPECT_EQ(result->checks[0].message, "Brand Name not provided in form");
  EXPECT_EQ(result->checks[1].message, "Product Class/Type not provided in form");
  EXPECT_EQ(result->checks[2].message, "Invalid alcohol content: not a number");
  EXPECT_TRUE(result->checks[3].matched);
}

TEST(LabelVerifier, ChecksSeeNormalizedText) {
  lc::LabelVerifier v;
  v.add_check(std::make_unique<FixedCheck>(lc::FieldId::BrandName, true));
  auto result = v.verify("  OLD Barrel Whiskey", {});
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->checks.size(), 1u);
  EXPECT_EQ(result->checks[0].message, "fixed:old");
}

TEST(LabelVerifier, OverallIsAndOfChecksThatRan) {
  lc::LabelVerifier v;
  v.add_check(std::make_unique<FixedCheck>(lc::FieldId::BrandName, true));
  v.add_check(std::make_unique<FixedCheck>(lc::FieldId::NetContents, false, /*applies=*/false));
  v.add_check(nullptr);
  EXPECT_EQ(v.check_count(), 2u);

  auto result = v.verify("long enough label text", {});
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->overall_match);
  EXPECT_EQ(result->checks.size(), 1u);
}

TEST(LabelVerifier, TimingCallbackPerCheckRun) {
  const auto v = labelcheck::check::make_label_verifier();
  auto form = full_form();
  form.net_contents.reset();

  std::vector<std::pair<std::size_t, double>> timings;
  lc::CheckTimingCallback cb = [&](std::size_t idx, double ms) { timings.emplace_back(idx, ms); };
  auto result = v.verify(kLabel, form, &cb);
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(timings.size(), 4u);
  EXPECT_EQ(timings[0].first, 0u);
  EXPECT_EQ(timings[3].first, 4u);  // net contents (index 3) skipped
  for (const auto& t : timings) {
    EXPECT_GE(t.second, 0.0);
  }
}

TEST(MakePreview, ShortTextUnchanged) {
  const std::string s(200, 'a');
  EXPECT_EQ(lc::make_preview(s, 200), s);
}

TEST(MakePreview, LongTextTruncatedWithMarker) {
  const std::string s(250, 'a');
  const std::string p = lc::make_preview(s, 200);
  EXPECT_EQ(p, std::string(200, 'a') + "...");
}

TEST(MakePreview, CountsCodePoints) {
  std::string s;
  for (int i = 0; i < 201; ++i) s += "\xC3\xA9";
  const std::string p = lc::make_preview(s, 200);
  EXPECT_EQ(p.size(), 400u + 3u);
  EXPECT_EQ(p.substr(p.size() - 3), "...");
}

TEST(LabelVerifier, PreviewKeepsRawText) {
  const auto v = labelcheck::check::make_label_verifier();
  auto result = v.verify("  Old Barrel\nWhiskey  ", full_form());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->extracted_text_preview, "  Old Barrel\nWhiskey  ");
}
