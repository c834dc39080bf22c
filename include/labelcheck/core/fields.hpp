#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace labelcheck::core {

/// Regulatory fields checked on a label, in report order.
enum class FieldId : std::uint8_t {
  BrandName,
  ProductClass,
  AlcoholContent,
  NetContents,
  GovernmentWarning,
};

/// Human-readable name used in reports ("Brand Name", "Product Class/Type", ...).
[[nodiscard]] std::string_view display_name(FieldId field) noexcept;

/// Form key the value arrives under ("brandName", "productClass", ...).
/// GovernmentWarning has no form value and returns an empty view.
[[nodiscard]] std::string_view form_key(FieldId field) noexcept;

/// Values submitted with the form. Only net_contents may be absent without
/// failing verification. An empty string counts as absent.
struct ExpectedFields {
  std::optional<std::string> brand_name;
  std::optional<std::string> product_class;
  std::optional<std::string> alcohol_content;
  std::optional<std::string> net_contents;

  /// Build from raw form data keyed by form_key(); unknown keys are ignored.
  [[nodiscard]] static ExpectedFields from_form(
      const std::unordered_map<std::string, std::string>& form);

  /// Value for a field, or nullopt when absent or empty.
  [[nodiscard]] std::optional<std::string_view> get(FieldId field) const;
};

}  // namespace labelcheck::core
