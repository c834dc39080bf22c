#include <labelcheck/core/fields.hpp>

namespace labelcheck::core {

std::string_view display_name(FieldId field) noexcept {
  switch (field) {
    case FieldId::BrandName:
      return "Brand Name";
    case FieldId::ProductClass:
      return "Product Class/Type";
    case FieldId::AlcoholContent:
      return "Alcohol Content";
    case FieldId::NetContents:
      return "Net Contents";
    case FieldId::GovernmentWarning:
      return "Government Warning";
  }
  return "Unknown";
}

std::string_view form_key(FieldId field) noexcept {
  switch (field) {
    case FieldId::BrandName:
      return "brandName";
    case FieldId::ProductClass:
      return "productClass";
    case FieldId::AlcoholContent:
      return "alcoholContent";
    case FieldId::NetContents:
      return "netContents";
    case FieldId::GovernmentWarning:
      return {};
  }
  return {};
}

ExpectedFields ExpectedFields::from_form(
    const std::unordered_map<std::string, std::string>& form) {
  auto lookup = [&form](FieldId field) -> std::optional<std::string> {
    const auto it = form.find(std::string(form_key(field)));
    if (it == form.end()) return std::nullopt;
    return it->second;
  };

  ExpectedFields f;
  f.brand_name = lookup(FieldId::BrandName);
  f.product_class = lookup(FieldId::ProductClass);
  f.alcohol_content = lookup(FieldId::AlcoholContent);
  f.net_contents = lookup(FieldId::NetContents);
  return f;
}

std::optional<std::string_view> ExpectedFields::get(FieldId field) const {
  const std::optional<std::string>* slot = nullptr;
  switch (field) {
    case FieldId::BrandName:
      slot = &brand_name;
      break;
    case FieldId::ProductClass:
      slot = &product_class;
      break;
    case FieldId::AlcoholContent:
      slot = &alcohol_content;
      break;
    case FieldId::NetContents:
      slot = &net_contents;
      break;
    case FieldId::GovernmentWarning:
      return std::nullopt;
  }
  if (!slot || !slot->has_value() || (*slot)->empty()) return std::nullopt;
  return std::string_view(**slot);
}

}  // namespace labelcheck::core
