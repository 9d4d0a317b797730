#include "ParameterModel.h"

#include "filters/FilterKeys.h"

#include <array>
#include <utility>

namespace Chroma {

namespace {

struct TypeTag final {
  std::string_view tag;
  ParamType type;
};

constexpr std::array<TypeTag, 16> kTypeTags = {{
    {"time", ParamType::Time},
    {"scalar", ParamType::Scalar},
    {"distance", ParamType::Distance},
    {"angle", ParamType::Angle},
    {"boolean", ParamType::Boolean},
    {"integer", ParamType::Integer},
    {"count", ParamType::Count},
    {"position", ParamType::Position},
    {"offset", ParamType::Offset},
    {"position3", ParamType::Position3},
    {"rectangle", ParamType::Rectangle},
    {"opaqueColor", ParamType::OpaqueColor},
    {"color", ParamType::Color},
    {"gradient", ParamType::Gradient},
    {"image", ParamType::Image},
    {"transform", ParamType::Transform},
}};

const AttributeValue *findAttr(const AttributeMap &m, std::string_view key) {
  auto it = m.find(std::string(key));
  if (it == m.end())
    return nullptr;
  return &it->second;
}

const std::string *stringAttr(const AttributeMap &m, std::string_view key) {
  const AttributeValue *v = findAttr(m, key);
  if (!v)
    return nullptr;
  return std::get_if<std::string>(v);
}

std::optional<double> numberAttr(const AttributeMap &m, std::string_view key) {
  const AttributeValue *v = findAttr(m, key);
  if (!v)
    return std::nullopt;
  if (const double *d = std::get_if<double>(v))
    return *d;
  return std::nullopt;
}

} // namespace

std::optional<ParamType> parseParamType(std::string_view tag) {
  for (const TypeTag &t : kTypeTags) {
    if (t.tag == tag)
      return t.type;
  }
  return std::nullopt;
}

std::string_view paramTypeName(ParamType t) {
  for (const TypeTag &tt : kTypeTags) {
    if (tt.type == t)
      return tt.tag;
  }
  return "unknown";
}

bool isEditableType(ParamType t) {
  switch (t) {
  case ParamType::Scalar:
  case ParamType::Distance:
  case ParamType::Time:
  case ParamType::Integer:
  case ParamType::Angle:
    return true;
  default:
    return false;
  }
}

bool isImageRoleKey(std::string_view key) {
  return key == FilterKeys::kInputImage ||
         key == FilterKeys::kInputBackgroundImage ||
         key == FilterKeys::kInputTargetImage;
}

double ParamBounds::preferredDefault() const {
  if (defaultValue)
    return *defaultValue;
  if (identityValue)
    return *identityValue;
  if (minValue)
    return *minValue;
  if (maxValue)
    return *maxValue;
  if (sliderMinValue)
    return *sliderMinValue;
  if (sliderMaxValue)
    return *sliderMaxValue;
  return 0.0;
}

double ParamBounds::preferredSliderMin() const {
  if (minValue)
    return *minValue;
  if (sliderMinValue)
    return *sliderMinValue;
  return 0.0;
}

double ParamBounds::preferredSliderMax() const {
  if (maxValue)
    return *maxValue;
  if (sliderMaxValue)
    return *sliderMaxValue;
  return 0.0;
}

std::optional<ParameterDefinition> parseParameter(std::string_view key,
                                                  const AttributeMap &attributes) {
  const std::string *displayName =
      stringAttr(attributes, FilterKeys::kAttrDisplayName);
  const std::string *classType = stringAttr(attributes, FilterKeys::kAttrClass);
  if (!displayName || !classType)
    return std::nullopt;

  const std::string *tag = stringAttr(attributes, FilterKeys::kAttrType);
  if (!tag)
    return std::nullopt;
  const std::optional<ParamType> type = parseParamType(*tag);
  if (!type)
    return std::nullopt;

  ParameterDefinition p{};
  p.name = std::string(key);
  p.displayName = *displayName;
  p.classType = *classType;
  if (const std::string *desc = stringAttr(attributes, FilterKeys::kAttrDescription))
    p.description = *desc;
  p.type = *type;

  p.bounds.defaultValue = numberAttr(attributes, FilterKeys::kAttrDefault);
  p.bounds.identityValue = numberAttr(attributes, FilterKeys::kAttrIdentity);
  p.bounds.minValue = numberAttr(attributes, FilterKeys::kAttrMin);
  p.bounds.maxValue = numberAttr(attributes, FilterKeys::kAttrMax);
  p.bounds.sliderMinValue = numberAttr(attributes, FilterKeys::kAttrSliderMin);
  p.bounds.sliderMaxValue = numberAttr(attributes, FilterKeys::kAttrSliderMax);
  return p;
}

} // namespace Chroma
