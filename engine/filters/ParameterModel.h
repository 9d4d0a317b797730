#pragma once

#include "filters/FilterRegistry.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Chroma {

// Closed set of declared input kinds. Tags outside this set are ignored.
enum class ParamType : uint8_t {
  Time = 0,
  Scalar,
  Distance,
  Angle,
  Boolean,
  Integer,
  Count,
  Position,
  Offset,
  Position3,
  Rectangle,
  OpaqueColor,
  Color,
  Gradient,
  Image,
  Transform,
};

std::optional<ParamType> parseParamType(std::string_view tag);
std::string_view paramTypeName(ParamType t);

// Types exposed for numeric editing.
bool isEditableType(ParamType t);

// Primary, background and target image keys.
bool isImageRoleKey(std::string_view key);

// Each bound is independent; absence is not zero.
struct ParamBounds final {
  std::optional<double> defaultValue;
  std::optional<double> identityValue;
  std::optional<double> minValue;
  std::optional<double> maxValue;
  std::optional<double> sliderMinValue;
  std::optional<double> sliderMaxValue;

  // default -> identity -> min -> max -> sliderMin -> sliderMax -> 0
  double preferredDefault() const;
  // min -> sliderMin -> 0
  double preferredSliderMin() const;
  // max -> sliderMax -> 0
  double preferredSliderMax() const;

  bool operator==(const ParamBounds &) const = default;
};

struct ParameterDefinition final {
  std::string name;
  std::string displayName;
  std::string classType;
  std::optional<std::string> description;
  ParamType type = ParamType::Scalar;
  ParamBounds bounds;

  bool isImageRole() const { return isImageRoleKey(name); }
  bool isEditable() const { return isEditableType(type); }
  bool isSupported() const { return isEditable() || isImageRole(); }

  double preferredDefault() const { return bounds.preferredDefault(); }
  double preferredSliderMin() const { return bounds.preferredSliderMin(); }
  double preferredSliderMax() const { return bounds.preferredSliderMax(); }
};

// Validates one declared input. nullopt when the type tag is missing or
// unknown, or when displayName/class are not strings.
std::optional<ParameterDefinition> parseParameter(std::string_view key,
                                                  const AttributeMap &attributes);

} // namespace Chroma
