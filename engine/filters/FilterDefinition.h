#pragma once

#include "filters/ParameterModel.h"

#include <string>
#include <vector>

namespace Chroma {

// Immutable description of one available filter. Built by FilterCatalog.
struct FilterDefinition final {
  std::string name;
  std::string displayName; // falls back to name
  std::vector<std::string> categories;
  std::string category; // representative grouping category, may be empty

  std::vector<std::string> inputParameterKeys;
  std::vector<std::string> outputKeys;

  // Parsed from inputParameterKeys; malformed declarations are absent.
  std::vector<ParameterDefinition> parameters;

  bool hasImageInput() const;
  bool hasImageOutput() const;
  bool hasBackgroundImage() const;
  bool hasTargetImage() const;

  // Declares a primary image input and a primary image output.
  bool isUsable() const;
  // Usable, and every non-image-role parameter is editable.
  bool isSupported() const;

  // Supported, non-image-role parameters in declaration order.
  std::vector<const ParameterDefinition *> editableParameters() const;

  const ParameterDefinition *findParameter(std::string_view key) const;
};

} // namespace Chroma
