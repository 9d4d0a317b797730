#include "FilterDefinition.h"

#include "filters/FilterKeys.h"

#include <algorithm>

namespace Chroma {

static bool containsKey(const std::vector<std::string> &keys,
                        std::string_view key) {
  return std::find(keys.begin(), keys.end(), key) != keys.end();
}

bool FilterDefinition::hasImageInput() const {
  return containsKey(inputParameterKeys, FilterKeys::kInputImage);
}

bool FilterDefinition::hasImageOutput() const {
  return containsKey(outputKeys, FilterKeys::kOutputImage);
}

bool FilterDefinition::hasBackgroundImage() const {
  return containsKey(inputParameterKeys, FilterKeys::kInputBackgroundImage);
}

bool FilterDefinition::hasTargetImage() const {
  return containsKey(inputParameterKeys, FilterKeys::kInputTargetImage);
}

bool FilterDefinition::isUsable() const {
  return hasImageInput() && hasImageOutput();
}

bool FilterDefinition::isSupported() const {
  if (!isUsable())
    return false;
  return std::all_of(parameters.begin(), parameters.end(),
                     [](const ParameterDefinition &p) { return p.isSupported(); });
}

std::vector<const ParameterDefinition *>
FilterDefinition::editableParameters() const {
  std::vector<const ParameterDefinition *> out;
  for (const ParameterDefinition &p : parameters) {
    if (p.isImageRole() || !p.isSupported())
      continue;
    out.push_back(&p);
  }
  return out;
}

const ParameterDefinition *
FilterDefinition::findParameter(std::string_view key) const {
  for (const ParameterDefinition &p : parameters) {
    if (p.name == key)
      return &p;
  }
  return nullptr;
}

} // namespace Chroma
