#pragma once

#include "image/Image.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Chroma {

// Loosely typed attribute as a registry declares it. Consumers validate
// before use; nothing here is trusted.
using AttributeValue =
    std::variant<std::monostate, double, std::string, std::vector<std::string>>;
using AttributeMap = std::unordered_map<std::string, AttributeValue>;

struct FilterDescription final {
  std::vector<std::string> inputKeys;
  std::vector<std::string> outputKeys;

  // Filter-level attributes (display name, categories).
  AttributeMap attributes;
  // One attribute map per input key. A key may be missing.
  std::unordered_map<std::string, AttributeMap> inputAttributes;
};

using ImageRef = std::shared_ptr<const Image>;

// Value bound to a filter input. monostate unbinds the input.
using InputValue = std::variant<std::monostate, double, ImageRef>;

// One live filter object. Keeps whatever was bound last until rebound.
class FilterInstance {
public:
  virtual ~FilterInstance() = default;

  virtual const std::string &name() const = 0;
  virtual const std::vector<std::string> &inputKeys() const = 0;

  virtual void setInput(std::string_view key, InputValue value) = 0;

  // Null when the current bindings cannot produce an image.
  virtual ImageRef output() = 0;
};

// Source of filter definitions and instances (an image-processing library).
class FilterRegistry {
public:
  virtual ~FilterRegistry() = default;

  virtual std::vector<std::string> listBuiltInFilterNames() const = 0;
  virtual std::optional<FilterDescription>
  describe(std::string_view filterName) const = 0;
  virtual std::unique_ptr<FilterInstance>
  instantiate(std::string_view filterName) const = 0;
};

} // namespace Chroma
