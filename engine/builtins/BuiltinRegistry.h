#pragma once

#include "filters/FilterRegistry.h"

#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Chroma {

// Inputs bound on one builtin instance.
class BoundInputs final {
public:
  void set(std::string_view key, InputValue v);

  ImageRef image(std::string_view key) const;
  double number(std::string_view key, double def) const;

private:
  std::unordered_map<std::string, InputValue> m_values;
};

using BuiltinProcessFn = ImageRef (*)(const BoundInputs &in);

// Declared input of a builtin filter.
struct BuiltinParamSpec final {
  const char *key = "";
  const char *displayName = "";
  const char *type = "scalar";
  const char *classType = "NSNumber";
  std::optional<double> def;
  std::optional<double> identity;
  std::optional<double> min;
  std::optional<double> max;
  std::optional<double> sliderMin;
  std::optional<double> sliderMax;
};

struct BuiltinFilterInfo final {
  std::string name;
  std::string displayName;
  std::vector<std::string> categories;
  std::vector<BuiltinParamSpec> inputs;
  std::vector<std::string> outputs;
  BuiltinProcessFn process = nullptr;
};

// CPU reference implementation of a filter library. The engine only sees it
// through FilterRegistry; the CLI and tests use it as a concrete backend.
class BuiltinRegistry final : public FilterRegistry {
public:
  BuiltinRegistry();

  // Removes all filters (tests/tools).
  void clear();
  void registerBuiltins();
  void add(BuiltinFilterInfo info);

  const BuiltinFilterInfo *findInfo(std::string_view name) const;

  std::vector<std::string> listBuiltInFilterNames() const override;
  std::optional<FilterDescription> describe(std::string_view filterName) const override;
  std::unique_ptr<FilterInstance> instantiate(std::string_view filterName) const override;

private:
  std::deque<BuiltinFilterInfo> m_filters; // stable addresses for live instances
  std::unordered_map<std::string, size_t> m_byName;
};

} // namespace Chroma
