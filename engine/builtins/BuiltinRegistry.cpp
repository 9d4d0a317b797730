#include "BuiltinRegistry.h"

#include "core/Assert.h"
#include "core/Log.h"
#include "filters/FilterKeys.h"

#include <algorithm>

namespace Chroma {

void BoundInputs::set(std::string_view key, InputValue v) {
  if (std::holds_alternative<std::monostate>(v)) {
    m_values.erase(std::string(key));
    return;
  }
  m_values.insert_or_assign(std::string(key), std::move(v));
}

ImageRef BoundInputs::image(std::string_view key) const {
  auto it = m_values.find(std::string(key));
  if (it == m_values.end())
    return nullptr;
  if (const ImageRef *img = std::get_if<ImageRef>(&it->second))
    return *img;
  return nullptr;
}

double BoundInputs::number(std::string_view key, double def) const {
  auto it = m_values.find(std::string(key));
  if (it == m_values.end())
    return def;
  if (const double *d = std::get_if<double>(&it->second))
    return *d;
  return def;
}

namespace {

class BuiltinInstance final : public FilterInstance {
public:
  explicit BuiltinInstance(const BuiltinFilterInfo &info) : m_info(info) {
    m_keys.reserve(info.inputs.size());
    for (const BuiltinParamSpec &p : info.inputs) m_keys.emplace_back(p.key);

    // Numeric inputs start at their declared default.
    for (const BuiltinParamSpec &p : info.inputs) {
      if (p.def)
        m_inputs.set(p.key, *p.def);
    }
  }

  const std::string &name() const override { return m_info.name; }
  const std::vector<std::string> &inputKeys() const override { return m_keys; }

  void setInput(std::string_view key, InputValue value) override {
    if (std::find(m_keys.begin(), m_keys.end(), key) == m_keys.end()) {
      Log::Debug("{}: ignoring unknown input '{}'", m_info.name, key);
      return;
    }
    m_inputs.set(key, std::move(value));
  }

  ImageRef output() override {
    if (!m_info.process)
      return nullptr;
    return m_info.process(m_inputs);
  }

private:
  const BuiltinFilterInfo &m_info;
  std::vector<std::string> m_keys;
  BoundInputs m_inputs;
};

void putNumber(AttributeMap &m, std::string_view key, const std::optional<double> &v) {
  if (v)
    m.emplace(std::string(key), *v);
}

} // namespace

BuiltinRegistry::BuiltinRegistry() { registerBuiltins(); }

void BuiltinRegistry::clear() {
  m_filters.clear();
  m_byName.clear();
}

void BuiltinRegistry::add(BuiltinFilterInfo info) {
  CHROMA_ASSERT(!info.name.empty(), "Builtin filter missing name");
  CHROMA_ASSERT(!m_byName.contains(info.name), "Builtin filter registered twice");

  m_byName.emplace(info.name, m_filters.size());
  m_filters.push_back(std::move(info));
}

const BuiltinFilterInfo *BuiltinRegistry::findInfo(std::string_view name) const {
  auto it = m_byName.find(std::string(name));
  if (it == m_byName.end())
    return nullptr;
  return &m_filters[it->second];
}

std::vector<std::string> BuiltinRegistry::listBuiltInFilterNames() const {
  std::vector<std::string> out;
  for (const BuiltinFilterInfo &f : m_filters) {
    const bool builtIn = std::find(f.categories.begin(), f.categories.end(),
                                   FilterKeys::kCategoryBuiltIn) != f.categories.end();
    if (builtIn)
      out.push_back(f.name);
  }
  return out;
}

std::optional<FilterDescription>
BuiltinRegistry::describe(std::string_view filterName) const {
  const BuiltinFilterInfo *f = findInfo(filterName);
  if (!f)
    return std::nullopt;

  FilterDescription d{};
  d.outputKeys = f->outputs;
  d.attributes.emplace(std::string(FilterKeys::kAttrFilterDisplayName), f->displayName);
  d.attributes.emplace(std::string(FilterKeys::kAttrCategories), f->categories);

  for (const BuiltinParamSpec &p : f->inputs) {
    d.inputKeys.emplace_back(p.key);

    AttributeMap a;
    a.emplace(std::string(FilterKeys::kAttrDisplayName), std::string(p.displayName));
    a.emplace(std::string(FilterKeys::kAttrClass), std::string(p.classType));
    a.emplace(std::string(FilterKeys::kAttrType), std::string(p.type));
    putNumber(a, FilterKeys::kAttrDefault, p.def);
    putNumber(a, FilterKeys::kAttrIdentity, p.identity);
    putNumber(a, FilterKeys::kAttrMin, p.min);
    putNumber(a, FilterKeys::kAttrMax, p.max);
    putNumber(a, FilterKeys::kAttrSliderMin, p.sliderMin);
    putNumber(a, FilterKeys::kAttrSliderMax, p.sliderMax);
    d.inputAttributes.emplace(p.key, std::move(a));
  }
  return d;
}

std::unique_ptr<FilterInstance>
BuiltinRegistry::instantiate(std::string_view filterName) const {
  const BuiltinFilterInfo *f = findInfo(filterName);
  if (!f)
    return nullptr;
  return std::make_unique<BuiltinInstance>(*f);
}

} // namespace Chroma
