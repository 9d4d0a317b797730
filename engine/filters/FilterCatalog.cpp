#include "FilterCatalog.h"

#include "core/Log.h"
#include "filters/FilterKeys.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace Chroma {

static std::string toLower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) out.push_back((char)std::tolower((unsigned char)c));
  return out;
}

static bool icontains(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) return true;
  const std::string h = toLower(haystack);
  const std::string n = toLower(needle);
  return h.find(n) != std::string::npos;
}

static void uniquePush(std::vector<std::string> &v, std::string s) {
  for (auto &x : v) {
    if (x == s) return;
  }
  v.push_back(std::move(s));
}

static std::string representativeCategory(const std::vector<std::string> &cats) {
  for (const std::string &c : cats) {
    for (std::string_view g : FilterKeys::kGroupingCategories) {
      if (c == g) return c;
    }
  }
  return {};
}

FilterDefinition FilterCatalog::makeDefinition(std::string_view name,
                                               const FilterDescription &desc) {
  FilterDefinition def{};
  def.name = std::string(name);
  def.inputParameterKeys = desc.inputKeys;
  def.outputKeys = desc.outputKeys;

  auto attr = desc.attributes.find(std::string(FilterKeys::kAttrFilterDisplayName));
  if (attr != desc.attributes.end()) {
    if (const auto *s = std::get_if<std::string>(&attr->second))
      def.displayName = *s;
  }
  if (def.displayName.empty())
    def.displayName = def.name;

  attr = desc.attributes.find(std::string(FilterKeys::kAttrCategories));
  if (attr != desc.attributes.end()) {
    if (const auto *list = std::get_if<std::vector<std::string>>(&attr->second))
      def.categories = *list;
  }
  def.category = representativeCategory(def.categories);

  def.parameters.reserve(desc.inputKeys.size());
  for (const std::string &key : desc.inputKeys) {
    auto it = desc.inputAttributes.find(key);
    if (it == desc.inputAttributes.end()) {
      Log::Debug("Catalog: {}.{} has no attributes, dropped", def.name, key);
      continue;
    }
    std::optional<ParameterDefinition> p = parseParameter(key, it->second);
    if (!p) {
      Log::Debug("Catalog: {}.{} is malformed or of unknown type, dropped",
                 def.name, key);
      continue;
    }
    def.parameters.push_back(std::move(*p));
  }

  return def;
}

FilterCatalog FilterCatalog::build(const FilterRegistry &registry) {
  FilterCatalog cat;

  const std::vector<std::string> names = registry.listBuiltInFilterNames();
  size_t usable = 0;
  size_t supported = 0;
  for (const std::string &name : names) {
    std::optional<FilterDescription> desc = registry.describe(name);
    if (!desc) {
      Log::Warn("Catalog: registry could not describe '{}', skipped", name);
      continue;
    }
    FilterDefinition def = makeDefinition(name, *desc);
    if (def.isUsable()) ++usable;
    if (def.isSupported()) ++supported;
    cat.add(std::move(def));
  }

  Log::Info("Catalog: {} filters ({} usable, {} fully supported)", cat.size(),
            usable, supported);
  return cat;
}

FilterCatalog FilterCatalog::fromDefinitions(std::vector<FilterDefinition> defs) {
  FilterCatalog cat;
  for (FilterDefinition &d : defs) cat.add(std::move(d));
  return cat;
}

void FilterCatalog::add(FilterDefinition def) {
  if (m_byName.contains(def.name)) {
    Log::Warn("Catalog: duplicate filter '{}' ignored", def.name);
    return;
  }
  m_order.push_back(def.name);
  std::string key = def.name;
  m_byName.emplace(std::move(key), std::move(def));
}

const FilterDefinition *FilterCatalog::find(std::string_view name) const {
  auto it = m_byName.find(std::string(name));
  if (it == m_byName.end()) return nullptr;
  return &it->second;
}

std::vector<const FilterDefinition *>
FilterCatalog::addable(bool includeUnsupported) const {
  std::vector<const FilterDefinition *> out;
  for (const std::string &n : m_order) {
    const FilterDefinition &d = m_byName.at(n);
    if (!d.isUsable()) continue;
    if (!includeUnsupported && !d.isSupported()) continue;
    out.push_back(&d);
  }
  return out;
}

std::vector<CatalogGroup> FilterCatalog::grouped(bool includeUnsupported) const {
  std::map<std::string, std::vector<const FilterDefinition *>> byCategory;
  for (const FilterDefinition *d : addable(includeUnsupported)) {
    if (d->category.empty()) {
      Log::Debug("Catalog: '{}' has no grouping category", d->name);
      continue;
    }
    byCategory[d->category].push_back(d);
  }

  std::vector<CatalogGroup> out;
  out.reserve(byCategory.size());
  for (auto &[category, filters] : byCategory) {
    std::stable_sort(filters.begin(), filters.end(),
                     [](const FilterDefinition *a, const FilterDefinition *b) {
                       return a->name < b->name;
                     });
    out.push_back(CatalogGroup{category, std::move(filters)});
  }
  return out;
}

std::vector<const FilterDefinition *>
FilterCatalog::search(std::string_view query, std::string_view category) const {
  std::vector<const FilterDefinition *> out;

  const std::string q = toLower(query);
  const std::string cat = toLower(category);

  for (const std::string &n : m_order) {
    const FilterDefinition &d = m_byName.at(n);
    if (!cat.empty() && toLower(d.category) != cat) continue;

    if (q.empty()) {
      out.push_back(&d);
      continue;
    }

    bool hit = icontains(d.name, q) || icontains(d.displayName, q) ||
               icontains(d.category, q);
    if (!hit) {
      for (const ParameterDefinition &p : d.parameters) {
        if (icontains(p.displayName, q)) {
          hit = true;
          break;
        }
      }
    }

    if (hit) out.push_back(&d);
  }

  // stable sort by category then name
  std::stable_sort(out.begin(), out.end(),
                   [](const FilterDefinition *a, const FilterDefinition *b) {
                     const int c = toLower(a->category).compare(toLower(b->category));
                     if (c != 0) return c < 0;
                     return toLower(a->name) < toLower(b->name);
                   });

  return out;
}

std::vector<std::string> FilterCatalog::categories() const {
  std::vector<std::string> cats;
  for (const std::string &n : m_order) {
    const FilterDefinition &d = m_byName.at(n);
    if (!d.category.empty()) uniquePush(cats, d.category);
  }
  std::stable_sort(cats.begin(), cats.end());
  return cats;
}

} // namespace Chroma
