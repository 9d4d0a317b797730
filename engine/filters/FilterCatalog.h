#pragma once

#include "filters/FilterDefinition.h"
#include "filters/FilterRegistry.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Chroma {

struct CatalogGroup final {
  std::string category;
  std::vector<const FilterDefinition *> filters; // sorted by name
};

// Snapshot of every filter a registry offers. Built once, read-only after.
class FilterCatalog final {
public:
  FilterCatalog() = default;

  // Never fails; filters the registry cannot describe are skipped.
  static FilterCatalog build(const FilterRegistry &registry);

  // Assembles a catalog from already parsed definitions (tests/tools).
  static FilterCatalog fromDefinitions(std::vector<FilterDefinition> defs);

  // Parses one registry description into a definition.
  static FilterDefinition makeDefinition(std::string_view name,
                                         const FilterDescription &desc);

  const std::unordered_map<std::string, FilterDefinition> &all() const {
    return m_byName;
  }
  // Registry order.
  const std::vector<std::string> &names() const { return m_order; }

  size_t size() const { return m_order.size(); }
  bool empty() const { return m_order.empty(); }

  const FilterDefinition *find(std::string_view name) const;

  // Usable definitions in registry order; unsupported ones only on request.
  std::vector<const FilterDefinition *> addable(bool includeUnsupported) const;

  // Addable definitions grouped by representative category. Categories
  // ascending, names ascending inside each group.
  std::vector<CatalogGroup> grouped(bool includeUnsupported) const;

  // Case-insensitive match over name, display name, category and parameter
  // display names. Pass "" as category to ignore it.
  std::vector<const FilterDefinition *>
  search(std::string_view query, std::string_view category = {}) const;

  std::vector<std::string> categories() const;

private:
  std::unordered_map<std::string, FilterDefinition> m_byName;
  std::vector<std::string> m_order;

  void add(FilterDefinition def);
};

} // namespace Chroma
