#include "FilterChain.h"

#include "filters/FilterCatalog.h"
#include "filters/FilterDefinition.h"

#include <algorithm>
#include <cmath>

namespace Chroma {

const ParameterOverride *ChainEntry::findOverride(std::string_view param) const {
  for (const ParameterOverride &o : parameterOverrides) {
    if (o.name == param)
      return &o;
  }
  return nullptr;
}

const char *chainErrorMessage(ChainError e) {
  switch (e) {
  case ChainError::FilterUnusable:
    return "filter has no image input or image output";
  case ChainError::EntryNotFound:
    return "chain entry not found";
  case ChainError::ParameterNotFound:
    return "parameter not found on chain entry";
  case ChainError::DuplicateId:
    return "chain entry id already present";
  case ChainError::InvalidValue:
    return "parameter value is not a finite number";
  }
  return "unknown chain error";
}

static std::vector<ParameterOverride> defaultOverrides(const FilterDefinition &def) {
  std::vector<ParameterOverride> out;
  for (const ParameterDefinition *p : def.editableParameters()) {
    out.push_back(ParameterOverride{p->name, p->displayName, p->preferredDefault()});
  }
  return out;
}

ChainEntry FilterChain::makeEntry(const FilterDefinition &def) {
  ChainEntry e{};
  e.id = EntryId::generate();
  e.name = def.name;
  e.enabled = true;
  e.parameterOverrides = defaultOverrides(def);
  return e;
}

std::expected<EntryId, ChainError> FilterChain::append(const FilterDefinition &def) {
  return insert(def, m_entries.size());
}

std::expected<EntryId, ChainError> FilterChain::insert(const FilterDefinition &def,
                                                       size_t index) {
  if (!def.isUsable())
    return std::unexpected(ChainError::FilterUnusable);

  ChainEntry e = makeEntry(def);
  const EntryId id = e.id;
  index = std::min(index, m_entries.size());
  m_entries.insert(m_entries.begin() + (std::ptrdiff_t)index, std::move(e));
  return id;
}

std::expected<void, ChainError> FilterChain::appendEntry(ChainEntry entry) {
  if (find(entry.id))
    return std::unexpected(ChainError::DuplicateId);
  m_entries.push_back(std::move(entry));
  return {};
}

bool FilterChain::remove(const EntryId &id) {
  auto it = std::find_if(m_entries.begin(), m_entries.end(),
                         [&](const ChainEntry &e) { return e.id == id; });
  if (it == m_entries.end())
    return false;
  m_entries.erase(it);
  return true;
}

bool FilterChain::move(const EntryId &id, size_t toIndex) {
  const size_t from = indexOf(id);
  if (from >= m_entries.size())
    return false;

  const size_t to = std::min(toIndex, m_entries.size() - 1);
  if (from == to)
    return true;

  ChainEntry e = std::move(m_entries[from]);
  m_entries.erase(m_entries.begin() + (std::ptrdiff_t)from);
  m_entries.insert(m_entries.begin() + (std::ptrdiff_t)to, std::move(e));
  return true;
}

bool FilterChain::setEnabled(const EntryId &id, bool enabled) {
  ChainEntry *e = findMutable(id);
  if (!e)
    return false;
  e->enabled = enabled;
  return true;
}

std::expected<void, ChainError> FilterChain::setParameter(const EntryId &id,
                                                          std::string_view parameterName,
                                                          double value) {
  ChainEntry *e = findMutable(id);
  if (!e)
    return std::unexpected(ChainError::EntryNotFound);
  if (!std::isfinite(value))
    return std::unexpected(ChainError::InvalidValue);

  for (ParameterOverride &o : e->parameterOverrides) {
    if (o.name == parameterName) {
      o.value = value;
      return {};
    }
  }
  return std::unexpected(ChainError::ParameterNotFound);
}

std::expected<void, ChainError>
FilterChain::resetToDefaults(const EntryId &id, const FilterCatalog &catalog) {
  ChainEntry *e = findMutable(id);
  if (!e)
    return std::unexpected(ChainError::EntryNotFound);
  const FilterDefinition *def = catalog.find(e->name);
  if (!def || !def->isUsable())
    return std::unexpected(ChainError::FilterUnusable);
  e->parameterOverrides = defaultOverrides(*def);
  return {};
}

const ChainEntry *FilterChain::find(const EntryId &id) const {
  for (const ChainEntry &e : m_entries) {
    if (e.id == id)
      return &e;
  }
  return nullptr;
}

ChainEntry *FilterChain::findMutable(const EntryId &id) {
  for (ChainEntry &e : m_entries) {
    if (e.id == id)
      return &e;
  }
  return nullptr;
}

size_t FilterChain::indexOf(const EntryId &id) const {
  for (size_t i = 0; i < m_entries.size(); ++i) {
    if (m_entries[i].id == id)
      return i;
  }
  return m_entries.size();
}

size_t FilterChain::enabledCount() const {
  return (size_t)std::count_if(m_entries.begin(), m_entries.end(),
                               [](const ChainEntry &e) { return e.enabled; });
}

} // namespace Chroma
