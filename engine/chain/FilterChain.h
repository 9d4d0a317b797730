#pragma once

#include "chain/EntryId.h"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace Chroma {

struct FilterDefinition;
class FilterCatalog;

struct ParameterOverride final {
  std::string name;
  std::string displayName;
  double value = 0.0;

  bool operator==(const ParameterOverride &) const = default;
};

// One configured filter in a chain. Several entries may share a filter name.
struct ChainEntry final {
  EntryId id;
  std::string name;
  bool enabled = true;
  std::vector<ParameterOverride> parameterOverrides;

  const ParameterOverride *findOverride(std::string_view param) const;

  bool operator==(const ChainEntry &) const = default;
};

enum class ChainError : uint8_t {
  FilterUnusable,    // no primary image input/output
  EntryNotFound,     // id not in this chain
  ParameterNotFound, // entry has no override with that name
  DuplicateId,       // inserted entry id already present
  InvalidValue,      // NaN or infinite parameter value
};

const char *chainErrorMessage(ChainError e);

// Ordered filter chain; order is execution order. A plain value: copies are
// independent snapshots, so state observed elsewhere never changes under it.
class FilterChain final {
public:
  // New entry seeded from the definition's editable parameter defaults.
  static ChainEntry makeEntry(const FilterDefinition &def);

  std::expected<EntryId, ChainError> append(const FilterDefinition &def);
  // Index is clamped to [0, size()].
  std::expected<EntryId, ChainError> insert(const FilterDefinition &def,
                                            size_t index);
  // Adds an already built entry (import). Fails on a duplicate id.
  std::expected<void, ChainError> appendEntry(ChainEntry entry);

  // All return false when the id is not present.
  bool remove(const EntryId &id);
  bool move(const EntryId &id, size_t toIndex);
  bool setEnabled(const EntryId &id, bool enabled);

  // Only finite values are accepted; JSON cannot carry the others.
  std::expected<void, ChainError> setParameter(const EntryId &id,
                                               std::string_view parameterName,
                                               double value);

  // Re-seeds overrides from the catalog definition.
  std::expected<void, ChainError> resetToDefaults(const EntryId &id,
                                                  const FilterCatalog &catalog);

  const ChainEntry *find(const EntryId &id) const;
  // size() when absent.
  size_t indexOf(const EntryId &id) const;

  const std::vector<ChainEntry> &entries() const { return m_entries; }
  size_t size() const { return m_entries.size(); }
  bool empty() const { return m_entries.empty(); }
  size_t enabledCount() const;

  void clear() { m_entries.clear(); }

  bool operator==(const FilterChain &) const = default;

private:
  std::vector<ChainEntry> m_entries;

  ChainEntry *findMutable(const EntryId &id);
};

} // namespace Chroma
