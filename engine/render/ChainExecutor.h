#pragma once

#include "chain/FilterChain.h"
#include "filters/FilterRegistry.h"
#include "image/Image.h"

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <unordered_map>

namespace Chroma {

enum class RenderErrorCode : uint8_t {
  MissingOutput, // a step produced no image
  UnknownFilter, // registry could not instantiate the entry's filter
  Cancelled,     // superseded; not a failure, yields no result
};

struct RenderError final {
  RenderErrorCode code = RenderErrorCode::MissingOutput;
  std::string filterName;
  EntryId entryId;

  bool isCancelled() const { return code == RenderErrorCode::Cancelled; }
  // User-facing text, e.g. Processing failed at filter "Bloom".
  std::string message() const;
};

using RenderResult = std::expected<Image, RenderError>;

// Runs a chain against concrete images. Filter instances are cached per
// chain entry id and reused for every later render of that entry.
// Not thread-safe: one render at a time (RenderScheduler owns one per worker).
class ChainExecutor final {
public:
  explicit ChainExecutor(const FilterRegistry &registry) : m_registry(registry) {}

  // Output has the base image's stored size, orientation, color space and
  // scale. Fails as a whole when any enabled step has no output. If `cancel`
  // becomes true the render stops and the instance cache is left as it was.
  RenderResult render(const FilterChain &chain, const Image &base,
                      const Image *secondary, bool scaleSecondaryToFit,
                      const std::atomic<bool> *cancel = nullptr);

  // Drops cached instances whose entry is no longer in the chain.
  size_t evictStale(const FilterChain &chain);
  void clearCache() { m_instances.clear(); }

  size_t cachedCount() const { return m_instances.size(); }
  const FilterInstance *cachedInstance(const EntryId &id) const;

private:
  using InstanceMap =
      std::unordered_map<EntryId, std::unique_ptr<FilterInstance>, EntryIdHash>;

  const FilterRegistry &m_registry;
  InstanceMap m_instances;
};

} // namespace Chroma
