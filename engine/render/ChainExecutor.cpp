#include "ChainExecutor.h"

#include "core/Log.h"
#include "filters/FilterKeys.h"

#include <algorithm>
#include <unordered_set>

namespace Chroma {

std::string RenderError::message() const {
  switch (code) {
  case RenderErrorCode::MissingOutput:
    return "Processing failed at filter \"" + filterName + "\".";
  case RenderErrorCode::UnknownFilter:
    return "Filter \"" + filterName + "\" is not available.";
  case RenderErrorCode::Cancelled:
    return "Processing was cancelled.";
  }
  return "Processing failed.";
}

static bool declares(const FilterInstance &f, std::string_view key) {
  const auto &keys = f.inputKeys();
  return std::find(keys.begin(), keys.end(), key) != keys.end();
}

static bool cancelled(const std::atomic<bool> *cancel) {
  return cancel && cancel->load(std::memory_order_relaxed);
}

RenderResult ChainExecutor::render(const FilterChain &chain, const Image &base,
                                   const Image *secondary,
                                   bool scaleSecondaryToFit,
                                   const std::atomic<bool> *cancel) {
  // Upright, linear working copies. Caller images are never touched.
  auto working = std::make_shared<const Image>(base.oriented().linearized());

  ImageRef sec;
  if (secondary && !secondary->empty()) {
    Image s = secondary->oriented().linearized();
    if (scaleSecondaryToFit && s.size() != working->size()) {
      Image scaled = s.resized(working->width(), working->height());
      if (scaled.empty()) {
        Log::Warn("Render: could not rescale secondary image {}x{} -> {}x{}",
                  s.width(), s.height(), working->width(), working->height());
      } else {
        s = std::move(scaled);
      }
    }
    sec = std::make_shared<const Image>(std::move(s));
  }

  // Instances created by this render; committed to the cache unless cancelled.
  InstanceMap created;
  auto instanceFor = [&](const ChainEntry &e) -> FilterInstance * {
    if (auto it = m_instances.find(e.id); it != m_instances.end())
      return it->second.get();
    if (auto it = created.find(e.id); it != created.end())
      return it->second.get();
    std::unique_ptr<FilterInstance> inst = m_registry.instantiate(e.name);
    if (!inst)
      return nullptr;
    FilterInstance *raw = inst.get();
    created.emplace(e.id, std::move(inst));
    return raw;
  };
  auto commit = [&] {
    for (auto &[id, inst] : created) m_instances[id] = std::move(inst);
    evictStale(chain);
  };

  ImageRef current = working;
  for (const ChainEntry &e : chain.entries()) {
    if (cancelled(cancel))
      return std::unexpected(RenderError{RenderErrorCode::Cancelled, e.name, e.id});
    if (!e.enabled)
      continue;

    FilterInstance *f = instanceFor(e);
    if (!f) {
      commit();
      Log::Warn("Render: no filter named '{}' in registry", e.name);
      return std::unexpected(RenderError{RenderErrorCode::UnknownFilter, e.name, e.id});
    }

    if (declares(*f, FilterKeys::kInputImage))
      f->setInput(FilterKeys::kInputImage, current);

    // Background wins when a filter declares both secondary roles.
    if (declares(*f, FilterKeys::kInputBackgroundImage)) {
      f->setInput(FilterKeys::kInputBackgroundImage,
                  sec ? InputValue{sec} : InputValue{});
    } else if (declares(*f, FilterKeys::kInputTargetImage)) {
      f->setInput(FilterKeys::kInputTargetImage,
                  sec ? InputValue{sec} : InputValue{});
    }

    for (const ParameterOverride &o : e.parameterOverrides)
      f->setInput(o.name, o.value);

    ImageRef out = f->output();
    if (!out) {
      commit();
      Log::Warn("Render: filter '{}' produced no output", f->name());
      return std::unexpected(
          RenderError{RenderErrorCode::MissingOutput, f->name(), e.id});
    }
    current = std::move(out);
  }

  if (cancelled(cancel))
    return std::unexpected(RenderError{RenderErrorCode::Cancelled, {}, {}});

  Image result = current->cropped(working->width(), working->height())
                     .encodedAs(base.colorSpace())
                     .reorientedTo(base.orientation());
  result.setScale(base.scale());

  if (cancelled(cancel))
    return std::unexpected(RenderError{RenderErrorCode::Cancelled, {}, {}});

  commit();
  Log::Debug("Render: {} of {} entries applied, {}x{}", chain.enabledCount(),
             chain.size(), result.width(), result.height());
  return result;
}

size_t ChainExecutor::evictStale(const FilterChain &chain) {
  std::unordered_set<EntryId, EntryIdHash> live;
  for (const ChainEntry &e : chain.entries()) live.insert(e.id);

  size_t evicted = 0;
  for (auto it = m_instances.begin(); it != m_instances.end();) {
    if (!live.contains(it->first)) {
      it = m_instances.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  return evicted;
}

const FilterInstance *ChainExecutor::cachedInstance(const EntryId &id) const {
  auto it = m_instances.find(id);
  if (it == m_instances.end())
    return nullptr;
  return it->second.get();
}

} // namespace Chroma
