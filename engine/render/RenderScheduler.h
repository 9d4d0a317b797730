#pragma once

#include "chain/FilterChain.h"
#include "render/ChainExecutor.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace Chroma {

// Everything a render depends on. Any change to it warrants a new request.
struct RenderRequest final {
  FilterChain chain;
  ImageRef base;
  ImageRef secondary;
  bool scaleSecondaryToFit = false;
};

struct RenderDelivery final {
  uint64_t generation = 0;
  // Null with no error when there was nothing to render (empty chain).
  ImageRef image;
  std::optional<RenderError> error;

  bool ok() const { return !error.has_value(); }
};

// Renders the most recent request on a worker thread. Requests are debounced;
// a newer request cancels the one in flight and only results for the newest
// request are ever handed out.
class RenderScheduler final {
public:
  RenderScheduler(const FilterRegistry &registry,
                  std::chrono::milliseconds debounce);
  ~RenderScheduler();

  RenderScheduler(const RenderScheduler &) = delete;
  RenderScheduler &operator=(const RenderScheduler &) = delete;

  // Returns the request's generation.
  uint64_t request(RenderRequest req);

  // Takes the finished result for the newest request, if there is one.
  // Call from the thread that owns the display.
  bool consume(RenderDelivery &out);

  // Blocks until the newest request has finished rendering.
  bool waitIdle(std::chrono::milliseconds timeout);

  uint64_t latestGeneration() const;
  std::chrono::milliseconds debounce() const { return m_debounce; }

  void shutdown();

private:
  using Clock = std::chrono::steady_clock;

  ChainExecutor m_executor; // worker thread only
  const std::chrono::milliseconds m_debounce;

  std::thread m_worker;
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::condition_variable m_idleCv;
  std::atomic<bool> m_stop{false};

  std::optional<RenderRequest> m_pending;
  Clock::time_point m_pendingAt{};
  uint64_t m_requested = 0;
  uint64_t m_finished = 0;
  std::shared_ptr<std::atomic<bool>> m_inflightCancel;
  std::optional<RenderDelivery> m_ready;

  void workerLoop();
  RenderDelivery run(RenderRequest &req, uint64_t generation,
                     const std::atomic<bool> &cancel, bool &wasCancelled);
};

} // namespace Chroma
