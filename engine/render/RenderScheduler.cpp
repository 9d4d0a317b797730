#include "RenderScheduler.h"

#include "core/Log.h"

namespace Chroma {

RenderScheduler::RenderScheduler(const FilterRegistry &registry,
                                 std::chrono::milliseconds debounce)
    : m_executor(registry), m_debounce(debounce) {
  m_worker = std::thread([this] { workerLoop(); });
}

RenderScheduler::~RenderScheduler() { shutdown(); }

void RenderScheduler::shutdown() {
  if (!m_worker.joinable())
    return;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stop = true;
    if (m_inflightCancel)
      m_inflightCancel->store(true);
  }
  m_cv.notify_all();
  m_worker.join();
  m_idleCv.notify_all();
}

uint64_t RenderScheduler::request(RenderRequest req) {
  uint64_t gen = 0;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    gen = ++m_requested;
    m_pending = std::move(req);
    m_pendingAt = Clock::now();
    if (m_inflightCancel)
      m_inflightCancel->store(true);
    // Anything finished earlier is stale now.
    m_ready.reset();
  }
  m_cv.notify_one();
  return gen;
}

bool RenderScheduler::consume(RenderDelivery &out) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_ready)
    return false;
  out = std::move(*m_ready);
  m_ready.reset();
  return true;
}

bool RenderScheduler::waitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_idleCv.wait_for(lock, timeout, [&] {
    return m_stop || (!m_pending && m_finished >= m_requested);
  });
}

uint64_t RenderScheduler::latestGeneration() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_requested;
}

RenderDelivery RenderScheduler::run(RenderRequest &req, uint64_t generation,
                                    const std::atomic<bool> &cancel,
                                    bool &wasCancelled) {
  wasCancelled = false;
  RenderDelivery d{};
  d.generation = generation;

  if (req.chain.empty() || !req.base) {
    m_executor.evictStale(req.chain);
    return d;
  }

  RenderResult r = m_executor.render(req.chain, *req.base, req.secondary.get(),
                                     req.scaleSecondaryToFit, &cancel);
  if (r) {
    d.image = std::make_shared<const Image>(std::move(*r));
  } else if (r.error().isCancelled()) {
    wasCancelled = true;
  } else {
    d.error = r.error();
  }
  return d;
}

void RenderScheduler::workerLoop() {
  for (;;) {
    RenderRequest req;
    uint64_t gen = 0;
    std::shared_ptr<std::atomic<bool>> cancel;
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_cv.wait(lock, [&] { return m_stop || m_pending.has_value(); });
      if (m_stop)
        return;

      // Debounce: restart the wait while newer requests keep arriving.
      for (;;) {
        const Clock::time_point deadline = m_pendingAt + m_debounce;
        if (m_cv.wait_until(lock, deadline, [&] { return m_stop.load(); }))
          return;
        if (m_pendingAt + m_debounce <= Clock::now())
          break;
      }

      req = std::move(*m_pending);
      m_pending.reset();
      gen = m_requested;
      cancel = std::make_shared<std::atomic<bool>>(false);
      m_inflightCancel = cancel;
    }

    bool wasCancelled = false;
    RenderDelivery d = run(req, gen, *cancel, wasCancelled);

    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_inflightCancel.reset();
      m_finished = gen;
      if (wasCancelled) {
        Log::Debug("Render {} cancelled", gen);
      } else if (gen == m_requested) {
        if (d.error)
          Log::Warn("Render {} failed: {}", gen, d.error->message());
        m_ready = std::move(d);
      } else {
        Log::Debug("Render {} superseded by {}, dropped", gen, m_requested);
      }
    }
    m_idleCv.notify_all();
  }
}

} // namespace Chroma
