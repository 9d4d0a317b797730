#pragma once

#include <cstdlib>
#include <spdlog/spdlog.h>

// Internal invariant check. Recoverable conditions are reported through
// std::expected/std::optional instead.
#if !defined(CHROMA_ASSERT)
#define CHROMA_ASSERT(expr, msg)                                               \
  do {                                                                         \
    if (!(expr)) {                                                             \
      spdlog::critical("ASSERT FAILED: {} | {}:{} | {}", #expr, __FILE__,      \
                       __LINE__, msg);                                         \
      std::abort();                                                            \
    }                                                                          \
  } while (false)
#endif
