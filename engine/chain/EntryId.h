#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Chroma {

// Identity of one chain entry. Rendered as a UUID string when exported so
// chains from other tools import unchanged.
struct EntryId final {
  uint64_t hi = 0;
  uint64_t lo = 0;

  explicit operator bool() const { return hi != 0 || lo != 0; }

  bool operator==(const EntryId &o) const = default;
  bool operator<(const EntryId &o) const {
    return hi != o.hi ? hi < o.hi : lo < o.lo;
  }

  // Random version-4 id. Never all-zero; 122 random bits.
  static EntryId generate();

  std::string toString() const;
  // Accepts 8-4-4-4-12 hex groups, any case.
  static std::optional<EntryId> parse(std::string_view text);
};

struct EntryIdHash final {
  size_t operator()(const EntryId &id) const noexcept {
    uint64_t x = id.hi ^ (id.lo * 0x9E3779B97F4A7C15ULL);
    x ^= x >> 33;
    x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33;
    x *= 0xc4ceb9fe1a85ec53ULL;
    x ^= x >> 33;
    return (size_t)x;
  }
};

} // namespace Chroma
