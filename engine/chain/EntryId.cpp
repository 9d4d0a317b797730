#include "EntryId.h"

#include <mutex>
#include <random>

namespace Chroma {

namespace {

// xorshift64* seeded from the OS once per process.
class EntryIdGen final {
public:
  EntryIdGen() {
    std::random_device rd;
    const uint64_t seed = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
    m_state = (seed == 0) ? 0x9E3779B97F4A7C15ULL : seed;
  }

  EntryId next() {
    std::lock_guard<std::mutex> lock(m_mutex);
    EntryId id{step(), step()};
    // version 4, variant 10
    id.hi = (id.hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    id.lo = (id.lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    return id;
  }

private:
  uint64_t step() {
    uint64_t x = m_state;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    m_state = x;
    return x * 2685821657736338717ULL;
  }

  std::mutex m_mutex;
  uint64_t m_state = 0;
};

EntryIdGen &generator() {
  static EntryIdGen gen;
  return gen;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

EntryId EntryId::generate() { return generator().next(); }

std::string EntryId::toString() const {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20)
      out.push_back('-');
    const uint64_t word = (i < 16) ? hi : lo;
    const int shift = 60 - 4 * (i % 16);
    out.push_back(kHex[(word >> shift) & 0xF]);
  }
  return out;
}

std::optional<EntryId> EntryId::parse(std::string_view text) {
  if (text.size() != 36)
    return std::nullopt;

  EntryId id{};
  int nibble = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-')
        return std::nullopt;
      continue;
    }
    const int v = hexValue(c);
    if (v < 0)
      return std::nullopt;
    uint64_t &word = (nibble < 16) ? id.hi : id.lo;
    word = (word << 4) | (uint64_t)v;
    ++nibble;
  }
  if (!id)
    return std::nullopt;
  return id;
}

} // namespace Chroma
