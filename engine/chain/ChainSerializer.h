#pragma once

#include "chain/FilterChain.h"

#include <expected>
#include <string>

namespace Chroma {

// JSON exchange format:
//   { "userFilters": [ { "id": "<uuid>", "name": "...", "isEnabled": true,
//                        "inputs": [ { "name", "displayName", "value" } ] } ] }
// Import also accepts a bare array of records and "enabled" for "isEnabled".
struct ChainSerializer final {
  static std::string toJson(const FilterChain &chain, bool pretty = true);
  static std::expected<FilterChain, std::string> fromJson(const std::string &text);

  static std::expected<void, std::string> saveFile(const std::string &path,
                                                   const FilterChain &chain);
  static std::expected<FilterChain, std::string> loadFile(const std::string &path);
};

} // namespace Chroma
