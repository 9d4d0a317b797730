#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <string_view>
#include <utility>

namespace Chroma::Log {

struct Settings final {
  // trace|debug|info|warn|error|critical|off
  std::string level = "info";
  // Empty = console only.
  std::string file;
};

void Init(const Settings &settings = {});

// Parses a level name, falling back to info for anything unknown.
spdlog::level::level_enum ParseLevel(std::string_view name);

template <class... Args>
inline void Info(fmt::format_string<Args...> f, Args&&... args) {
  spdlog::info(f, std::forward<Args>(args)...);
}

template <class... Args>
inline void Warn(fmt::format_string<Args...> f, Args&&... args) {
  spdlog::warn(f, std::forward<Args>(args)...);
}

template <class... Args>
inline void Error(fmt::format_string<Args...> f, Args&&... args) {
  spdlog::error(f, std::forward<Args>(args)...);
}

template <class... Args>
inline void Debug(fmt::format_string<Args...> f, Args&&... args) {
  spdlog::debug(f, std::forward<Args>(args)...);
}

} // namespace Chroma::Log
