#include "Log.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Chroma::Log {

spdlog::level::level_enum ParseLevel(std::string_view name) {
  if (name == "trace")
    return spdlog::level::trace;
  if (name == "debug")
    return spdlog::level::debug;
  if (name == "warn" || name == "warning")
    return spdlog::level::warn;
  if (name == "error")
    return spdlog::level::err;
  if (name == "critical")
    return spdlog::level::critical;
  if (name == "off")
    return spdlog::level::off;
  return spdlog::level::info;
}

void Init(const Settings &settings) {
  namespace fs = std::filesystem;

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  std::string fileError;
  if (!settings.file.empty()) {
    const fs::path p(settings.file);
    std::error_code ec;
    if (p.has_parent_path())
      fs::create_directories(p.parent_path(), ec);
    if (ec) {
      fileError = ec.message();
    } else {
      try {
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(p.string(), true));
      } catch (const spdlog::spdlog_ex &e) {
        fileError = e.what();
      }
    }
  }

  auto logger =
      std::make_shared<spdlog::logger>("chroma", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%T] [%^%l%$] %v");
  spdlog::set_level(ParseLevel(settings.level));
  spdlog::flush_on(spdlog::level::info);

  if (!fileError.empty())
    spdlog::warn("Could not open log file '{}' ({}), logging to console only",
                 settings.file, fileError);
}

} // namespace Chroma::Log
