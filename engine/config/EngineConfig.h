#pragma once

#include <expected>
#include <string>
#include <unordered_map>

namespace Chroma {

struct EngineConfig final {
  int debounceMs = 20;
  bool scaleSecondaryToFit = false;
  bool showUnsupported = false;

  std::string logLevel = "info";
  std::string logFile;
};

// key=value text, '#' comments. Unknown keys are ignored and malformed values
// keep the current setting.
struct EngineConfigIO final {
  static std::expected<void, std::string> load(const std::string &path,
                                               EngineConfig &out);
  static std::expected<void, std::string> save(const std::string &path,
                                               const EngineConfig &cfg);

  static void apply(const std::unordered_map<std::string, std::string> &kv,
                    EngineConfig &out);
  static std::unordered_map<std::string, std::string>
  parseKV(const std::string &text);

private:
  static std::string trim(std::string v);

  static bool toBool(const std::string &v, bool def);
  static int toInt(const std::string &v, int def);
};

} // namespace Chroma
