#include "EngineConfig.h"

#include "core/Log.h"
#include "io/FileUtil.h"

#include <charconv>
#include <filesystem>
#include <sstream>

namespace Chroma {

static void put(std::ostringstream &o, const char *k, bool v) {
  o << k << "=" << (v ? "1" : "0") << "\n";
}
static void put(std::ostringstream &o, const char *k, int v) {
  o << k << "=" << v << "\n";
}
static void put(std::ostringstream &o, const char *k, const std::string &v) {
  o << k << "=" << v << "\n";
}

std::expected<void, std::string> EngineConfigIO::save(const std::string &path,
                                                      const EngineConfig &cfg) {
  std::ostringstream o;
  o << "# chroma engine settings\n";
  put(o, "render.debounceMs", cfg.debounceMs);
  put(o, "render.scaleSecondaryToFit", cfg.scaleSecondaryToFit);
  put(o, "catalog.showUnsupported", cfg.showUnsupported);
  put(o, "log.level", cfg.logLevel);
  put(o, "log.file", cfg.logFile);

  return FileUtil::writeTextAtomic(path, o.str());
}

std::expected<void, std::string> EngineConfigIO::load(const std::string &path,
                                                      EngineConfig &out) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    // Not an error; defaults apply.
    return {};
  }

  auto text = FileUtil::readText(path);
  if (!text)
    return std::unexpected("Failed to read config: " + text.error());

  apply(parseKV(*text), out);
  return {};
}

void EngineConfigIO::apply(const std::unordered_map<std::string, std::string> &kv,
                           EngineConfig &out) {
  auto get = [&](const char *k) -> std::string {
    auto it = kv.find(k);
    if (it == kv.end())
      return {};
    return it->second;
  };

  out.debounceMs = toInt(get("render.debounceMs"), out.debounceMs);
  if (out.debounceMs < 0)
    out.debounceMs = 0;
  out.scaleSecondaryToFit =
      toBool(get("render.scaleSecondaryToFit"), out.scaleSecondaryToFit);
  out.showUnsupported = toBool(get("catalog.showUnsupported"), out.showUnsupported);

  if (const std::string lvl = get("log.level"); !lvl.empty())
    out.logLevel = lvl;
  if (kv.contains("log.file"))
    out.logFile = get("log.file");

  for (const auto &[k, v] : kv) {
    if (k != "render.debounceMs" && k != "render.scaleSecondaryToFit" &&
        k != "catalog.showUnsupported" && k != "log.level" && k != "log.file")
      Log::Debug("Config: unknown key '{}' ignored", k);
  }
}

std::string EngineConfigIO::trim(std::string v) {
  auto isSpace = [](unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
  };
  while (!v.empty() && isSpace((unsigned char)v.front()))
    v.erase(v.begin());
  while (!v.empty() && isSpace((unsigned char)v.back()))
    v.pop_back();
  return v;
}

std::unordered_map<std::string, std::string>
EngineConfigIO::parseKV(const std::string &text) {
  std::unordered_map<std::string, std::string> m;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty())
      continue;
    if (line[0] == '#')
      continue;
    const auto eq = line.find('=');
    if (eq == std::string::npos)
      continue;
    std::string k = trim(line.substr(0, eq));
    std::string v = trim(line.substr(eq + 1));
    if (!k.empty())
      m.insert_or_assign(std::move(k), std::move(v));
  }
  return m;
}

bool EngineConfigIO::toBool(const std::string &v, bool def) {
  if (v.empty())
    return def;
  if (v == "1" || v == "true" || v == "True" || v == "TRUE")
    return true;
  if (v == "0" || v == "false" || v == "False" || v == "FALSE")
    return false;
  return def;
}

int EngineConfigIO::toInt(const std::string &v, int def) {
  if (v.empty())
    return def;
  int out = 0;
  const char *end = v.data() + v.size();
  const auto [ptr, ec] = std::from_chars(v.data(), end, out);
  if (ec != std::errc() || ptr != end)
    return def;
  return out;
}

} // namespace Chroma
