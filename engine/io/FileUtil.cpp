#include "FileUtil.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace Chroma::FileUtil {

namespace {

struct FileCloser final {
  void operator()(FILE *f) const {
    if (f)
      std::fclose(f);
  }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

std::string osReason() { return std::strerror(errno); }

} // namespace

std::expected<std::string, std::string> readText(const std::string &path) {
  FilePtr f(std::fopen(path.c_str(), "rb"));
  if (!f)
    return std::unexpected("Cannot open '" + path + "': " + osReason());

  std::string out;
  char buf[16 * 1024];
  for (;;) {
    const size_t n = std::fread(buf, 1, sizeof(buf), f.get());
    out.append(buf, n);
    if (n < sizeof(buf))
      break;
  }
  if (std::ferror(f.get()))
    return std::unexpected("Read error on '" + path + "'");
  return out;
}

std::expected<void, std::string> writeTextAtomic(const std::string &path,
                                                 const std::string &text) {
  const fs::path target(path);
  fs::path tmpPath = target;
  tmpPath += ".tmp";

  {
    FilePtr f(std::fopen(tmpPath.string().c_str(), "wb"));
    if (!f)
      return std::unexpected("Cannot create '" + tmpPath.string() + "': " + osReason());

    const bool ok = std::fwrite(text.data(), 1, text.size(), f.get()) == text.size() &&
                    std::fflush(f.get()) == 0;
#if !defined(_WIN32)
    if (ok)
      (void)::fsync(fileno(f.get()));
#endif
    if (!ok) {
      f.reset();
      std::error_code ec;
      fs::remove(tmpPath, ec);
      return std::unexpected("Short write to '" + tmpPath.string() + "'");
    }
  }

  std::error_code ec;
  fs::rename(tmpPath, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmpPath, ignored);
    return std::unexpected("Cannot replace '" + path + "': " + ec.message());
  }
  return {};
}

} // namespace Chroma::FileUtil
