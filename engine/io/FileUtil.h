#pragma once

#include <expected>
#include <string>

namespace Chroma::FileUtil {

// Whole file as text. Error carries the path and the OS reason.
std::expected<std::string, std::string> readText(const std::string &path);

// Writes a sibling temp file, then renames it over `path`, so readers never
// see a partial document.
std::expected<void, std::string> writeTextAtomic(const std::string &path,
                                                 const std::string &text);

} // namespace Chroma::FileUtil
