#pragma once

#include "image/Image.h"

#include <expected>
#include <string>

namespace Chroma::ImageIO {

// Decodes any format stb_image understands into an 8-bit sRGB-tagged image.
// File formats handled here carry no orientation, so callers pass the EXIF
// tag they obtained elsewhere.
std::expected<Image, std::string> load(const std::string &path,
                                       Orientation orientation = Orientation::Up);

// Writes the stored pixels as PNG, encoding to sRGB first when the image is
// linear.
std::expected<void, std::string> savePNG(const std::string &path,
                                         const Image &image);

} // namespace Chroma::ImageIO
