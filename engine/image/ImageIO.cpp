#include "ImageIO.h"

#include "core/Log.h"

#include <filesystem>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb_image_resize2.h>

namespace Chroma::ImageIO {

std::expected<Image, std::string> load(const std::string &path,
                                       Orientation orientation) {
  int w = 0, h = 0, c = 0;
  stbi_uc *data = stbi_load(path.c_str(), &w, &h, &c, STBI_rgb_alpha);
  if (!data) {
    const char *reason = stbi_failure_reason();
    return std::unexpected("Failed to load image '" + path +
                           "': " + (reason ? reason : "unknown error"));
  }

  Image img = Image::fromRGBA8((uint32_t)w, (uint32_t)h, data, ColorSpace::SRGB);
  stbi_image_free(data);
  img.setOrientation(orientation);

  Log::Debug("Loaded image '{}' ({}x{}, {} channels, {})", path, w, h, c,
             orientationName(orientation));
  return img;
}

std::expected<void, std::string> savePNG(const std::string &path,
                                         const Image &image) {
  if (image.empty())
    return std::unexpected(std::string("Refusing to write an empty image"));

  const Image encoded = isTransferEncoded(image.colorSpace())
                            ? image
                            : image.encodedAs(ColorSpace::SRGB);
  const std::vector<uint8_t> rgba = encoded.toRGBA8();

  std::error_code ec;
  const std::filesystem::path p(path);
  if (p.has_parent_path())
    std::filesystem::create_directories(p.parent_path(), ec);

  const int stride = (int)image.width() * 4;
  if (!stbi_write_png(path.c_str(), (int)image.width(), (int)image.height(), 4,
                      rgba.data(), stride))
    return std::unexpected("Failed to write PNG '" + path + "'");
  return {};
}

} // namespace Chroma::ImageIO
