#include "Image.h"

#include <algorithm>
#include <cmath>

#include <stb_image_resize2.h>

namespace Chroma {

std::string_view orientationName(Orientation o) {
  switch (o) {
  case Orientation::Up: return "up";
  case Orientation::UpMirrored: return "upMirrored";
  case Orientation::Down: return "down";
  case Orientation::DownMirrored: return "downMirrored";
  case Orientation::LeftMirrored: return "leftMirrored";
  case Orientation::Right: return "right";
  case Orientation::RightMirrored: return "rightMirrored";
  case Orientation::Left: return "left";
  }
  return "up";
}

std::string_view colorSpaceName(ColorSpace cs) {
  switch (cs) {
  case ColorSpace::Unknown: return "unknown";
  case ColorSpace::SRGB: return "sRGB";
  case ColorSpace::LinearSRGB: return "linear sRGB";
  case ColorSpace::DisplayP3: return "Display P3";
  }
  return "unknown";
}

bool orientationFromExif(int exif, Orientation &out) {
  if (exif < 1 || exif > 8)
    return false;
  out = static_cast<Orientation>(exif);
  return true;
}

bool swapsAxes(Orientation o) {
  return o == Orientation::LeftMirrored || o == Orientation::Right ||
         o == Orientation::RightMirrored || o == Orientation::Left;
}

bool isTransferEncoded(ColorSpace cs) {
  return cs == ColorSpace::SRGB || cs == ColorSpace::DisplayP3;
}

// Maps an upright (display) pixel to the stored pixel it comes from.
// w/h are the stored dimensions.
static glm::uvec2 displayToStored(Orientation o, uint32_t dx, uint32_t dy,
                                  uint32_t w, uint32_t h) {
  switch (o) {
  case Orientation::Up: return {dx, dy};
  case Orientation::UpMirrored: return {w - 1 - dx, dy};
  case Orientation::Down: return {w - 1 - dx, h - 1 - dy};
  case Orientation::DownMirrored: return {dx, h - 1 - dy};
  case Orientation::LeftMirrored: return {dy, dx};
  case Orientation::Right: return {dy, h - 1 - dx};
  case Orientation::RightMirrored: return {w - 1 - dy, h - 1 - dx};
  case Orientation::Left: return {w - 1 - dy, dx};
  }
  return {dx, dy};
}

static inline float srgbToLinear(float c) {
  if (c <= 0.04045f)
    return c / 12.92f;
  return std::pow((c + 0.055f) / 1.055f, 2.4f);
}

static inline float linearToSrgb(float c) {
  if (c <= 0.0031308f)
    return c * 12.92f;
  return 1.055f * std::pow(c, 1.0f / 2.4f) - 0.055f;
}

Image::Image(uint32_t width, uint32_t height, glm::vec4 fill)
    : m_width(width), m_height(height),
      m_pixels((size_t)width * height, fill) {}

Image Image::fromRGBA8(uint32_t width, uint32_t height, const uint8_t *rgba,
                       ColorSpace cs) {
  Image img(width, height);
  img.m_colorSpace = cs;
  const size_t n = (size_t)width * height;
  for (size_t i = 0; i < n; ++i) {
    img.m_pixels[i] = glm::vec4(rgba[i * 4 + 0], rgba[i * 4 + 1],
                                rgba[i * 4 + 2], rgba[i * 4 + 3]) /
                      255.0f;
  }
  return img;
}

void Image::copyMetadataFrom(const Image &o) {
  m_orientation = o.m_orientation;
  m_colorSpace = o.m_colorSpace;
  m_scale = o.m_scale;
}

glm::uvec2 Image::orientedSize() const {
  if (swapsAxes(m_orientation))
    return {m_height, m_width};
  return {m_width, m_height};
}

Image Image::oriented() const {
  const glm::uvec2 ds = orientedSize();
  Image out(ds.x, ds.y);
  out.copyMetadataFrom(*this);
  out.m_orientation = Orientation::Up;

  for (uint32_t y = 0; y < ds.y; ++y) {
    for (uint32_t x = 0; x < ds.x; ++x) {
      const glm::uvec2 s = displayToStored(m_orientation, x, y, m_width, m_height);
      out.at(x, y) = at(s.x, s.y);
    }
  }
  return out;
}

Image Image::reorientedTo(Orientation target) const {
  // This image is the display; the stored image has the display size with
  // axes swapped back for rotating orientations.
  const uint32_t sw = swapsAxes(target) ? m_height : m_width;
  const uint32_t sh = swapsAxes(target) ? m_width : m_height;

  Image out(sw, sh);
  out.copyMetadataFrom(*this);
  out.m_orientation = target;

  for (uint32_t y = 0; y < m_height; ++y) {
    for (uint32_t x = 0; x < m_width; ++x) {
      const glm::uvec2 s = displayToStored(target, x, y, sw, sh);
      out.at(s.x, s.y) = at(x, y);
    }
  }
  return out;
}

Image Image::linearized() const {
  Image out = *this;
  if (!isTransferEncoded(m_colorSpace))
    return out;

  for (glm::vec4 &p : out.m_pixels) {
    p.r = srgbToLinear(p.r);
    p.g = srgbToLinear(p.g);
    p.b = srgbToLinear(p.b);
  }
  out.m_colorSpace = ColorSpace::LinearSRGB;
  return out;
}

Image Image::encodedAs(ColorSpace cs) const {
  Image out = *this;
  out.m_colorSpace = cs;
  if (!isTransferEncoded(cs))
    return out;

  for (glm::vec4 &p : out.m_pixels) {
    p.r = linearToSrgb(std::max(p.r, 0.0f));
    p.g = linearToSrgb(std::max(p.g, 0.0f));
    p.b = linearToSrgb(std::max(p.b, 0.0f));
  }
  return out;
}

Image Image::resized(uint32_t width, uint32_t height) const {
  if (width == m_width && height == m_height)
    return *this;
  if (empty() || width == 0 || height == 0)
    return {};

  Image out(width, height);
  out.copyMetadataFrom(*this);

  const float *src = reinterpret_cast<const float *>(m_pixels.data());
  float *dst = reinterpret_cast<float *>(out.m_pixels.data());
  const int srcStride = (int)(m_width * sizeof(glm::vec4));
  const int dstStride = (int)(width * sizeof(glm::vec4));

  if (!stbir_resize_float_linear(src, (int)m_width, (int)m_height, srcStride,
                                 dst, (int)width, (int)height, dstStride,
                                 STBIR_RGBA))
    return {};
  return out;
}

Image Image::cropped(uint32_t width, uint32_t height) const {
  if (width == m_width && height == m_height)
    return *this;

  Image out(width, height);
  out.copyMetadataFrom(*this);
  const uint32_t cw = std::min(width, m_width);
  const uint32_t ch = std::min(height, m_height);
  for (uint32_t y = 0; y < ch; ++y) {
    std::copy_n(m_pixels.begin() + (size_t)y * m_width, cw,
                out.m_pixels.begin() + (size_t)y * width);
  }
  return out;
}

std::vector<uint8_t> Image::toRGBA8() const {
  std::vector<uint8_t> out(m_pixels.size() * 4);
  for (size_t i = 0; i < m_pixels.size(); ++i) {
    const glm::vec4 c = glm::clamp(m_pixels[i], 0.0f, 1.0f);
    out[i * 4 + 0] = (uint8_t)std::lround(c.r * 255.0f);
    out[i * 4 + 1] = (uint8_t)std::lround(c.g * 255.0f);
    out[i * 4 + 2] = (uint8_t)std::lround(c.b * 255.0f);
    out[i * 4 + 3] = (uint8_t)std::lround(c.a * 255.0f);
  }
  return out;
}

bool Image::operator==(const Image &o) const {
  return m_width == o.m_width && m_height == o.m_height &&
         m_orientation == o.m_orientation && m_colorSpace == o.m_colorSpace &&
         m_scale == o.m_scale && m_pixels == o.m_pixels;
}

} // namespace Chroma
