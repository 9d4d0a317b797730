#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <string_view>
#include <vector>

namespace Chroma {

// EXIF orientation tags. Describes how stored pixels must be transformed to
// appear upright.
enum class Orientation : uint8_t {
  Up = 1,
  UpMirrored = 2,
  Down = 3,
  DownMirrored = 4,
  LeftMirrored = 5,
  Right = 6,
  RightMirrored = 7,
  Left = 8,
};

enum class ColorSpace : uint8_t {
  Unknown = 0, // treated as already linear
  SRGB,
  LinearSRGB,
  DisplayP3, // sRGB transfer curve, P3 primaries
};

std::string_view orientationName(Orientation o);
std::string_view colorSpaceName(ColorSpace cs);
bool orientationFromExif(int exif, Orientation &out);
bool swapsAxes(Orientation o);
bool isTransferEncoded(ColorSpace cs);

// RGBA float image with the metadata needed to hand results back in the
// caller's own orientation, color space and scale.
class Image final {
public:
  Image() = default;
  Image(uint32_t width, uint32_t height, glm::vec4 fill = glm::vec4(0.0f));

  // 8-bit RGBA, row-major, top row first.
  static Image fromRGBA8(uint32_t width, uint32_t height, const uint8_t *rgba,
                         ColorSpace cs = ColorSpace::SRGB);

  uint32_t width() const { return m_width; }
  uint32_t height() const { return m_height; }
  glm::uvec2 size() const { return {m_width, m_height}; }
  bool empty() const { return m_width == 0 || m_height == 0; }

  // Size once the orientation has been applied.
  glm::uvec2 orientedSize() const;

  Orientation orientation() const { return m_orientation; }
  ColorSpace colorSpace() const { return m_colorSpace; }
  float scale() const { return m_scale; }

  void setOrientation(Orientation o) { m_orientation = o; }
  void setColorSpace(ColorSpace cs) { m_colorSpace = cs; }
  void setScale(float s) { m_scale = s; }

  glm::vec4 &at(uint32_t x, uint32_t y) { return m_pixels[(size_t)y * m_width + x]; }
  const glm::vec4 &at(uint32_t x, uint32_t y) const {
    return m_pixels[(size_t)y * m_width + x];
  }

  const std::vector<glm::vec4> &pixels() const { return m_pixels; }
  std::vector<glm::vec4> &pixels() { return m_pixels; }

  // Pixels rotated/flipped upright; result is tagged Orientation::Up.
  Image oriented() const;
  // Inverse of oriented(): treats this image as upright and stores it so that
  // applying `target` displays it upright again.
  Image reorientedTo(Orientation target) const;

  // Removes the transfer curve; result is linear (LinearSRGB for sRGB/P3
  // sources keeps the primaries implied by the source tag).
  Image linearized() const;
  // Applies the transfer curve of `cs` to linear pixels and tags the result.
  Image encodedAs(ColorSpace cs) const;

  // Resamples to exactly width x height. Returns an empty image on failure.
  Image resized(uint32_t width, uint32_t height) const;
  // Top-left aligned crop; area outside this image becomes transparent.
  Image cropped(uint32_t width, uint32_t height) const;

  std::vector<uint8_t> toRGBA8() const;

  bool operator==(const Image &o) const;

private:
  uint32_t m_width = 0;
  uint32_t m_height = 0;
  std::vector<glm::vec4> m_pixels;

  Orientation m_orientation = Orientation::Up;
  ColorSpace m_colorSpace = ColorSpace::SRGB;
  float m_scale = 1.0f;

  void copyMetadataFrom(const Image &o);
};

} // namespace Chroma
