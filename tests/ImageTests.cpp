// =============================================================================
// Image Tests
// =============================================================================
// Orientation handling, color transfer and resampling of the working image.
// =============================================================================

#include <catch2/catch_all.hpp>

#include "image/Image.h"

#include <iterator>
#include <vector>

using namespace Chroma;
using Catch::Approx;

namespace {

// 3x2 image whose pixels encode their own stored coordinates.
Image coordImage() {
  Image img(3, 2);
  img.setColorSpace(ColorSpace::LinearSRGB);
  for (uint32_t y = 0; y < img.height(); ++y)
    for (uint32_t x = 0; x < img.width(); ++x)
      img.at(x, y) = glm::vec4((float)x, (float)y, 0.0f, 1.0f);
  return img;
}

} // namespace

TEST_CASE("EXIF orientation values", "[image][orientation]") {
  Orientation o{};
  for (int v = 1; v <= 8; ++v) {
    REQUIRE(orientationFromExif(v, o));
    REQUIRE((int)o == v);
  }
  REQUIRE_FALSE(orientationFromExif(0, o));
  REQUIRE_FALSE(orientationFromExif(9, o));

  REQUIRE_FALSE(swapsAxes(Orientation::Down));
  REQUIRE(swapsAxes(Orientation::Right));
  REQUIRE(swapsAxes(Orientation::LeftMirrored));
}

TEST_CASE("oriented applies the stored orientation", "[image][orientation]") {
  Image img = coordImage();

  SECTION("Up is unchanged") {
    REQUIRE(img.oriented() == img);
  }

  SECTION("Right rotates clockwise") {
    img.setOrientation(Orientation::Right);
    REQUIRE(img.orientedSize() == glm::uvec2(2, 3));

    const Image up = img.oriented();
    REQUIRE(up.width() == 2);
    REQUIRE(up.height() == 3);
    REQUIRE(up.orientation() == Orientation::Up);
    // top-left of the display is the bottom-left of storage
    REQUIRE(up.at(0, 0) == glm::vec4(0, 1, 0, 1));
    REQUIRE(up.at(1, 0) == glm::vec4(0, 0, 0, 1));
    REQUIRE(up.at(1, 2) == glm::vec4(2, 0, 0, 1));
  }

  SECTION("UpMirrored flips horizontally") {
    img.setOrientation(Orientation::UpMirrored);
    const Image up = img.oriented();
    REQUIRE(up.at(0, 0) == glm::vec4(2, 0, 0, 1));
    REQUIRE(up.at(2, 1) == glm::vec4(0, 1, 0, 1));
  }
}

TEST_CASE("reorientedTo inverts oriented for every orientation", "[image][orientation]") {
  const Image upright = coordImage();
  for (int v = 1; v <= 8; ++v) {
    Orientation o{};
    REQUIRE(orientationFromExif(v, o));

    const Image stored = upright.reorientedTo(o);
    REQUIRE(stored.orientation() == o);
    REQUIRE(stored.orientedSize() == upright.size());
    REQUIRE(stored.oriented() == upright);
  }
}

TEST_CASE("sRGB transfer curve", "[image][color]") {
  Image img(1, 1, glm::vec4(0.5f, 0.0f, 1.0f, 0.25f));
  img.setColorSpace(ColorSpace::SRGB);

  const Image lin = img.linearized();
  REQUIRE(lin.colorSpace() == ColorSpace::LinearSRGB);
  REQUIRE(lin.at(0, 0).r == Approx(0.214).epsilon(0.01));
  REQUIRE(lin.at(0, 0).b == Approx(1.0));
  // alpha is never transfer encoded
  REQUIRE(lin.at(0, 0).a == 0.25f);

  const Image back = lin.encodedAs(ColorSpace::SRGB);
  REQUIRE(back.colorSpace() == ColorSpace::SRGB);
  REQUIRE(back.at(0, 0).r == Approx(0.5).margin(1e-4));

  SECTION("linear images are left alone") {
    REQUIRE(lin.linearized().at(0, 0) == lin.at(0, 0));
    REQUIRE(lin.encodedAs(ColorSpace::LinearSRGB).at(0, 0) == lin.at(0, 0));
  }
}

TEST_CASE("resized and cropped", "[image]") {
  Image img(4, 4, glm::vec4(0.25f, 0.5f, 0.75f, 1.0f));
  img.setColorSpace(ColorSpace::LinearSRGB);
  img.setScale(2.0f);

  const Image small = img.resized(2, 3);
  REQUIRE(small.width() == 2);
  REQUIRE(small.height() == 3);
  REQUIRE(small.scale() == 2.0f);
  REQUIRE(small.at(1, 2).g == Approx(0.5f).margin(1e-3));

  const Image padded = img.cropped(6, 2);
  REQUIRE(padded.width() == 6);
  REQUIRE(padded.height() == 2);
  REQUIRE(padded.at(3, 1) == img.at(3, 1));
  REQUIRE(padded.at(5, 0) == glm::vec4(0.0f));

  REQUIRE(Image().resized(2, 2).empty());
}

TEST_CASE("8-bit conversion", "[image]") {
  const uint8_t rgba[] = {255, 0, 128, 255, 0, 0, 0, 0};
  const Image img = Image::fromRGBA8(2, 1, rgba);
  REQUIRE(img.colorSpace() == ColorSpace::SRGB);
  REQUIRE(img.at(0, 0).r == 1.0f);
  REQUIRE(img.toRGBA8() == std::vector<uint8_t>(std::begin(rgba), std::end(rgba)));
}
