#include "BuiltinKernels.h"

#include "filters/FilterKeys.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <glm/glm.hpp>

namespace Chroma::Kernels {

static const glm::vec3 kLuma{0.2126f, 0.7152f, 0.0722f};

// Upper bounds of the declared BoxBlur/Bloom radius and Pixellate scale.
static constexpr int kMaxBlurRadius = 100;
static constexpr int kMaxPixelBlock = 100;

static ImageRef source(const BoundInputs &in) {
  return in.image(FilterKeys::kInputImage);
}

static ImageRef mapPixels(const Image &src,
                          const std::function<glm::vec4(const glm::vec4 &)> &fn) {
  Image out = src;
  for (glm::vec4 &p : out.pixels()) p = fn(p);
  return std::make_shared<const Image>(std::move(out));
}

// Pixel extent read from a numeric input, clamped to [lo, hi].
static int extentOf(const BoundInputs &in, const char *key, double def, int lo,
                    int hi) {
  double v = in.number(key, def);
  if (!std::isfinite(v))
    v = def;
  return (int)std::lround(std::clamp(v, (double)lo, (double)hi));
}

// Sample with transparent black outside the image.
static glm::vec4 sampleOrClear(const Image &img, uint32_t x, uint32_t y) {
  if (x >= img.width() || y >= img.height())
    return glm::vec4(0.0f);
  return img.at(x, y);
}

static Image boxBlurImage(const Image &src, int radius) {
  if (radius <= 0 || src.empty())
    return src;

  const int w = (int)src.width();
  const int h = (int)src.height();
  // Past the larger dimension every tap is an edge repeat.
  radius = std::min(radius, std::max(w, h));
  const float norm = 1.0f / (float)(2 * radius + 1);

  Image tmp = src;
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      glm::vec4 acc(0.0f);
      for (int k = -radius; k <= radius; ++k) {
        const int sx = std::clamp(x + k, 0, w - 1);
        acc += src.at((uint32_t)sx, (uint32_t)y);
      }
      tmp.at((uint32_t)x, (uint32_t)y) = acc * norm;
    }
  }

  Image out = tmp;
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      glm::vec4 acc(0.0f);
      for (int k = -radius; k <= radius; ++k) {
        const int sy = std::clamp(y + k, 0, h - 1);
        acc += tmp.at((uint32_t)x, (uint32_t)sy);
      }
      out.at((uint32_t)x, (uint32_t)y) = acc * norm;
    }
  }
  return out;
}

ImageRef exposure(const BoundInputs &in) {
  ImageRef src = source(in);
  if (!src)
    return nullptr;
  const float gain = std::exp2((float)in.number("inputEV", 0.0));
  return mapPixels(*src, [gain](const glm::vec4 &p) {
    return glm::vec4(glm::vec3(p) * gain, p.a);
  });
}

ImageRef colorControls(const BoundInputs &in) {
  ImageRef src = source(in);
  if (!src)
    return nullptr;
  const float sat = (float)in.number("inputSaturation", 1.0);
  const float bri = (float)in.number("inputBrightness", 0.0);
  const float con = (float)in.number("inputContrast", 1.0);
  return mapPixels(*src, [=](const glm::vec4 &p) {
    glm::vec3 c(p);
    const float l = glm::dot(c, kLuma);
    c = glm::mix(glm::vec3(l), c, sat);
    c += bri;
    c = (c - 0.5f) * con + 0.5f;
    return glm::vec4(c, p.a);
  });
}

ImageRef gammaAdjust(const BoundInputs &in) {
  ImageRef src = source(in);
  if (!src)
    return nullptr;
  const float power = (float)in.number("inputPower", 1.0);
  return mapPixels(*src, [power](const glm::vec4 &p) {
    return glm::vec4(glm::pow(glm::max(glm::vec3(p), 0.0f), glm::vec3(power)), p.a);
  });
}

ImageRef hueAdjust(const BoundInputs &in) {
  ImageRef src = source(in);
  if (!src)
    return nullptr;
  const float angle = (float)in.number("inputAngle", 0.0);
  const float cs = std::cos(angle);
  const float sn = std::sin(angle);
  // Rotate chroma in YIQ.
  return mapPixels(*src, [=](const glm::vec4 &p) {
    const float y = 0.299f * p.r + 0.587f * p.g + 0.114f * p.b;
    const float i = 0.596f * p.r - 0.274f * p.g - 0.322f * p.b;
    const float q = 0.211f * p.r - 0.523f * p.g + 0.312f * p.b;
    const float i2 = i * cs - q * sn;
    const float q2 = i * sn + q * cs;
    return glm::vec4(y + 0.956f * i2 + 0.621f * q2,
                     y - 0.272f * i2 - 0.647f * q2,
                     y - 1.106f * i2 + 1.703f * q2, p.a);
  });
}

ImageRef colorInvert(const BoundInputs &in) {
  ImageRef src = source(in);
  if (!src)
    return nullptr;
  return mapPixels(*src, [](const glm::vec4 &p) {
    return glm::vec4(glm::vec3(1.0f) - glm::vec3(p), p.a);
  });
}

ImageRef colorMonochrome(const BoundInputs &in) {
  ImageRef src = source(in);
  if (!src)
    return nullptr;
  // inputColor is not bindable as a number; the declared default applies.
  const glm::vec3 tint(0.6f, 0.45f, 0.3f);
  const float amount = glm::clamp((float)in.number("inputIntensity", 1.0), 0.0f, 1.0f);
  return mapPixels(*src, [=](const glm::vec4 &p) {
    const glm::vec3 c(p);
    const glm::vec3 mono = tint * glm::dot(c, kLuma);
    return glm::vec4(glm::mix(c, mono, amount), p.a);
  });
}

ImageRef colorPosterize(const BoundInputs &in) {
  ImageRef src = source(in);
  if (!src)
    return nullptr;
  const float levels = std::max(2.0f, std::round((float)in.number("inputLevels", 6.0)));
  const float steps = levels - 1.0f;
  return mapPixels(*src, [steps](const glm::vec4 &p) {
    const glm::vec3 c = glm::clamp(glm::vec3(p), 0.0f, 1.0f);
    return glm::vec4(glm::round(c * steps) / steps, p.a);
  });
}

ImageRef vignette(const BoundInputs &in) {
  ImageRef src = source(in);
  if (!src)
    return nullptr;
  const float intensity = (float)in.number("inputIntensity", 0.0);
  const float radius = std::max(0.0001f, (float)in.number("inputRadius", 1.0));

  Image out = *src;
  const glm::vec2 center(0.5f * (float)out.width(), 0.5f * (float)out.height());
  const float halfDiag = glm::length(center);
  for (uint32_t y = 0; y < out.height(); ++y) {
    for (uint32_t x = 0; x < out.width(); ++x) {
      const glm::vec2 pos((float)x + 0.5f, (float)y + 0.5f);
      const float d = glm::length(pos - center) / std::max(halfDiag, 1.0f);
      const float falloff = glm::smoothstep(0.0f, radius, d);
      glm::vec4 &p = out.at(x, y);
      p = glm::vec4(glm::vec3(p) * (1.0f - intensity * falloff), p.a);
    }
  }
  return std::make_shared<const Image>(std::move(out));
}

ImageRef boxBlur(const BoundInputs &in) {
  ImageRef src = source(in);
  if (!src)
    return nullptr;
  const int radius = extentOf(in, "inputRadius", 10.0, 0, kMaxBlurRadius);
  return std::make_shared<const Image>(boxBlurImage(*src, radius));
}

ImageRef bloom(const BoundInputs &in) {
  ImageRef src = source(in);
  if (!src)
    return nullptr;
  const int radius = extentOf(in, "inputRadius", 10.0, 0, kMaxBlurRadius);
  const float intensity = (float)in.number("inputIntensity", 0.5);

  const Image glow = boxBlurImage(*src, radius);
  Image out = *src;
  for (size_t i = 0; i < out.pixels().size(); ++i) {
    glm::vec4 &p = out.pixels()[i];
    p = glm::vec4(glm::vec3(p) + glm::vec3(glow.pixels()[i]) * intensity, p.a);
  }
  return std::make_shared<const Image>(std::move(out));
}

ImageRef pixellate(const BoundInputs &in) {
  ImageRef src = source(in);
  if (!src)
    return nullptr;
  const uint32_t block = (uint32_t)extentOf(in, "inputScale", 8.0, 1, kMaxPixelBlock);

  Image out = *src;
  for (uint32_t by = 0; by < out.height(); by += block) {
    for (uint32_t bx = 0; bx < out.width(); bx += block) {
      const uint32_t ex = std::min(bx + block, out.width());
      const uint32_t ey = std::min(by + block, out.height());
      glm::vec4 acc(0.0f);
      for (uint32_t y = by; y < ey; ++y)
        for (uint32_t x = bx; x < ex; ++x) acc += src->at(x, y);
      acc /= (float)((ex - bx) * (ey - by));
      for (uint32_t y = by; y < ey; ++y)
        for (uint32_t x = bx; x < ex; ++x) out.at(x, y) = acc;
    }
  }
  return std::make_shared<const Image>(std::move(out));
}

ImageRef sourceOverCompositing(const BoundInputs &in) {
  ImageRef src = source(in);
  ImageRef bg = in.image(FilterKeys::kInputBackgroundImage);
  if (!src || !bg)
    return nullptr;

  Image out = *src;
  for (uint32_t y = 0; y < out.height(); ++y) {
    for (uint32_t x = 0; x < out.width(); ++x) {
      const glm::vec4 s = src->at(x, y);
      const glm::vec4 b = sampleOrClear(*bg, x, y);
      const float a = s.a + b.a * (1.0f - s.a);
      glm::vec3 c(0.0f);
      if (a > 0.0f)
        c = (glm::vec3(s) * s.a + glm::vec3(b) * b.a * (1.0f - s.a)) / a;
      out.at(x, y) = glm::vec4(c, a);
    }
  }
  return std::make_shared<const Image>(std::move(out));
}

ImageRef multiplyBlendMode(const BoundInputs &in) {
  ImageRef src = source(in);
  ImageRef bg = in.image(FilterKeys::kInputBackgroundImage);
  if (!src || !bg)
    return nullptr;

  Image out = *src;
  for (uint32_t y = 0; y < out.height(); ++y) {
    for (uint32_t x = 0; x < out.width(); ++x) {
      const glm::vec4 s = src->at(x, y);
      const glm::vec4 b = sampleOrClear(*bg, x, y);
      out.at(x, y) = glm::vec4(glm::vec3(s) * glm::vec3(b), s.a);
    }
  }
  return std::make_shared<const Image>(std::move(out));
}

ImageRef dissolveTransition(const BoundInputs &in) {
  ImageRef src = source(in);
  ImageRef target = in.image(FilterKeys::kInputTargetImage);
  if (!src || !target)
    return nullptr;
  const float t = glm::clamp((float)in.number("inputTime", 0.0), 0.0f, 1.0f);

  Image out = *src;
  for (uint32_t y = 0; y < out.height(); ++y) {
    for (uint32_t x = 0; x < out.width(); ++x) {
      out.at(x, y) = glm::mix(src->at(x, y), sampleOrClear(*target, x, y), t);
    }
  }
  return std::make_shared<const Image>(std::move(out));
}

ImageRef constantColorGenerator(const BoundInputs &) {
  Image out(1, 1, glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
  out.setColorSpace(ColorSpace::LinearSRGB);
  return std::make_shared<const Image>(std::move(out));
}

ImageRef areaAverage(const BoundInputs &in) {
  ImageRef src = source(in);
  if (!src || src->empty())
    return nullptr;
  glm::vec4 acc(0.0f);
  for (const glm::vec4 &p : src->pixels()) acc += p;
  acc /= (float)src->pixels().size();

  Image out(1, 1, acc);
  out.setColorSpace(src->colorSpace());
  return std::make_shared<const Image>(std::move(out));
}

} // namespace Chroma::Kernels
