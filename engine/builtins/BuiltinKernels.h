#pragma once

#include "builtins/BuiltinRegistry.h"

// Pixel kernels behind the builtin filters. All expect linear RGBA input and
// return null when a required image is not bound.
namespace Chroma::Kernels {

ImageRef exposure(const BoundInputs &in);
ImageRef colorControls(const BoundInputs &in);
ImageRef gammaAdjust(const BoundInputs &in);
ImageRef hueAdjust(const BoundInputs &in);
ImageRef colorInvert(const BoundInputs &in);
ImageRef colorMonochrome(const BoundInputs &in);
ImageRef colorPosterize(const BoundInputs &in);
ImageRef vignette(const BoundInputs &in);
ImageRef boxBlur(const BoundInputs &in);
ImageRef bloom(const BoundInputs &in);
ImageRef pixellate(const BoundInputs &in);
ImageRef sourceOverCompositing(const BoundInputs &in);
ImageRef multiplyBlendMode(const BoundInputs &in);
ImageRef dissolveTransition(const BoundInputs &in);
ImageRef constantColorGenerator(const BoundInputs &in);
ImageRef areaAverage(const BoundInputs &in);

} // namespace Chroma::Kernels
