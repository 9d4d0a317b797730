#include "BuiltinRegistry.h"

#include "builtins/BuiltinKernels.h"
#include "core/Log.h"
#include "filters/FilterKeys.h"

#include <numbers>

namespace Chroma {

static constexpr double kPi = std::numbers::pi;

static BuiltinParamSpec imageInput(const char *key, const char *displayName) {
  BuiltinParamSpec p{};
  p.key = key;
  p.displayName = displayName;
  p.type = "image";
  p.classType = "Image";
  return p;
}

void BuiltinRegistry::registerBuiltins() {
  clear();

  const BuiltinParamSpec inImage = imageInput("inputImage", "Image");
  const BuiltinParamSpec inBackground =
      imageInput("inputBackgroundImage", "Background Image");
  const BuiltinParamSpec inTarget = imageInput("inputTargetImage", "Target Image");
  const std::vector<std::string> outImage = {"outputImage"};

  {
    BuiltinFilterInfo f{};
    f.name = "Exposure";
    f.displayName = "Exposure Adjust";
    f.categories = {"Color Adjustment", "Video", "Still Image", "Built-In"};
    f.inputs = {
        inImage,
        {.key = "inputEV", .displayName = "EV", .type = "scalar",
         .def = 0.0, .identity = 0.0, .sliderMin = -10.0, .sliderMax = 10.0},
    };
    f.outputs = outImage;
    f.process = Kernels::exposure;
    add(std::move(f));
  }

  {
    BuiltinFilterInfo f{};
    f.name = "ColorControls";
    f.displayName = "Color Controls";
    f.categories = {"Color Adjustment", "Video", "Still Image", "Built-In"};
    f.inputs = {
        inImage,
        {.key = "inputSaturation", .displayName = "Saturation", .type = "scalar",
         .def = 1.0, .identity = 1.0, .min = 0.0, .sliderMin = 0.0, .sliderMax = 2.0},
        {.key = "inputBrightness", .displayName = "Brightness", .type = "scalar",
         .def = 0.0, .identity = 0.0, .min = -1.0, .sliderMin = -1.0, .sliderMax = 1.0},
        {.key = "inputContrast", .displayName = "Contrast", .type = "scalar",
         .def = 1.0, .identity = 1.0, .min = 0.25, .sliderMin = 0.25, .sliderMax = 4.0},
    };
    f.outputs = outImage;
    f.process = Kernels::colorControls;
    add(std::move(f));
  }

  {
    BuiltinFilterInfo f{};
    f.name = "GammaAdjust";
    f.displayName = "Gamma Adjust";
    f.categories = {"Color Adjustment", "Video", "Still Image", "Built-In"};
    f.inputs = {
        inImage,
        // no hard min/max: slider bounds come from sliderMin/sliderMax
        {.key = "inputPower", .displayName = "Power", .type = "scalar",
         .def = 1.0, .identity = 1.0, .sliderMin = 0.25, .sliderMax = 4.0},
    };
    f.outputs = outImage;
    f.process = Kernels::gammaAdjust;
    add(std::move(f));
  }

  {
    BuiltinFilterInfo f{};
    f.name = "HueAdjust";
    f.displayName = "Hue Adjust";
    f.categories = {"Color Adjustment", "Video", "Still Image", "Built-In"};
    f.inputs = {
        inImage,
        {.key = "inputAngle", .displayName = "Angle", .type = "angle",
         .def = 0.0, .identity = 0.0, .sliderMin = -kPi, .sliderMax = kPi},
    };
    f.outputs = outImage;
    f.process = Kernels::hueAdjust;
    add(std::move(f));
  }

  {
    BuiltinFilterInfo f{};
    f.name = "ColorInvert";
    f.displayName = "Color Invert";
    f.categories = {"Color Effect", "Video", "Still Image", "Built-In"};
    f.inputs = {inImage};
    f.outputs = outImage;
    f.process = Kernels::colorInvert;
    add(std::move(f));
  }

  {
    // Reference-only: inputColor is not a numeric type.
    BuiltinFilterInfo f{};
    f.name = "ColorMonochrome";
    f.displayName = "Color Monochrome";
    f.categories = {"Color Effect", "Video", "Still Image", "Built-In"};
    f.inputs = {
        inImage,
        {.key = "inputColor", .displayName = "Color", .type = "opaqueColor",
         .classType = "Color"},
        {.key = "inputIntensity", .displayName = "Intensity", .type = "scalar",
         .def = 1.0, .identity = 0.0, .min = 0.0, .max = 1.0,
         .sliderMin = 0.0, .sliderMax = 1.0},
    };
    f.outputs = outImage;
    f.process = Kernels::colorMonochrome;
    add(std::move(f));
  }

  {
    BuiltinFilterInfo f{};
    f.name = "ColorPosterize";
    f.displayName = "Color Posterize";
    f.categories = {"Color Effect", "Video", "Still Image", "Built-In"};
    f.inputs = {
        inImage,
        {.key = "inputLevels", .displayName = "Levels", .type = "integer",
         .def = 6.0, .min = 2.0, .max = 30.0, .sliderMin = 2.0, .sliderMax = 30.0},
    };
    f.outputs = outImage;
    f.process = Kernels::colorPosterize;
    add(std::move(f));
  }

  {
    BuiltinFilterInfo f{};
    f.name = "Vignette";
    f.displayName = "Vignette";
    f.categories = {"Color Effect", "Video", "Still Image", "Built-In"};
    f.inputs = {
        inImage,
        {.key = "inputIntensity", .displayName = "Intensity", .type = "scalar",
         .def = 0.0, .identity = 0.0, .min = -1.0, .max = 1.0,
         .sliderMin = -1.0, .sliderMax = 1.0},
        {.key = "inputRadius", .displayName = "Radius", .type = "distance",
         .def = 1.0, .min = 0.0, .max = 2.0, .sliderMin = 0.0, .sliderMax = 2.0},
    };
    f.outputs = outImage;
    f.process = Kernels::vignette;
    add(std::move(f));
  }

  {
    BuiltinFilterInfo f{};
    f.name = "BoxBlur";
    f.displayName = "Box Blur";
    f.categories = {"Blur", "Video", "Still Image", "Built-In"};
    f.inputs = {
        inImage,
        {.key = "inputRadius", .displayName = "Radius", .type = "distance",
         .def = 10.0, .identity = 1.0, .min = 1.0, .max = 100.0,
         .sliderMin = 1.0, .sliderMax = 100.0},
    };
    f.outputs = outImage;
    f.process = Kernels::boxBlur;
    add(std::move(f));
  }

  {
    BuiltinFilterInfo f{};
    f.name = "Bloom";
    f.displayName = "Bloom";
    f.categories = {"Stylize", "Video", "Still Image", "Built-In"};
    f.inputs = {
        inImage,
        {.key = "inputRadius", .displayName = "Radius", .type = "distance",
         .def = 10.0, .min = 0.0, .max = 100.0, .sliderMin = 0.0, .sliderMax = 100.0},
        {.key = "inputIntensity", .displayName = "Intensity", .type = "scalar",
         .def = 0.5, .identity = 0.0, .min = 0.0, .max = 1.0,
         .sliderMin = 0.0, .sliderMax = 1.0},
    };
    f.outputs = outImage;
    f.process = Kernels::bloom;
    add(std::move(f));
  }

  {
    // Reference-only: inputCenter is a position.
    BuiltinFilterInfo f{};
    f.name = "Pixellate";
    f.displayName = "Pixellate";
    f.categories = {"Stylize", "Video", "Still Image", "Built-In"};
    f.inputs = {
        inImage,
        {.key = "inputCenter", .displayName = "Center", .type = "position",
         .classType = "Vector"},
        {.key = "inputScale", .displayName = "Scale", .type = "distance",
         .def = 8.0, .min = 1.0, .max = 100.0, .sliderMin = 1.0, .sliderMax = 100.0},
    };
    f.outputs = outImage;
    f.process = Kernels::pixellate;
    add(std::move(f));
  }

  {
    BuiltinFilterInfo f{};
    f.name = "SourceOverCompositing";
    f.displayName = "Source Over";
    f.categories = {"Composite Operation", "Video", "Still Image", "Built-In"};
    f.inputs = {inImage, inBackground};
    f.outputs = outImage;
    f.process = Kernels::sourceOverCompositing;
    add(std::move(f));
  }

  {
    BuiltinFilterInfo f{};
    f.name = "MultiplyBlendMode";
    f.displayName = "Multiply Blend Mode";
    f.categories = {"Composite Operation", "Video", "Still Image", "Built-In"};
    f.inputs = {inImage, inBackground};
    f.outputs = outImage;
    f.process = Kernels::multiplyBlendMode;
    add(std::move(f));
  }

  {
    BuiltinFilterInfo f{};
    f.name = "DissolveTransition";
    f.displayName = "Dissolve";
    f.categories = {"Transition", "Video", "Still Image", "Built-In"};
    f.inputs = {
        inImage,
        inTarget,
        {.key = "inputTime", .displayName = "Time", .type = "time",
         .def = 0.0, .identity = 0.0, .min = 0.0, .max = 1.0,
         .sliderMin = 0.0, .sliderMax = 1.0},
    };
    f.outputs = outImage;
    f.process = Kernels::dissolveTransition;
    add(std::move(f));
  }

  {
    // Not usable in a chain: produces an image but takes none.
    BuiltinFilterInfo f{};
    f.name = "ConstantColorGenerator";
    f.displayName = "Constant Color";
    f.categories = {"Generator", "Video", "Still Image", "Built-In"};
    f.inputs = {
        {.key = "inputColor", .displayName = "Color", .type = "color",
         .classType = "Color"},
    };
    f.outputs = outImage;
    f.process = Kernels::constantColorGenerator;
    add(std::move(f));
  }

  {
    // Reference-only: inputExtent is a rectangle.
    BuiltinFilterInfo f{};
    f.name = "AreaAverage";
    f.displayName = "Area Average";
    f.categories = {"Reduction", "Video", "Still Image", "Built-In"};
    f.inputs = {
        inImage,
        {.key = "inputExtent", .displayName = "Extent", .type = "rectangle",
         .classType = "Vector"},
    };
    f.outputs = outImage;
    f.process = Kernels::areaAverage;
    add(std::move(f));
  }

  Log::Debug("BuiltinRegistry: {} filters registered", m_filters.size());
}

} // namespace Chroma
