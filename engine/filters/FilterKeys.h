#pragma once

#include <array>
#include <string_view>

namespace Chroma::FilterKeys {

// Image roles
inline constexpr std::string_view kInputImage = "inputImage";
inline constexpr std::string_view kInputBackgroundImage = "inputBackgroundImage";
inline constexpr std::string_view kInputTargetImage = "inputTargetImage";
inline constexpr std::string_view kOutputImage = "outputImage";

// Per-input attribute keys
inline constexpr std::string_view kAttrDisplayName = "displayName";
inline constexpr std::string_view kAttrClass = "class";
inline constexpr std::string_view kAttrDescription = "description";
inline constexpr std::string_view kAttrType = "type";
inline constexpr std::string_view kAttrDefault = "default";
inline constexpr std::string_view kAttrIdentity = "identity";
inline constexpr std::string_view kAttrMin = "min";
inline constexpr std::string_view kAttrMax = "max";
inline constexpr std::string_view kAttrSliderMin = "sliderMin";
inline constexpr std::string_view kAttrSliderMax = "sliderMax";

// Filter-level attribute keys
inline constexpr std::string_view kAttrFilterDisplayName = "filterDisplayName";
inline constexpr std::string_view kAttrCategories = "categories";

// Category every registry filter listed by listBuiltInFilterNames() carries.
inline constexpr std::string_view kCategoryBuiltIn = "Built-In";

// Categories that can act as a filter's representative (grouping) category.
inline constexpr std::array<std::string_view, 15> kGroupingCategories = {
    "Distortion Effect", "Geometry Adjustment", "Composite Operation",
    "Halftone Effect",   "Color Adjustment",    "Color Effect",
    "Transition",        "Tile Effect",         "Generator",
    "Reduction",         "Gradient",            "Stylize",
    "Sharpen",           "Blur",                "Filter Generator",
};

} // namespace Chroma::FilterKeys
