// =============================================================================
// ParameterModel Tests
// =============================================================================
// Declared-input parsing, type classification and bound priority rules.
// =============================================================================

#include <catch2/catch_all.hpp>

#include "FakeRegistry.h"
#include "filters/ParameterModel.h"

using namespace Chroma;
using ChromaTest::imageParam;
using ChromaTest::numberParam;

TEST_CASE("parseParamType knows the closed tag set", "[parameters]") {
  SECTION("known tags round-trip through their names") {
    for (const char *tag : {"time", "scalar", "distance", "angle", "boolean",
                            "integer", "count", "position", "offset", "position3",
                            "rectangle", "opaqueColor", "color", "gradient",
                            "image", "transform"}) {
      auto t = parseParamType(tag);
      REQUIRE(t.has_value());
      REQUIRE(paramTypeName(*t) == tag);
    }
  }

  SECTION("unknown or differently cased tags are rejected") {
    REQUIRE_FALSE(parseParamType("vector").has_value());
    REQUIRE_FALSE(parseParamType("Scalar").has_value());
    REQUIRE_FALSE(parseParamType("").has_value());
  }
}

TEST_CASE("Only numeric-like types are editable", "[parameters]") {
  REQUIRE(isEditableType(ParamType::Scalar));
  REQUIRE(isEditableType(ParamType::Distance));
  REQUIRE(isEditableType(ParamType::Time));
  REQUIRE(isEditableType(ParamType::Integer));
  REQUIRE(isEditableType(ParamType::Angle));

  REQUIRE_FALSE(isEditableType(ParamType::Boolean));
  REQUIRE_FALSE(isEditableType(ParamType::Count));
  REQUIRE_FALSE(isEditableType(ParamType::Position));
  REQUIRE_FALSE(isEditableType(ParamType::Color));
  REQUIRE_FALSE(isEditableType(ParamType::Image));
}

TEST_CASE("Image role keys", "[parameters]") {
  REQUIRE(isImageRoleKey("inputImage"));
  REQUIRE(isImageRoleKey("inputBackgroundImage"));
  REQUIRE(isImageRoleKey("inputTargetImage"));
  REQUIRE_FALSE(isImageRoleKey("inputMaskImage"));
  REQUIRE_FALSE(isImageRoleKey("outputImage"));
}

TEST_CASE("preferredDefault priority", "[parameters][bounds]") {
  ParamBounds b;

  SECTION("nothing declared gives zero") {
    REQUIRE(b.preferredDefault() == 0.0);
  }

  SECTION("default wins over everything") {
    b.defaultValue = 3.0;
    b.identityValue = 1.0;
    b.minValue = -5.0;
    REQUIRE(b.preferredDefault() == 3.0);
  }

  SECTION("identity is used when there is no default") {
    b.identityValue = 1.0;
    b.minValue = -5.0;
    REQUIRE(b.preferredDefault() == 1.0);
  }

  SECTION("falls through min, max and slider bounds in order") {
    b.sliderMaxValue = 9.0;
    REQUIRE(b.preferredDefault() == 9.0);
    b.sliderMinValue = 7.0;
    REQUIRE(b.preferredDefault() == 7.0);
    b.maxValue = 5.0;
    REQUIRE(b.preferredDefault() == 5.0);
    b.minValue = 2.0;
    REQUIRE(b.preferredDefault() == 2.0);
  }

  SECTION("an explicit zero default is not treated as absent") {
    b.defaultValue = 0.0;
    b.identityValue = 1.0;
    REQUIRE(b.preferredDefault() == 0.0);
  }
}

TEST_CASE("Slider bounds prefer hard limits", "[parameters][bounds]") {
  ParamBounds b;
  REQUIRE(b.preferredSliderMin() == 0.0);
  REQUIRE(b.preferredSliderMax() == 0.0);

  b.sliderMinValue = -10.0;
  b.sliderMaxValue = 10.0;
  REQUIRE(b.preferredSliderMin() == -10.0);
  REQUIRE(b.preferredSliderMax() == 10.0);

  b.minValue = -1.0;
  b.maxValue = 1.0;
  REQUIRE(b.preferredSliderMin() == -1.0);
  REQUIRE(b.preferredSliderMax() == 1.0);
}

TEST_CASE("parseParameter validates required attributes", "[parameters]") {
  SECTION("well formed scalar with bounds") {
    AttributeMap a = numberParam("Radius", "distance");
    a.emplace("default", 10.0);
    a.emplace("min", 0.0);
    a.emplace("sliderMax", 100.0);
    a.emplace("description", std::string("Blur radius"));

    auto p = parseParameter("inputRadius", a);
    REQUIRE(p.has_value());
    REQUIRE(p->name == "inputRadius");
    REQUIRE(p->displayName == "Radius");
    REQUIRE(p->classType == "NSNumber");
    REQUIRE(p->type == ParamType::Distance);
    REQUIRE(p->description == std::optional<std::string>("Blur radius"));
    REQUIRE(p->bounds.defaultValue == 10.0);
    REQUIRE(p->bounds.minValue == 0.0);
    REQUIRE_FALSE(p->bounds.maxValue.has_value());
    REQUIRE(p->preferredSliderMax() == 100.0);
    REQUIRE(p->isEditable());
    REQUIRE(p->isSupported());
  }

  SECTION("missing type is malformed") {
    AttributeMap a = numberParam("Amount");
    a.erase("type");
    REQUIRE_FALSE(parseParameter("inputAmount", a).has_value());
  }

  SECTION("unknown type tag is malformed") {
    REQUIRE_FALSE(parseParameter("inputAmount", numberParam("Amount", "matrix")).has_value());
  }

  SECTION("non-string display name is malformed") {
    AttributeMap a = numberParam("Amount");
    a["displayName"] = 4.0;
    REQUIRE_FALSE(parseParameter("inputAmount", a).has_value());
  }

  SECTION("missing class is malformed") {
    AttributeMap a = numberParam("Amount");
    a.erase("class");
    REQUIRE_FALSE(parseParameter("inputAmount", a).has_value());
  }

  SECTION("non-numeric bounds are ignored") {
    AttributeMap a = numberParam("Amount");
    a.emplace("default", std::string("high"));
    auto p = parseParameter("inputAmount", a);
    REQUIRE(p.has_value());
    REQUIRE_FALSE(p->bounds.defaultValue.has_value());
    REQUIRE(p->preferredDefault() == 0.0);
  }
}

TEST_CASE("Image roles are supported without being editable", "[parameters]") {
  auto img = parseParameter("inputBackgroundImage", imageParam("Background"));
  REQUIRE(img.has_value());
  REQUIRE(img->isImageRole());
  REQUIRE_FALSE(img->isEditable());
  REQUIRE(img->isSupported());

  auto other = parseParameter("inputMaskImage", imageParam("Mask"));
  REQUIRE(other.has_value());
  REQUIRE_FALSE(other->isSupported());
}
