// =============================================================================
// FilterCatalog Tests
// =============================================================================
// Catalog construction from a registry, usability/support classification,
// grouping and search.
// =============================================================================

#include <catch2/catch_all.hpp>

#include "FakeRegistry.h"
#include "builtins/BuiltinRegistry.h"
#include "filters/FilterCatalog.h"

#include <algorithm>

using namespace Chroma;
using namespace ChromaTest;

namespace {

std::vector<std::string> namesOf(const std::vector<const FilterDefinition *> &defs) {
  std::vector<std::string> out;
  for (const FilterDefinition *d : defs) out.push_back(d->name);
  return out;
}

FakeRegistry makeMixedRegistry() {
  FakeRegistry reg;

  reg.add(simpleFilter("Sepia"));

  FakeFilter generator;
  generator.name = "Checkerboard";
  generator.input("inputWidth", numberParam("Width", "distance"));
  generator.output();
  generator.categories({"Generator", "Built-In"});
  reg.add(std::move(generator));

  FakeFilter crop;
  crop.name = "Crop";
  crop.input("inputImage", imageParam("Image"));
  crop.input("inputRectangle", numberParam("Rectangle", "rectangle"));
  crop.output();
  crop.categories({"Geometry Adjustment", "Built-In"});
  reg.add(std::move(crop));

  FakeFilter blend;
  blend.name = "Screen";
  blend.displayName("Screen Blend");
  blend.input("inputImage", imageParam("Image"));
  blend.input("inputBackgroundImage", imageParam("Background"));
  blend.output();
  blend.categories({"Video", "Composite Operation", "Built-In"});
  reg.add(std::move(blend));

  FakeFilter analysis;
  analysis.name = "Histogram";
  analysis.input("inputImage", imageParam("Image"));
  analysis.output("outputData");
  analysis.categories({"Reduction", "Built-In"});
  reg.add(std::move(analysis));

  FakeFilter hidden = simpleFilter("Private");
  hidden.listed = false;
  reg.add(std::move(hidden));

  return reg;
}

} // namespace

TEST_CASE("FilterCatalog::build lists every named filter", "[catalog]") {
  FakeRegistry reg = makeMixedRegistry();
  FilterCatalog cat = FilterCatalog::build(reg);

  REQUIRE(cat.size() == 5);
  REQUIRE(cat.names() ==
          std::vector<std::string>{"Sepia", "Checkerboard", "Crop", "Screen", "Histogram"});
  REQUIRE(cat.find("Private") == nullptr);
  REQUIRE(cat.find("Sepia") != nullptr);
}

TEST_CASE("Usable and supported classification", "[catalog]") {
  FakeRegistry reg = makeMixedRegistry();
  FilterCatalog cat = FilterCatalog::build(reg);

  SECTION("plain adjustment is usable and supported") {
    const FilterDefinition *d = cat.find("Sepia");
    REQUIRE(d->isUsable());
    REQUIRE(d->isSupported());
    REQUIRE(d->displayName == "Sepia");
  }

  SECTION("generator without image input is unusable") {
    const FilterDefinition *d = cat.find("Checkerboard");
    REQUIRE_FALSE(d->hasImageInput());
    REQUIRE_FALSE(d->isUsable());
    REQUIRE_FALSE(d->isSupported());
  }

  SECTION("filter without image output is unusable") {
    REQUIRE_FALSE(cat.find("Histogram")->isUsable());
  }

  SECTION("non-numeric parameter makes a filter reference-only") {
    const FilterDefinition *d = cat.find("Crop");
    REQUIRE(d->isUsable());
    REQUIRE_FALSE(d->isSupported());
    REQUIRE(d->editableParameters().empty());
  }

  SECTION("background role counts as supported") {
    const FilterDefinition *d = cat.find("Screen");
    REQUIRE(d->hasBackgroundImage());
    REQUIRE_FALSE(d->hasTargetImage());
    REQUIRE(d->isSupported());
    REQUIRE(d->displayName == "Screen Blend");
    REQUIRE(d->category == "Composite Operation");
  }
}

TEST_CASE("Malformed parameters are dropped, not fatal", "[catalog]") {
  FakeRegistry reg;
  FakeFilter f = simpleFilter("Odd");
  f.input("inputWeird", numberParam("Weird", "hologram"));
  f.bareInput("inputNothing");
  reg.add(std::move(f));

  FilterCatalog cat = FilterCatalog::build(reg);
  const FilterDefinition *d = cat.find("Odd");
  REQUIRE(d != nullptr);
  REQUIRE(d->inputParameterKeys.size() == 4);
  REQUIRE(d->parameters.size() == 2);
  REQUIRE(d->findParameter("inputWeird") == nullptr);
  REQUIRE(d->findParameter("inputAmount") != nullptr);
  REQUIRE(d->isSupported());
}

TEST_CASE("addable respects the unsupported toggle", "[catalog]") {
  FakeRegistry reg = makeMixedRegistry();
  FilterCatalog cat = FilterCatalog::build(reg);

  REQUIRE(namesOf(cat.addable(false)) == std::vector<std::string>{"Sepia", "Screen"});
  REQUIRE(namesOf(cat.addable(true)) ==
          std::vector<std::string>{"Sepia", "Crop", "Screen"});
}

TEST_CASE("grouped sorts categories and names", "[catalog]") {
  FakeRegistry reg = makeMixedRegistry();
  reg.add(simpleFilter("Ansel"));
  FilterCatalog cat = FilterCatalog::build(reg);

  const std::vector<CatalogGroup> groups = cat.grouped(true);
  REQUIRE(groups.size() == 3);
  REQUIRE(groups[0].category == "Color Effect");
  REQUIRE(namesOf(groups[0].filters) == std::vector<std::string>{"Ansel", "Sepia"});
  REQUIRE(groups[1].category == "Composite Operation");
  REQUIRE(groups[2].category == "Geometry Adjustment");

  const std::vector<CatalogGroup> supportedOnly = cat.grouped(false);
  REQUIRE(supportedOnly.size() == 2);
}

TEST_CASE("search matches case-insensitively", "[catalog]") {
  FakeRegistry reg = makeMixedRegistry();
  FilterCatalog cat = FilterCatalog::build(reg);

  REQUIRE(namesOf(cat.search("sEpI")) == std::vector<std::string>{"Sepia"});
  // parameter display names are searched too
  REQUIRE(namesOf(cat.search("amount")) == std::vector<std::string>{"Sepia"});
  REQUIRE(namesOf(cat.search("", "composite operation")) ==
          std::vector<std::string>{"Screen"});
  REQUIRE(cat.search("nothing-like-this").empty());
}

TEST_CASE("Builtin registry catalog", "[catalog][builtins]") {
  BuiltinRegistry reg;
  FilterCatalog cat = FilterCatalog::build(reg);

  REQUIRE(cat.size() == 16);
  REQUIRE(cat.addable(false).size() == 12);
  REQUIRE(cat.addable(true).size() == 15);

  REQUIRE_FALSE(cat.find("ConstantColorGenerator")->isUsable());
  REQUIRE_FALSE(cat.find("ColorMonochrome")->isSupported());
  REQUIRE(cat.find("DissolveTransition")->hasTargetImage());

  const FilterDefinition *bloom = cat.find("Bloom");
  REQUIRE(bloom->category == "Stylize");
  REQUIRE(bloom->editableParameters().size() == 2);

  const std::vector<std::string> cats = cat.categories();
  REQUIRE(std::find(cats.begin(), cats.end(), "Blur") != cats.end());
}
