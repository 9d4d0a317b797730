// =============================================================================
// ChainExecutor Tests
// =============================================================================
// Chain evaluation against concrete images: ordering, toggling, secondary
// image roles, failure reporting and the per-entry instance cache.
// =============================================================================

#include <catch2/catch_all.hpp>

#include "FakeRegistry.h"
#include "builtins/BuiltinRegistry.h"
#include "filters/FilterCatalog.h"
#include "render/ChainExecutor.h"

using namespace Chroma;
using namespace ChromaTest;
using Catch::Approx;

namespace {

struct BuiltinFixture {
  BuiltinRegistry registry;
  FilterCatalog catalog = FilterCatalog::build(registry);
  ChainExecutor executor{registry};

  EntryId add(FilterChain &chain, const char *name) {
    const FilterDefinition *d = catalog.find(name);
    REQUIRE(d != nullptr);
    auto id = chain.append(*d);
    REQUIRE(id.has_value());
    return *id;
  }
};

Image linearGray(uint32_t w, uint32_t h, float v) {
  Image img(w, h, glm::vec4(v, v, v, 1.0f));
  img.setColorSpace(ColorSpace::LinearSRGB);
  return img;
}

} // namespace

TEST_CASE_METHOD(BuiltinFixture, "Steps apply in chain order", "[executor]") {
  const Image base = linearGray(2, 2, 0.1f);

  FilterChain ab;
  const EntryId exp = add(ab, "Exposure");
  add(ab, "ColorInvert");
  REQUIRE(ab.setParameter(exp, "inputEV", 1.0).has_value());

  FilterChain ba = ab;
  REQUIRE(ba.move(exp, 1));

  auto first = executor.render(ab, base, nullptr, false);
  auto second = executor.render(ba, base, nullptr, false);
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());

  // 0.1 * 2 -> invert = 0.8; invert -> 0.9 * 2 = 1.8
  REQUIRE(first->at(0, 0).r == Approx(0.8f));
  REQUIRE(second->at(0, 0).r == Approx(1.8f));
}

TEST_CASE_METHOD(BuiltinFixture, "Disabled steps behave as if removed", "[executor]") {
  const Image base = linearGray(3, 3, 0.3f);

  FilterChain chain;
  const EntryId a = add(chain, "Exposure");
  const EntryId b = add(chain, "ColorInvert");
  add(chain, "GammaAdjust");
  REQUIRE(chain.setParameter(a, "inputEV", 0.5).has_value());

  FilterChain disabled = chain;
  REQUIRE(disabled.setEnabled(b, false));
  FilterChain removed = chain;
  REQUIRE(removed.remove(b));

  auto r1 = executor.render(disabled, base, nullptr, false);
  auto r2 = executor.render(removed, base, nullptr, false);
  REQUIRE(r1.has_value());
  REQUIRE(r2.has_value());
  REQUIRE(*r1 == *r2);
}

TEST_CASE_METHOD(BuiltinFixture, "Empty chain returns the base unchanged", "[executor]") {
  Image base(2, 1, glm::vec4(0.5f, 0.25f, 0.75f, 1.0f));
  base.setColorSpace(ColorSpace::SRGB);

  auto r = executor.render(FilterChain{}, base, nullptr, false);
  REQUIRE(r.has_value());
  REQUIRE(r->colorSpace() == ColorSpace::SRGB);
  REQUIRE(r->at(1, 0).r == Approx(0.5f).margin(1e-4));
  REQUIRE(r->at(1, 0).g == Approx(0.25f).margin(1e-4));
}

TEST_CASE_METHOD(BuiltinFixture, "Result keeps the base extent and metadata", "[executor]") {
  Image base(6, 4, glm::vec4(0.4f, 0.2f, 0.1f, 1.0f));
  base.setOrientation(Orientation::Right);
  base.setColorSpace(ColorSpace::SRGB);
  base.setScale(2.0f);

  FilterChain chain;
  add(chain, "Bloom");
  add(chain, "BoxBlur");

  auto r = executor.render(chain, base, nullptr, false);
  REQUIRE(r.has_value());
  REQUIRE(r->width() == 6);
  REQUIRE(r->height() == 4);
  REQUIRE(r->orientation() == Orientation::Right);
  REQUIRE(r->colorSpace() == ColorSpace::SRGB);
  REQUIRE(r->scale() == 2.0f);
}

TEST_CASE_METHOD(BuiltinFixture, "Missing secondary image fails the whole render", "[executor]") {
  const Image base = linearGray(2, 2, 0.5f);

  FilterChain chain;
  add(chain, "Exposure");
  const EntryId comp = add(chain, "SourceOverCompositing");

  auto r = executor.render(chain, base, nullptr, false);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == RenderErrorCode::MissingOutput);
  REQUIRE(r.error().filterName == "SourceOverCompositing");
  REQUIRE(r.error().entryId == comp);
  REQUIRE(r.error().message() == "Processing failed at filter \"SourceOverCompositing\".");

  SECTION("a later render with the image bound succeeds") {
    const Image bg = linearGray(2, 2, 0.0f);
    auto ok = executor.render(chain, base, &bg, false);
    REQUIRE(ok.has_value());
  }

  SECTION("dropping the image again unbinds it on the cached instance") {
    const Image bg = linearGray(2, 2, 0.0f);
    REQUIRE(executor.render(chain, base, &bg, false).has_value());
    REQUIRE_FALSE(executor.render(chain, base, nullptr, false).has_value());
  }
}

TEST_CASE_METHOD(BuiltinFixture, "Unknown filters are reported", "[executor]") {
  FilterChain chain;
  ChainEntry e{};
  e.id = EntryId::generate();
  e.name = "NoSuchFilter";
  REQUIRE(chain.appendEntry(e).has_value());

  auto r = executor.render(chain, linearGray(1, 1, 0.5f), nullptr, false);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == RenderErrorCode::UnknownFilter);
  REQUIRE(r.error().filterName == "NoSuchFilter");
}

TEST_CASE_METHOD(BuiltinFixture, "Secondary image scaling", "[executor]") {
  Image base(4, 4, glm::vec4(0.0f));
  base.setColorSpace(ColorSpace::LinearSRGB);
  Image bg(2, 2, glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
  bg.setColorSpace(ColorSpace::LinearSRGB);

  FilterChain chain;
  add(chain, "SourceOverCompositing");

  SECTION("unscaled secondary leaves the uncovered area clear") {
    auto r = executor.render(chain, base, &bg, false);
    REQUIRE(r.has_value());
    REQUIRE(r->at(0, 0).a == 1.0f);
    REQUIRE(r->at(3, 3).a == 0.0f);
  }

  SECTION("scaled secondary covers the base") {
    auto r = executor.render(chain, base, &bg, true);
    REQUIRE(r.has_value());
    REQUIRE(r->at(3, 3).a == Approx(1.0f).margin(1e-3));
    REQUIRE(r->at(3, 3).r == Approx(1.0f).margin(1e-3));
  }
}

TEST_CASE("Instances are reused per entry and evicted with it", "[executor][cache]") {
  FakeRegistry reg;
  reg.add(simpleFilter("Sepia"));
  const FilterCatalog cat = FilterCatalog::build(reg);
  ChainExecutor executor(reg);
  const Image base = linearGray(2, 2, 0.5f);

  FilterChain chain;
  const EntryId a = *chain.append(*cat.find("Sepia"));
  const EntryId b = *chain.append(*cat.find("Sepia"));

  REQUIRE(executor.render(chain, base, nullptr, false).has_value());
  REQUIRE(reg.instantiated == 2);
  REQUIRE(executor.cachedCount() == 2);
  const FilterInstance *first = executor.cachedInstance(a);
  REQUIRE(first != nullptr);
  REQUIRE(executor.cachedInstance(b) != first);

  REQUIRE(chain.setParameter(a, "inputAmount", 0.9).has_value());
  REQUIRE(executor.render(chain, base, nullptr, false).has_value());
  REQUIRE(reg.instantiated == 2);
  REQUIRE(executor.cachedInstance(a) == first);

  const auto *inst = dynamic_cast<const FakeInstance *>(first);
  REQUIRE(inst != nullptr);
  REQUIRE(inst->number("inputAmount") == 0.9);

  SECTION("disabled entries keep their instance") {
    REQUIRE(chain.setEnabled(a, false));
    REQUIRE(executor.render(chain, base, nullptr, false).has_value());
    REQUIRE(executor.cachedInstance(a) == first);
  }

  SECTION("removed entries are evicted on the next render") {
    REQUIRE(chain.remove(a));
    REQUIRE(executor.render(chain, base, nullptr, false).has_value());
    REQUIRE(executor.cachedCount() == 1);
    REQUIRE(executor.cachedInstance(a) == nullptr);
  }

  SECTION("evictStale drops entries directly") {
    REQUIRE(executor.evictStale(FilterChain{}) == 2);
    REQUIRE(executor.cachedCount() == 0);
  }
}

TEST_CASE("Background role wins over target role", "[executor]") {
  FakeRegistry reg;
  FakeFilter f;
  f.name = "TwoRoles";
  f.input("inputImage", imageParam("Image"));
  f.input("inputTargetImage", imageParam("Target"));
  f.input("inputBackgroundImage", imageParam("Background"));
  f.output();
  reg.add(std::move(f));
  const FilterCatalog cat = FilterCatalog::build(reg);

  ChainExecutor executor(reg);
  FilterChain chain;
  const EntryId id = *chain.append(*cat.find("TwoRoles"));

  const Image base = linearGray(2, 2, 0.5f);
  const Image sec = linearGray(2, 2, 1.0f);
  REQUIRE(executor.render(chain, base, &sec, false).has_value());

  const auto *inst = dynamic_cast<const FakeInstance *>(executor.cachedInstance(id));
  REQUIRE(inst != nullptr);
  REQUIRE(inst->isBound("inputImage"));
  REQUIRE(inst->isBound("inputBackgroundImage"));
  REQUIRE_FALSE(inst->isBound("inputTargetImage"));
}

TEST_CASE("Target role receives the secondary image", "[executor]") {
  BuiltinRegistry reg;
  const FilterCatalog cat = FilterCatalog::build(reg);
  ChainExecutor executor(reg);

  FilterChain chain;
  const EntryId id = *chain.append(*cat.find("DissolveTransition"));
  REQUIRE(chain.setParameter(id, "inputTime", 1.0).has_value());

  const Image base = linearGray(2, 2, 0.0f);
  const Image target = linearGray(2, 2, 0.75f);
  auto r = executor.render(chain, base, &target, false);
  REQUIRE(r.has_value());
  REQUIRE(r->at(1, 1).r == Approx(0.75f));
}

TEST_CASE("Cancelled renders leave the cache untouched", "[executor][cancel]") {
  std::atomic<bool> cancel{false};

  FakeRegistry reg;
  reg.add(simpleFilter("Sepia"));
  reg.add(simpleFilter("Trip", [&cancel](const Bindings &b) {
    cancel = true;
    return passThrough(b);
  }));
  const FilterCatalog cat = FilterCatalog::build(reg);
  ChainExecutor executor(reg);
  const Image base = linearGray(2, 2, 0.5f);

  FilterChain chain;
  const EntryId a = *chain.append(*cat.find("Sepia"));
  REQUIRE(executor.render(chain, base, nullptr, false, &cancel).has_value());
  const FilterInstance *cached = executor.cachedInstance(a);
  REQUIRE(executor.cachedCount() == 1);

  const EntryId trip = *chain.append(*cat.find("Trip"));
  chain.append(*cat.find("Sepia"));
  auto r = executor.render(chain, base, nullptr, false, &cancel);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().isCancelled());

  REQUIRE(executor.cachedCount() == 1);
  REQUIRE(executor.cachedInstance(a) == cached);
  REQUIRE(executor.cachedInstance(trip) == nullptr);

  SECTION("a cancel requested up front renders nothing") {
    auto again = executor.render(chain, base, nullptr, false, &cancel);
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().isCancelled());
    REQUIRE(executor.cachedCount() == 1);
  }
}
