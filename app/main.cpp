#include "core/Log.h"

#include "builtins/BuiltinRegistry.h"
#include "chain/ChainSerializer.h"
#include "config/EngineConfig.h"
#include "filters/FilterCatalog.h"
#include "image/ImageIO.h"
#include "render/RenderScheduler.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace {

struct CliArgs final {
  std::string command;
  std::vector<std::string> positional;
  std::unordered_map<std::string, std::string> options;
  std::vector<std::string> flags;

  bool has(const std::string &flag) const {
    for (const auto &f : flags)
      if (f == flag)
        return true;
    return options.contains(flag);
  }
  std::string opt(const std::string &k, const std::string &def = {}) const {
    auto it = options.find(k);
    return it == options.end() ? def : it->second;
  }
};

// Options taking a value; everything else starting with -- is a flag.
const char *kValueOptions[] = {"--config", "--log-level", "--category", "--search",
                               "--image",  "--secondary", "--chain",    "--out",
                               "--orientation"};

bool takesValue(const std::string &a) {
  for (const char *o : kValueOptions)
    if (a == o)
      return true;
  return false;
}

bool parseArgs(int argc, char **argv, CliArgs &out) {
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a.rfind("--", 0) == 0) {
      if (takesValue(a)) {
        if (i + 1 >= argc) {
          std::fprintf(stderr, "Missing value for %s\n", a.c_str());
          return false;
        }
        out.options[a] = argv[++i];
      } else {
        out.flags.push_back(a);
      }
    } else if (out.command.empty()) {
      out.command = a;
    } else {
      out.positional.push_back(a);
    }
  }
  return !out.command.empty();
}

void printUsage() {
  std::puts(
      "usage: chroma <command> [options]\n"
      "\n"
      "  list [--all] [--category C] [--search Q]   list addable filters\n"
      "  describe <filter>                          show a filter's parameters\n"
      "  add <filter> --chain chain.json            append a filter with defaults\n"
      "  render --image base.png --chain chain.json --out out.png\n"
      "         [--secondary bg.png] [--scale-secondary] [--orientation 1-8]\n"
      "\n"
      "  --config path     engine settings (key=value)\n"
      "  --log-level L     trace|debug|info|warn|error");
}

int cmdList(const Chroma::FilterCatalog &catalog, const Chroma::EngineConfig &cfg,
            const CliArgs &args) {
  const bool all = args.has("--all") || cfg.showUnsupported;
  const std::string category = args.opt("--category");
  const std::string query = args.opt("--search");

  if (!category.empty() || !query.empty()) {
    for (const Chroma::FilterDefinition *d : catalog.search(query, category)) {
      if (!d->isUsable() || (!all && !d->isSupported()))
        continue;
      std::printf("%-24s %-20s%s\n", d->name.c_str(), d->category.c_str(),
                  d->isSupported() ? "" : " (unsupported)");
    }
    return 0;
  }

  for (const Chroma::CatalogGroup &g : catalog.grouped(all)) {
    std::printf("%s\n", g.category.c_str());
    for (const Chroma::FilterDefinition *d : g.filters) {
      std::printf("  %-24s%s\n", d->name.c_str(),
                  d->isSupported() ? "" : " (unsupported)");
    }
  }
  return 0;
}

int cmdDescribe(const Chroma::FilterCatalog &catalog, const CliArgs &args) {
  if (args.positional.empty()) {
    printUsage();
    return 1;
  }
  const Chroma::FilterDefinition *d = catalog.find(args.positional[0]);
  if (!d) {
    Chroma::Log::Error("Unknown filter '{}'", args.positional[0]);
    return 1;
  }

  std::printf("%s (%s)\n", d->name.c_str(), d->displayName.c_str());
  std::printf("  category: %s\n", d->category.empty() ? "-" : d->category.c_str());
  std::printf("  usable: %s, supported: %s\n", d->isUsable() ? "yes" : "no",
              d->isSupported() ? "yes" : "no");
  for (const Chroma::ParameterDefinition &p : d->parameters) {
    const std::string type(Chroma::paramTypeName(p.type));
    if (p.isImageRole()) {
      std::printf("  %-22s %-12s image role\n", p.name.c_str(), type.c_str());
      continue;
    }
    std::printf("  %-22s %-12s default %g, range [%g, %g]%s\n", p.name.c_str(),
                type.c_str(), p.preferredDefault(), p.preferredSliderMin(),
                p.preferredSliderMax(), p.isSupported() ? "" : " (not editable)");
  }
  return 0;
}

int cmdAdd(const Chroma::FilterCatalog &catalog, const CliArgs &args) {
  const std::string chainPath = args.opt("--chain");
  if (args.positional.empty() || chainPath.empty()) {
    printUsage();
    return 1;
  }

  Chroma::FilterChain chain;
  std::error_code ec;
  if (std::filesystem::exists(chainPath, ec)) {
    auto loaded = Chroma::ChainSerializer::loadFile(chainPath);
    if (!loaded) {
      Chroma::Log::Error("{}", loaded.error());
      return 1;
    }
    chain = std::move(*loaded);
  }

  const Chroma::FilterDefinition *d = catalog.find(args.positional[0]);
  if (!d) {
    Chroma::Log::Error("Unknown filter '{}'", args.positional[0]);
    return 1;
  }
  auto id = chain.append(*d);
  if (!id) {
    Chroma::Log::Error("Cannot add '{}': {}", d->name,
                       Chroma::chainErrorMessage(id.error()));
    return 1;
  }

  if (auto saved = Chroma::ChainSerializer::saveFile(chainPath, chain); !saved) {
    Chroma::Log::Error("{}", saved.error());
    return 1;
  }
  Chroma::Log::Info("Added {} as {} ({} entries)", d->name, id->toString(),
                    chain.size());
  return 0;
}

int cmdRender(const Chroma::FilterRegistry &registry,
              const Chroma::EngineConfig &cfg, const CliArgs &args) {
  const std::string imagePath = args.opt("--image");
  const std::string chainPath = args.opt("--chain");
  const std::string outPath = args.opt("--out");
  if (imagePath.empty() || chainPath.empty() || outPath.empty()) {
    printUsage();
    return 1;
  }

  Chroma::Orientation orientation = Chroma::Orientation::Up;
  if (const std::string o = args.opt("--orientation"); !o.empty()) {
    if (!Chroma::orientationFromExif(std::atoi(o.c_str()), orientation)) {
      Chroma::Log::Error("Orientation must be an EXIF value 1-8, got '{}'", o);
      return 1;
    }
  }

  auto base = Chroma::ImageIO::load(imagePath, orientation);
  if (!base) {
    Chroma::Log::Error("{}", base.error());
    return 1;
  }

  Chroma::ImageRef secondary;
  if (const std::string sp = args.opt("--secondary"); !sp.empty()) {
    auto sec = Chroma::ImageIO::load(sp);
    if (!sec) {
      Chroma::Log::Error("{}", sec.error());
      return 1;
    }
    secondary = std::make_shared<const Chroma::Image>(std::move(*sec));
  }

  auto chain = Chroma::ChainSerializer::loadFile(chainPath);
  if (!chain) {
    Chroma::Log::Error("{}", chain.error());
    return 1;
  }

  auto baseRef = std::make_shared<const Chroma::Image>(std::move(*base));

  Chroma::RenderScheduler scheduler(registry,
                                    std::chrono::milliseconds(cfg.debounceMs));
  Chroma::RenderRequest req{};
  req.chain = std::move(*chain);
  req.base = baseRef;
  req.secondary = secondary;
  req.scaleSecondaryToFit = args.has("--scale-secondary") || cfg.scaleSecondaryToFit;
  scheduler.request(std::move(req));

  if (!scheduler.waitIdle(std::chrono::minutes(5))) {
    Chroma::Log::Error("Render timed out");
    return 1;
  }

  Chroma::RenderDelivery d{};
  if (!scheduler.consume(d)) {
    Chroma::Log::Error("Render produced no result");
    return 1;
  }
  if (d.error) {
    std::fprintf(stderr, "%s\n", d.error->message().c_str());
    return 1;
  }

  // Empty chain: the unfiltered image is the result.
  const Chroma::Image &result = d.image ? *d.image : *baseRef;
  if (auto saved = Chroma::ImageIO::savePNG(outPath, result); !saved) {
    Chroma::Log::Error("{}", saved.error());
    return 1;
  }
  Chroma::Log::Info("Wrote {} ({}x{})", outPath, result.width(), result.height());
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  CliArgs args;
  if (!parseArgs(argc, argv, args) || args.command == "help" || args.has("--help")) {
    printUsage();
    return args.command == "help" ? 0 : 1;
  }

  Chroma::EngineConfig cfg{};
  if (const std::string path = args.opt("--config"); !path.empty()) {
    if (auto loaded = Chroma::EngineConfigIO::load(path, cfg); !loaded) {
      std::fprintf(stderr, "%s\n", loaded.error().c_str());
      return 1;
    }
  }
  if (const std::string lvl = args.opt("--log-level"); !lvl.empty())
    cfg.logLevel = lvl;

  Chroma::Log::Init(Chroma::Log::Settings{cfg.logLevel, cfg.logFile});

  Chroma::BuiltinRegistry registry;
  const Chroma::FilterCatalog catalog = Chroma::FilterCatalog::build(registry);

  if (args.command == "list")
    return cmdList(catalog, cfg, args);
  if (args.command == "describe")
    return cmdDescribe(catalog, args);
  if (args.command == "add")
    return cmdAdd(catalog, args);
  if (args.command == "render")
    return cmdRender(registry, cfg, args);

  Chroma::Log::Error("Unknown command '{}'", args.command);
  printUsage();
  return 1;
}
