#include "ChainSerializer.h"

#include "core/Log.h"
#include "io/FileUtil.h"

#include <nlohmann/json.hpp>

namespace Chroma {

using nlohmann::json;

static json entryToJson(const ChainEntry &e) {
  json inputs = json::array();
  for (const ParameterOverride &o : e.parameterOverrides) {
    inputs.push_back(json{
        {"name", o.name},
        {"displayName", o.displayName},
        {"value", o.value},
    });
  }
  return json{
      {"id", e.id.toString()},
      {"name", e.name},
      {"isEnabled", e.enabled},
      {"inputs", std::move(inputs)},
  };
}

static std::expected<ChainEntry, std::string> entryFromJson(const json &j,
                                                            size_t index) {
  const std::string where = "userFilters[" + std::to_string(index) + "]";
  if (!j.is_object())
    return std::unexpected(where + " is not an object");

  ChainEntry e{};

  auto idIt = j.find("id");
  if (idIt == j.end() || !idIt->is_string())
    return std::unexpected(where + ".id is missing");
  const std::optional<EntryId> id = EntryId::parse(idIt->get<std::string>());
  if (!id)
    return std::unexpected(where + ".id is not a UUID");
  e.id = *id;

  auto nameIt = j.find("name");
  if (nameIt == j.end() || !nameIt->is_string() ||
      nameIt->get<std::string>().empty())
    return std::unexpected(where + ".name is missing");
  e.name = nameIt->get<std::string>();

  auto enIt = j.find("isEnabled");
  if (enIt == j.end())
    enIt = j.find("enabled");
  if (enIt != j.end()) {
    if (!enIt->is_boolean())
      return std::unexpected(where + ".isEnabled is not a boolean");
    e.enabled = enIt->get<bool>();
  }

  auto inIt = j.find("inputs");
  if (inIt != j.end()) {
    if (!inIt->is_array())
      return std::unexpected(where + ".inputs is not an array");
    for (size_t i = 0; i < inIt->size(); ++i) {
      const json &in = (*inIt)[i];
      const std::string inWhere = where + ".inputs[" + std::to_string(i) + "]";
      if (!in.is_object())
        return std::unexpected(inWhere + " is not an object");
      auto n = in.find("name");
      auto v = in.find("value");
      if (n == in.end() || !n->is_string())
        return std::unexpected(inWhere + ".name is missing");
      if (v == in.end() || !v->is_number())
        return std::unexpected(inWhere + ".value is not a number");

      ParameterOverride o{};
      o.name = n->get<std::string>();
      o.value = v->get<double>();
      auto dn = in.find("displayName");
      o.displayName = (dn != in.end() && dn->is_string()) ? dn->get<std::string>()
                                                          : o.name;
      e.parameterOverrides.push_back(std::move(o));
    }
  }

  return e;
}

std::string ChainSerializer::toJson(const FilterChain &chain, bool pretty) {
  json list = json::array();
  for (const ChainEntry &e : chain.entries()) list.push_back(entryToJson(e));
  const json doc{{"userFilters", std::move(list)}};
  return doc.dump(pretty ? 2 : -1);
}

std::expected<FilterChain, std::string>
ChainSerializer::fromJson(const std::string &text) {
  const json doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded())
    return std::unexpected(std::string("chain document is not valid JSON"));

  const json *list = nullptr;
  if (doc.is_array()) {
    list = &doc;
  } else if (doc.is_object()) {
    auto it = doc.find("userFilters");
    if (it != doc.end() && it->is_array())
      list = &*it;
  }
  if (!list)
    return std::unexpected(std::string("chain document has no userFilters array"));

  FilterChain chain;
  for (size_t i = 0; i < list->size(); ++i) {
    auto entry = entryFromJson((*list)[i], i);
    if (!entry)
      return std::unexpected(entry.error());
    const std::string id = entry->id.toString();
    if (auto added = chain.appendEntry(std::move(*entry)); !added)
      return std::unexpected("duplicate chain entry id " + id);
  }
  return chain;
}

std::expected<void, std::string>
ChainSerializer::saveFile(const std::string &path, const FilterChain &chain) {
  if (auto written = FileUtil::writeTextAtomic(path, toJson(chain)); !written)
    return std::unexpected(written.error());
  Log::Debug("Saved chain ({} entries) to '{}'", chain.size(), path);
  return {};
}

std::expected<FilterChain, std::string>
ChainSerializer::loadFile(const std::string &path) {
  auto text = FileUtil::readText(path);
  if (!text)
    return std::unexpected("Failed to read chain file: " + text.error());

  auto chain = fromJson(*text);
  if (!chain) {
    Log::Warn("Chain import '{}' failed: {}", path, chain.error());
    return std::unexpected(chain.error());
  }
  Log::Debug("Loaded chain ({} entries) from '{}'", chain->size(), path);
  return chain;
}

} // namespace Chroma
