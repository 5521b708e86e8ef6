/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/GeneratedContent.hpp"
#include "utils/JsonReader.hpp"

#include <algorithm>

namespace Realmforge {

namespace {

JsonValue toJsonArray(const std::vector<std::string> &values) {
  JsonArray array;
  array.reserve(values.size());
  for (const auto &value : values) {
    array.emplace_back(value);
  }
  return JsonValue(std::move(array));
}

JsonValue toJsonObject(const std::map<std::string, int> &values) {
  JsonObject obj;
  for (const auto &[key, value] : values) {
    obj[key] = JsonValue(value);
  }
  return JsonValue(std::move(obj));
}

JsonValue optionalString(const std::optional<std::string> &value) {
  return value ? JsonValue(*value) : JsonValue();
}

std::vector<std::string> readStrings(const JsonValue &json) {
  std::vector<std::string> result;
  if (const JsonArray *array = json.tryAsArray()) {
    for (const auto &entry : *array) {
      if (auto text = entry.tryAsString()) {
        result.push_back(std::move(*text));
      }
    }
  }
  return result;
}

std::map<std::string, int> readIntMap(const JsonValue &json) {
  std::map<std::string, int> result;
  if (const JsonObject *obj = json.tryAsObject()) {
    for (const auto &[key, value] : *obj) {
      if (auto number = value.tryAsInt()) {
        result[key] = *number;
      }
    }
  }
  return result;
}

std::optional<std::string> readOptionalString(const JsonValue &json) {
  return json.tryAsString();
}

template <typename T>
std::optional<std::vector<T>> readRecords(const JsonValue &json) {
  std::vector<T> result;
  if (json.isNull()) {
    return result;
  }
  const JsonArray *array = json.tryAsArray();
  if (!array) {
    return std::nullopt;
  }
  for (const auto &entry : *array) {
    auto record = T::fromJson(entry);
    if (!record) {
      return std::nullopt;
    }
    result.push_back(std::move(*record));
  }
  return result;
}

template <typename T> JsonValue recordsToJson(const std::vector<T> &records) {
  JsonArray array;
  array.reserve(records.size());
  for (const auto &record : records) {
    array.push_back(record.toJson());
  }
  return JsonValue(std::move(array));
}

void joinTo(std::ostream &os, const std::vector<std::string> &values) {
  for (size_t i = 0; i < values.size(); ++i) {
    os << (i ? ", " : "") << values[i];
  }
}

} // namespace

bool Item::hasProperty(const std::string &flag) const {
  return std::find(properties.begin(), properties.end(), flag) !=
         properties.end();
}

JsonValue Item::toJson() const {
  JsonObject obj;
  obj["name"] = JsonValue(name);
  obj["type"] = JsonValue(type);
  obj["subtype"] = JsonValue(subtype);
  obj["template"] = JsonValue(templateName);
  obj["quality"] = optionalString(quality);
  obj["rarity"] = optionalString(rarity);
  obj["material"] = optionalString(material);
  obj["stats"] = toJsonObject(stats);
  obj["value"] = JsonValue(value);
  obj["description"] = JsonValue(description);
  obj["damage_types"] = toJsonArray(damageTypes);
  obj["properties"] = toJsonArray(properties);
  return JsonValue(std::move(obj));
}

std::optional<Item> Item::fromJson(const JsonValue &json) {
  if (!json.isObject() || !json["name"].isString()) {
    return std::nullopt;
  }

  Item item;
  item.name = json["name"].asString();
  item.type = json["type"].tryAsString().value_or("");
  item.subtype = json["subtype"].tryAsString().value_or("");
  item.templateName = json["template"].tryAsString().value_or("");
  item.quality = readOptionalString(json["quality"]);
  item.rarity = readOptionalString(json["rarity"]);
  item.material = readOptionalString(json["material"]);
  item.stats = readIntMap(json["stats"]);
  item.value = json["value"].tryAsInt().value_or(0);
  item.description = json["description"].tryAsString().value_or("");
  item.damageTypes = readStrings(json["damage_types"]);
  item.properties = readStrings(json["properties"]);
  return item;
}

JsonValue NpcRecord::toJson() const {
  JsonObject obj;
  obj["name"] = JsonValue(name);
  obj["title"] = JsonValue(title);
  obj["professions"] = toJsonArray(professions);
  obj["race"] = JsonValue(race);
  obj["faction"] = optionalString(faction);
  obj["stats"] = toJsonObject(stats);
  obj["skills"] = toJsonArray(skills);
  obj["dialogue"] = JsonValue(dialogue);
  obj["description"] = JsonValue(description);
  obj["inventory"] = recordsToJson(inventory);
  return JsonValue(std::move(obj));
}

std::optional<NpcRecord> NpcRecord::fromJson(const JsonValue &json) {
  if (!json.isObject() || !json["name"].isString()) {
    return std::nullopt;
  }

  auto inventory = readRecords<Item>(json["inventory"]);
  if (!inventory) {
    return std::nullopt;
  }

  NpcRecord npc;
  npc.name = json["name"].asString();
  npc.title = json["title"].tryAsString().value_or("");
  npc.professions = readStrings(json["professions"]);
  npc.race = json["race"].tryAsString().value_or("");
  npc.faction = readOptionalString(json["faction"]);
  npc.stats = readIntMap(json["stats"]);
  npc.skills = readStrings(json["skills"]);
  npc.dialogue = json["dialogue"].tryAsString().value_or("");
  npc.description = json["description"].tryAsString().value_or("");
  npc.inventory = std::move(*inventory);
  return npc;
}

JsonValue LocationRecord::toJson() const {
  JsonObject obj;
  obj["id"] = JsonValue(id);
  obj["name"] = JsonValue(name);
  obj["type"] = JsonValue(type);
  obj["template"] = JsonValue(templateName);
  obj["biome"] = JsonValue(biome);
  obj["environment_tags"] = toJsonArray(environmentTags);
  obj["description"] = JsonValue(description);
  obj["npcs"] = recordsToJson(npcs);
  obj["items"] = recordsToJson(items);

  JsonObject links;
  for (const auto &[templateName, neighborId] : connections) {
    links[templateName] = JsonValue(neighborId);
  }
  obj["connections"] = JsonValue(std::move(links));
  return JsonValue(std::move(obj));
}

std::optional<LocationRecord> LocationRecord::fromJson(const JsonValue &json) {
  if (!json.isObject() || !json["id"].isString()) {
    return std::nullopt;
  }

  auto npcs = readRecords<NpcRecord>(json["npcs"]);
  auto items = readRecords<Item>(json["items"]);
  if (!npcs || !items) {
    return std::nullopt;
  }

  LocationRecord location;
  location.id = json["id"].asString();
  location.name = json["name"].tryAsString().value_or("");
  location.type = json["type"].tryAsString().value_or("");
  location.templateName = json["template"].tryAsString().value_or("");
  location.biome = json["biome"].tryAsString().value_or("");
  location.environmentTags = readStrings(json["environment_tags"]);
  location.description = json["description"].tryAsString().value_or("");
  location.npcs = std::move(*npcs);
  location.items = std::move(*items);
  if (const JsonObject *links = json["connections"].tryAsObject()) {
    for (const auto &[templateName, neighbor] : *links) {
      if (auto neighborId = neighbor.tryAsString()) {
        location.connections[templateName] = *neighborId;
      }
    }
  }
  return location;
}

const LocationRecord *GeneratedWorld::findLocation(const std::string &id) const {
  auto it = std::find_if(locations.begin(), locations.end(),
                         [&id](const LocationRecord &loc) { return loc.id == id; });
  return it != locations.end() ? &*it : nullptr;
}

JsonValue GeneratedWorld::toJson() const {
  JsonObject locationMap;
  for (const auto &location : locations) {
    locationMap[location.id] = location.toJson();
  }

  JsonObject worldMap;
  for (const auto &[id, entry] : summary) {
    JsonObject obj;
    obj["name"] = JsonValue(entry.name);
    obj["type"] = JsonValue(entry.type);
    obj["connections"] = toJsonArray(entry.connections);
    obj["npc_count"] = JsonValue(entry.npcCount);
    obj["item_count"] = JsonValue(entry.itemCount);
    worldMap[id] = JsonValue(std::move(obj));
  }

  JsonObject root;
  root["locations"] = JsonValue(std::move(locationMap));
  root["world_map"] = JsonValue(std::move(worldMap));
  return JsonValue(std::move(root));
}

std::ostream &operator<<(std::ostream &os, const Item &item) {
  os << item.name << " [" << item.type;
  if (!item.subtype.empty()) {
    os << "/" << item.subtype;
  }
  os << "] value=" << item.value;
  for (const auto &[stat, amount] : item.stats) {
    os << " " << stat << (amount >= 0 ? "+" : "") << amount;
  }
  return os;
}

std::ostream &operator<<(std::ostream &os, const NpcRecord &npc) {
  os << npc.name << ", " << npc.title << " (" << npc.race;
  if (npc.faction) {
    os << ", " << *npc.faction;
  }
  os << ") skills: ";
  joinTo(os, npc.skills);
  return os;
}

std::ostream &operator<<(std::ostream &os, const LocationRecord &location) {
  os << location.id << " \"" << location.name << "\" (" << location.biome
     << ") tags: ";
  joinTo(os, location.environmentTags);
  os << " links:";
  for (const auto &[templateName, neighborId] : location.connections) {
    os << " " << templateName << "->" << neighborId;
  }
  return os;
}

} // namespace Realmforge
