/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GENERATED_CONTENT_HPP
#define GENERATED_CONTENT_HPP

/**
 * @file GeneratedContent.hpp
 * @brief Plain records produced by the ContentGenerator
 *
 * Records are immutable once generated. Living entities wrap them and keep
 * their dynamic state separately.
 */

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Realmforge {

class JsonValue;

struct Item {
  std::string name;
  std::string type;
  std::string subtype;
  std::string templateName;
  std::optional<std::string> quality;
  std::optional<std::string> rarity;
  std::optional<std::string> material;
  std::map<std::string, int> stats; // zero entries are never stored
  int value{0};
  std::string description;
  std::vector<std::string> damageTypes;
  std::vector<std::string> properties; // consumable, single_use, ...

  bool hasProperty(const std::string &flag) const;

  JsonValue toJson() const;
  static std::optional<Item> fromJson(const JsonValue &json);

  bool operator==(const Item &other) const = default;
};

struct NpcRecord {
  std::string name;
  std::string title;
  std::vector<std::string> professions;
  std::string race;
  std::optional<std::string> faction;
  std::map<std::string, int> stats;
  std::vector<std::string> skills;
  std::string dialogue;
  std::string description;
  std::vector<Item> inventory;

  JsonValue toJson() const;
  static std::optional<NpcRecord> fromJson(const JsonValue &json);

  bool operator==(const NpcRecord &other) const = default;
};

struct LocationRecord {
  std::string id;
  std::string name;
  std::string type;
  std::string templateName;
  std::string biome;
  std::vector<std::string> environmentTags;
  std::string description;
  std::vector<NpcRecord> npcs;
  std::vector<Item> items;
  // Neighbor template name -> neighbor location id, mirrored on the neighbor
  std::map<std::string, std::string> connections;

  JsonValue toJson() const;
  static std::optional<LocationRecord> fromJson(const JsonValue &json);

  bool operator==(const LocationRecord &other) const = default;
};

struct LocationSummary {
  std::string name;
  std::string type;
  std::vector<std::string> connections;
  size_t npcCount{0};
  size_t itemCount{0};

  bool operator==(const LocationSummary &other) const = default;
};

struct GeneratedWorld {
  std::vector<LocationRecord> locations; // generation order
  std::map<std::string, LocationSummary> summary;

  const LocationRecord *findLocation(const std::string &id) const;

  JsonValue toJson() const;
};

std::ostream &operator<<(std::ostream &os, const Item &item);
std::ostream &operator<<(std::ostream &os, const NpcRecord &npc);
std::ostream &operator<<(std::ostream &os, const LocationRecord &location);

} // namespace Realmforge

#endif // GENERATED_CONTENT_HPP
