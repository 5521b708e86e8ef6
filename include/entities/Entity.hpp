/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

namespace Realmforge {

class JsonValue;
class World;

enum class EntityKind : uint8_t { Location = 0, NPC = 1 };

const char *entityKindName(EntityKind kind);

inline std::ostream &operator<<(std::ostream &os, EntityKind kind) {
  return os << entityKindName(kind);
}

/**
 * @brief Base class for everything the World updates each tick
 *
 * Entities wrap an immutable generated record and own the dynamic state
 * around it. The kind tag lets the World and EntityFactory dispatch without
 * dynamic_cast chains.
 */
class Entity {
public:
  Entity(std::string id, EntityKind kind)
      : m_id(std::move(id)), m_kind(kind) {}
  virtual ~Entity() = default;

  Entity(const Entity &) = delete;
  Entity &operator=(const Entity &) = delete;

  /**
   * @brief Advances the entity by deltaMinutes of simulation time
   *
   * Inactive entities return immediately. Exceptions propagate to the World,
   * which records them in the tick report.
   */
  virtual void update(double deltaMinutes, World &world) = 0;

  virtual JsonValue serialize() const = 0;

  /**
   * @brief Restores dynamic state written by serialize()
   * @return false (state unspecified) on a malformed document
   */
  virtual bool deserialize(const JsonValue &json) = 0;

  const std::string &getId() const { return m_id; }
  EntityKind getKind() const { return m_kind; }

  bool isActive() const { return m_active; }
  void setActive(bool active) { m_active = active; }
  void destroy() { m_active = false; }

  // Simulation minutes this entity has been updated for
  double getLastUpdate() const { return m_lastUpdate; }

protected:
  double m_lastUpdate{0.0};
  bool m_active{true};

private:
  std::string m_id;
  EntityKind m_kind;
};

using EntityPtr = std::unique_ptr<Entity>;

} // namespace Realmforge

#endif // ENTITY_HPP
