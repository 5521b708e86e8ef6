/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Realmforge {

/**
 * @brief Thrown when a named template, profession, race, faction, biome,
 * item set, tier, stat or entity does not exist
 */
class LookupError : public std::out_of_range {
public:
  LookupError(const std::string &kind, const std::string &name)
      : std::out_of_range("Unknown " + kind + ": '" + name + "'"),
        m_kind(kind), m_name(name) {}

  const std::string &kind() const { return m_kind; }
  const std::string &name() const { return m_name; }

private:
  std::string m_kind;
  std::string m_name;
};

/**
 * @brief Thrown when constrained generation gives up after its retry budget
 */
class GenerationExhausted : public std::runtime_error {
public:
  GenerationExhausted(const std::string &what, int attempts)
      : std::runtime_error(what + " not satisfiable after " +
                           std::to_string(attempts) + " attempts"),
        m_attempts(attempts) {}

  int attempts() const { return m_attempts; }

private:
  int m_attempts;
};

} // namespace Realmforge

#endif // ERRORS_HPP
