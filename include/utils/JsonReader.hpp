/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace Realmforge {

class JsonValue;

using JsonArray = std::vector<JsonValue>;

/**
 * @brief JSON object that keeps members in insertion (document) order
 *
 * Template tables rely on declared order (quality and rarity tiers are
 * ranked by position), and snapshots are easier to diff when keys come
 * back in the order they were written. Lookups are linear; objects in this
 * project are small.
 */
class JsonObject {
public:
  using Entry = std::pair<std::string, JsonValue>;
  using Container = std::vector<Entry>;
  using iterator = Container::iterator;
  using const_iterator = Container::const_iterator;

  iterator begin() { return m_entries.begin(); }
  iterator end() { return m_entries.end(); }
  const_iterator begin() const { return m_entries.begin(); }
  const_iterator end() const { return m_entries.end(); }

  size_t size() const { return m_entries.size(); }
  bool empty() const { return m_entries.empty(); }
  void clear() { m_entries.clear(); }

  iterator find(const std::string &key);
  const_iterator find(const std::string &key) const;
  bool contains(const std::string &key) const;

  // Inserts a null member at the end when the key is missing
  JsonValue &operator[](const std::string &key);

  // Throws std::out_of_range when the key is missing
  const JsonValue &at(const std::string &key) const;

  void insert_or_assign(const std::string &key, JsonValue value);
  bool erase(const std::string &key);

  bool operator==(const JsonObject &other) const;

private:
  Container m_entries;
};

enum class JsonType { Null, Boolean, Number, String, Array, Object };

// Stream operator for JsonType (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null:
    return os << "Null";
  case JsonType::Boolean:
    return os << "Boolean";
  case JsonType::Number:
    return os << "Number";
  case JsonType::String:
    return os << "String";
  case JsonType::Array:
    return os << "Array";
  case JsonType::Object:
    return os << "Object";
  }
  return os << "Unknown";
}

class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, // null
                                 bool,           // boolean
                                 double,         // number
                                 std::string,    // string
                                 JsonArray,      // array
                                 JsonObject      // object
                                 >;

private:
  ValueType m_value;

public:
  // Constructors
  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(std::nullptr_t) : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(int64_t value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(size_t value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(const std::string &value) : m_value(value) {}
  explicit JsonValue(std::string &&value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(const JsonArray &value) : m_value(value) {}
  explicit JsonValue(JsonArray &&value) : m_value(std::move(value)) {}
  explicit JsonValue(const JsonObject &value) : m_value(value) {}
  explicit JsonValue(JsonObject &&value) : m_value(std::move(value)) {}

  // Type checking
  JsonType getType() const;
  bool isNull() const {
    return std::holds_alternative<std::nullptr_t>(m_value);
  }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  // Value accessors (throw std::bad_variant_access if wrong type)
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  // Truncate toward zero; throw std::out_of_range if the number does not fit
  int asInt() const;
  int64_t asInt64() const;
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }

  // Mutable accessors
  JsonArray &asArray() { return std::get<JsonArray>(m_value); }
  JsonObject &asObject() { return std::get<JsonObject>(m_value); }

  // Safe accessors (return optional)
  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  // nullopt for non-numbers and for numbers outside the integer's range
  std::optional<int> tryAsInt() const;
  std::optional<int64_t> tryAsInt64() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  // Object member access
  bool hasKey(const std::string &key) const;
  const JsonValue &operator[](const std::string &key) const;
  JsonValue &operator[](const std::string &key);

  // Array element access
  const JsonValue &operator[](size_t index) const;
  JsonValue &operator[](size_t index);
  size_t size() const;

  bool operator==(const JsonValue &other) const {
    return m_value == other.m_value;
  }

  /**
   * @brief Serializes the value as JSON text
   * @param indent Spaces per nesting level; negative writes compact output
   */
  std::string toString(int indent = -1) const;

private:
  void writeToStream(std::ostream &stream, int indent, int depth) const;
};

std::ostream &operator<<(std::ostream &os, const JsonValue &value);

/**
 * @brief Recursive-descent JSON parser
 *
 * Errors are reported through getLastError() with line/column information;
 * parse() and loadFromFile() return false on failure and leave the root null.
 */
class JsonReader {
private:
  std::string m_input;
  size_t m_position;
  size_t m_line;
  size_t m_column;
  std::string m_lastError;
  JsonValue m_root;

  char peek(size_t offset = 0) const;
  char advance();
  bool isAtEnd() const { return m_position >= m_input.length(); }
  void skipWhitespace();
  bool consumeLiteral(const char *literal);

  bool parseValue(JsonValue &out, int depth);
  bool parseObject(JsonValue &out, int depth);
  bool parseArray(JsonValue &out, int depth);
  bool parseString(std::string &out);
  bool parseNumber(JsonValue &out);
  bool parseUnicodeEscape(uint32_t &codepoint);
  static void appendUtf8(std::string &out, uint32_t codepoint);
  static bool isDigit(char c) { return c >= '0' && c <= '9'; }

public:
  JsonReader();

  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);
  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  void setError(const std::string &message);
};

/**
 * @brief Writes a value to disk as indented JSON
 * @return false if the file could not be written
 */
bool writeJsonFile(const std::string &path, const JsonValue &value,
                   int indent = 2);

} // namespace Realmforge

#endif // JSONREADER_HPP
