/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/BinarySerializer.hpp"

namespace Realmforge::BinarySerial {

bool Writer::writeJson(const JsonValue &value) {
  const auto tag = static_cast<uint8_t>(value.getType());
  if (!write(tag)) {
    return false;
  }

  switch (value.getType()) {
  case JsonType::Null:
    return true;
  case JsonType::Boolean:
    return write(static_cast<uint8_t>(value.asBool() ? 1 : 0));
  case JsonType::Number:
    return write(value.asNumber());
  case JsonType::String:
    return writeString(value.asString());
  case JsonType::Array: {
    const auto &arr = value.asArray();
    if (!write(static_cast<uint32_t>(arr.size()))) {
      return false;
    }
    for (const auto &element : arr) {
      if (!writeJson(element)) {
        return false;
      }
    }
    return true;
  }
  case JsonType::Object: {
    const auto &obj = value.asObject();
    if (!write(static_cast<uint32_t>(obj.size()))) {
      return false;
    }
    for (const auto &[key, member] : obj) {
      if (!writeString(key) || !writeJson(member)) {
        return false;
      }
    }
    return true;
  }
  }
  return false;
}

bool Reader::readJsonNode(JsonValue &value, int depth) {
  if (depth > MAX_TREE_DEPTH) {
    SAVEGAME_ERROR("Binary JSON tree nested too deeply");
    return false;
  }

  uint8_t tag = 0;
  if (!read(tag)) {
    return false;
  }

  switch (static_cast<JsonType>(tag)) {
  case JsonType::Null:
    value = JsonValue();
    return true;
  case JsonType::Boolean: {
    uint8_t flag = 0;
    if (!read(flag)) {
      return false;
    }
    value = JsonValue(flag != 0);
    return true;
  }
  case JsonType::Number: {
    double number = 0.0;
    if (!read(number)) {
      return false;
    }
    value = JsonValue(number);
    return true;
  }
  case JsonType::String: {
    std::string text;
    if (!readString(text)) {
      return false;
    }
    value = JsonValue(std::move(text));
    return true;
  }
  case JsonType::Array: {
    uint32_t count = 0;
    if (!read(count) || count > MAX_CONTAINER_SIZE) {
      return false;
    }
    JsonArray arr;
    arr.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
      JsonValue element;
      if (!readJsonNode(element, depth + 1)) {
        return false;
      }
      arr.push_back(std::move(element));
    }
    value = JsonValue(std::move(arr));
    return true;
  }
  case JsonType::Object: {
    uint32_t count = 0;
    if (!read(count) || count > MAX_CONTAINER_SIZE) {
      return false;
    }
    JsonObject obj;
    for (uint32_t i = 0; i < count; ++i) {
      std::string key;
      JsonValue member;
      if (!readString(key) || !readJsonNode(member, depth + 1)) {
        return false;
      }
      obj.insert_or_assign(key, std::move(member));
    }
    value = JsonValue(std::move(obj));
    return true;
  }
  }

  SAVEGAME_ERROR("Unknown binary JSON tag: " + std::to_string(tag));
  return false;
}

} // namespace Realmforge::BinarySerial
