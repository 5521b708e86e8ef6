/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace Realmforge {

namespace {
// Nesting guard so malformed input cannot exhaust the stack
constexpr int MAX_NESTING_DEPTH = 256;

void writeEscapedString(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (char c : text) {
    switch (c) {
    case '"':
      stream << "\\\"";
      break;
    case '\\':
      stream << "\\\\";
      break;
    case '\b':
      stream << "\\b";
      break;
    case '\f':
      stream << "\\f";
      break;
    case '\n':
      stream << "\\n";
      break;
    case '\r':
      stream << "\\r";
      break;
    case '\t':
      stream << "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        stream << std::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        stream << c;
      }
      break;
    }
  }
  stream << '"';
}

void writeIndent(std::ostream &stream, int indent, int depth) {
  if (indent < 0)
    return;
  stream << '\n';
  for (int i = 0; i < indent * depth; ++i)
    stream << ' ';
}
} // namespace

// JsonObject implementation
JsonObject::iterator JsonObject::find(const std::string &key) {
  return std::find_if(m_entries.begin(), m_entries.end(),
                      [&key](const Entry &e) { return e.first == key; });
}

JsonObject::const_iterator JsonObject::find(const std::string &key) const {
  return std::find_if(m_entries.begin(), m_entries.end(),
                      [&key](const Entry &e) { return e.first == key; });
}

bool JsonObject::contains(const std::string &key) const {
  return find(key) != end();
}

JsonValue &JsonObject::operator[](const std::string &key) {
  auto it = find(key);
  if (it != end())
    return it->second;
  m_entries.emplace_back(key, JsonValue());
  return m_entries.back().second;
}

const JsonValue &JsonObject::at(const std::string &key) const {
  auto it = find(key);
  if (it == end())
    throw std::out_of_range(std::format("JSON object has no member '{}'", key));
  return it->second;
}

void JsonObject::insert_or_assign(const std::string &key, JsonValue value) {
  (*this)[key] = std::move(value);
}

bool JsonObject::erase(const std::string &key) {
  auto it = find(key);
  if (it == end())
    return false;
  m_entries.erase(it);
  return true;
}

bool JsonObject::operator==(const JsonObject &other) const {
  return m_entries == other.m_entries;
}

// JsonValue implementation
JsonType JsonValue::getType() const {
  if (std::holds_alternative<std::nullptr_t>(m_value))
    return JsonType::Null;
  if (std::holds_alternative<bool>(m_value))
    return JsonType::Boolean;
  if (std::holds_alternative<double>(m_value))
    return JsonType::Number;
  if (std::holds_alternative<std::string>(m_value))
    return JsonType::String;
  if (std::holds_alternative<JsonArray>(m_value))
    return JsonType::Array;
  return JsonType::Object;
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

namespace {

// Integral part of value when it lies within [lo, hi]
template <typename Int> std::optional<Int> truncateToRange(double value) {
  if (!std::isfinite(value)) {
    return std::nullopt;
  }
  const double whole = std::trunc(value);
  // 2^63 is exactly representable; INT64_MAX is not
  constexpr double upper =
      static_cast<double>(std::numeric_limits<Int>::max()) + 1.0;
  constexpr double lower = static_cast<double>(std::numeric_limits<Int>::min());
  if (whole < lower || whole >= upper) {
    return std::nullopt;
  }
  return static_cast<Int>(whole);
}

} // namespace

int JsonValue::asInt() const {
  if (auto value = truncateToRange<int>(asNumber())) {
    return *value;
  }
  throw std::out_of_range("JSON number does not fit in int");
}

int64_t JsonValue::asInt64() const {
  if (auto value = truncateToRange<int64_t>(asNumber())) {
    return *value;
  }
  throw std::out_of_range("JSON number does not fit in int64");
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber())
    return truncateToRange<int>(asNumber());
  return std::nullopt;
}

std::optional<int64_t> JsonValue::tryAsInt64() const {
  if (isNumber())
    return truncateToRange<int64_t>(asNumber());
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return isArray() ? &asArray() : nullptr;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().contains(key);
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : null_value;
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  if (!isArray() || index >= asArray().size())
    return null_value;
  return asArray()[index];
}

JsonValue &JsonValue::operator[](size_t index) {
  if (!isArray()) {
    m_value = JsonArray{};
  }
  auto &arr = asArray();
  if (index >= arr.size()) {
    arr.resize(index + 1);
  }
  return arr[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString(int indent) const {
  std::ostringstream oss;
  writeToStream(oss, indent, 0);
  return oss.str();
}

void JsonValue::writeToStream(std::ostream &stream, int indent,
                              int depth) const {
  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (!std::isfinite(num)) {
      stream << "null";
    } else if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      // Shortest representation that parses back to the same double
      stream << std::format("{}", num);
    }
    break;
  }
  case JsonType::String:
    writeEscapedString(stream, asString());
    break;
  case JsonType::Array: {
    const auto &arr = asArray();
    stream << "[";
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ",";
      writeIndent(stream, indent, depth + 1);
      arr[i].writeToStream(stream, indent, depth + 1);
    }
    if (!arr.empty())
      writeIndent(stream, indent, depth);
    stream << "]";
    break;
  }
  case JsonType::Object: {
    const auto &obj = asObject();
    stream << "{";
    bool first = true;
    for (const auto &[key, value] : obj) {
      if (!first)
        stream << ",";
      first = false;
      writeIndent(stream, indent, depth + 1);
      writeEscapedString(stream, key);
      stream << (indent < 0 ? ":" : ": ");
      value.writeToStream(stream, indent, depth + 1);
    }
    if (!obj.empty())
      writeIndent(stream, indent, depth);
    stream << "}";
    break;
  }
  }
}

std::ostream &operator<<(std::ostream &os, const JsonValue &value) {
  return os << value.toString();
}

// JsonReader implementation
JsonReader::JsonReader() : m_position(0), m_line(1), m_column(1) {}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_line = 0;
    m_column = 0;
    setError("Could not open file: " + path);
    m_root = JsonValue();
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  JsonValue result;
  skipWhitespace();
  if (isAtEnd()) {
    setError("Empty JSON input");
    return false;
  }
  if (!parseValue(result, 0)) {
    return false;
  }
  skipWhitespace();
  if (!isAtEnd()) {
    setError("Unexpected token after JSON value");
    return false;
  }

  m_root = std::move(result);
  return true;
}

void JsonReader::setError(const std::string &message) {
  m_lastError =
      std::format("Line {}, Column {}: {}", m_line, m_column, message);
}

char JsonReader::peek(size_t offset) const {
  size_t pos = m_position + offset;
  return (pos < m_input.length()) ? m_input[pos] : '\0';
}

char JsonReader::advance() {
  if (isAtEnd())
    return '\0';

  char c = m_input[m_position++];
  if (c == '\n') {
    m_line++;
    m_column = 1;
  } else {
    m_column++;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!isAtEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
      break;
    advance();
  }
}

bool JsonReader::consumeLiteral(const char *literal) {
  size_t len = std::char_traits<char>::length(literal);
  if (m_input.compare(m_position, len, literal) != 0)
    return false;
  m_position += len;
  m_column += len;
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_NESTING_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return false;
  }

  skipWhitespace();
  char c = peek();
  switch (c) {
  case '{':
    return parseObject(out, depth);
  case '[':
    return parseArray(out, depth);
  case '"': {
    std::string str;
    if (!parseString(str))
      return false;
    out = JsonValue(std::move(str));
    return true;
  }
  case 't':
    if (consumeLiteral("true")) {
      out = JsonValue(true);
      return true;
    }
    setError("Invalid token starting with 't'");
    return false;
  case 'f':
    if (consumeLiteral("false")) {
      out = JsonValue(false);
      return true;
    }
    setError("Invalid token starting with 'f'");
    return false;
  case 'n':
    if (consumeLiteral("null")) {
      out = JsonValue();
      return true;
    }
    setError("Invalid token starting with 'n'");
    return false;
  default:
    if (isDigit(c) || c == '-')
      return parseNumber(out);
    if (isAtEnd()) {
      setError("Unexpected end of input");
    } else {
      setError("Unexpected character: " + std::string(1, c));
    }
    return false;
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject result;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(result));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return false;
    }
    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (peek() != ':') {
      setError("Expected ':' after object key");
      return false;
    }
    advance();

    JsonValue value;
    if (!parseValue(value, depth + 1))
      return false;
    // Duplicate keys: last one wins, position of the first is kept
    result.insert_or_assign(key, std::move(value));

    skipWhitespace();
    char c = peek();
    if (c == ',') {
      advance();
      continue;
    }
    if (c == '}') {
      advance();
      break;
    }
    setError("Expected '}' or ',' in object");
    return false;
  }

  out = JsonValue(std::move(result));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray result;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(result));
    return true;
  }

  while (true) {
    JsonValue value;
    if (!parseValue(value, depth + 1))
      return false;
    result.push_back(std::move(value));

    skipWhitespace();
    char c = peek();
    if (c == ',') {
      advance();
      continue;
    }
    if (c == ']') {
      advance();
      break;
    }
    setError("Expected ']' or ',' in array");
    return false;
  }

  out = JsonValue(std::move(result));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (!isAtEnd()) {
    char c = peek();

    if (c == '"') {
      advance();
      return true;
    }

    if (c == '\\') {
      advance();
      if (isAtEnd()) {
        setError("Unexpected end of input in string escape");
        return false;
      }

      char escaped = advance();
      switch (escaped) {
      case '"':
      case '\\':
      case '/':
        out += escaped;
        break;
      case 'b':
        out += '\b';
        break;
      case 'f':
        out += '\f';
        break;
      case 'n':
        out += '\n';
        break;
      case 'r':
        out += '\r';
        break;
      case 't':
        out += '\t';
        break;
      case 'u': {
        uint32_t codepoint = 0;
        if (!parseUnicodeEscape(codepoint))
          return false;
        // Surrogate pair
        if (codepoint >= 0xD800 && codepoint <= 0xDBFF && peek() == '\\' &&
            peek(1) == 'u') {
          advance();
          advance();
          uint32_t low = 0;
          if (!parseUnicodeEscape(low))
            return false;
          if (low >= 0xDC00 && low <= 0xDFFF) {
            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
          } else {
            appendUtf8(out, codepoint);
            codepoint = low;
          }
        }
        appendUtf8(out, codepoint);
        break;
      }
      default:
        setError("Invalid escape sequence: \\" + std::string(1, escaped));
        return false;
      }
    } else if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return false;
    } else {
      out += c;
      advance();
    }
  }

  setError("Unterminated string");
  return false;
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek()))
      advance();
  } else {
    setError("Invalid number format");
    return false;
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit after decimal point");
      return false;
    }
    while (isDigit(peek()))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit in exponent");
      return false;
    }
    while (isDigit(peek()))
      advance();
  }

  std::string numStr = m_input.substr(start, m_position - start);
  try {
    out = JsonValue(std::stod(numStr));
  } catch (const std::exception &) {
    setError("Invalid number format: " + numStr);
    return false;
  }
  return true;
}

bool JsonReader::parseUnicodeEscape(uint32_t &codepoint) {
  codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = peek();
    uint32_t digit;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid Unicode escape sequence");
      return false;
    }
    advance();
    codepoint = (codepoint << 4) | digit;
  }
  return true;
}

void JsonReader::appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint <= 0xFFFF) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

bool writeJsonFile(const std::string &path, const JsonValue &value,
                   int indent) {
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file.is_open())
    return false;
  file << value.toString(indent) << '\n';
  file.flush();
  return file.good();
}

} // namespace Realmforge
