/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/**
 * Compact binary encoding used by the binary snapshot format
 *
 * Fundamentals are written in host byte order; snapshots are not meant to be
 * moved between machines of different endianness.
 */
namespace Realmforge::BinarySerial {

// Reject absurd lengths read from corrupted input before allocating
constexpr uint32_t MAX_STRING_LENGTH = 16 * 1024 * 1024;
constexpr uint32_t MAX_CONTAINER_SIZE = 4 * 1024 * 1024;
constexpr int MAX_TREE_DEPTH = 256;

class Writer {
private:
  std::shared_ptr<std::ostream> m_stream;

public:
  explicit Writer(std::shared_ptr<std::ostream> stream)
      : m_stream(std::move(stream)) {
    if (!m_stream || !m_stream->good()) {
      throw std::runtime_error("Invalid output stream");
    }
  }

  ~Writer() {
    if (m_stream) {
      m_stream->flush();
    }
  }

  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;

  template <typename T> bool write(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->write(reinterpret_cast<const char *>(&value), sizeof(T));
    return m_stream->good();
  }

  bool writeString(const std::string &str) {
    uint32_t length = static_cast<uint32_t>(str.length());
    if (!write(length)) {
      return false;
    }
    if (length > 0) {
      m_stream->write(str.data(), length);
    }
    return m_stream->good();
  }

  template <typename T> bool writeVector(const std::vector<T> &vec) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    uint32_t size = static_cast<uint32_t>(vec.size());
    if (!write(size)) {
      return false;
    }
    if (size > 0) {
      m_stream->write(reinterpret_cast<const char *>(vec.data()),
                      sizeof(T) * size);
    }
    return m_stream->good();
  }

  /**
   * @brief Writes a JSON tree as tagged binary records
   *
   * Each node is a one-byte JsonType tag followed by its payload; arrays and
   * objects carry a uint32 element count. Object member order is preserved.
   */
  bool writeJson(const JsonValue &value);

  bool good() const { return m_stream && m_stream->good(); }

  void flush() {
    if (m_stream) {
      m_stream->flush();
    }
  }
};

class Reader {
private:
  std::shared_ptr<std::istream> m_stream;

  bool readJsonNode(JsonValue &value, int depth);

public:
  explicit Reader(std::shared_ptr<std::istream> stream)
      : m_stream(std::move(stream)) {
    if (!m_stream || !m_stream->good()) {
      throw std::runtime_error("Invalid input stream");
    }
  }

  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;

  template <typename T> bool read(T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->read(reinterpret_cast<char *>(&value), sizeof(T));
    return m_stream->good() && m_stream->gcount() == sizeof(T);
  }

  bool readString(std::string &str) {
    uint32_t length = 0;
    if (!read(length)) {
      return false;
    }

    if (length == 0) {
      str.clear();
      return true;
    }

    if (length > MAX_STRING_LENGTH) {
      SAVEGAME_ERROR("String length too large: " + std::to_string(length) +
                     " bytes");
      return false;
    }

    str.resize(length);
    m_stream->read(str.data(), length);
    return m_stream->good() &&
           m_stream->gcount() == static_cast<std::streamsize>(length);
  }

  template <typename T> bool readVector(std::vector<T> &vec) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    uint32_t size = 0;
    if (!read(size)) {
      return false;
    }

    if (size == 0) {
      vec.clear();
      return true;
    }

    if (size > MAX_CONTAINER_SIZE) {
      SAVEGAME_ERROR("Vector size too large: " + std::to_string(size) +
                     " elements");
      return false;
    }

    vec.resize(size);
    m_stream->read(reinterpret_cast<char *>(vec.data()), sizeof(T) * size);
    return m_stream->good() &&
           m_stream->gcount() == static_cast<std::streamsize>(sizeof(T) * size);
  }

  /**
   * @brief Reads a JSON tree written by Writer::writeJson
   * @return false on truncated or malformed input
   */
  bool readJson(JsonValue &value) { return readJsonNode(value, 0); }

  bool good() const { return m_stream && m_stream->good(); }
};

} // namespace Realmforge::BinarySerial

#endif // BINARY_SERIALIZER_HPP
