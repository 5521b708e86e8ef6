/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SAVE_GAME_MANAGER_HPP
#define SAVE_GAME_MANAGER_HPP

#include "utils/JsonReader.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace Realmforge {

enum class SaveFormat : uint8_t { Json = 0, Binary = 1 };

const char *saveFormatName(SaveFormat format);

inline std::ostream &operator<<(std::ostream &os, SaveFormat format) {
  return os << saveFormatName(format);
}

// SaveGame header structure - used at the beginning of binary snapshots
struct SaveGameHeader {
  char signature[9]{'R', 'E', 'A', 'L', 'M', 'S', 'A', 'V', 'E'};
  uint32_t version{1}; // Binary layout version
};

// Metadata for one file in the save directory
struct SaveInfo {
  std::string name;
  std::string path;
  uintmax_t size{0};
  std::string modified; // ISO-8601, local time
  SaveFormat format{SaveFormat::Json};
  bool compressed{false};
};

struct LoadedSnapshot {
  JsonValue worldState;
  std::string version;
  std::string timestamp;
  bool compressed{false};
  bool versionMismatch{false};
};

/**
 * @brief Versioned world snapshots on disk
 *
 * Envelope: {version, timestamp, compressed, world_state}. JSON snapshots
 * are written as indented text; binary snapshots are a SaveGameHeader
 * followed by the envelope encoded with BinarySerial. Either may be gzip
 * compressed, which load() detects from the magic bytes.
 */
class SaveGameManager {
public:
  static constexpr const char *SNAPSHOT_VERSION = "1.0.0";
  static constexpr const char *AUTOSAVE_PREFIX = "autosave_";

  explicit SaveGameManager(std::string saveDirectory = "saves");

  /**
   * @brief Writes a snapshot under the given name
   * @return Path of the written file, or nullopt on failure (logged)
   */
  std::optional<std::string> save(const JsonValue &worldState,
                                  const std::string &name,
                                  SaveFormat format = SaveFormat::Json,
                                  bool compressed = true);

  /**
   * @brief Reads a snapshot by name
   *
   * The requested format's extensions are tried first (compressed, then
   * plain), then the other format's. A version different from
   * SNAPSHOT_VERSION is reported in the result and logged as a warning.
   */
  std::optional<LoadedSnapshot> load(const std::string &name,
                                     SaveFormat format = SaveFormat::Json) const;

  // Removes every file of that name, whatever the extension
  bool deleteSave(const std::string &name);
  bool saveExists(const std::string &name) const;

  // Newest first
  std::vector<SaveInfo> listSaves() const;

  /**
   * @brief Writes "autosave_<total minutes>" and prunes old autosaves
   *
   * Only the newest keep autosaves survive, ordered by simulation minute.
   */
  std::optional<std::string> autosave(const JsonValue &worldState,
                                      int64_t totalMinutes, size_t keep,
                                      SaveFormat format = SaveFormat::Json);

  void setSaveDirectory(const std::string &directory);
  const std::string &getSaveDirectory() const { return m_saveDirectory; }

  static std::string getExtension(SaveFormat format, bool compressed);
  static std::string autosaveName(int64_t totalMinutes);

private:
  std::string m_saveDirectory;

  // Helper methods
  std::string getFullSavePath(const std::string &fileName) const;
  bool ensureSaveDirectoryExists() const;
  std::optional<std::string> findSaveFile(const std::string &name,
                                          SaveFormat format) const;

  bool writeBytes(const std::string &path, const std::string &bytes) const;
  bool readBytes(const std::string &path, std::string &bytes) const;
  bool encodeBinary(const JsonValue &snapshot, std::string &bytes) const;
  bool decodeBinary(const std::string &bytes, JsonValue &snapshot) const;
};

} // namespace Realmforge

#endif // SAVE_GAME_MANAGER_HPP
