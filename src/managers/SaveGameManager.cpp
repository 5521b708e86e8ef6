/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SaveGameManager.hpp"
#include "core/Logger.hpp"
#include "utils/BinarySerializer.hpp"
#include "utils/Compression.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace Realmforge {

namespace {

// File signature constant
constexpr char REALM_SAVE_SIGNATURE[9] = {'R', 'E', 'A', 'L', 'M',
                                          'S', 'A', 'V', 'E'};
constexpr size_t REALM_SAVE_SIGNATURE_SIZE = sizeof(REALM_SAVE_SIGNATURE);
constexpr uint32_t BINARY_LAYOUT_VERSION = 1;

struct ExtensionInfo {
  const char *extension;
  SaveFormat format;
  bool compressed;
};

// Longest suffix first so ".json.gz" wins over ".json"
constexpr std::array<ExtensionInfo, 4> kExtensions = {{
    {".json.gz", SaveFormat::Json, true},
    {".rfs.gz", SaveFormat::Binary, true},
    {".json", SaveFormat::Json, false},
    {".rfs", SaveFormat::Binary, false},
}};

std::string formatIsoTime(std::time_t time) {
  // Thread-safe localtime
  std::tm timeinfo;
#ifdef _WIN32
  localtime_s(&timeinfo, &time);
#else
  localtime_r(&time, &timeinfo);
#endif
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &timeinfo);
  return buffer;
}

bool endsWith(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

const char *saveFormatName(SaveFormat format) {
  return format == SaveFormat::Binary ? "binary" : "json";
}

SaveGameManager::SaveGameManager(std::string saveDirectory)
    : m_saveDirectory(std::move(saveDirectory)) {}

void SaveGameManager::setSaveDirectory(const std::string &directory) {
  m_saveDirectory = directory;
  SAVEGAME_INFO("Save directory set to: " + m_saveDirectory);
}

std::string SaveGameManager::getExtension(SaveFormat format, bool compressed) {
  std::string ext = format == SaveFormat::Binary ? ".rfs" : ".json";
  if (compressed) {
    ext += ".gz";
  }
  return ext;
}

std::string SaveGameManager::autosaveName(int64_t totalMinutes) {
  // Zero padded so names sort in simulation order
  return std::format("{}{:012}", AUTOSAVE_PREFIX, totalMinutes);
}

std::optional<std::string> SaveGameManager::save(const JsonValue &worldState,
                                                 const std::string &name,
                                                 SaveFormat format,
                                                 bool compressed) {
  if (name.empty()) {
    SAVEGAME_ERROR("Refusing to save without a name");
    return std::nullopt;
  }
  if (!ensureSaveDirectoryExists()) {
    SAVEGAME_ERROR("Failed to ensure save directory exists!");
    return std::nullopt;
  }

  JsonObject envelope;
  envelope["version"] = JsonValue(SNAPSHOT_VERSION);
  envelope["timestamp"] = JsonValue(formatIsoTime(std::time(nullptr)));
  envelope["compressed"] = JsonValue(compressed);
  envelope["world_state"] = worldState;
  const JsonValue snapshot(std::move(envelope));

  std::string bytes;
  if (format == SaveFormat::Binary) {
    if (!encodeBinary(snapshot, bytes)) {
      SAVEGAME_ERROR("Failed to encode binary snapshot " + name);
      return std::nullopt;
    }
  } else {
    bytes = snapshot.toString(2);
  }

  if (compressed) {
    std::string packed;
    if (!Compression::gzipCompress(bytes, packed)) {
      SAVEGAME_ERROR("Failed to compress snapshot " + name);
      return std::nullopt;
    }
    bytes = std::move(packed);
  }

  const std::string fullPath = getFullSavePath(name + getExtension(format, compressed));
  if (!writeBytes(fullPath, bytes)) {
    return std::nullopt;
  }

  SAVEGAME_INFO("Save successful: " + fullPath);
  return fullPath;
}

std::optional<LoadedSnapshot> SaveGameManager::load(const std::string &name,
                                                    SaveFormat format) const {
  auto path = findSaveFile(name, format);
  if (!path) {
    SAVEGAME_ERROR("No save file named " + name + " in " + m_saveDirectory);
    return std::nullopt;
  }

  std::string bytes;
  if (!readBytes(*path, bytes)) {
    return std::nullopt;
  }

  LoadedSnapshot loaded;
  if (Compression::isGzipData(bytes)) {
    std::string unpacked;
    if (!Compression::gzipDecompress(bytes, unpacked)) {
      SAVEGAME_ERROR("Corrupt compressed save file: " + *path);
      return std::nullopt;
    }
    bytes = std::move(unpacked);
    loaded.compressed = true;
  }

  JsonValue snapshot;
  if (bytes.size() >= REALM_SAVE_SIGNATURE_SIZE &&
      std::memcmp(bytes.data(), REALM_SAVE_SIGNATURE,
                  REALM_SAVE_SIGNATURE_SIZE) == 0) {
    if (!decodeBinary(bytes, snapshot)) {
      SAVEGAME_ERROR("Invalid binary save file: " + *path);
      return std::nullopt;
    }
  } else {
    JsonReader reader;
    if (!reader.parse(bytes)) {
      SAVEGAME_ERROR("Invalid JSON save file " + *path + ": " +
                     reader.getLastError());
      return std::nullopt;
    }
    snapshot = reader.getRoot();
  }

  if (!snapshot["world_state"].isObject()) {
    SAVEGAME_ERROR("Save file has no world_state: " + *path);
    return std::nullopt;
  }

  loaded.version = snapshot["version"].tryAsString().value_or("");
  loaded.timestamp = snapshot["timestamp"].tryAsString().value_or("");
  if (loaded.version != SNAPSHOT_VERSION) {
    loaded.versionMismatch = true;
    SAVEGAME_WARN(std::format("Save {} has version '{}', expected '{}'", name,
                              loaded.version, SNAPSHOT_VERSION));
  }
  loaded.worldState = snapshot["world_state"];

  SAVEGAME_INFO("Load successful: " + *path);
  return loaded;
}

bool SaveGameManager::deleteSave(const std::string &name) {
  bool removed = false;
  for (const auto &info : kExtensions) {
    const std::string fullPath = getFullSavePath(name + info.extension);
    std::error_code ec;
    if (std::filesystem::remove(fullPath, ec)) {
      SAVEGAME_INFO("Deleted save file: " + fullPath);
      removed = true;
    } else if (ec) {
      SAVEGAME_ERROR("Could not delete " + fullPath + ": " + ec.message());
    }
  }
  return removed;
}

bool SaveGameManager::saveExists(const std::string &name) const {
  return findSaveFile(name, SaveFormat::Json).has_value();
}

std::vector<SaveInfo> SaveGameManager::listSaves() const {
  struct Entry {
    SaveInfo info;
    std::filesystem::file_time_type writeTime;
  };
  std::vector<Entry> entries;

  // Check if the directory exists
  if (!std::filesystem::exists(m_saveDirectory) ||
      !std::filesystem::is_directory(m_saveDirectory)) {
    return {};
  }

  try {
    for (const auto &dirEntry :
         std::filesystem::directory_iterator(m_saveDirectory)) {
      if (!dirEntry.is_regular_file()) {
        continue;
      }
      const std::string fileName = dirEntry.path().filename().string();
      for (const auto &ext : kExtensions) {
        if (!endsWith(fileName, ext.extension)) {
          continue;
        }
        Entry entry;
        entry.info.name =
            fileName.substr(0, fileName.size() - std::strlen(ext.extension));
        entry.info.path = dirEntry.path().string();
        entry.info.size = dirEntry.file_size();
        entry.info.format = ext.format;
        entry.info.compressed = ext.compressed;
        entry.writeTime = dirEntry.last_write_time();

        const auto sysTime = std::chrono::time_point_cast<
            std::chrono::system_clock::duration>(
            std::chrono::file_clock::to_sys(entry.writeTime));
        entry.info.modified =
            formatIsoTime(std::chrono::system_clock::to_time_t(sysTime));
        entries.push_back(std::move(entry));
        break;
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    SAVEGAME_ERROR("Error listing save files: " + std::string(e.what()));
  }

  std::sort(entries.begin(), entries.end(), [](const Entry &a, const Entry &b) {
    if (a.writeTime != b.writeTime) {
      return a.writeTime > b.writeTime;
    }
    return a.info.name > b.info.name;
  });

  std::vector<SaveInfo> saves;
  saves.reserve(entries.size());
  for (auto &entry : entries) {
    saves.push_back(std::move(entry.info));
  }
  return saves;
}

std::optional<std::string> SaveGameManager::autosave(const JsonValue &worldState,
                                                     int64_t totalMinutes,
                                                     size_t keep,
                                                     SaveFormat format) {
  auto path = save(worldState, autosaveName(totalMinutes), format, true);
  if (!path) {
    return std::nullopt;
  }

  std::vector<std::string> autosaves;
  for (const auto &info : listSaves()) {
    if (info.name.rfind(AUTOSAVE_PREFIX, 0) == 0 &&
        std::find(autosaves.begin(), autosaves.end(), info.name) ==
            autosaves.end()) {
      autosaves.push_back(info.name);
    }
  }
  // Newest simulation minute first
  std::sort(autosaves.begin(), autosaves.end(), std::greater<>());
  for (size_t i = std::max<size_t>(keep, 1); i < autosaves.size(); ++i) {
    deleteSave(autosaves[i]);
  }
  return path;
}

std::string SaveGameManager::getFullSavePath(const std::string &fileName) const {
  return (std::filesystem::path(m_saveDirectory) / fileName).string();
}

bool SaveGameManager::ensureSaveDirectoryExists() const {
  try {
    if (!std::filesystem::exists(m_saveDirectory)) {
      if (!std::filesystem::create_directories(m_saveDirectory)) {
        SAVEGAME_ERROR("Failed to create save directory " + m_saveDirectory);
        return false;
      }
      SAVEGAME_INFO("Created save directory: " + m_saveDirectory);
    }
    if (!std::filesystem::is_directory(m_saveDirectory)) {
      SAVEGAME_ERROR("Save path is not a directory: " + m_saveDirectory);
      return false;
    }
    return true;
  } catch (const std::exception &e) {
    SAVEGAME_ERROR("Error creating save directory: " + std::string(e.what()));
    return false;
  }
}

std::optional<std::string>
SaveGameManager::findSaveFile(const std::string &name, SaveFormat format) const {
  std::vector<ExtensionInfo> order;
  for (const auto &ext : kExtensions) {
    if (ext.format == format) {
      order.push_back(ext);
    }
  }
  for (const auto &ext : kExtensions) {
    if (ext.format != format) {
      order.push_back(ext);
    }
  }

  for (const auto &ext : order) {
    const std::string fullPath = getFullSavePath(name + ext.extension);
    std::error_code ec;
    if (std::filesystem::is_regular_file(fullPath, ec)) {
      return fullPath;
    }
  }
  return std::nullopt;
}

bool SaveGameManager::writeBytes(const std::string &path,
                                 const std::string &bytes) const {
  std::ofstream file(path, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    SAVEGAME_ERROR("Could not open file " + path + " for writing!");
    return false;
  }
  file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!file.good()) {
    SAVEGAME_ERROR("Failed writing save file " + path);
    return false;
  }
  return true;
}

bool SaveGameManager::readBytes(const std::string &path,
                                std::string &bytes) const {
  std::ifstream file(path, std::ios::binary | std::ios::in);
  if (!file.is_open()) {
    SAVEGAME_ERROR("Could not open file " + path + " for reading!");
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  bytes = buffer.str();
  return true;
}

bool SaveGameManager::encodeBinary(const JsonValue &snapshot,
                                   std::string &bytes) const {
  auto stream = std::make_shared<std::ostringstream>(std::ios::binary);
  {
    BinarySerial::Writer writer(stream);
    SaveGameHeader header;
    header.version = BINARY_LAYOUT_VERSION;
    stream->write(header.signature, REALM_SAVE_SIGNATURE_SIZE);
    if (!writer.write(header.version) || !writer.writeJson(snapshot)) {
      return false;
    }
  }
  bytes = stream->str();
  return true;
}

bool SaveGameManager::decodeBinary(const std::string &bytes,
                                   JsonValue &snapshot) const {
  auto stream = std::make_shared<std::istringstream>(bytes, std::ios::binary);
  SaveGameHeader header;
  stream->read(header.signature, REALM_SAVE_SIGNATURE_SIZE);

  BinarySerial::Reader reader(stream);
  if (!reader.read(header.version)) {
    SAVEGAME_ERROR("Truncated binary save header");
    return false;
  }
  if (header.version != BINARY_LAYOUT_VERSION) {
    SAVEGAME_ERROR(std::format("Unsupported binary save layout {}",
                               header.version));
    return false;
  }
  return reader.readJson(snapshot);
}

} // namespace Realmforge
