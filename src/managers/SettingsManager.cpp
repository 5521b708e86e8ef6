/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>

namespace Realmforge {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    return mergeJson(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromJsonString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings JSON - " + reader.getLastError());
        return false;
    }
    return mergeJson(reader.getRoot(), "<string>");
}

bool SettingsManager::mergeJson(const JsonValue& root, const std::string& origin) {
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + origin);
        return false;
    }

    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : categoryValue.asObject()) {
            SettingValue settingValue;

            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                double numValue = value.asNumber();
                if (std::floor(numValue) == numValue && std::abs(numValue) < 2147483647.0) {
                    settingValue = static_cast<int>(numValue);
                } else {
                    settingValue = static_cast<float>(numValue);
                }
            } else if (value.isString()) {
                settingValue = value.asString();
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }

            m_settings[categoryName][key] = settingValue;
        }
    }

    SETTINGS_INFO("Loaded settings from " + origin);
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonObject root;
    for (const auto& [categoryName, categorySettings] : m_settings) {
        JsonObject category;
        for (const auto& [key, value] : categorySettings) {
            category[key] = std::visit([](auto&& arg) { return JsonValue(arg); }, value);
        }
        root[categoryName] = JsonValue(std::move(category));
    }

    if (!writeJsonFile(filepath, JsonValue(std::move(root)))) {
        SETTINGS_ERROR("Failed to write settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }
    return categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }

    if (categoryIt->second.erase(key) == 0) {
        return false;
    }

    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
    return m_settings.erase(category) > 0;
}

void SettingsManager::clearAll() {
    m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    size_t id = m_nextCallbackId++;
    m_listeners.push_back({id, category, std::move(callback)});
    return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(),
            [callbackId](const ListenerInfo& info) {
                return info.id == callbackId;
            }),
        m_listeners.end()
    );
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    return keys;
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue) {
    // Copy so a listener may unregister itself while being notified
    const auto listeners = m_listeners;
    for (const auto& listener : listeners) {
        if (listener.category.empty() || listener.category == category) {
            listener.callback(category, key, newValue);
        }
    }
}

} // namespace Realmforge
