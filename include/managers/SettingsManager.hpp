/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <functional>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace Realmforge {

class JsonValue;

/**
 * @brief Category-organized settings store with JSON persistence
 *
 * Provides type-safe access to settings, change notifications, and default
 * values. Each World or tool owns its own instance.
 *
 * Usage:
 *   SettingsManager settings;
 *   settings.loadFromFile("res/config/realmforge.json");
 *   int history = settings.get<int>("events", "max_history", 1000);
 *   settings.set("save", "directory", std::string("saves"));
 *   settings.saveToFile("res/config/realmforge.json");
 */
class SettingsManager {
public:
    SettingsManager() = default;
    ~SettingsManager() = default;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    /**
     * @brief Supported setting value types
     */
    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Callback function type for change notifications
     * @param category The category that changed
     * @param key The setting key that changed
     * @param newValue The new value of the setting
     */
    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Loads settings from a JSON file, merging into existing values
     * @param filepath Path to the JSON settings file
     * @return true if loading successful, false otherwise
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Loads settings from JSON text, merging into existing values
     * @return true if the text is a JSON object of category objects
     */
    bool loadFromJsonString(const std::string& json);

    /**
     * @brief Saves current settings to a JSON file
     * @param filepath Path to save the JSON settings file
     * @return true if saving successful, false otherwise
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Gets a typed setting value with optional default
     * @tparam T Type of the setting (int, float, bool, or std::string)
     * @param category Setting category (e.g., "events", "save")
     * @param key Setting key within the category
     * @param defaultValue Value to return if setting doesn't exist
     * @return The setting value or defaultValue if not found or mistyped
     *
     * An int value is returned for a float request.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Sets a typed setting value and notifies listeners
     * @return false for unsupported value types
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    /**
     * @brief Registers a callback for setting changes
     * @param category Category to watch (empty string watches all categories)
     * @param callback Function to call when settings change
     * @return Callback ID that can be used to unregister
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::map<std::string, SettingValue>;
    std::map<std::string, CategorySettings> m_settings;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };
    std::vector<ListenerInfo> m_listeners;
    size_t m_nextCallbackId = 0;

    bool mergeJson(const JsonValue& root, const std::string& origin);
    void notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue);
};

// Template implementations must be in header for linking

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& stored = keyIt->second;
    if constexpr (std::is_same_v<T, float>) {
        if (const int* asInt = std::get_if<int>(&stored)) {
            return static_cast<float>(*asInt);
        }
    }
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(&stored)) {
            return *typed;
        }
    }
    // Unsupported type or type mismatch
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    m_settings[category][key] = settingValue;
    notifyListeners(category, key, settingValue);
    return true;
}

} // namespace Realmforge

#endif // SETTINGS_MANAGER_HPP
