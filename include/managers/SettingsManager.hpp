/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace PolyForge {

/**
 * @brief Category/key settings store with JSON persistence and change
 * notifications.
 *
 * Owned by the EngineContext. Reads may run concurrently with each other;
 * writes take an exclusive lock. Listeners run on the writing thread after
 * the lock is released.
 *
 * Usage:
 *   settings.loadFromFile("res/settings.json");
 *   bool parallel = settings.get<bool>("tags", "parallel_queries", true);
 *   settings.set("logging", "benchmark_mode", true);
 */
class SettingsManager {
public:
    using SettingValue = std::variant<int, float, bool, std::string>;

    using ChangeCallback = std::function<void(const std::string& category,
                                              const std::string& key,
                                              const SettingValue& newValue)>;

    SettingsManager() = default;
    ~SettingsManager() = default;

    /**
     * @brief Merge settings from a JSON file of the form
     * { "category": { "key": value, ... }, ... }.
     *
     * Integral numbers load as int, other numbers as float. Values of other
     * JSON types are skipped with a warning. Listeners are not notified.
     *
     * @return false if the file is missing, malformed or not an object
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Write every setting to a JSON file.
     * @return false if the file cannot be written
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Typed read.
     *
     * Returns defaultValue when the setting is missing or holds another type.
     * An int setting is accepted where a float is requested.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Typed write; notifies listeners watching the category.
     * @return false for a type the store cannot hold
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    /**
     * @brief Register a callback for setting changes.
     * @param category Category to watch, or empty for every category
     * @return Id for unregisterChangeListener
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };

    void store(const std::string& category, const std::string& key, SettingValue value);

    std::unordered_map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId = 0;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;
};

// Template implementations must be in header for linking

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& value = keyIt->second;
    if constexpr (std::is_same_v<T, float>) {
        if (const int* asInt = std::get_if<int>(&value)) {
            return static_cast<float>(*asInt);
        }
    }

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(&value)) {
            return *typed;
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        store(category, key, SettingValue(value));
        return true;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        store(category, key, SettingValue(std::string(value)));
        return true;
    } else {
        return false;
    }
}

} // namespace PolyForge

#endif // SETTINGS_MANAGER_HPP
