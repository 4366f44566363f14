/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>

namespace PolyForge {

namespace {

bool isIntegral(double number) {
    return std::trunc(number) == number &&
           number >= static_cast<double>(std::numeric_limits<int>::min()) &&
           number <= static_cast<double>(std::numeric_limits<int>::max());
}

JsonValue toJson(const SettingsManager::SettingValue& value) {
    return std::visit([](const auto& arg) -> JsonValue {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return JsonValue(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            return JsonValue(arg);
        } else {
            return JsonValue(static_cast<double>(arg));
        }
    }, value);
}

} // anonymous namespace

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARN("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : categoryValue.asObject()) {
            if (value.isBool()) {
                m_settings[categoryName][key] = value.asBool();
            } else if (value.isNumber()) {
                const double number = value.asNumber();
                if (isIntegral(number)) {
                    m_settings[categoryName][key] = static_cast<int>(number);
                } else {
                    m_settings[categoryName][key] = static_cast<float>(number);
                }
            } else if (value.isString()) {
                m_settings[categoryName][key] = value.asString();
            } else {
                SETTINGS_WARN("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
            }
        }
    }

    SETTINGS_INFO("Loaded settings from file: " + filepath);
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonObject root;
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [categoryName, categorySettings] : m_settings) {
            JsonObject category;
            for (const auto& [key, value] : categorySettings) {
                category[key] = toJson(value);
            }
            root[categoryName] = JsonValue(std::move(category));
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }

    file << JsonValue(std::move(root)).toString() << '\n';
    if (!file) {
        SETTINGS_ERROR("Failed to write settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() &&
           categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }

    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    return m_settings.erase(category) > 0;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);

    const size_t id = m_nextCallbackId++;
    m_listeners.push_back({id, category, std::move(callback)});
    return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);

    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(),
            [callbackId](const ListenerInfo& info) { return info.id == callbackId; }),
        m_listeners.end());
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, settings] : m_settings) {
        categories.push_back(category);
    }
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, value] : categoryIt->second) {
        keys.push_back(key);
    }
    return keys;
}

void SettingsManager::store(const std::string& category, const std::string& key, SettingValue value) {
    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        m_settings[category][key] = value;
    }

    // Listeners may read or write settings, so call them on a copy outside both locks
    std::vector<ListenerInfo> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        listeners = m_listeners;
    }

    for (const auto& listener : listeners) {
        if (listener.category.empty() || listener.category == category) {
            listener.callback(category, key, value);
        }
    }
}

} // namespace PolyForge
