/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef CONFIG_STORE_HPP
#define CONFIG_STORE_HPP

#include "config/ConfigMigration.hpp"
#include "utils/JsonReader.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace Lifeline {

enum class ConfigLoadStatus {
    NotLoaded,
    Loaded,           // Read as-is at the current version
    CreatedDefault,   // File was absent; defaults written
    Migrated,         // Older version migrated and rewritten
    MigrationFailed,  // Migration or post-migration validation failed; defaults in use
    ParseFailed,      // File is not valid JSON; defaults in use
    ValidationFailed  // Current version but invalid values; defaults in use
};

const char* toString(ConfigLoadStatus status);

/**
 * @brief Versioned, migrating store for typed configuration documents
 *
 * Each document lives in <configDir>/<name>.json and carries an integer
 * "configVersion". Older documents are backed up byte for byte, migrated one
 * version at a time, validated and written back atomically. Any failure
 * leaves the user's file as it was and falls back to defaults.
 *
 * A config type T provides:
 *   static constexpr int CURRENT_VERSION;
 *   static T fromJson(const JsonValue& document);
 *   JsonValue toJson() const;
 *   static bool validate(const JsonValue& document, std::string& error);
 *
 * Usage:
 *   ConfigStore store(configDir);
 *   store.getMigrations().registerMigrations("metabolism", MetabolismConfig::migrations());
 *   auto config = store.load<MetabolismConfig>("metabolism");
 *   store.registerChangeListener<MetabolismConfig>("metabolism", onChange);
 *   store.reload("metabolism");
 */
class ConfigStore {
public:
    explicit ConfigStore(std::filesystem::path configDir);
    ~ConfigStore() = default;

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    ConfigMigrationRegistry& getMigrations() { return m_migrations; }
    const std::filesystem::path& getConfigDir() const { return m_configDir; }

    /**
     * @brief Loads (creating, migrating or falling back as needed) a document
     * @return the typed value; defaults when the status reports a failure
     *
     * Never throws for file problems; check getStatus() for the outcome.
     */
    template<typename T>
    T load(const std::string& name);

    /**
     * @brief Writes a value back, keeping keys T does not know about
     * @return true if the file was replaced
     */
    template<typename T>
    bool save(const std::string& name, const T& value);

    /**
     * @brief Last loaded value without touching the disk
     */
    template<typename T>
    std::optional<T> get(const std::string& name) const;

    /**
     * @brief Re-reads one document (or every loaded one) and notifies listeners
     * @return names that were reloaded
     */
    std::vector<std::string> reload(const std::optional<std::string>& name = std::nullopt);

    /**
     * @brief Registers a callback invoked with the new value after reload()
     * @return id for unregisterChangeListener
     */
    template<typename T>
    size_t registerChangeListener(const std::string& name,
                                  std::function<void(const T&)> callback);

    void unregisterChangeListener(size_t listenerId);

    ConfigLoadStatus getStatus(const std::string& name) const;

    std::filesystem::path pathFor(const std::string& name) const;
    std::filesystem::path backupPathFor(const std::string& name, int fromVersion) const;

private:
    struct DocumentHooks {
        int currentVersion;
        std::function<JsonValue()> defaults;
        std::function<bool(const JsonValue&, std::string&)> validate;
    };

    struct Entry {
        JsonValue raw;
        std::shared_ptr<const void> value;
        std::function<void()> reloader;
        ConfigLoadStatus status{ConfigLoadStatus::NotLoaded};
    };

    struct ListenerInfo {
        size_t id;
        std::string name;
        std::function<void(const void*)> callback;
    };

    JsonValue loadDocument(const std::string& name, const DocumentHooks& hooks,
                           ConfigLoadStatus& status) const;
    JsonValue migrateDocument(const std::string& name, const DocumentHooks& hooks,
                              const JsonValue& document, const std::string& originalText,
                              int version, ConfigLoadStatus& status) const;
    bool writeAtomically(const std::filesystem::path& path, const JsonValue& document) const;
    bool writeBytes(const std::filesystem::path& path, const std::string& bytes) const;
    void restoreBackup(const std::string& name, int fromVersion) const;
    void storeEntry(const std::string& name, JsonValue raw,
                    std::shared_ptr<const void> value, std::function<void()> reloader,
                    ConfigLoadStatus status);
    void notifyListeners(const std::string& name, const void* value);

    std::filesystem::path m_configDir;
    ConfigMigrationRegistry m_migrations;

    std::map<std::string, Entry> m_entries;
    mutable std::shared_mutex m_entriesMutex;

    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextListenerId = 0;
};

// Template implementations must be in header for linking
template<typename T>
T ConfigStore::load(const std::string& name) {
    DocumentHooks hooks{
        T::CURRENT_VERSION,
        []() {
            JsonValue document = T{}.toJson();
            document["configVersion"] = JsonValue(T::CURRENT_VERSION);
            return document;
        },
        [](const JsonValue& document, std::string& error) {
            return T::validate(document, error);
        }};

    ConfigLoadStatus status = ConfigLoadStatus::NotLoaded;
    JsonValue document = loadDocument(name, hooks, status);
    T value = T::fromJson(document);

    storeEntry(name, document, std::make_shared<const T>(value),
               [this, name]() {
                   T reloaded = load<T>(name);
                   notifyListeners(name, &reloaded);
               },
               status);
    return value;
}

template<typename T>
bool ConfigStore::save(const std::string& name, const T& value) {
    JsonValue document = value.toJson();
    document["configVersion"] = JsonValue(T::CURRENT_VERSION);

    std::unique_lock<std::shared_mutex> lock(m_entriesMutex);
    Entry& entry = m_entries[name];
    JsonValue merged = entry.raw.isObject() ? entry.raw : JsonValue::object();
    merged.overlay(document);

    if (!writeAtomically(pathFor(name), merged)) {
        return false;
    }
    entry.raw = std::move(merged);
    entry.value = std::make_shared<const T>(value);
    if (entry.status == ConfigLoadStatus::NotLoaded) {
        entry.status = ConfigLoadStatus::Loaded;
    }
    return true;
}

template<typename T>
std::optional<T> ConfigStore::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(m_entriesMutex);
    auto it = m_entries.find(name);
    if (it == m_entries.end() || !it->second.value) {
        return std::nullopt;
    }
    return *std::static_pointer_cast<const T>(it->second.value);
}

template<typename T>
size_t ConfigStore::registerChangeListener(const std::string& name,
                                           std::function<void(const T&)> callback) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    size_t id = m_nextListenerId++;
    m_listeners.push_back(ListenerInfo{
        id, name, [callback = std::move(callback)](const void* value) {
            callback(*static_cast<const T*>(value));
        }});
    return id;
}

} // namespace Lifeline

#endif // CONFIG_STORE_HPP
