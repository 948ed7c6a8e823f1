/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/ConfigStore.hpp"
#include "core/CoreErrors.hpp"
#include "core/Logger.hpp"

#include <fstream>
#include <sstream>

namespace Lifeline {

namespace {

bool isBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

const char* toString(ConfigLoadStatus status) {
    switch (status) {
    case ConfigLoadStatus::NotLoaded:
        return "NotLoaded";
    case ConfigLoadStatus::Loaded:
        return "Loaded";
    case ConfigLoadStatus::CreatedDefault:
        return "CreatedDefault";
    case ConfigLoadStatus::Migrated:
        return "Migrated";
    case ConfigLoadStatus::MigrationFailed:
        return "MigrationFailed";
    case ConfigLoadStatus::ParseFailed:
        return "ParseFailed";
    case ConfigLoadStatus::ValidationFailed:
        return "ValidationFailed";
    }
    return "Unknown";
}

ConfigStore::ConfigStore(std::filesystem::path configDir)
    : m_configDir(std::move(configDir)) {}

std::filesystem::path ConfigStore::pathFor(const std::string& name) const {
    return m_configDir / (name + ".json");
}

std::filesystem::path ConfigStore::backupPathFor(const std::string& name,
                                                 int fromVersion) const {
    return m_configDir / (name + ".v" + std::to_string(fromVersion) + ".json.backup");
}

JsonValue ConfigStore::loadDocument(const std::string& name, const DocumentHooks& hooks,
                                    ConfigLoadStatus& status) const {
    const std::filesystem::path path = pathFor(name);

    std::string text;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            CONFIG_ERROR("Cannot read " + path.string() + ", using defaults for '" + name + "'");
            status = ConfigLoadStatus::ParseFailed;
            return hooks.defaults();
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        text = buffer.str();
    }

    if (isBlank(text)) {
        JsonValue defaults = hooks.defaults();
        if (writeAtomically(path, defaults)) {
            CONFIG_INFO("Created default config '" + name + "' at " + path.string());
        } else {
            CONFIG_ERROR("Could not write default config to " + path.string());
        }
        status = ConfigLoadStatus::CreatedDefault;
        return defaults;
    }

    JsonReader reader;
    if (!reader.parse(text) || !reader.getRoot().isObject()) {
        std::string reason = reader.getLastError().empty() ? "top level is not an object"
                                                           : reader.getLastError();
        std::filesystem::path backup = m_configDir / (name + ".parse-error.json.backup");
        writeBytes(backup, text);
        CONFIG_ERROR("Config '" + name + "' is unreadable (" + reason +
                     "); copy kept at " + backup.string() + ", using defaults");
        status = ConfigLoadStatus::ParseFailed;
        return hooks.defaults();
    }

    JsonValue document = reader.takeRoot();
    // Documents written before versioning existed count as v1
    int version = document.getInt("configVersion", 1);
    if (version < 1) {
        version = 1;
    }

    if (version > hooks.currentVersion) {
        CONFIG_WARN("Config '" + name + "' is v" + std::to_string(version) +
                    ", newer than supported v" + std::to_string(hooks.currentVersion) +
                    "; loading without downgrade");
        status = ConfigLoadStatus::Loaded;
        return document;
    }

    if (version < hooks.currentVersion) {
        return migrateDocument(name, hooks, document, text, version, status);
    }

    std::string error;
    if (!hooks.validate(document, error)) {
        CONFIG_ERROR("Config '" + name + "' failed validation (" + error +
                     "), using defaults");
        status = ConfigLoadStatus::ValidationFailed;
        return hooks.defaults();
    }

    status = ConfigLoadStatus::Loaded;
    return document;
}

JsonValue ConfigStore::migrateDocument(const std::string& name, const DocumentHooks& hooks,
                                       const JsonValue& document,
                                       const std::string& originalText, int version,
                                       ConfigLoadStatus& status) const {
    std::string error;
    if (!m_migrations.validateChain(name, version, hooks.currentVersion, error)) {
        CONFIG_ERROR("ConfigMigrationFailed: " + error + "; file left untouched, using defaults");
        status = ConfigLoadStatus::MigrationFailed;
        return hooks.defaults();
    }

    const std::filesystem::path backup = backupPathFor(name, version);
    if (!writeBytes(backup, originalText)) {
        CONFIG_ERROR("ConfigMigrationFailed: cannot write backup " + backup.string() +
                     "; refusing to migrate '" + name + "', using defaults");
        status = ConfigLoadStatus::MigrationFailed;
        return hooks.defaults();
    }
    CONFIG_INFO("Backed up '" + name + "' v" + std::to_string(version) + " to " +
                backup.string());

    JsonValue migrated;
    try {
        migrated = m_migrations.apply(name, document, version, hooks.currentVersion);
    } catch (const ConfigMigrationFailed& e) {
        CONFIG_ERROR(std::string("ConfigMigrationFailed: ") + e.what() +
                     "; restoring backup, using defaults");
        restoreBackup(name, version);
        status = ConfigLoadStatus::MigrationFailed;
        return hooks.defaults();
    }

    if (!hooks.validate(migrated, error)) {
        CONFIG_ERROR("ConfigMigrationFailed: '" + name + "' invalid after migration (" +
                     error + "); restoring backup, using defaults");
        restoreBackup(name, version);
        status = ConfigLoadStatus::MigrationFailed;
        return hooks.defaults();
    }

    if (!writeAtomically(pathFor(name), migrated)) {
        CONFIG_WARN("Migrated '" + name + "' could not be written back; the old file "
                    "stays on disk and will be migrated again on next load");
    }

    CONFIG_INFO("Config '" + name + "' migrated v" + std::to_string(version) + " -> v" +
                std::to_string(hooks.currentVersion));
    status = ConfigLoadStatus::Migrated;
    return migrated;
}

bool ConfigStore::writeBytes(const std::filesystem::path& path,
                             const std::string& bytes) const {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    return file.good();
}

bool ConfigStore::writeAtomically(const std::filesystem::path& path,
                                  const JsonValue& document) const {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        CONFIG_ERROR("Cannot create " + path.parent_path().string() + ": " + ec.message());
        return false;
    }

    std::filesystem::path temp = path;
    temp += ".tmp";
    if (!writeBytes(temp, JsonWriter().write(document))) {
        CONFIG_ERROR("Cannot write " + temp.string());
        std::filesystem::remove(temp, ec);
        return false;
    }

    std::filesystem::rename(temp, path, ec);
    if (ec) {
        CONFIG_ERROR("Cannot replace " + path.string() + ": " + ec.message());
        std::filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

void ConfigStore::restoreBackup(const std::string& name, int fromVersion) const {
    const std::filesystem::path backup = backupPathFor(name, fromVersion);
    const std::filesystem::path path = pathFor(name);

    std::filesystem::path temp = path;
    temp += ".tmp";
    std::error_code ec;
    std::filesystem::copy_file(backup, temp,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (!ec) {
        std::filesystem::rename(temp, path, ec);
    }
    if (ec) {
        CONFIG_ERROR("Could not restore " + path.string() + " from " + backup.string() +
                     ": " + ec.message());
        std::filesystem::remove(temp, ec);
        return;
    }
    CONFIG_WARN("Restored '" + name + "' from backup " + backup.string());
}

void ConfigStore::storeEntry(const std::string& name, JsonValue raw,
                             std::shared_ptr<const void> value,
                             std::function<void()> reloader, ConfigLoadStatus status) {
    std::unique_lock<std::shared_mutex> lock(m_entriesMutex);
    Entry& entry = m_entries[name];
    entry.raw = std::move(raw);
    entry.value = std::move(value);
    entry.reloader = std::move(reloader);
    entry.status = status;
}

std::vector<std::string> ConfigStore::reload(const std::optional<std::string>& name) {
    std::vector<std::pair<std::string, std::function<void()>>> reloaders;
    {
        std::shared_lock<std::shared_mutex> lock(m_entriesMutex);
        for (const auto& [entryName, entry] : m_entries) {
            if (entry.reloader && (!name || *name == entryName)) {
                reloaders.emplace_back(entryName, entry.reloader);
            }
        }
    }

    if (name && reloaders.empty()) {
        CONFIG_WARN("Reload requested for '" + *name + "', which was never loaded");
    }

    std::vector<std::string> reloaded;
    for (const auto& [entryName, reloader] : reloaders) {
        reloader();
        reloaded.push_back(entryName);
        CONFIG_INFO("Reloaded '" + entryName + "' (" + toString(getStatus(entryName)) + ")");
    }
    return reloaded;
}

void ConfigStore::unregisterChangeListener(size_t listenerId) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    for (auto it = m_listeners.begin(); it != m_listeners.end(); ++it) {
        if (it->id == listenerId) {
            m_listeners.erase(it);
            return;
        }
    }
}

void ConfigStore::notifyListeners(const std::string& name, const void* value) {
    // Copy so callbacks may register or unregister listeners
    std::vector<ListenerInfo> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& listener : m_listeners) {
            if (listener.name == name) {
                listeners.push_back(listener);
            }
        }
    }

    for (const auto& listener : listeners) {
        try {
            listener.callback(value);
        } catch (const std::exception& e) {
            CONFIG_ERROR("Change listener " + std::to_string(listener.id) + " for '" +
                         name + "' threw: " + e.what());
        }
    }
}

ConfigLoadStatus ConfigStore::getStatus(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(m_entriesMutex);
    auto it = m_entries.find(name);
    return it != m_entries.end() ? it->second.status : ConfigLoadStatus::NotLoaded;
}

} // namespace Lifeline
