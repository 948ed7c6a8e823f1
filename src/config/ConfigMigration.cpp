/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "config/ConfigMigration.hpp"
#include "core/CoreErrors.hpp"
#include "core/Logger.hpp"

#include <algorithm>

namespace Lifeline {

void ConfigMigrationRegistry::registerMigrations(const std::string& name,
                                                 std::vector<ConfigMigration> migrations) {
    std::sort(migrations.begin(), migrations.end(),
              [](const ConfigMigration& a, const ConfigMigration& b) {
                  return a.fromVersion < b.fromVersion;
              });

    for (size_t i = 0; i < migrations.size(); ++i) {
        const auto& step = migrations[i];
        if (step.fromVersion < 1 || step.toVersion != step.fromVersion + 1) {
            throw ConfigMigrationFailed("config '" + name + "': migration " +
                                        std::to_string(step.fromVersion) + " -> " +
                                        std::to_string(step.toVersion) +
                                        " must advance exactly one version");
        }
        if (!step.transform) {
            throw ConfigMigrationFailed("config '" + name + "': migration from v" +
                                        std::to_string(step.fromVersion) +
                                        " has no transform");
        }
        if (i > 0 && step.fromVersion != migrations[i - 1].toVersion) {
            throw ConfigMigrationFailed(
                "config '" + name + "': migration chain " +
                (step.fromVersion == migrations[i - 1].fromVersion
                     ? "registers v" + std::to_string(step.fromVersion) + " twice"
                     : "has a gap between v" + std::to_string(migrations[i - 1].toVersion) +
                           " and v" + std::to_string(step.fromVersion)));
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_chains[name] = std::move(migrations);
}

bool ConfigMigrationRegistry::hasMigrations(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_chains.find(name);
    return it != m_chains.end() && !it->second.empty();
}

bool ConfigMigrationRegistry::validateChain(const std::string& name, int fromVersion,
                                            int toVersion, std::string& error) const {
    if (fromVersion >= toVersion) {
        return true;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_chains.find(name);
    for (int version = fromVersion; version < toVersion; ++version) {
        bool found = it != m_chains.end() &&
                     std::any_of(it->second.begin(), it->second.end(),
                                 [version](const ConfigMigration& m) {
                                     return m.fromVersion == version;
                                 });
        if (!found) {
            error = "config '" + name + "' has no migration from v" +
                    std::to_string(version) + " to v" + std::to_string(version + 1);
            return false;
        }
    }
    return true;
}

JsonValue ConfigMigrationRegistry::apply(const std::string& name, JsonValue document,
                                         int fromVersion, int toVersion) const {
    if (fromVersion >= toVersion) {
        return document;
    }

    std::string error;
    if (!validateChain(name, fromVersion, toVersion, error)) {
        throw ConfigMigrationFailed(error);
    }

    // Copy the steps so transforms run without holding the lock
    std::vector<ConfigMigration> steps;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& step : m_chains.at(name)) {
            if (step.fromVersion >= fromVersion && step.fromVersion < toVersion) {
                steps.push_back(step);
            }
        }
    }

    for (const auto& step : steps) {
        try {
            document = step.transform(std::move(document));
        } catch (const std::exception& e) {
            throw ConfigMigrationFailed("config '" + name + "' migration v" +
                                        std::to_string(step.fromVersion) + " -> v" +
                                        std::to_string(step.toVersion) + " failed: " +
                                        e.what());
        }
        if (!document.isObject()) {
            throw ConfigMigrationFailed("config '" + name + "' migration v" +
                                        std::to_string(step.fromVersion) +
                                        " did not produce an object");
        }
        document["configVersion"] = JsonValue(step.toVersion);
        CONFIG_INFO("Migrated '" + name + "' v" + std::to_string(step.fromVersion) +
                    " -> v" + std::to_string(step.toVersion) + ": " + step.description);
    }
    return document;
}

} // namespace Lifeline
