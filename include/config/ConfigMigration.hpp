/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONFIG_MIGRATION_HPP
#define CONFIG_MIGRATION_HPP

#include "utils/JsonReader.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace Lifeline {

/**
 * @brief One step of a config document's history.
 *
 * toVersion is always fromVersion + 1. The transform receives the whole
 * document and returns the rewritten one; keys it does not know about must be
 * passed through untouched.
 */
struct ConfigMigration {
    int fromVersion;
    int toVersion;
    std::string description;
    std::function<JsonValue(JsonValue)> transform;
};

/**
 * @brief Ordered migration chains, one per config document name.
 */
class ConfigMigrationRegistry {
public:
    /**
     * @brief Installs the chain for a document, replacing any previous one.
     * @throws ConfigMigrationFailed on duplicate versions, gaps, steps that
     *         skip versions or a missing transform
     */
    void registerMigrations(const std::string& name, std::vector<ConfigMigration> migrations);

    bool hasMigrations(const std::string& name) const;

    /**
     * @brief Checks that every step from @p fromVersion to @p toVersion exists.
     * @param error receives the first missing step
     */
    bool validateChain(const std::string& name, int fromVersion, int toVersion,
                       std::string& error) const;

    /**
     * @brief Runs the chain one version at a time and stamps configVersion.
     *
     * Applying from a version at or above @p toVersion returns the document
     * unchanged.
     *
     * @throws ConfigMigrationFailed if a step is missing, a transform throws
     *         or a transform returns something other than an object
     */
    JsonValue apply(const std::string& name, JsonValue document, int fromVersion,
                    int toVersion) const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::vector<ConfigMigration>> m_chains;
};

} // namespace Lifeline

#endif // CONFIG_MIGRATION_HPP
