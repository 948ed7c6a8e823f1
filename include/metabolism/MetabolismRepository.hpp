/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef METABOLISM_REPOSITORY_HPP
#define METABOLISM_REPOSITORY_HPP

#include "storage/SchemaMigration.hpp"

#include <map>
#include <string>
#include <vector>

namespace Lifeline {

class StatVector;
class WorldStorage;

// Persisted stats of the metabolism module, one row per (player, stat)
class MetabolismRepository {
public:
    static constexpr const char* MODULE_ID = "metabolism";

    explicit MetabolismRepository(WorldStorage& storage) : m_storage(storage) {}

    static std::vector<SchemaStep> schemaSteps();

    // Brings the module tables up to date; returns the schema version
    int ensureSchema();

    /**
     * @brief Every persisted stat of a player, including ones no longer configured
     */
    std::map<std::string, double> load(const std::string& playerId) const;

    /**
     * @brief Upserts all stats of a player in one transaction
     * @throws StorageBusy, LifelineError
     */
    void save(const std::string& playerId, const StatVector& stats);

    size_t countRows(const std::string& playerId) const;

private:
    WorldStorage& m_storage;
};

} // namespace Lifeline

#endif // METABOLISM_REPOSITORY_HPP
