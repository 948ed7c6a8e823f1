/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "metabolism/MetabolismRepository.hpp"
#include "metabolism/StatVector.hpp"
#include "storage/WorldStorage.hpp"

namespace Lifeline {

std::vector<SchemaStep> MetabolismRepository::schemaSteps() {
    return {
        {1, "create metabolism_stats",
         [](Transaction& tx) {
             tx.execute("CREATE TABLE IF NOT EXISTS metabolism_stats ("
                        "player_id TEXT NOT NULL, "
                        "world_id TEXT NOT NULL, "
                        "stat_name TEXT NOT NULL, "
                        "value REAL NOT NULL, "
                        "PRIMARY KEY (player_id, stat_name))");
         }},
        {2, "index metabolism_stats by player",
         [](Transaction& tx) {
             tx.execute("CREATE INDEX IF NOT EXISTS idx_metabolism_player "
                        "ON metabolism_stats (player_id)");
         }},
    };
}

int MetabolismRepository::ensureSchema() {
    return applySchemaSteps(m_storage, MODULE_ID, schemaSteps());
}

std::map<std::string, double> MetabolismRepository::load(const std::string& playerId) const {
    std::map<std::string, double> values;
    m_storage.query("SELECT stat_name, value FROM metabolism_stats WHERE player_id = ?",
                    {playerId}, [&values](const SqlRow& row) {
                        values[sqlText(row.at(0))] = sqlReal(row.at(1));
                    });
    return values;
}

void MetabolismRepository::save(const std::string& playerId, const StatVector& stats) {
    const std::string worldId = m_storage.getWorldId();
    m_storage.transaction([&](Transaction& tx) {
        for (const auto& [name, stat] : stats) {
            tx.execute("INSERT INTO metabolism_stats (player_id, world_id, stat_name, value) "
                       "VALUES (?, ?, ?, ?) "
                       "ON CONFLICT(player_id, stat_name) DO UPDATE SET "
                       "value = excluded.value, world_id = excluded.world_id",
                       {playerId, worldId, name, stat.value});
        }
    });
}

size_t MetabolismRepository::countRows(const std::string& playerId) const {
    auto row = m_storage.queryOne("SELECT COUNT(*) FROM metabolism_stats WHERE player_id = ?",
                                  {playerId});
    return row ? static_cast<size_t>(sqlInt(row->at(0))) : 0;
}

} // namespace Lifeline
