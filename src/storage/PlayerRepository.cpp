/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "storage/PlayerRepository.hpp"
#include "storage/WorldStorage.hpp"

#include <chrono>

namespace Lifeline {

namespace {
const char* const UPSERT_PLAYER_SQL =
    "INSERT INTO players (id, first_seen, last_seen) VALUES (?, ?, ?) "
    "ON CONFLICT(id) DO UPDATE SET last_seen = excluded.last_seen";
} // namespace

void PlayerRepository::recordSeen(const std::string& playerId, int64_t nowMs) {
    m_storage.execute(UPSERT_PLAYER_SQL, {playerId, nowMs, nowMs});
}

void PlayerRepository::recordSeen(Transaction& tx, const std::string& playerId,
                                  int64_t nowMs) {
    tx.execute(UPSERT_PLAYER_SQL, {playerId, nowMs, nowMs});
}

std::optional<PlayerRecord> PlayerRepository::find(const std::string& playerId) const {
    auto row = m_storage.queryOne(
        "SELECT id, first_seen, last_seen FROM players WHERE id = ?", {playerId});
    if (!row) {
        return std::nullopt;
    }
    PlayerRecord record;
    record.id = sqlText(row->at(0));
    record.firstSeen = sqlInt(row->at(1));
    record.lastSeen = sqlInt(row->at(2));
    return record;
}

size_t PlayerRepository::count() const {
    auto row = m_storage.queryOne("SELECT COUNT(*) FROM players");
    return row ? static_cast<size_t>(sqlInt(row->at(0))) : 0;
}

int64_t PlayerRepository::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace Lifeline
