/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLAYER_REPOSITORY_HPP
#define PLAYER_REPOSITORY_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace Lifeline {

class WorldStorage;
class Transaction;

struct PlayerRecord {
    std::string id;
    int64_t firstSeen{0}; // ms since epoch
    int64_t lastSeen{0};
};

/**
 * @brief Reads and upserts rows of the core players table.
 *
 * Records are never deleted; first_seen is written once.
 */
class PlayerRepository {
public:
    explicit PlayerRepository(WorldStorage& storage) : m_storage(storage) {}

    void recordSeen(const std::string& playerId, int64_t nowMs);
    static void recordSeen(Transaction& tx, const std::string& playerId, int64_t nowMs);

    std::optional<PlayerRecord> find(const std::string& playerId) const;
    size_t count() const;

    static int64_t nowMs();

private:
    WorldStorage& m_storage;
};

} // namespace Lifeline

#endif // PLAYER_REPOSITORY_HPP
