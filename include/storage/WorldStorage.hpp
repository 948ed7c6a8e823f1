/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_STORAGE_HPP
#define WORLD_STORAGE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct sqlite3;

namespace Lifeline {

using SqlValue = std::variant<std::nullptr_t, int64_t, double, std::string>;
using SqlRow = std::vector<SqlValue>;
using SqlParams = std::vector<SqlValue>;
using RowCallback = std::function<void(const SqlRow&)>;

// Typed column accessors; a NULL or mismatched column yields the fallback
int64_t sqlInt(const SqlValue& value, int64_t fallback = 0);
double sqlReal(const SqlValue& value, double fallback = 0.0);
std::string sqlText(const SqlValue& value, const std::string& fallback = "");

struct StorageOptions {
    std::chrono::milliseconds busyTimeout{5000};
    size_t readerConnections{2};
};

/**
 * @brief Write scope handed to WorldStorage::transaction bodies.
 *
 * Every statement runs on the writer connection inside the open transaction,
 * so queries see the transaction's own uncommitted changes.
 */
class Transaction {
public:
    int execute(const std::string& sql, const SqlParams& params = {});
    void query(const std::string& sql, const SqlParams& params,
               const RowCallback& onRow);
    std::optional<SqlRow> queryOne(const std::string& sql,
                                   const SqlParams& params = {});

    int getModuleSchemaVersion(const std::string& moduleId);

    /**
     * @brief Records a module's schema version inside this transaction.
     * @throws std::invalid_argument if @p version is lower than the stored one
     */
    void setModuleSchemaVersion(const std::string& moduleId, int version);

private:
    friend class WorldStorage;
    Transaction(sqlite3* db, const std::string& worldId)
        : m_db(db), m_worldId(worldId) {}

    sqlite3* m_db;
    const std::string& m_worldId;
};

/**
 * @brief Embedded SQLite database owned by exactly one world.
 *
 * Layout: <dataDir>/<worldId>/world.db in WAL mode. Writers are serialized
 * through one connection and wait at most StorageOptions::busyTimeout before
 * StorageBusy is thrown. Reads use a small pool of read-only connections and
 * proceed while a write is active.
 *
 * Errors: StorageCorrupt when the file is not a usable database,
 * SchemaMismatch when a core table has unexpected columns, StorageBusy on
 * lock timeouts. All are scoped to this world.
 */
class WorldStorage {
public:
    static constexpr const char* DATABASE_FILE = "world.db";

    /**
     * @brief Opens (creating if needed) the database for a world.
     * @throws StorageCorrupt, SchemaMismatch, StorageBusy
     */
    static std::unique_ptr<WorldStorage> open(const std::filesystem::path& dataDir,
                                              const std::string& worldId,
                                              const StorageOptions& options = {});

    ~WorldStorage();

    WorldStorage(const WorldStorage&) = delete;
    WorldStorage& operator=(const WorldStorage&) = delete;

    /**
     * @brief Runs one statement in its own implicit transaction.
     * @return number of rows changed
     */
    int execute(const std::string& sql, const SqlParams& params = {});

    /**
     * @brief Runs @p body inside BEGIN IMMEDIATE ... COMMIT.
     *
     * Any exception from the body rolls back and is rethrown unchanged.
     */
    void transaction(const std::function<void(Transaction&)>& body);

    void query(const std::string& sql, const SqlParams& params,
               const RowCallback& onRow) const;
    std::optional<SqlRow> queryOne(const std::string& sql,
                                   const SqlParams& params = {}) const;

    int getModuleSchemaVersion(const std::string& moduleId) const;
    void setModuleSchemaVersion(const std::string& moduleId, int version);

    /**
     * @brief Waits (at most busyTimeout per stage) for the active writer and
     * readers, checkpoints the WAL and closes every connection.
     *
     * New writes are refused as soon as close starts. Safe to call more than
     * once; a call that timed out can be repeated to finish the close.
     * @throws StorageBusy if the writer or a reader is still busy at the timeout
     */
    void close();

    bool isOpen() const;
    const std::string& getWorldId() const { return m_worldId; }
    const std::filesystem::path& getPath() const { return m_path; }

private:
    WorldStorage(std::filesystem::path path, std::string worldId,
                 const StorageOptions& options);

    void openConnections();
    void bootstrapSchema();
    std::unique_lock<std::timed_mutex> acquireWriter(const std::string& operation);
    sqlite3* borrowReader() const;
    void returnReader(sqlite3* reader) const;
    void ensureOpen() const;

    std::filesystem::path m_path;
    std::string m_worldId;
    StorageOptions m_options;

    sqlite3* m_writer{nullptr};
    std::timed_mutex m_writeMutex;

    std::vector<sqlite3*> m_readers;
    mutable std::vector<sqlite3*> m_idleReaders;
    mutable std::mutex m_readerMutex;
    mutable std::condition_variable m_readerAvailable;

    mutable std::mutex m_stateMutex;
    bool m_closed{false};
    bool m_released{false};
};

} // namespace Lifeline

#endif // WORLD_STORAGE_HPP
