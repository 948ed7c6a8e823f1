/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "storage/WorldStorage.hpp"
#include "core/CoreErrors.hpp"
#include "core/Logger.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace Lifeline {

namespace {

const char* const CORE_SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS players (
    id TEXT PRIMARY KEY,
    first_seen INTEGER NOT NULL,
    last_seen INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS module_schema_versions (
    module_id TEXT PRIMARY KEY,
    version INTEGER NOT NULL
);
)SQL";

[[noreturn]] void throwForCode(int rc, sqlite3* db, const std::string& worldId,
                               const std::string& context) {
    std::string detail = "world '" + worldId + "': " + context + ": " +
                         (db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
        throw StorageBusy(detail);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
        throw StorageCorrupt(detail);
    default:
        throw LifelineError(detail);
    }
}

// Prepared statement bound to one connection, finalized on scope exit
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql, const std::string& worldId)
        : m_db(db), m_worldId(worldId) {
        int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &m_stmt, nullptr);
        if (rc != SQLITE_OK) {
            throwForCode(rc, m_db, m_worldId, "prepare '" + sql + "'");
        }
    }

    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(const SqlParams& params) {
        for (size_t i = 0; i < params.size(); ++i) {
            int index = static_cast<int>(i + 1);
            int rc = std::visit(
                [this, index](const auto& value) -> int {
                    using T = std::decay_t<decltype(value)>;
                    if constexpr (std::is_same_v<T, std::nullptr_t>) {
                        return sqlite3_bind_null(m_stmt, index);
                    } else if constexpr (std::is_same_v<T, int64_t>) {
                        return sqlite3_bind_int64(m_stmt, index, value);
                    } else if constexpr (std::is_same_v<T, double>) {
                        return sqlite3_bind_double(m_stmt, index, value);
                    } else {
                        return sqlite3_bind_text(m_stmt, index, value.c_str(),
                                                 static_cast<int>(value.size()),
                                                 SQLITE_TRANSIENT);
                    }
                },
                params[i]);
            if (rc != SQLITE_OK) {
                throwForCode(rc, m_db, m_worldId,
                             "bind parameter " + std::to_string(index));
            }
        }
    }

    // Returns true while rows are available
    bool step() {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throwForCode(rc, m_db, m_worldId, "step '" + std::string(sqlite3_sql(m_stmt)) + "'");
    }

    SqlRow row() const {
        int columns = sqlite3_column_count(m_stmt);
        SqlRow result;
        result.reserve(static_cast<size_t>(columns));
        for (int c = 0; c < columns; ++c) {
            switch (sqlite3_column_type(m_stmt, c)) {
            case SQLITE_INTEGER:
                result.emplace_back(static_cast<int64_t>(sqlite3_column_int64(m_stmt, c)));
                break;
            case SQLITE_FLOAT:
                result.emplace_back(sqlite3_column_double(m_stmt, c));
                break;
            case SQLITE_TEXT:
            case SQLITE_BLOB: {
                const auto* bytes =
                    static_cast<const char*>(sqlite3_column_blob(m_stmt, c));
                int length = sqlite3_column_bytes(m_stmt, c);
                result.emplace_back(bytes != nullptr
                                        ? std::string(bytes, static_cast<size_t>(length))
                                        : std::string());
                break;
            }
            default:
                result.emplace_back(nullptr);
                break;
            }
        }
        return result;
    }

private:
    sqlite3* m_db;
    sqlite3_stmt* m_stmt{nullptr};
    const std::string& m_worldId;
};

int runStatement(sqlite3* db, const std::string& sql, const SqlParams& params,
                 const std::string& worldId, const RowCallback* onRow) {
    Statement statement(db, sql, worldId);
    statement.bind(params);
    while (statement.step()) {
        if (onRow != nullptr) {
            (*onRow)(statement.row());
        }
    }
    return sqlite3_changes(db);
}

std::optional<SqlRow> runQueryOne(sqlite3* db, const std::string& sql,
                                  const SqlParams& params,
                                  const std::string& worldId) {
    Statement statement(db, sql, worldId);
    statement.bind(params);
    if (!statement.step()) {
        return std::nullopt;
    }
    return statement.row();
}

void execScript(sqlite3* db, const char* sql, const std::string& worldId,
                const std::string& context) {
    char* errorMessage = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errorMessage);
    if (rc != SQLITE_OK) {
        std::string detail = errorMessage != nullptr ? errorMessage : sqlite3_errstr(rc);
        sqlite3_free(errorMessage);
        throwForCode(rc, nullptr, worldId, context + ": " + detail);
    }
}

const char* const SELECT_SCHEMA_VERSION_SQL =
    "SELECT version FROM module_schema_versions WHERE module_id = ?";

} // namespace

int64_t sqlInt(const SqlValue& value, int64_t fallback) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return static_cast<int64_t>(*d);
    }
    return fallback;
}

double sqlReal(const SqlValue& value, double fallback) {
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    return fallback;
}

std::string sqlText(const SqlValue& value, const std::string& fallback) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return fallback;
}

// Transaction implementation
int Transaction::execute(const std::string& sql, const SqlParams& params) {
    return runStatement(m_db, sql, params, m_worldId, nullptr);
}

void Transaction::query(const std::string& sql, const SqlParams& params,
                        const RowCallback& onRow) {
    runStatement(m_db, sql, params, m_worldId, &onRow);
}

std::optional<SqlRow> Transaction::queryOne(const std::string& sql,
                                            const SqlParams& params) {
    return runQueryOne(m_db, sql, params, m_worldId);
}

int Transaction::getModuleSchemaVersion(const std::string& moduleId) {
    auto row = queryOne(SELECT_SCHEMA_VERSION_SQL, {moduleId});
    return row ? static_cast<int>(sqlInt(row->at(0))) : 0;
}

void Transaction::setModuleSchemaVersion(const std::string& moduleId, int version) {
    int current = getModuleSchemaVersion(moduleId);
    if (version < current) {
        throw std::invalid_argument("Schema version for module '" + moduleId +
                                    "' cannot move backwards from " +
                                    std::to_string(current) + " to " +
                                    std::to_string(version));
    }
    execute("INSERT INTO module_schema_versions (module_id, version) VALUES (?, ?) "
            "ON CONFLICT(module_id) DO UPDATE SET version = excluded.version",
            {moduleId, static_cast<int64_t>(version)});
}

// WorldStorage implementation
WorldStorage::WorldStorage(std::filesystem::path path, std::string worldId,
                           const StorageOptions& options)
    : m_path(std::move(path)), m_worldId(std::move(worldId)), m_options(options) {
    m_options.readerConnections = std::max<size_t>(1, m_options.readerConnections);
}

WorldStorage::~WorldStorage() {
    try {
        close();
    } catch (const StorageBusy& e) {
        STORAGE_ERROR("World '" + m_worldId + "' left open at destruction: " + e.what());
    }
}

std::unique_ptr<WorldStorage> WorldStorage::open(const std::filesystem::path& dataDir,
                                                 const std::string& worldId,
                                                 const StorageOptions& options) {
    std::filesystem::path worldDir = dataDir / worldId;
    std::error_code ec;
    std::filesystem::create_directories(worldDir, ec);
    if (ec) {
        throw StorageCorrupt("world '" + worldId + "': cannot create " +
                             worldDir.string() + ": " + ec.message());
    }

    std::unique_ptr<WorldStorage> storage(
        new WorldStorage(worldDir / DATABASE_FILE, worldId, options));
    storage->openConnections();

    STORAGE_INFO("Opened world '" + worldId + "' at " + storage->m_path.string());
    return storage;
}

void WorldStorage::openConnections() {
    int rc = sqlite3_open_v2(m_path.c_str(), &m_writer,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_NOMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = m_writer != nullptr ? sqlite3_errmsg(m_writer)
                                                 : sqlite3_errstr(rc);
        sqlite3_close_v2(m_writer);
        m_writer = nullptr;
        throw StorageCorrupt("world '" + m_worldId + "': cannot open " +
                             m_path.string() + ": " + detail);
    }

    int timeoutMs = static_cast<int>(m_options.busyTimeout.count());
    sqlite3_busy_timeout(m_writer, timeoutMs);

    // First real read of the file; a non-database fails here
    auto mode = runQueryOne(m_writer, "PRAGMA journal_mode = WAL", {}, m_worldId);
    if (!mode || sqlText(mode->at(0)) != "wal") {
        STORAGE_WARN("World '" + m_worldId + "' could not enable WAL mode");
    }

    auto check = runQueryOne(m_writer, "PRAGMA quick_check", {}, m_worldId);
    if (!check || sqlText(check->at(0)) != "ok") {
        throw StorageCorrupt("world '" + m_worldId + "': integrity check failed: " +
                             (check ? sqlText(check->at(0)) : std::string("no result")));
    }

    execScript(m_writer, "PRAGMA synchronous = NORMAL; PRAGMA foreign_keys = ON;",
               m_worldId, "configure connection");

    bootstrapSchema();

    for (size_t i = 0; i < m_options.readerConnections; ++i) {
        sqlite3* reader = nullptr;
        rc = sqlite3_open_v2(m_path.c_str(), &reader,
                             SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close_v2(reader);
            throwForCode(rc, nullptr, m_worldId, "open reader connection");
        }
        sqlite3_busy_timeout(reader, timeoutMs);
        m_readers.push_back(reader);
        m_idleReaders.push_back(reader);
    }
}

void WorldStorage::bootstrapSchema() {
    execScript(m_writer, CORE_SCHEMA_SQL, m_worldId, "bootstrap schema");

    struct RequiredTable {
        const char* name;
        std::vector<std::string> columns;
    };
    const std::vector<RequiredTable> required = {
        {"players", {"id", "first_seen", "last_seen"}},
        {"module_schema_versions", {"module_id", "version"}},
    };

    for (const auto& table : required) {
        std::set<std::string> present;
        RowCallback collect = [&present](const SqlRow& row) {
            // PRAGMA table_info: cid, name, type, notnull, dflt_value, pk
            present.insert(sqlText(row.at(1)));
        };
        runStatement(m_writer, std::string("PRAGMA table_info(") + table.name + ")",
                     {}, m_worldId, &collect);

        for (const auto& column : table.columns) {
            if (present.count(column) == 0) {
                throw SchemaMismatch("world '" + m_worldId + "': table '" +
                                     table.name + "' is missing column '" +
                                     column + "'");
            }
        }
    }
}

void WorldStorage::ensureOpen() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (m_closed) {
        throw std::logic_error("Storage for world '" + m_worldId + "' is closed");
    }
}

bool WorldStorage::isOpen() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return !m_closed && m_writer != nullptr;
}

std::unique_lock<std::timed_mutex> WorldStorage::acquireWriter(const std::string& operation) {
    ensureOpen();
    std::unique_lock<std::timed_mutex> lock(m_writeMutex, std::defer_lock);
    if (!lock.try_lock_for(m_options.busyTimeout)) {
        throw StorageBusy("world '" + m_worldId + "': " + operation +
                          " waited " + std::to_string(m_options.busyTimeout.count()) +
                          "ms for the active writer");
    }
    // close() may have won the race while we waited
    ensureOpen();
    return lock;
}

sqlite3* WorldStorage::borrowReader() const {
    std::unique_lock<std::mutex> lock(m_readerMutex);
    bool ready = m_readerAvailable.wait_for(lock, m_options.busyTimeout, [this]() {
        return !m_idleReaders.empty() || m_readers.empty();
    });
    if (m_readers.empty()) {
        throw std::logic_error("Storage for world '" + m_worldId + "' is closed");
    }
    if (!ready) {
        throw StorageBusy("world '" + m_worldId + "': no reader connection within " +
                          std::to_string(m_options.busyTimeout.count()) + "ms");
    }
    sqlite3* reader = m_idleReaders.back();
    m_idleReaders.pop_back();
    return reader;
}

void WorldStorage::returnReader(sqlite3* reader) const {
    {
        std::lock_guard<std::mutex> lock(m_readerMutex);
        m_idleReaders.push_back(reader);
    }
    m_readerAvailable.notify_all();
}

int WorldStorage::execute(const std::string& sql, const SqlParams& params) {
    auto lock = acquireWriter("execute");
    return runStatement(m_writer, sql, params, m_worldId, nullptr);
}

void WorldStorage::transaction(const std::function<void(Transaction&)>& body) {
    auto lock = acquireWriter("transaction");

    execScript(m_writer, "BEGIN IMMEDIATE", m_worldId, "begin transaction");
    auto rollback = [this]() {
        char* errorMessage = nullptr;
        if (sqlite3_exec(m_writer, "ROLLBACK", nullptr, nullptr, &errorMessage) != SQLITE_OK) {
            STORAGE_ERROR("World '" + m_worldId + "' rollback failed: " +
                          (errorMessage != nullptr ? errorMessage : "unknown"));
        }
        sqlite3_free(errorMessage);
    };

    try {
        Transaction tx(m_writer, m_worldId);
        body(tx);
        execScript(m_writer, "COMMIT", m_worldId, "commit transaction");
    } catch (...) {
        // Leave the connection clean for the next writer, then propagate
        if (sqlite3_get_autocommit(m_writer) == 0) {
            rollback();
        }
        throw;
    }
}

void WorldStorage::query(const std::string& sql, const SqlParams& params,
                         const RowCallback& onRow) const {
    sqlite3* reader = borrowReader();
    try {
        runStatement(reader, sql, params, m_worldId, &onRow);
    } catch (...) {
        returnReader(reader);
        throw;
    }
    returnReader(reader);
}

std::optional<SqlRow> WorldStorage::queryOne(const std::string& sql,
                                             const SqlParams& params) const {
    std::optional<SqlRow> result;
    query(sql, params, [&result](const SqlRow& row) {
        if (!result) {
            result = row;
        }
    });
    return result;
}

int WorldStorage::getModuleSchemaVersion(const std::string& moduleId) const {
    auto row = queryOne(SELECT_SCHEMA_VERSION_SQL, {moduleId});
    return row ? static_cast<int>(sqlInt(row->at(0))) : 0;
}

void WorldStorage::setModuleSchemaVersion(const std::string& moduleId, int version) {
    transaction([&moduleId, version](Transaction& tx) {
        tx.setModuleSchemaVersion(moduleId, version);
    });
}

void WorldStorage::close() {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_released) {
            return;
        }
        // New writers are refused from here on, even if this call times out
        m_closed = true;
    }

    // Let the in-flight writer finish its transaction
    std::unique_lock<std::timed_mutex> writeLock(m_writeMutex, std::defer_lock);
    if (!writeLock.try_lock_for(m_options.busyTimeout)) {
        throw StorageBusy("world '" + m_worldId + "': close waited " +
                          std::to_string(m_options.busyTimeout.count()) +
                          "ms for the active writer");
    }

    {
        std::unique_lock<std::mutex> lock(m_readerMutex);
        bool idle = m_readerAvailable.wait_for(lock, m_options.busyTimeout, [this]() {
            return m_idleReaders.size() == m_readers.size();
        });
        if (!idle) {
            throw StorageBusy("world '" + m_worldId + "': close waited " +
                              std::to_string(m_options.busyTimeout.count()) +
                              "ms for " +
                              std::to_string(m_readers.size() - m_idleReaders.size()) +
                              " active readers");
        }
        for (sqlite3* reader : m_readers) {
            sqlite3_close_v2(reader);
        }
        m_readers.clear();
        m_idleReaders.clear();
    }
    m_readerAvailable.notify_all();

    if (m_writer != nullptr) {
        int rc = sqlite3_wal_checkpoint_v2(m_writer, nullptr,
                                           SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            STORAGE_WARN("World '" + m_worldId + "' WAL checkpoint failed: " +
                         sqlite3_errmsg(m_writer));
        }
        sqlite3_close_v2(m_writer);
        m_writer = nullptr;
        STORAGE_INFO("Closed world '" + m_worldId + "'");
    }

    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_released = true;
}

} // namespace Lifeline
