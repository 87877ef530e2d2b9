#include "metadata_store.hpp"
#include "debug.hpp"
#include "errors.hpp"
#include "query_planner.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace FontGrep {

namespace {

constexpr int kMaxBusyRetries = 10;
constexpr int kMaxBusyDelayMs = 200;
constexpr int kOperationRetryDelayMs = 50;

// Helper to safely get text from SQLite column (returns empty string if NULL)
inline std::string safeColumnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

std::string errorMessage(sqlite3* db, const std::string& context) {
    return context + ": " + (db ? sqlite3_errmsg(db) : "out of memory");
}

// Exponential backoff for SQLITE_BUSY: 1, 2, 4 ... ms, capped, bounded attempts
int busyHandler(void*, int attempt) {
    if (attempt >= kMaxBusyRetries) return 0;
    int delayMs = std::min(1 << attempt, kMaxBusyDelayMs);
    std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    return 1;
}

void execute(sqlite3* db, const char* sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string message = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        throw StoreError(std::string("SQL error in '") + sql + "': " + message, rc);
    }
}

/**
 * Prepared statement owning its sqlite3_stmt.
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_db(db) {
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw StoreError(errorMessage(db, "prepare failed"), rc);
        }
    }

    ~Statement() {
        sqlite3_finalize(m_stmt);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, int64_t value) {
        check(sqlite3_bind_int64(m_stmt, index, value), "bind");
    }

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT), "bind");
    }

    void bind(int index, const QueryParam& value) {
        std::visit([&](const auto& v) { bind(index, v); }, value);
    }

    /// Advance; true while a row is available
    bool step() {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(errorMessage(m_db, "step failed"), rc);
    }

    void reset() {
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
    }

    int64_t columnInt64(int col) const { return sqlite3_column_int64(m_stmt, col); }
    std::string columnText(int col) const { return safeColumnText(m_stmt, col); }

private:
    void check(int rc, const char* what) {
        if (rc != SQLITE_OK) {
            throw StoreError(errorMessage(m_db, what), rc);
        }
    }

    sqlite3* m_db;
    sqlite3_stmt* m_stmt = nullptr;
};

/**
 * Transaction rolled back unless committed.
 */
class Transaction {
public:
    Transaction(sqlite3* db, const char* beginSql) : m_db(db) {
        execute(m_db, beginSql);
    }

    ~Transaction() {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        execute(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3* m_db;
    bool m_committed = false;
};

// Retry a whole operation once before surfacing its StoreError
template <typename Fn>
auto retryOnce(const char* operation, Fn&& fn) {
    try {
        return fn();
    } catch (const StoreError& e) {
        DEBUG_LOG("MetadataStore::" << operation << " failed, retrying: " << e.what());
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kOperationRetryDelayMs));
    return fn();
}

std::vector<std::string> loadStrings(sqlite3* db, const char* sql, int64_t fontId) {
    std::vector<std::string> result;
    Statement stmt(db, sql);
    stmt.bind(1, fontId);
    while (stmt.step()) {
        result.push_back(stmt.columnText(0));
    }
    return result;
}

} // anonymous namespace

template <typename Fn>
auto MetadataStore::withReader(Fn&& fn) {
    if (m_readers.empty()) {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        return fn(m_writer);
    }

    struct Lease {
        MetadataStore& store;
        sqlite3* db;
        ~Lease() { store.releaseReader(db); }
    } lease{*this, acquireReader()};
    return fn(lease.db);
}

template <typename Fn>
auto MetadataStore::withWriter(Fn&& fn) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return fn(m_writer);
}

MetadataStore::MetadataStore(const std::filesystem::path& dbPath, size_t readConnections)
    : m_dbPath(dbPath), m_inMemory(dbPath == ":memory:") {
    try {
        openWriter();
        init();
        if (!m_inMemory) {
            openReaders(readConnections);
        }
    } catch (...) {
        closeAll();
        throw;
    }
    DEBUG_LOG("Metadata store opened: " << m_dbPath << " (" << m_readers.size() << " readers)");
}

MetadataStore::~MetadataStore() {
    closeAll();
}

void MetadataStore::openWriter() {
    if (!m_inMemory && m_dbPath.has_parent_path()) {
        // Create parent directory if it doesn't exist
        std::error_code ec;
        std::filesystem::create_directories(m_dbPath.parent_path(), ec);
    }

    int rc = sqlite3_open_v2(m_dbPath.string().c_str(), &m_writer,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = errorMessage(m_writer, "cannot open " + m_dbPath.string());
        sqlite3_close(m_writer);
        m_writer = nullptr;
        throw StoreError(message, rc);
    }

    sqlite3_busy_handler(m_writer, busyHandler, nullptr);

    // The first statement touches the file header; a non-database fails here with SQLITE_NOTADB
    if (!m_inMemory) {
        execute(m_writer, "PRAGMA journal_mode = WAL;");
        execute(m_writer, "PRAGMA synchronous = NORMAL;");
    }
    execute(m_writer, "PRAGMA foreign_keys = ON;");
}

void MetadataStore::openReaders(size_t count) {
    for (size_t i = 0; i < count; ++i) {
        sqlite3* db = nullptr;
        int rc = sqlite3_open_v2(m_dbPath.string().c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
        if (rc != SQLITE_OK) {
            std::string message = errorMessage(db, "cannot open reader for " + m_dbPath.string());
            sqlite3_close(db);
            throw StoreError(message, rc);
        }
        sqlite3_busy_handler(db, busyHandler, nullptr);
        m_readers.push_back(db);
    }
    m_idleReaders = m_readers;
}

void MetadataStore::closeAll() {
    for (sqlite3* db : m_readers) {
        sqlite3_close(db);
    }
    m_readers.clear();
    m_idleReaders.clear();

    if (m_writer) {
        sqlite3_close(m_writer);
        m_writer = nullptr;
        DEBUG_LOG("Metadata store closed");
    }
}

sqlite3* MetadataStore::acquireReader() {
    std::unique_lock<std::mutex> lock(m_readMutex);
    m_readerAvailable.wait(lock, [this] { return !m_idleReaders.empty(); });
    sqlite3* db = m_idleReaders.back();
    m_idleReaders.pop_back();
    return db;
}

void MetadataStore::releaseReader(sqlite3* db) {
    {
        std::lock_guard<std::mutex> lock(m_readMutex);
        m_idleReaders.push_back(db);
    }
    m_readerAvailable.notify_one();
}

void MetadataStore::init() {
    withWriter([this](sqlite3* db) {
        int version = 0;
        {
            Statement stmt(db, "PRAGMA user_version;");
            if (stmt.step()) {
                version = static_cast<int>(stmt.columnInt64(0));
            }
        }

        Transaction tx(db, "BEGIN IMMEDIATE;");

        if (version != kSchemaVersion) {
            if (version != 0) {
                WARN_LOG("Cache schema version " << version << " in " << m_dbPath
                         << " is not supported, rebuilding the cache");
            }
            // Tables of an older or foreign layout are discarded; the cache is disposable
            execute(db, "DROP TABLE IF EXISTS font_tags;");
            execute(db, "DROP TABLE IF EXISTS codepoints;");
            execute(db, "DROP TABLE IF EXISTS names;");
            execute(db, "DROP TABLE IF EXISTS fonts;");
        }

        execute(db, R"(
            CREATE TABLE IF NOT EXISTS fonts (
                font_id INTEGER PRIMARY KEY,
                path TEXT UNIQUE NOT NULL,
                mtime INTEGER NOT NULL,
                size INTEGER NOT NULL
            );
        )");

        execute(db, R"(
            CREATE TABLE IF NOT EXISTS font_tags (
                font_id INTEGER NOT NULL,
                category TEXT NOT NULL,
                tag TEXT NOT NULL,
                PRIMARY KEY (font_id, category, tag),
                FOREIGN KEY (font_id) REFERENCES fonts(font_id) ON DELETE CASCADE
            );
        )");

        execute(db, R"(
            CREATE TABLE IF NOT EXISTS codepoints (
                font_id INTEGER NOT NULL,
                codepoint INTEGER NOT NULL,
                PRIMARY KEY (font_id, codepoint),
                FOREIGN KEY (font_id) REFERENCES fonts(font_id) ON DELETE CASCADE
            ) WITHOUT ROWID;
        )");

        execute(db, R"(
            CREATE TABLE IF NOT EXISTS names (
                font_id INTEGER NOT NULL,
                name TEXT NOT NULL,
                PRIMARY KEY (font_id, name),
                FOREIGN KEY (font_id) REFERENCES fonts(font_id) ON DELETE CASCADE
            );
        )");

        // Create indexes for performance
        execute(db, "CREATE INDEX IF NOT EXISTS idx_font_tags_tag ON font_tags(category, tag);");
        execute(db, "CREATE INDEX IF NOT EXISTS idx_codepoints_codepoint ON codepoints(codepoint);");

        execute(db, ("PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";").c_str());
        tx.commit();
    });
}

// === Writes ===

void MetadataStore::upsert(const std::string& path, const FileStamp& stamp, const FontMetadata& metadata) {
    SCOPED_TIMER("MetadataStore::upsert");

    retryOnce("upsert", [&] {
        withWriter([&](sqlite3* db) {
            Transaction tx(db, "BEGIN IMMEDIATE;");

            {
                Statement remove(db, "DELETE FROM fonts WHERE path = ?;");
                remove.bind(1, path);
                remove.step();
            }

            int64_t fontId = 0;
            {
                Statement insert(db, "INSERT INTO fonts (path, mtime, size) VALUES (?, ?, ?);");
                insert.bind(1, path);
                insert.bind(2, stamp.mtime);
                insert.bind(3, stamp.size);
                insert.step();
                fontId = sqlite3_last_insert_rowid(db);
            }

            {
                Statement insert(db, "INSERT INTO font_tags (font_id, category, tag) VALUES (?, ?, ?);");
                auto insertTags = [&](TagCategory category, const std::set<std::string>& tags) {
                    for (const auto& tag : tags) {
                        insert.bind(1, fontId);
                        insert.bind(2, std::string(categoryName(category)));
                        insert.bind(3, tag);
                        insert.step();
                        insert.reset();
                    }
                };
                insertTags(TagCategory::Axis, metadata.axes);
                insertTags(TagCategory::Feature, metadata.features);
                insertTags(TagCategory::Script, metadata.scripts);
                insertTags(TagCategory::Table, metadata.tables);
            }

            {
                Statement insert(db, "INSERT INTO codepoints (font_id, codepoint) VALUES (?, ?);");
                for (uint32_t codepoint : metadata.codepoints) {
                    insert.bind(1, fontId);
                    insert.bind(2, static_cast<int64_t>(codepoint));
                    insert.step();
                    insert.reset();
                }
            }

            {
                Statement insert(db, "INSERT INTO names (font_id, name) VALUES (?, ?);");
                for (const auto& name : metadata.names) {
                    insert.bind(1, fontId);
                    insert.bind(2, name);
                    insert.step();
                    insert.reset();
                }
            }

            tx.commit();
        });
    });
}

bool MetadataStore::remove(const std::string& path) {
    return retryOnce("remove", [&] {
        return withWriter([&](sqlite3* db) {
            Transaction tx(db, "BEGIN IMMEDIATE;");
            Statement stmt(db, "DELETE FROM fonts WHERE path = ?;");
            stmt.bind(1, path);
            stmt.step();
            bool removed = sqlite3_changes(db) > 0;
            tx.commit();
            return removed;
        });
    });
}

int MetadataStore::prune(const std::set<std::string>& existingPaths) {
    SCOPED_TIMER("MetadataStore::prune");

    int removed = retryOnce("prune", [&] {
        return withWriter([&](sqlite3* db) {
            Transaction tx(db, "BEGIN IMMEDIATE;");

            execute(db, "CREATE TEMP TABLE IF NOT EXISTS seen_paths (path TEXT PRIMARY KEY);");
            execute(db, "DELETE FROM seen_paths;");

            {
                Statement insert(db, "INSERT OR IGNORE INTO seen_paths (path) VALUES (?);");
                for (const auto& path : existingPaths) {
                    insert.bind(1, path);
                    insert.step();
                    insert.reset();
                }
            }

            execute(db, "DELETE FROM fonts WHERE path NOT IN (SELECT path FROM seen_paths);");
            int changes = sqlite3_changes(db);

            execute(db, "DELETE FROM seen_paths;");
            tx.commit();
            return changes;
        });
    });

    DEBUG_LOG("Pruned " << removed << " cache records");
    return removed;
}

int MetadataStore::removeMissingFiles() {
    std::vector<std::string> pathsToRemove;
    for (const auto& path : allPaths()) {
        std::error_code ec;
        if (!path.empty() && !std::filesystem::exists(path, ec) && !ec) {
            pathsToRemove.push_back(path);
        }
    }

    if (pathsToRemove.empty()) {
        return 0;
    }

    retryOnce("removeMissingFiles", [&] {
        withWriter([&](sqlite3* db) {
            Transaction tx(db, "BEGIN IMMEDIATE;");
            Statement remove(db, "DELETE FROM fonts WHERE path = ?;");
            for (const auto& path : pathsToRemove) {
                remove.bind(1, path);
                remove.step();
                remove.reset();
            }
            tx.commit();
        });
    });

    return static_cast<int>(pathsToRemove.size());
}

// === Reads ===

bool MetadataStore::needsUpdate(const std::string& path, const FileStamp& stamp) {
    return retryOnce("needsUpdate", [&] {
        return withReader([&](sqlite3* db) {
            Statement stmt(db, "SELECT mtime, size FROM fonts WHERE path = ?;");
            stmt.bind(1, path);
            if (!stmt.step()) {
                return true;
            }
            return stmt.columnInt64(0) != stamp.mtime || stmt.columnInt64(1) != stamp.size;
        });
    });
}

std::vector<std::string> MetadataStore::runQuery(sqlite3* db, const CriteriaSet& criteria,
                                                 const std::optional<std::string>& restrictToPath) {
    QueryPlan plan = QueryPlanner::plan(criteria, restrictToPath);

    // One read transaction so candidates and their names come from the same snapshot
    Transaction tx(db, "BEGIN;");

    std::vector<std::string> candidates;
    {
        Statement stmt(db, plan.sql());
        auto params = plan.parameters();
        for (size_t i = 0; i < params.size(); ++i) {
            stmt.bind(static_cast<int>(i + 1), params[i]);
        }
        while (stmt.step()) {
            candidates.push_back(stmt.columnText(0));
        }
    }

    if (criteria.namePatterns.empty()) {
        tx.commit();
        return candidates;
    }

    std::vector<std::string> result;
    Statement names(db, "SELECT n.name FROM names n JOIN fonts f ON f.font_id = n.font_id WHERE f.path = ?;");
    for (const auto& candidate : candidates) {
        std::set<std::string> candidateNames;
        names.bind(1, candidate);
        while (names.step()) {
            candidateNames.insert(names.columnText(0));
        }
        names.reset();

        if (criteria.matchesNames(candidateNames)) {
            result.push_back(candidate);
        }
    }
    tx.commit();
    return result;
}

std::vector<std::string> MetadataStore::query(const CriteriaSet& criteria) {
    SCOPED_TIMER("MetadataStore::query");
    return retryOnce("query", [&] {
        return withReader([&](sqlite3* db) {
            return runQuery(db, criteria, std::nullopt);
        });
    });
}

bool MetadataStore::matches(const std::string& path, const CriteriaSet& criteria) {
    return retryOnce("matches", [&] {
        return withReader([&](sqlite3* db) {
            return !runQuery(db, criteria, path).empty();
        });
    });
}

std::optional<FontRecord> MetadataStore::fetch(const std::string& path) {
    return retryOnce("fetch", [&] {
        return withReader([&](sqlite3* db) -> std::optional<FontRecord> {
            Transaction tx(db, "BEGIN;");

            FontRecord record;
            int64_t fontId = 0;
            {
                Statement stmt(db, "SELECT font_id, mtime, size FROM fonts WHERE path = ?;");
                stmt.bind(1, path);
                if (!stmt.step()) {
                    tx.commit();
                    return std::nullopt;
                }
                fontId = stmt.columnInt64(0);
                record.path = path;
                record.stamp.mtime = stmt.columnInt64(1);
                record.stamp.size = stmt.columnInt64(2);
            }

            {
                Statement stmt(db, "SELECT category, tag FROM font_tags WHERE font_id = ?;");
                stmt.bind(1, fontId);
                while (stmt.step()) {
                    std::string category = stmt.columnText(0);
                    std::string tag = stmt.columnText(1);
                    if (category == categoryName(TagCategory::Axis)) {
                        record.metadata.axes.insert(tag);
                    } else if (category == categoryName(TagCategory::Feature)) {
                        record.metadata.features.insert(tag);
                    } else if (category == categoryName(TagCategory::Script)) {
                        record.metadata.scripts.insert(tag);
                    } else if (category == categoryName(TagCategory::Table)) {
                        record.metadata.tables.insert(tag);
                    }
                }
            }

            {
                Statement stmt(db, "SELECT codepoint FROM codepoints WHERE font_id = ? ORDER BY codepoint;");
                stmt.bind(1, fontId);
                while (stmt.step()) {
                    record.metadata.codepoints.insert(record.metadata.codepoints.end(),
                                                      static_cast<uint32_t>(stmt.columnInt64(0)));
                }
            }

            for (auto& name : loadStrings(db, "SELECT name FROM names WHERE font_id = ?;", fontId)) {
                record.metadata.names.insert(std::move(name));
            }

            tx.commit();
            return record;
        });
    });
}

std::vector<std::string> MetadataStore::allPaths() {
    return retryOnce("allPaths", [&] {
        return withReader([&](sqlite3* db) {
            std::vector<std::string> result;
            Statement stmt(db, "SELECT path FROM fonts ORDER BY path;");
            while (stmt.step()) {
                result.push_back(stmt.columnText(0));
            }
            return result;
        });
    });
}

int64_t MetadataStore::count() {
    return retryOnce("count", [&] {
        return withReader([&](sqlite3* db) {
            Statement stmt(db, "SELECT COUNT(*) FROM fonts;");
            return stmt.step() ? stmt.columnInt64(0) : int64_t{0};
        });
    });
}

} // namespace FontGrep
