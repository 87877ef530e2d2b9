/**
 * @file metadata_store.hpp
 * @brief SQLite cache of font metadata keyed by file path.
 */

#pragma once

#include "criteria.hpp"
#include "font_parser.hpp"
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace FontGrep {

/**
 * @brief Persistent metadata cache for font files.
 *
 * Stores one record per font path: the file's modification time and size
 * plus its axis, feature, script, table, codepoint and name sets. Records
 * are replaced atomically; a concurrent reader sees either the complete old
 * or the complete new child rows of a path.
 *
 * Connections are split by capability:
 * - one writer connection, serialized by a mutex, owns every mutation
 * - a pool of read-only connections serves lookups under WAL, so reads are
 *   not blocked by an open write transaction
 *
 * An in-memory database (":memory:") cannot be shared between connections,
 * so there reads go through the writer.
 *
 * Lock contention is retried with bounded exponential backoff; every other
 * failure raises StoreError after one retry of the whole operation.
 *
 * @par Usage Example:
 * @code
 * MetadataStore store(cacheDir / MetadataStore::kDatabaseFileName);
 * if (store.needsUpdate(path, stamp)) {
 *     store.upsert(path, stamp, font->metadata());
 * }
 * for (const auto& match : store.query(criteria)) {
 *     std::cout << match << '\n';
 * }
 * @endcode
 */
class MetadataStore {
public:
    static constexpr const char* kDatabaseFileName = "fontcache.db";  ///< Name inside a cache directory
    static constexpr int kSchemaVersion = 1;                          ///< Stored in PRAGMA user_version

    /**
     * @brief Open (or create) the cache database and initialise its schema.
     * @param dbPath Database file, or ":memory:"
     * @param readConnections Size of the read-only connection pool
     * @throws StoreError if the file cannot be opened or is not a database
     */
    explicit MetadataStore(const std::filesystem::path& dbPath, size_t readConnections = 4);
    ~MetadataStore();

    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    /**
     * @brief Create the schema if missing; rebuild it on a version mismatch.
     *
     * Idempotent. Called by the constructor.
     */
    void init();

    /// @name Writes
    /// @{

    /**
     * @brief Replace the record of a path with new metadata.
     *
     * Old child rows are deleted and new ones inserted in one transaction.
     * On failure the previous record stays intact.
     */
    void upsert(const std::string& path, const FileStamp& stamp, const FontMetadata& metadata);

    /**
     * @brief Delete the record of one path.
     * @return true if a record was removed
     */
    bool remove(const std::string& path);

    /**
     * @brief Delete every record whose path is not in existingPaths.
     * @return Number of removed records
     */
    int prune(const std::set<std::string>& existingPaths);

    /**
     * @brief Delete records whose file no longer exists on disk.
     * @return Number of removed records
     */
    int removeMissingFiles();

    /// @}

    /// @name Reads
    /// @{

    /**
     * @brief Check whether a path has no record or a record with another stamp.
     */
    bool needsUpdate(const std::string& path, const FileStamp& stamp);

    /**
     * @brief Find all cached fonts matching the criteria.
     * @return Matching paths sorted by path
     */
    std::vector<std::string> query(const CriteriaSet& criteria);

    /**
     * @brief Check whether the cached record of one path matches the criteria.
     * @return false if there is no record or it does not match
     */
    bool matches(const std::string& path, const CriteriaSet& criteria);

    /**
     * @brief Reconstruct a full record.
     */
    std::optional<FontRecord> fetch(const std::string& path);

    std::vector<std::string> allPaths();
    int64_t count();

    /// @}

    const std::filesystem::path& path() const { return m_dbPath; }

private:
    void openWriter();
    void openReaders(size_t count);
    void closeAll();

    sqlite3* acquireReader();
    void releaseReader(sqlite3* db);

    template <typename Fn>
    auto withReader(Fn&& fn);

    template <typename Fn>
    auto withWriter(Fn&& fn);

    std::vector<std::string> runQuery(sqlite3* db, const CriteriaSet& criteria,
                                      const std::optional<std::string>& restrictToPath);

    std::filesystem::path m_dbPath;
    bool m_inMemory = false;

    sqlite3* m_writer = nullptr;            ///< Single writer connection
    std::mutex m_writeMutex;                ///< Serializes use of m_writer

    std::vector<sqlite3*> m_readers;        ///< All read-only connections
    std::vector<sqlite3*> m_idleReaders;    ///< Readers not currently leased
    std::mutex m_readMutex;                 ///< Protects m_idleReaders
    std::condition_variable m_readerAvailable;
};

} // namespace FontGrep
