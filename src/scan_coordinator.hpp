/**
 * @file scan_coordinator.hpp
 * @brief Drives directory walks, parsing, caching and matching.
 */

#pragma once

#include "criteria.hpp"
#include "font_parser.hpp"
#include "result_sink.hpp"
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace FontGrep {

class MetadataStore;

template <typename T>
class WorkQueue;

/**
 * @brief How a run obtains font metadata.
 */
enum class ScanMode {
    Direct,         ///< Walk and parse every file, no cache
    ScanAndUpdate,  ///< Walk, parse stale files and refresh the cache
    QueryOnly       ///< Answer from the cache without touching the filesystem
};

const char* scanModeName(ScanMode mode);

/**
 * @brief Configuration of one run.
 */
struct ScanOptions {
    std::vector<std::filesystem::path> roots;               ///< Files or directories to search
    std::optional<std::filesystem::path> cacheTarget;       ///< Cache directory or database file
    unsigned jobs = 0;                                      ///< Worker threads (0 = hardware concurrency)
    bool force = false;                                     ///< Re-parse even up-to-date files
};

/**
 * @brief Counters reported at the end of a run.
 */
struct ScanSummary {
    size_t filesSeen = 0;       ///< Font-like files found by the walk
    size_t parsed = 0;          ///< Files parsed from disk
    size_t cached = 0;          ///< Files answered from the cache
    size_t matched = 0;         ///< Paths emitted to the sink
    size_t skipped = 0;         ///< Unreadable or unparsable files
    size_t storeFailures = 0;   ///< Failed cache writes and reads
    int pruned = 0;             ///< Records removed for vanished files
};

/// Creates one extractor per worker thread
using ExtractorFactory = std::function<std::unique_ptr<FontExtractor>()>;

/**
 * @brief Runs a search in one of the three scan modes.
 *
 * The mode follows from the cache target:
 * - none: Direct
 * - an existing directory: ScanAndUpdate on `<dir>/fontcache.db`
 * - an existing file: QueryOnly
 * - a missing path: ConfigError from the constructor
 *
 * In the walking modes the calling thread traverses the roots (symlinks
 * found during the walk are not followed) and feeds a bounded queue read
 * by a fixed pool of worker threads. Each worker owns its extractor. With
 * a cache, all writes go through one writer thread draining a second
 * queue; after the walk and the writer are done, records of files that
 * were not seen are pruned. The prune is skipped when a root or one of its
 * directories could not be read.
 *
 * A file that cannot be read or parsed is logged, skipped and dropped from
 * the cache. A failed cache write leaves that record unchanged; the match
 * computed from the freshly parsed font is still reported.
 *
 * @par Usage Example:
 * @code
 * ScanOptions options;
 * options.roots = {"/usr/share/fonts"};
 * options.cacheTarget = defaultCacheDirectory();
 * ScanCoordinator coordinator(options);
 * StreamSink sink(std::cout);
 * ScanSummary summary = coordinator.run(criteria, sink);
 * @endcode
 */
class ScanCoordinator {
public:
    /**
     * @param options Run configuration
     * @param factory Extractor factory; defaults to FreeTypeExtractor
     * @throws ConfigError if the cache target does not exist
     */
    explicit ScanCoordinator(ScanOptions options, ExtractorFactory factory = {});
    ~ScanCoordinator();

    /**
     * @brief Determine the mode for a cache target.
     * @throws ConfigError if the target does not exist
     */
    static ScanMode selectMode(const std::optional<std::filesystem::path>& cacheTarget);

    ScanMode mode() const { return m_mode; }

    /// Database file used by the cache modes (empty in Direct mode)
    const std::filesystem::path& databasePath() const { return m_databasePath; }

    /**
     * @brief Execute the search, emitting matching paths to the sink.
     * @throws StoreError if the cache cannot be opened or queried
     */
    ScanSummary run(const CriteriaSet& criteria, ResultSink& sink);

private:
    struct Counters {
        std::atomic<size_t> filesSeen{0};
        std::atomic<size_t> parsed{0};
        std::atomic<size_t> cached{0};
        std::atomic<size_t> matched{0};
        std::atomic<size_t> skipped{0};
        std::atomic<size_t> storeFailures{0};
    };

    struct PendingUpdate;

    ScanSummary runQueryOnly(const CriteriaSet& criteria, ResultSink& sink);
    ScanSummary runWalk(const CriteriaSet& criteria, ResultSink& sink, MetadataStore* store);

    /// @return false if the root or one of its directories could not be read
    bool walkRoot(const std::filesystem::path& root,
                  WorkQueue<std::filesystem::path>& files,
                  std::set<std::string>& observed);
    bool enqueue(const std::filesystem::path& path,
                 WorkQueue<std::filesystem::path>& files,
                 std::set<std::string>& observed);

    void processFile(const std::filesystem::path& path, FontExtractor& extractor,
                     const CriteriaSet& criteria, ResultSink& sink,
                     MetadataStore* store, WorkQueue<PendingUpdate>* updates);

    unsigned workerCount() const;

    ScanOptions m_options;
    ExtractorFactory m_factory;
    ScanMode m_mode;
    std::filesystem::path m_databasePath;
    Counters m_counters;
};

} // namespace FontGrep
