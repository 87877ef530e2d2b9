#include "scan_coordinator.hpp"
#include "debug.hpp"
#include "errors.hpp"
#include "file_utils.hpp"
#include "match_pipeline.hpp"
#include "metadata_store.hpp"
#include "work_queue.hpp"
#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>

namespace FontGrep {

namespace {

constexpr size_t kQueueSlotsPerWorker = 4;
constexpr size_t kUpdateQueueCapacity = 64;

std::filesystem::path normalizeRoot(const std::filesystem::path& root) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(root, ec);
    return (ec ? root : absolute).lexically_normal();
}

} // anonymous namespace

struct ScanCoordinator::PendingUpdate {
    std::string path;
    FileStamp stamp;
    std::optional<FontMetadata> metadata;   ///< nullopt drops the record
};

const char* scanModeName(ScanMode mode) {
    switch (mode) {
        case ScanMode::Direct: return "direct";
        case ScanMode::ScanAndUpdate: return "scan-and-update";
        case ScanMode::QueryOnly: return "query-only";
    }
    return "unknown";
}

ScanCoordinator::ScanCoordinator(ScanOptions options, ExtractorFactory factory)
    : m_options(std::move(options)),
      m_factory(std::move(factory)),
      m_mode(selectMode(m_options.cacheTarget)) {
    if (!m_factory) {
        m_factory = [] { return std::make_unique<FreeTypeExtractor>(); };
    }

    if (m_mode == ScanMode::ScanAndUpdate) {
        m_databasePath = *m_options.cacheTarget / MetadataStore::kDatabaseFileName;
    } else if (m_mode == ScanMode::QueryOnly) {
        m_databasePath = *m_options.cacheTarget;
    }

    for (auto& root : m_options.roots) {
        root = normalizeRoot(root);
    }
}

ScanCoordinator::~ScanCoordinator() = default;

ScanMode ScanCoordinator::selectMode(const std::optional<std::filesystem::path>& cacheTarget) {
    if (!cacheTarget) {
        return ScanMode::Direct;
    }

    std::error_code ec;
    auto status = std::filesystem::status(*cacheTarget, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw ConfigError("cache target " + cacheTarget->string() + " does not exist");
    }
    return std::filesystem::is_directory(status) ? ScanMode::ScanAndUpdate : ScanMode::QueryOnly;
}

unsigned ScanCoordinator::workerCount() const {
    if (m_options.jobs > 0) {
        return m_options.jobs;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

ScanSummary ScanCoordinator::run(const CriteriaSet& criteria, ResultSink& sink) {
    m_counters.filesSeen = 0;
    m_counters.parsed = 0;
    m_counters.cached = 0;
    m_counters.matched = 0;
    m_counters.skipped = 0;
    m_counters.storeFailures = 0;

    DEBUG_LOG("Starting " << scanModeName(m_mode) << " run with " << m_options.roots.size() << " roots");

    ScanSummary summary;
    switch (m_mode) {
        case ScanMode::Direct:
            summary = runWalk(criteria, sink, nullptr);
            break;
        case ScanMode::ScanAndUpdate: {
            MetadataStore store(m_databasePath, workerCount());
            summary = runWalk(criteria, sink, &store);
            break;
        }
        case ScanMode::QueryOnly:
            summary = runQueryOnly(criteria, sink);
            break;
    }

    sink.flush();

    DEBUG_LOG("Run finished: seen=" << summary.filesSeen << " parsed=" << summary.parsed
              << " cached=" << summary.cached << " matched=" << summary.matched
              << " skipped=" << summary.skipped << " storeFailures=" << summary.storeFailures
              << " pruned=" << summary.pruned);
    return summary;
}

ScanSummary ScanCoordinator::runQueryOnly(const CriteriaSet& criteria, ResultSink& sink) {
    MetadataStore store(m_databasePath, 1);

    ScanSummary summary;
    for (const auto& path : store.query(criteria)) {
        sink.emit(path);
        ++summary.matched;
    }
    return summary;
}

ScanSummary ScanCoordinator::runWalk(const CriteriaSet& criteria, ResultSink& sink, MetadataStore* store) {
    SCOPED_TIMER_THRESHOLD("ScanCoordinator::runWalk", 1000);

    unsigned jobs = workerCount();
    WorkQueue<std::filesystem::path> files(jobs * kQueueSlotsPerWorker);
    WorkQueue<PendingUpdate> updates(kUpdateQueueCapacity);

    // A fatal error in any thread stops the walk; it is rethrown after all threads are joined
    std::mutex errorMutex;
    std::exception_ptr firstError;
    auto recordError = [&](std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(errorMutex);
            if (!firstError) firstError = error;
        }
        files.close();
    };

    std::jthread writer;
    if (store) {
        writer = std::jthread([this, store, &updates]() {
            while (auto update = updates.pop()) {
                try {
                    if (update->metadata) {
                        store->upsert(update->path, update->stamp, *update->metadata);
                    } else if (store->remove(update->path)) {
                        DEBUG_LOG("Dropped cache record of unreadable file " << update->path);
                    }
                } catch (const std::exception& e) {
                    // Keep draining so that workers never block on a full queue
                    WARN_LOG("Could not update cache for " << update->path << ": " << e.what());
                    ++m_counters.storeFailures;
                }
            }
        });
    }

    std::vector<std::jthread> workers;
    workers.reserve(jobs);
    for (unsigned i = 0; i < jobs; ++i) {
        workers.emplace_back([&, store]() {
            try {
                auto extractor = m_factory();
                while (auto path = files.pop()) {
                    processFile(*path, *extractor, criteria, sink, store, store ? &updates : nullptr);
                }
            } catch (const std::exception& e) {
                DEBUG_LOG("Worker stopped: " << e.what());
                recordError(std::current_exception());
            }
        });
    }

    std::set<std::string> observed;
    bool walkComplete = true;
    try {
        for (const auto& root : m_options.roots) {
            walkComplete = walkRoot(root, files, observed) && walkComplete;
        }
    } catch (const std::exception& e) {
        DEBUG_LOG("Walk stopped: " << e.what());
        recordError(std::current_exception());
    }

    files.close();
    workers.clear();    // joins
    updates.close();
    if (writer.joinable()) {
        writer.join();
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }

    ScanSummary summary;
    if (store && !walkComplete) {
        WARN_LOG("Not every root could be walked, keeping cached records of unseen files");
    } else if (store) {
        try {
            summary.pruned = store->prune(observed);
        } catch (const StoreError& e) {
            WARN_LOG("Could not prune cache: " << e.what());
            ++m_counters.storeFailures;
        }
    }

    summary.filesSeen = m_counters.filesSeen;
    summary.parsed = m_counters.parsed;
    summary.cached = m_counters.cached;
    summary.matched = m_counters.matched;
    summary.skipped = m_counters.skipped;
    summary.storeFailures = m_counters.storeFailures;
    return summary;
}

bool ScanCoordinator::walkRoot(const std::filesystem::path& root,
                               WorkQueue<std::filesystem::path>& files,
                               std::set<std::string>& observed) {
    // Roots named explicitly are followed even when they are symlinks
    std::error_code ec;
    auto rootStatus = std::filesystem::status(root, ec);
    if (ec || !std::filesystem::exists(rootStatus)) {
        WARN_LOG("Skipping " << root.string() << ": " << (ec ? ec.message() : "no such file or directory"));
        return false;
    }

    if (std::filesystem::is_regular_file(rootStatus)) {
        if (isFontFile(root)) {
            enqueue(root, files, observed);
        }
        return true;
    }

    if (!std::filesystem::is_directory(rootStatus)) {
        return true;
    }

    bool complete = true;
    std::vector<std::filesystem::path> pending{root};
    while (!pending.empty()) {
        auto directory = std::move(pending.back());
        pending.pop_back();

        std::filesystem::directory_iterator it(directory, ec);
        if (ec) {
            WARN_LOG("Cannot read directory " << directory.string() << ": " << ec.message());
            ec.clear();
            complete = false;
            continue;
        }

        // Sorted per directory so that discovery order is stable between runs
        std::vector<std::filesystem::path> fontFiles;
        std::vector<std::filesystem::path> subdirectories;
        for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (ec) break;

            std::error_code entryEc;
            auto status = it->symlink_status(entryEc);
            if (entryEc || std::filesystem::is_symlink(status)) {
                continue;
            }

            if (std::filesystem::is_directory(status)) {
                subdirectories.push_back(it->path());
            } else if (std::filesystem::is_regular_file(status) && isFontFile(it->path())) {
                fontFiles.push_back(it->path());
            }
        }
        if (ec) {
            WARN_LOG("Error while reading " << directory.string() << ": " << ec.message());
            ec.clear();
            complete = false;
        }

        std::sort(fontFiles.begin(), fontFiles.end());
        for (const auto& path : fontFiles) {
            if (!enqueue(path, files, observed)) {
                return false;
            }
        }

        std::sort(subdirectories.begin(), subdirectories.end());
        for (auto sub = subdirectories.rbegin(); sub != subdirectories.rend(); ++sub) {
            pending.push_back(std::move(*sub));
        }
    }
    return complete;
}

bool ScanCoordinator::enqueue(const std::filesystem::path& path,
                              WorkQueue<std::filesystem::path>& files,
                              std::set<std::string>& observed) {
    if (!observed.insert(path.string()).second) {
        return true;    // reached twice through overlapping roots
    }
    ++m_counters.filesSeen;
    return files.push(path);
}

void ScanCoordinator::processFile(const std::filesystem::path& path, FontExtractor& extractor,
                                  const CriteriaSet& criteria, ResultSink& sink,
                                  MetadataStore* store, WorkQueue<PendingUpdate>* updates) {
    MatchPipeline pipeline(criteria);
    std::string pathStr = path.string();

    // A file that cannot be read or parsed loses its cached record
    auto skip = [&]() {
        ++m_counters.skipped;
        if (updates && !updates->push(PendingUpdate{pathStr, FileStamp{}, std::nullopt})) {
            DEBUG_LOG("Update queue closed, not dropping " << pathStr);
        }
    };

    FileStamp stamp;
    try {
        stamp = readFileStamp(path);
    } catch (const IoError& e) {
        DEBUG_LOG("Skipping unreadable file: " << e.what());
        skip();
        return;
    }

    if (store && !m_options.force) {
        try {
            if (!store->needsUpdate(pathStr, stamp)) {
                ++m_counters.cached;
                if (store->matches(pathStr, criteria)) {
                    ++m_counters.matched;
                    sink.emit(pathStr);
                }
                return;
            }
        } catch (const StoreError& e) {
            // Fall back to parsing the file
            WARN_LOG("Cache lookup failed for " << pathStr << ": " << e.what());
            ++m_counters.storeFailures;
        }
    }

    std::unique_ptr<ParsedFont> font;
    try {
        SCOPED_TIMER("parse font");
        font = extractor.parse(readFileBytes(path));
    } catch (const IoError& e) {
        DEBUG_LOG("Skipping unreadable file: " << e.what());
        skip();
        return;
    } catch (const FontParseError& e) {
        DEBUG_LOG("Skipping " << pathStr << " ("
                  << (e.kind() == FontParseError::Kind::NotAFont ? "not a font" : "corrupt")
                  << "): " << e.what());
        skip();
        return;
    }
    ++m_counters.parsed;

    if (updates) {
        // The cache needs the full record, codepoints included
        PendingUpdate update{pathStr, stamp, font->metadata()};
        if (!updates->push(std::move(update))) {
            DEBUG_LOG("Update queue closed, not caching " << pathStr);
        }
    }

    if (pipeline.matches(*font)) {
        ++m_counters.matched;
        sink.emit(pathStr);
    }
}

} // namespace FontGrep
