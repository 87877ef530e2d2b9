#include "criteria.hpp"
#include "debug.hpp"
#include "errors.hpp"
#include "file_utils.hpp"
#include "font_parser.hpp"
#include "font_report.hpp"
#include "metadata_store.hpp"
#include "result_sink.hpp"
#include "scan_coordinator.hpp"
#include <getopt.h>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

constexpr int kExitRuntimeError = 1;
constexpr int kExitUsageError = 2;

enum LongOnlyOption {
    kOptionForce = 1000,
    kOptionClean,
    kOptionList,
    kOptionInfo,
    kOptionDetailed
};

struct CliOptions {
    FontGrep::CriteriaSet criteria;
    FontGrep::ScanOptions scan;
    std::optional<std::string> cacheArgument;
    std::optional<std::string> infoPath;
    bool detailed = false;
    bool list = false;
    bool clean = false;
    bool verbose = false;
};

void printHelp(std::ostream& out) {
    out << "Usage: fontgrep [options] [PATH...]\n";
    out << "\nSearch font files by OpenType metadata. PATH defaults to the current directory.\n";
    out << "\nCriteria (all must match):\n";
    out << "  -a, --axis TAG          Variation axis, e.g. wght (comma separated, repeatable)\n";
    out << "  -f, --feature TAG       OpenType feature, e.g. smcp\n";
    out << "  -s, --script TAG        OpenType script, e.g. cyrl\n";
    out << "  -T, --table TAG         Font table, e.g. COLR\n";
    out << "  -u, --unicode RANGES    Codepoints, e.g. U+0041-005A,20AC (one set per option)\n";
    out << "  -t, --text TEXT         Every character of TEXT (one set per option)\n";
    out << "  -n, --name REGEX        Case-insensitive pattern matched against name table strings\n";
    out << "  -V, --variable          Only variable fonts\n";
    out << "\nCache:\n";
    out << "  -c, --cache TARGET      Directory: scan and update TARGET/fontcache.db\n";
    out << "                          Existing file: answer from that database only\n";
    out << "                          Empty string: " << FontGrep::defaultCacheDirectory().string() << "\n";
    out << "      --force             Re-parse every file even if the cache is current\n";
    out << "      --clean             Drop cached records of deleted files and exit\n";
    out << "      --list              Print every cached font path and exit\n";
    out << "\nInspection:\n";
    out << "      --info FILE         Print the names and variable flag of one font and exit\n";
    out << "      --detailed          With --info, also print axes, features, scripts, tables and charset\n";
    out << "\nGeneral:\n";
    out << "  -j, --jobs N            Worker threads (default: number of CPUs)\n";
    out << "  -v, --verbose           Log progress to stderr\n";
    out << "  -h, --help              Show this help\n";
    out << "\nExamples:\n";
    out << "  fontgrep -a wght -f smcp /usr/share/fonts\n";
    out << "  fontgrep -c '' -t 'Ωμέγα' ~/fonts\n";
    out << "  fontgrep -c ~/.local/share/fontgrep/fontcache.db -V\n";
    out << "  fontgrep --info MyFont.otf --detailed\n";
}

unsigned parseJobs(const std::string& text) {
    try {
        size_t consumed = 0;
        long value = std::stol(text, &consumed);
        if (consumed == text.size() && value > 0 && value <= 1024) {
            return static_cast<unsigned>(value);
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    throw FontGrep::ConfigError("invalid job count '" + text + "'");
}

// Returns std::nullopt when help was requested
std::optional<CliOptions> parseArgs(int argc, char* argv[]) {
    CliOptions opts;

    static struct option longOptions[] = {{"axis", required_argument, nullptr, 'a'},
                                          {"feature", required_argument, nullptr, 'f'},
                                          {"script", required_argument, nullptr, 's'},
                                          {"table", required_argument, nullptr, 'T'},
                                          {"unicode", required_argument, nullptr, 'u'},
                                          {"text", required_argument, nullptr, 't'},
                                          {"name", required_argument, nullptr, 'n'},
                                          {"variable", no_argument, nullptr, 'V'},
                                          {"cache", required_argument, nullptr, 'c'},
                                          {"force", no_argument, nullptr, kOptionForce},
                                          {"clean", no_argument, nullptr, kOptionClean},
                                          {"list", no_argument, nullptr, kOptionList},
                                          {"info", required_argument, nullptr, kOptionInfo},
                                          {"detailed", no_argument, nullptr, kOptionDetailed},
                                          {"jobs", required_argument, nullptr, 'j'},
                                          {"verbose", no_argument, nullptr, 'v'},
                                          {"help", no_argument, nullptr, 'h'},
                                          {nullptr, 0, nullptr, 0}};

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "a:f:s:T:u:t:n:Vc:j:vh", longOptions, &optionIndex)) != -1) {
        switch (opt) {
        case 'a':
            opts.criteria.addTags(FontGrep::TagCategory::Axis, optarg);
            break;
        case 'f':
            opts.criteria.addTags(FontGrep::TagCategory::Feature, optarg);
            break;
        case 's':
            opts.criteria.addTags(FontGrep::TagCategory::Script, optarg);
            break;
        case 'T':
            opts.criteria.addTags(FontGrep::TagCategory::Table, optarg);
            break;
        case 'u':
            opts.criteria.addCodepointRanges(optarg);
            break;
        case 't':
            opts.criteria.addText(optarg);
            break;
        case 'n':
            opts.criteria.addNamePattern(optarg);
            break;
        case 'V':
            opts.criteria.variableOnly = true;
            break;
        case 'c':
            opts.cacheArgument = optarg;
            break;
        case kOptionForce:
            opts.scan.force = true;
            break;
        case kOptionClean:
            opts.clean = true;
            break;
        case kOptionList:
            opts.list = true;
            break;
        case kOptionInfo:
            opts.infoPath = optarg;
            break;
        case kOptionDetailed:
            opts.detailed = true;
            break;
        case 'j':
            opts.scan.jobs = parseJobs(optarg);
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'h':
            printHelp(std::cout);
            return std::nullopt;
        default:
            throw FontGrep::ConfigError("unrecognised option, see --help");
        }
    }

    while (optind < argc) {
        opts.scan.roots.emplace_back(argv[optind]);
        optind++;
    }
    if (opts.scan.roots.empty()) {
        opts.scan.roots.emplace_back(".");
    }

    return opts;
}

std::filesystem::path resolveCacheTarget(const std::string& argument) {
    if (argument.empty()) {
        auto directory = FontGrep::defaultCacheDirectory();
        std::filesystem::create_directories(directory);
        return directory;
    }

    // A trailing separator asks for a cache directory, created on demand
    std::filesystem::path target(argument);
    if (argument.back() == '/' && !std::filesystem::exists(target)) {
        std::filesystem::create_directories(target);
    }
    return target;
}

int cleanCache(const std::filesystem::path& target) {
    auto dbPath = FontGrep::existingDatabasePath(target);
    FontGrep::MetadataStore store(dbPath, 1);
    int removed = store.removeMissingFiles();
    std::cerr << "Removed " << removed << " records of missing files from " << dbPath.string() << "\n";
    return 0;
}

int listCache(const std::filesystem::path& target) {
    FontGrep::MetadataStore store(FontGrep::existingDatabasePath(target), 1);
    FontGrep::StreamSink sink(std::cout);
    size_t listed = FontGrep::listCachedFonts(store, sink);
    DEBUG_LOG("Listed " << listed << " cached fonts");
    return 0;
}

int showInfo(const std::string& path, bool detailed) {
    FontGrep::FreeTypeExtractor extractor;
    auto font = extractor.parse(FontGrep::readFileBytes(path));
    FontGrep::writeFontInfo(std::cout, *font, detailed);
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        auto cli = parseArgs(argc, argv);
        if (!cli) {
            return 0;
        }

        FontGrep::setVerboseLogging(cli->verbose);
        DEBUG_LOG("=== fontgrep starting ===");
        DEBUG_LOG("PID: " << getpid());

        if (cli->infoPath) {
            return showInfo(*cli->infoPath, cli->detailed);
        }

        if (cli->cacheArgument) {
            cli->scan.cacheTarget = resolveCacheTarget(*cli->cacheArgument);
        }

        if (cli->clean) {
            return cleanCache(cli->scan.cacheTarget.value_or(FontGrep::defaultCacheDirectory()));
        }
        if (cli->list) {
            return listCache(cli->scan.cacheTarget.value_or(FontGrep::defaultCacheDirectory()));
        }

        FontGrep::ScanCoordinator coordinator(cli->scan);
        FontGrep::StreamSink sink(std::cout);
        auto summary = coordinator.run(cli->criteria, sink);

        DEBUG_LOG("=== fontgrep done: " << summary.matched << " matches ===");
        return 0;
    } catch (const FontGrep::InvalidCriteriaError& e) {
        std::cerr << "fontgrep: " << e.what() << "\n";
        return kExitUsageError;
    } catch (const FontGrep::ConfigError& e) {
        std::cerr << "fontgrep: " << e.what() << "\n";
        return kExitUsageError;
    } catch (const std::exception& e) {
        std::cerr << "fontgrep: " << e.what() << "\n";
        DEBUG_LOG("FATAL EXCEPTION: " << e.what());
        return kExitRuntimeError;
    }
}
