#include "font_report.hpp"
#include "errors.hpp"
#include "metadata_store.hpp"
#include <cstdio>

namespace FontGrep {

namespace {

std::string formatCodepoint(uint32_t codepoint) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04X", codepoint);
    return buffer;
}

void writeList(std::ostream& out, const char* label, const std::set<std::string>& values) {
    out << label << ':';
    const char* separator = " ";
    for (const auto& value : values) {
        out << separator << value;
        separator = ", ";
    }
    out << '\n';
}

} // anonymous namespace

std::string formatCodepointRanges(const std::set<uint32_t>& codepoints) {
    std::string result;
    auto it = codepoints.begin();
    while (it != codepoints.end()) {
        uint32_t first = *it;
        uint32_t last = first;
        for (++it; it != codepoints.end() && *it == last + 1; ++it) {
            last = *it;
        }

        if (!result.empty()) result += ", ";
        result += "U+" + formatCodepoint(first);
        if (last != first) {
            result += "-" + formatCodepoint(last);
        }
    }
    return result;
}

void writeFontInfo(std::ostream& out, ParsedFont& font, bool detailed) {
    writeList(out, "Names", font.names());
    out << "Variable: " << (font.isVariable() ? "true" : "false") << '\n';

    if (!detailed) return;

    writeList(out, "Axes", font.axes());
    writeList(out, "Features", font.features());
    writeList(out, "Scripts", font.scripts());
    writeList(out, "Tables", font.tables());

    std::string charset = formatCodepointRanges(font.codepoints());
    out << "Charset:" << (charset.empty() ? "" : " ") << charset << '\n';
}

size_t listCachedFonts(MetadataStore& store, ResultSink& sink) {
    auto paths = store.allPaths();
    for (const auto& path : paths) {
        sink.emit(path);
    }
    sink.flush();
    return paths.size();
}

std::filesystem::path existingDatabasePath(const std::filesystem::path& cacheTarget) {
    auto dbPath = std::filesystem::is_directory(cacheTarget)
        ? cacheTarget / MetadataStore::kDatabaseFileName
        : cacheTarget;
    if (!std::filesystem::exists(dbPath)) {
        throw ConfigError("no cache database at " + dbPath.string());
    }
    return dbPath;
}

} // namespace FontGrep
