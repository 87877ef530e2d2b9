/**
 * @file test_helpers.hpp
 * @brief Temporary directories and a text-based fake font format for tests.
 */

#pragma once

#include "errors.hpp"
#include "font_parser.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace FontGrep::Test {

/**
 * Unique directory under the system temp path, removed on destruction.
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        auto name = "fontgrep-test-" + std::to_string(rd()) + "-" +
                    std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        m_path = std::filesystem::temp_directory_path() / name;
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::filesystem::path operator/(const std::string& name) const { return m_path / name; }

private:
    std::filesystem::path m_path;
};

inline void writeFile(const std::filesystem::path& path, const std::string& contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

/**
 * Description of a fake font; serialized as a "FAKEFONT" header line
 * followed by key=value lines with '|' separated values.
 */
struct FakeFont {
    std::vector<std::string> axes;
    std::vector<std::string> features;
    std::vector<std::string> scripts;
    std::vector<std::string> tables;
    std::vector<std::string> names;
    std::vector<uint32_t> codepoints;

    std::string serialize() const {
        std::ostringstream out;
        out << "FAKEFONT\n";
        auto writeList = [&out](const char* key, const std::vector<std::string>& values) {
            out << key << '=';
            for (size_t i = 0; i < values.size(); ++i) {
                out << (i ? "|" : "") << values[i];
            }
            out << '\n';
        };
        writeList("axes", axes);
        writeList("features", features);
        writeList("scripts", scripts);
        writeList("tables", tables);
        writeList("names", names);
        out << "codepoints=";
        for (size_t i = 0; i < codepoints.size(); ++i) {
            out << (i ? "|" : "") << std::hex << codepoints[i] << std::dec;
        }
        out << '\n';
        return out.str();
    }
};

inline void writeFakeFont(const std::filesystem::path& path, const FakeFont& font) {
    writeFile(path, font.serialize());
}

/**
 * Extractor for the fake format. Anything without the header is not a
 * font; an unknown key makes the font corrupt.
 */
class FakeExtractor : public FontExtractor {
public:
    explicit FakeExtractor(std::shared_ptr<std::atomic<int>> parseCount = nullptr)
        : m_parseCount(std::move(parseCount)) {}

    std::unique_ptr<ParsedFont> parse(std::vector<uint8_t> bytes) override {
        if (m_parseCount) ++*m_parseCount;

        std::string text(bytes.begin(), bytes.end());
        std::istringstream in(text);
        std::string line;
        if (!std::getline(in, line) || line != "FAKEFONT") {
            throw FontParseError(FontParseError::Kind::NotAFont, "missing FAKEFONT header");
        }

        FontMetadata metadata;
        while (std::getline(in, line)) {
            if (line.empty()) continue;
            auto eq = line.find('=');
            if (eq == std::string::npos) {
                throw FontParseError(FontParseError::Kind::Corrupt, "bad line: " + line);
            }
            std::string key = line.substr(0, eq);
            auto values = split(line.substr(eq + 1));

            if (key == "axes") metadata.axes = padded(values);
            else if (key == "features") metadata.features = padded(values);
            else if (key == "scripts") metadata.scripts = padded(values);
            else if (key == "tables") metadata.tables = padded(values);
            else if (key == "names") metadata.names.insert(values.begin(), values.end());
            else if (key == "codepoints") {
                for (const auto& value : values) {
                    metadata.codepoints.insert(static_cast<uint32_t>(std::stoul(value, nullptr, 16)));
                }
            } else {
                throw FontParseError(FontParseError::Kind::Corrupt, "unknown key: " + key);
            }
        }
        return std::make_unique<MetadataFont>(std::move(metadata));
    }

private:
    static std::vector<std::string> split(const std::string& text) {
        std::vector<std::string> result;
        std::istringstream in(text);
        std::string item;
        while (std::getline(in, item, '|')) {
            if (!item.empty()) result.push_back(item);
        }
        return result;
    }

    static std::set<std::string> padded(const std::vector<std::string>& values) {
        std::set<std::string> result;
        for (auto value : values) {
            value.resize(4, ' ');
            result.insert(value);
        }
        return result;
    }

    std::shared_ptr<std::atomic<int>> m_parseCount;
};

/**
 * MetadataFont that counts how often its coverage is computed.
 */
class CountingFont : public MetadataFont {
public:
    explicit CountingFont(FontMetadata metadata) : MetadataFont(std::move(metadata)) {}

    int loads() const { return m_loads; }

protected:
    std::set<uint32_t> loadCodepoints() override {
        ++m_loads;
        return MetadataFont::loadCodepoints();
    }

private:
    int m_loads = 0;
};

inline FontMetadata makeMetadata(std::set<std::string> axes,
                                 std::set<std::string> features,
                                 std::set<uint32_t> codepoints,
                                 std::set<std::string> names = {}) {
    FontMetadata metadata;
    metadata.axes = std::move(axes);
    metadata.features = std::move(features);
    metadata.codepoints = std::move(codepoints);
    metadata.names = std::move(names);
    return metadata;
}

} // namespace FontGrep::Test
