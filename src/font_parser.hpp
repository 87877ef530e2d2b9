/**
 * @file font_parser.hpp
 * @brief Extraction of searchable metadata from OpenType/TrueType font files.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>

namespace FontGrep {

/**
 * @brief Searchable metadata of one font.
 *
 * Tags are 4-character OpenType tags; shorter tags are padded with
 * spaces (e.g. "CFF ").
 */
struct FontMetadata {
    std::set<std::string> axes;         ///< Variation axis tags (fvar)
    std::set<std::string> features;     ///< GSUB and GPOS feature tags
    std::set<std::string> scripts;      ///< GSUB and GPOS script tags
    std::set<std::string> tables;       ///< Present tables from the allow-list
    std::set<std::string> names;        ///< Decoded name table strings (UTF-8)
    std::set<uint32_t> codepoints;      ///< Unicode scalar values in the charmap

    bool operator==(const FontMetadata& other) const = default;
};

/**
 * @brief Modification time and size of a file on disk.
 *
 * mtime is the std::filesystem::file_time_type tick count.
 */
struct FileStamp {
    int64_t mtime = 0;
    int64_t size = 0;

    bool operator==(const FileStamp& other) const = default;
};

/**
 * @brief Complete cached information about one font file.
 */
struct FontRecord {
    std::string path;           ///< Key: full path of the font file
    FileStamp stamp;            ///< Filesystem state when the record was written
    FontMetadata metadata;      ///< Extracted metadata
};

/**
 * @brief Fixed list of table tags whose presence is recorded.
 */
const std::vector<std::string>& tableAllowList();

/**
 * @brief Check whether a (space padded) table tag is on the allow-list.
 */
bool isAllowListedTable(const std::string& tag);

/**
 * @brief Metadata of a parsed font, with lazily computed charmap coverage.
 *
 * Everything except the codepoint coverage is available right after
 * parsing. The coverage is only computed when codepoints() (or
 * metadata()) is first called, since it requires walking the whole
 * character map.
 */
class ParsedFont {
public:
    virtual ~ParsedFont() = default;

    const std::set<std::string>& axes() const { return m_metadata.axes; }
    const std::set<std::string>& features() const { return m_metadata.features; }
    const std::set<std::string>& scripts() const { return m_metadata.scripts; }
    const std::set<std::string>& tables() const { return m_metadata.tables; }
    const std::set<std::string>& names() const { return m_metadata.names; }

    /// A font is variable when it exposes at least one variation axis
    bool isVariable() const { return !m_metadata.axes.empty(); }

    /**
     * @brief Codepoint coverage, computed on first use.
     */
    const std::set<uint32_t>& codepoints();

    /**
     * @brief Full metadata including the codepoint coverage.
     */
    const FontMetadata& metadata();

    /// True once the codepoint coverage has been computed
    bool codepointsLoaded() const { return m_codepointsLoaded; }

protected:
    virtual std::set<uint32_t> loadCodepoints() = 0;

    FontMetadata m_metadata;

private:
    bool m_codepointsLoaded = false;
};

/**
 * @brief ParsedFont over metadata that is already fully known.
 *
 * Used for records reconstructed from the cache and by tests.
 */
class MetadataFont : public ParsedFont {
public:
    explicit MetadataFont(FontMetadata metadata);

protected:
    std::set<uint32_t> loadCodepoints() override;

private:
    std::set<uint32_t> m_pendingCodepoints;
};

/**
 * @brief Contract for turning raw font bytes into metadata.
 *
 * Implementations throw FontParseError with Kind::NotAFont when the bytes
 * carry no known font signature and Kind::Corrupt when they do but cannot
 * be read. An extractor instance is used by one thread at a time.
 */
class FontExtractor {
public:
    virtual ~FontExtractor() = default;

    /**
     * @brief Parse a font from its raw bytes.
     * @param bytes Complete file contents (ownership is taken)
     * @return Parsed font; codepoint coverage is computed lazily
     */
    virtual std::unique_ptr<ParsedFont> parse(std::vector<uint8_t> bytes) = 0;
};

/**
 * @brief FontExtractor backed by FreeType.
 *
 * Owns one FT_Library. Faces created by parse() keep a reference to that
 * library, so the extractor must outlive every ParsedFont it returns.
 *
 * The parser understands:
 * - sfnt signatures (TrueType, CFF, collections, WOFF/WOFF2) and Type 1
 * - fvar axes through FreeType's multiple masters API
 * - GSUB/GPOS script and feature lists through HarfBuzz
 * - name table records in Unicode, Windows and Mac Roman encodings
 *
 * @note Only the first face of a collection is examined.
 */
class FreeTypeExtractor : public FontExtractor {
public:
    FreeTypeExtractor();
    ~FreeTypeExtractor() override;

    FreeTypeExtractor(const FreeTypeExtractor&) = delete;
    FreeTypeExtractor& operator=(const FreeTypeExtractor&) = delete;

    std::unique_ptr<ParsedFont> parse(std::vector<uint8_t> bytes) override;

private:
    FT_Library m_library = nullptr;
};

/**
 * @brief Check whether bytes start with a font signature FreeType can read.
 */
bool hasFontSignature(const std::vector<uint8_t>& bytes);

/**
 * @brief Collect script and feature tags of the GSUB and GPOS tables.
 *
 * Missing or malformed tables contribute no tags.
 *
 * @param face HarfBuzz face of the font
 * @param scripts Receives script tags
 * @param features Receives feature tags
 */
void readLayoutTags(hb_face_t* face,
                    std::set<std::string>& scripts,
                    std::set<std::string>& features);

/**
 * @brief Decode a name table record into UTF-8.
 * @return Decoded string, empty if the platform/encoding is not supported
 */
std::string decodeNameRecord(unsigned platformId, unsigned encodingId,
                             const uint8_t* data, size_t length);

} // namespace FontGrep
