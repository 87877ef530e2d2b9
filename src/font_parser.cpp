#include "font_parser.hpp"
#include "debug.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>

#include FT_MULTIPLE_MASTERS_H
#include FT_SFNT_NAMES_H
#include FT_TRUETYPE_IDS_H
#include FT_TRUETYPE_TABLES_H

#include <hb-ft.h>
#include <hb-ot.h>
#include <hb.h>

#include <unicode/ucnv.h>
#include <unicode/utf16.h>
#include <unicode/utf8.h>

namespace FontGrep {

namespace {

constexpr uint32_t kMaxCodepoint = 0x10FFFF;

std::string tagToString(FT_ULong tag) {
    std::string result(4, ' ');
    result[0] = static_cast<char>((tag >> 24) & 0xFF);
    result[1] = static_cast<char>((tag >> 16) & 0xFF);
    result[2] = static_cast<char>((tag >> 8) & 0xFF);
    result[3] = static_cast<char>(tag & 0xFF);
    return result;
}

FT_ULong stringToTag(const std::string& tag) {
    FT_ULong value = 0;
    for (size_t i = 0; i < 4; ++i) {
        unsigned char c = i < tag.size() ? static_cast<unsigned char>(tag[i]) : ' ';
        value = (value << 8) | c;
    }
    return value;
}

bool isSurrogate(uint32_t codepoint) {
    return codepoint >= 0xD800 && codepoint <= 0xDFFF;
}

void appendUtf8(std::string& out, UChar32 c) {
    uint8_t buffer[U8_MAX_LENGTH];
    int32_t length = 0;
    U8_APPEND_UNSAFE(buffer, length, c);
    out.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(length));
}

void appendUtf16(std::string& out, const UChar* units, int32_t count) {
    int32_t index = 0;
    while (index < count) {
        UChar32 c;
        U16_NEXT(units, index, count, c);
        if (c == 0) continue;
        if (U_IS_SURROGATE(c)) c = 0xFFFD;
        appendUtf8(out, c);
    }
}

struct ConverterDeleter {
    void operator()(UConverter* converter) const {
        if (converter) ucnv_close(converter);
    }
};

using ConverterPtr = std::unique_ptr<UConverter, ConverterDeleter>;

struct HbFaceDeleter {
    void operator()(hb_face_t* face) const {
        if (face) hb_face_destroy(face);
    }
};

using HbFacePtr = std::unique_ptr<hb_face_t, HbFaceDeleter>;

using LayoutTagGetter = unsigned int (*)(hb_face_t*, hb_tag_t, unsigned int, unsigned int*, hb_tag_t*);

void collectLayoutTags(hb_face_t* face, hb_tag_t table, LayoutTagGetter getTags, std::set<std::string>& out) {
    std::array<hb_tag_t, 32> tags;
    unsigned int start = 0;
    while (true) {
        unsigned int count = static_cast<unsigned int>(tags.size());
        unsigned int total = getTags(face, table, start, &count, tags.data());
        for (unsigned int i = 0; i < count; ++i) {
            char text[4];
            hb_tag_to_string(tags[i], text);
            out.emplace(text, 4);
        }
        start += count;
        if (count == 0 || start >= total) break;
    }
}

struct FaceDeleter {
    void operator()(FT_Face face) const {
        if (face) FT_Done_Face(face);
    }
};

using FacePtr = std::unique_ptr<FT_FaceRec_, FaceDeleter>;

/**
 * ParsedFont over a FreeType face created from an in-memory buffer.
 */
class FreeTypeFont : public ParsedFont {
public:
    FreeTypeFont(FT_Library library, std::vector<uint8_t> bytes)
        : m_bytes(std::move(bytes)) {
        FT_Face face = nullptr;
        FT_Error error = FT_New_Memory_Face(library,
                                            reinterpret_cast<const FT_Byte*>(m_bytes.data()),
                                            static_cast<FT_Long>(m_bytes.size()),
                                            0, &face);
        if (error != 0 || !face) {
            throw FontParseError(FontParseError::Kind::Corrupt,
                                 "FreeType could not open face (error " + std::to_string(error) + ")");
        }
        m_face.reset(face);

        extractAxes(library);
        if (FT_IS_SFNT(face)) {
            extractTables();
            extractLayout();
            extractNames();
        } else {
            // Type 1 and other non-sfnt formats only carry the face names
            if (face->family_name) m_metadata.names.insert(face->family_name);
            if (face->style_name) m_metadata.names.insert(face->style_name);
        }
    }

protected:
    std::set<uint32_t> loadCodepoints() override {
        std::set<uint32_t> result;
        if (!selectUnicodeCharmap()) {
            DEBUG_LOG("Font has no Unicode charmap, coverage is empty");
            return result;
        }

        // The charmap is walked once in ascending order; unmapped codepoints are never visited
        FT_UInt glyphIndex = 0;
        FT_ULong charCode = FT_Get_First_Char(m_face.get(), &glyphIndex);
        while (glyphIndex != 0) {
            if (charCode <= kMaxCodepoint && !isSurrogate(static_cast<uint32_t>(charCode))) {
                result.insert(result.end(), static_cast<uint32_t>(charCode));
            }
            charCode = FT_Get_Next_Char(m_face.get(), charCode, &glyphIndex);
        }
        return result;
    }

private:
    void extractAxes(FT_Library library) {
        if (!FT_HAS_MULTIPLE_MASTERS(m_face.get())) return;

        FT_MM_Var* mmVar = nullptr;
        if (FT_Get_MM_Var(m_face.get(), &mmVar) != 0 || !mmVar) return;

        for (FT_UInt i = 0; i < mmVar->num_axis; ++i) {
            if (mmVar->axis[i].tag != 0) {
                m_metadata.axes.insert(tagToString(mmVar->axis[i].tag));
            }
        }
        FT_Done_MM_Var(library, mmVar);
    }

    void extractTables() {
        for (const auto& tag : tableAllowList()) {
            FT_ULong length = 0;
            if (FT_Load_Sfnt_Table(m_face.get(), stringToTag(tag), 0, nullptr, &length) == 0) {
                m_metadata.tables.insert(tag);
            }
        }
    }

    void extractLayout() {
        // HarfBuzz reads the tables back through FreeType, which also unwraps WOFF
        HbFacePtr hbFace(hb_ft_face_create_referenced(m_face.get()));
        readLayoutTags(hbFace.get(), m_metadata.scripts, m_metadata.features);
    }

    void extractNames() {
        FT_UInt count = FT_Get_Sfnt_Name_Count(m_face.get());
        for (FT_UInt i = 0; i < count; ++i) {
            FT_SfntName record;
            if (FT_Get_Sfnt_Name(m_face.get(), i, &record) != 0) continue;

            std::string name = decodeNameRecord(record.platform_id, record.encoding_id,
                                                record.string, record.string_len);
            if (!name.empty()) {
                m_metadata.names.insert(std::move(name));
            }
        }
    }

    bool selectUnicodeCharmap() {
        FT_Face face = m_face.get();
        if (FT_Select_Charmap(face, FT_ENCODING_UNICODE) == 0) return true;
        for (FT_Int i = 0; i < face->num_charmaps; ++i) {
            if (face->charmaps[i] && face->charmaps[i]->encoding == FT_ENCODING_UNICODE) {
                return FT_Set_Charmap(face, face->charmaps[i]) == 0;
            }
        }
        return false;
    }

    std::vector<uint8_t> m_bytes;   ///< Backing memory of the face, must outlive it
    FacePtr m_face;
};

} // anonymous namespace

const std::vector<std::string>& tableAllowList() {
    static const std::vector<std::string> tags = {
        "avar", "BASE", "CBDT", "CBLC", "CFF ", "CFF2", "cmap", "COLR",
        "CPAL", "cvar", "cvt ", "DSIG", "EBDT", "EBLC", "EBSC", "feat",
        "fpgm", "fvar", "gasp", "GDEF", "glyf", "GPOS", "GSUB", "gvar",
        "hdmx", "head", "hhea", "hmtx", "HVAR", "JSTF", "kern", "kerx",
        "loca", "LTSH", "MATH", "maxp", "MERG", "meta", "morx", "MVAR",
        "name", "OS/2", "PCLT", "post", "prep", "sbix", "STAT", "SVG ",
        "trak", "VDMX", "vhea", "vmtx", "VORG", "VVAR",
    };
    return tags;
}

bool isAllowListedTable(const std::string& tag) {
    const auto& tags = tableAllowList();
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

const std::set<uint32_t>& ParsedFont::codepoints() {
    if (!m_codepointsLoaded) {
        m_metadata.codepoints = loadCodepoints();
        m_codepointsLoaded = true;
    }
    return m_metadata.codepoints;
}

const FontMetadata& ParsedFont::metadata() {
    codepoints();
    return m_metadata;
}

MetadataFont::MetadataFont(FontMetadata metadata) {
    m_pendingCodepoints = std::move(metadata.codepoints);
    metadata.codepoints.clear();
    m_metadata = std::move(metadata);
}

std::set<uint32_t> MetadataFont::loadCodepoints() {
    return std::move(m_pendingCodepoints);
}

bool hasFontSignature(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 4) return false;

    static const std::array<std::array<uint8_t, 4>, 8> signatures = {{
        {0x00, 0x01, 0x00, 0x00},   // TrueType
        {'O', 'T', 'T', 'O'},       // CFF OpenType
        {'t', 'r', 'u', 'e'},       // Apple TrueType
        {'t', 'y', 'p', '1'},       // sfnt-wrapped Type 1
        {'t', 't', 'c', 'f'},       // Collection
        {'w', 'O', 'F', 'F'},       // WOFF
        {'w', 'O', 'F', '2'},       // WOFF2
        {0x00, 0x00, 0x01, 0x00},   // Mac resource fork (dfont)
    }};

    for (const auto& signature : signatures) {
        if (std::equal(signature.begin(), signature.end(), bytes.begin())) {
            return true;
        }
    }

    // Type 1: PFB segment header or PFA PostScript comment
    if (bytes[0] == 0x80 && bytes[1] == 0x01) return true;
    return bytes[0] == '%' && bytes[1] == '!';
}

void readLayoutTags(hb_face_t* face,
                    std::set<std::string>& scripts,
                    std::set<std::string>& features) {
    for (hb_tag_t table : {HB_OT_TAG_GSUB, HB_OT_TAG_GPOS}) {
        collectLayoutTags(face, table, hb_ot_layout_table_get_script_tags, scripts);
        collectLayoutTags(face, table, hb_ot_layout_table_get_feature_tags, features);
    }
}

std::string decodeNameRecord(unsigned platformId, unsigned encodingId,
                             const uint8_t* data, size_t length) {
    std::string result;
    if (!data || length == 0) return result;

    bool utf16 = platformId == TT_PLATFORM_APPLE_UNICODE ||
                 (platformId == TT_PLATFORM_MICROSOFT &&
                  (encodingId == TT_MS_ID_SYMBOL_CS ||
                   encodingId == TT_MS_ID_UNICODE_CS ||
                   encodingId == TT_MS_ID_UCS_4));

    if (utf16) {
        std::u16string units;
        units.reserve(length / 2);
        for (size_t i = 0; i + 1 < length; i += 2) {
            units.push_back(static_cast<char16_t>((data[i] << 8) | data[i + 1]));
        }
        appendUtf16(result, units.data(), static_cast<int32_t>(units.size()));
    } else if (platformId == TT_PLATFORM_MACINTOSH && encodingId == TT_MAC_ID_ROMAN) {
        UErrorCode status = U_ZERO_ERROR;
        ConverterPtr converter(ucnv_open("macintosh", &status));
        if (U_FAILURE(status)) {
            DEBUG_LOG("Mac Roman converter unavailable: " << u_errorName(status));
            return result;
        }

        // Mac Roman is a single byte encoding, every byte maps to one BMP character
        std::u16string units(length + 1, u'\0');
        int32_t count = ucnv_toUChars(converter.get(), units.data(), static_cast<int32_t>(units.size()),
                                      reinterpret_cast<const char*>(data), static_cast<int32_t>(length), &status);
        if (U_FAILURE(status)) {
            DEBUG_LOG("Mac Roman name record not decoded: " << u_errorName(status));
            return result;
        }
        appendUtf16(result, units.data(), count);
    }

    return result;
}

FreeTypeExtractor::FreeTypeExtractor() {
    FT_Error error = FT_Init_FreeType(&m_library);
    if (error != 0) {
        m_library = nullptr;
        throw Error("FreeType initialisation failed (error " + std::to_string(error) + ")");
    }
}

FreeTypeExtractor::~FreeTypeExtractor() {
    if (m_library) {
        FT_Done_FreeType(m_library);
    }
}

std::unique_ptr<ParsedFont> FreeTypeExtractor::parse(std::vector<uint8_t> bytes) {
    if (!hasFontSignature(bytes)) {
        throw FontParseError(FontParseError::Kind::NotAFont, "no known font signature");
    }
    return std::make_unique<FreeTypeFont>(m_library, std::move(bytes));
}

} // namespace FontGrep
