#include <catch2/catch.hpp>

#include "errors.hpp"
#include "file_utils.hpp"
#include "font_parser.hpp"

#include <hb-ot.h>
#include <hb.h>

using namespace FontGrep;

namespace {

std::vector<uint8_t> bytesOf(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

void appendU16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

// Record offsets stay 0; only the tags are read
void appendRecord(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
    appendU16(out, 0);
}

// GSUB 1.0 header followed by a ScriptList (DFLT, latn) and a FeatureList (kern, liga)
std::vector<uint8_t> layoutTable() {
    std::vector<uint8_t> table;
    appendU16(table, 1);    // major
    appendU16(table, 0);    // minor
    appendU16(table, 10);   // ScriptList
    appendU16(table, 24);   // FeatureList
    appendU16(table, 0);    // LookupList

    appendU16(table, 2);
    appendRecord(table, "DFLT");
    appendRecord(table, "latn");

    appendU16(table, 2);
    appendRecord(table, "kern");
    appendRecord(table, "liga");
    return table;
}

const char* kSystemFont = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";

} // anonymous namespace

TEST_CASE("Font signatures", "[FontParser]") {
    REQUIRE(hasFontSignature({0x00, 0x01, 0x00, 0x00, 0x00}));
    REQUIRE(hasFontSignature(bytesOf("OTTO....")));
    REQUIRE(hasFontSignature(bytesOf("ttcf....")));
    REQUIRE(hasFontSignature(bytesOf("wOF2....")));
    REQUIRE(hasFontSignature(bytesOf("%!PS-AdobeFont-1.0")));
    REQUIRE(hasFontSignature({0x80, 0x01, 0x10, 0x00}));

    REQUIRE_FALSE(hasFontSignature(bytesOf("OTT")));
    REQUIRE_FALSE(hasFontSignature(bytesOf("hello world")));
    REQUIRE_FALSE(hasFontSignature({}));
}

TEST_CASE("Layout script and feature lists", "[FontParser]") {
    auto table = layoutTable();
    hb_face_t* face = hb_face_builder_create();

    SECTION("Well-formed table") {
        hb_blob_t* blob = hb_blob_create(reinterpret_cast<const char*>(table.data()),
                                         static_cast<unsigned int>(table.size()),
                                         HB_MEMORY_MODE_READONLY, nullptr, nullptr);
        REQUIRE(hb_face_builder_add_table(face, HB_OT_TAG_GSUB, blob));
        hb_blob_destroy(blob);

        std::set<std::string> scripts;
        std::set<std::string> features;
        readLayoutTags(face, scripts, features);
        REQUIRE(scripts == std::set<std::string>{"DFLT", "latn"});
        REQUIRE(features == std::set<std::string>{"kern", "liga"});
    }

    SECTION("A truncated table contributes nothing") {
        table.resize(table.size() - 3);
        hb_blob_t* blob = hb_blob_create(reinterpret_cast<const char*>(table.data()),
                                         static_cast<unsigned int>(table.size()),
                                         HB_MEMORY_MODE_READONLY, nullptr, nullptr);
        REQUIRE(hb_face_builder_add_table(face, HB_OT_TAG_GSUB, blob));
        hb_blob_destroy(blob);

        std::set<std::string> scripts;
        std::set<std::string> features;
        readLayoutTags(face, scripts, features);
        REQUIRE(scripts.empty());
        REQUIRE(features.empty());
    }

    SECTION("No layout tables") {
        std::set<std::string> scripts;
        std::set<std::string> features;
        readLayoutTags(face, scripts, features);
        REQUIRE(scripts.empty());
        REQUIRE(features.empty());
    }

    hb_face_destroy(face);
}

TEST_CASE("Name records are decoded to UTF-8", "[FontParser]") {
    SECTION("Windows Unicode") {
        const uint8_t data[] = {0x00, 'A', 0x00, 'b', 0x03, 0xA9};
        REQUIRE(decodeNameRecord(3, 1, data, sizeof(data)) == "Ab\xce\xa9");
    }

    SECTION("Surrogate pairs and unpaired surrogates") {
        const uint8_t data[] = {0xD8, 0x3D, 0xDE, 0x00, 0xD8, 0x00, 0x00, 'x'};
        REQUIRE(decodeNameRecord(0, 3, data, sizeof(data)) == "\xf0\x9f\x98\x80\xef\xbf\xbdx");
    }

    SECTION("Mac Roman") {
        const uint8_t data[] = {'C', 'a', 'f', 0x8E};
        REQUIRE(decodeNameRecord(1, 0, data, sizeof(data)) == "Caf\xc3\xa9");

        const uint8_t symbols[] = {0xA5, 'x', 0xD0};
        REQUIRE(decodeNameRecord(1, 0, symbols, sizeof(symbols)) == "\xe2\x80\xa2x\xe2\x80\x93");
    }

    SECTION("Unsupported platforms decode to nothing") {
        const uint8_t data[] = {'A', 'B'};
        REQUIRE(decodeNameRecord(2, 0, data, sizeof(data)).empty());
        REQUIRE(decodeNameRecord(1, 1, data, sizeof(data)).empty());
        REQUIRE(decodeNameRecord(3, 1, nullptr, 0).empty());
    }
}

TEST_CASE("Table allow-list", "[FontParser]") {
    REQUIRE(tableAllowList().size() == 54);
    REQUIRE(isAllowListedTable("CFF "));
    REQUIRE(isAllowListedTable("OS/2"));
    REQUIRE_FALSE(isAllowListedTable("CFF"));
    REQUIRE_FALSE(isAllowListedTable("abcd"));
}

TEST_CASE("FreeType extractor separates non-fonts from corrupt fonts", "[FontParser]") {
    FreeTypeExtractor extractor;

    try {
        extractor.parse(bytesOf("just some text"));
        FAIL("expected FontParseError");
    } catch (const FontParseError& e) {
        REQUIRE(e.kind() == FontParseError::Kind::NotAFont);
    }

    std::vector<uint8_t> truncated = bytesOf("OTTO");
    appendU16(truncated, 5);    // numTables, with no table records following
    truncated.resize(12, 0);
    try {
        extractor.parse(truncated);
        FAIL("expected FontParseError");
    } catch (const FontParseError& e) {
        REQUIRE(e.kind() == FontParseError::Kind::Corrupt);
    }
}

TEST_CASE("Metadata of a system font", "[FontParser]") {
    if (!std::filesystem::exists(kSystemFont)) {
        WARN("System font " << kSystemFont << " not installed, skipping");
        return;
    }

    FreeTypeExtractor extractor;
    auto bytes = readFileBytes(kSystemFont);
    auto font = extractor.parse(bytes);

    REQUIRE_FALSE(font->isVariable());
    REQUIRE(font->tables().count("cmap") == 1);
    REQUIRE(font->tables().count("head") == 1);
    REQUIRE(font->tables().count("fvar") == 0);
    REQUIRE(font->scripts().count("latn") == 1);
    REQUIRE(font->features().count("kern") == 1);
    REQUIRE(font->names().count("DejaVu Sans") == 1);

    REQUIRE_FALSE(font->codepointsLoaded());
    const auto& codepoints = font->codepoints();
    REQUIRE(font->codepointsLoaded());
    REQUIRE(codepoints.count(0x41) == 1);
    REQUIRE(codepoints.count(0xD800) == 0);

    // Extraction is deterministic across parses of the same bytes
    auto again = extractor.parse(bytes);
    REQUIRE(again->metadata() == font->metadata());
}

TEST_CASE("MetadataFont defers its coverage", "[FontParser]") {
    FontMetadata metadata;
    metadata.axes = {"wght"};
    metadata.codepoints = {0x41, 0x42};

    MetadataFont font(metadata);
    REQUIRE(font.isVariable());
    REQUIRE_FALSE(font.codepointsLoaded());
    REQUIRE(font.codepoints() == std::set<uint32_t>{0x41, 0x42});
    REQUIRE(font.metadata() == metadata);
}
