#include <catch2/catch.hpp>

#include "errors.hpp"
#include "file_utils.hpp"
#include "font_report.hpp"
#include "metadata_store.hpp"
#include "test_helpers.hpp"

#include <sstream>

using namespace FontGrep;
using namespace FontGrep::Test;

TEST_CASE("Codepoints collapse into ranges", "[FontReport]") {
    REQUIRE(formatCodepointRanges({}).empty());
    REQUIRE(formatCodepointRanges({0x41}) == "U+0041");
    REQUIRE(formatCodepointRanges({0x41, 0x42, 0x43, 0x45, 0x20AC}) == "U+0041-0043, U+0045, U+20AC");
    REQUIRE(formatCodepointRanges({0x1F600, 0x1F601}) == "U+1F600-1F601");
}

TEST_CASE("Font info lists names and the variable flag", "[FontReport]") {
    FontMetadata metadata = makeMetadata({"wght", "wdth"}, {"liga", "smcp"}, {0x41, 0x42, 0x7A}, {"Alpha Sans", "Bold"});
    metadata.scripts = {"latn"};
    metadata.tables = {"GSUB", "fvar"};

    SECTION("Summary") {
        CountingFont font(metadata);
        std::ostringstream out;
        writeFontInfo(out, font, false);
        REQUIRE(out.str() == "Names: Alpha Sans, Bold\nVariable: true\n");
        // Coverage is only computed for the detailed report
        REQUIRE(font.loads() == 0);
    }

    SECTION("Detailed") {
        MetadataFont font(metadata);
        std::ostringstream out;
        writeFontInfo(out, font, true);
        REQUIRE(out.str() ==
                "Names: Alpha Sans, Bold\n"
                "Variable: true\n"
                "Axes: wdth, wght\n"
                "Features: liga, smcp\n"
                "Scripts: latn\n"
                "Tables: GSUB, fvar\n"
                "Charset: U+0041-0042, U+007A\n");
    }

    SECTION("Static font with nothing to show") {
        MetadataFont font(FontMetadata{});
        std::ostringstream out;
        writeFontInfo(out, font, true);
        REQUIRE(out.str() == "Names:\nVariable: false\nAxes:\nFeatures:\nScripts:\nTables:\nCharset:\n");
    }
}

TEST_CASE("Info of a font file read from disk", "[FontReport]") {
    TempDir dir;
    FakeFont fake;
    fake.names = {"Beta Serif"};
    fake.codepoints = {0x41};
    writeFakeFont(dir / "b.otf", fake);

    FakeExtractor extractor;
    auto font = extractor.parse(readFileBytes(dir / "b.otf"));
    std::ostringstream out;
    writeFontInfo(out, *font, false);
    REQUIRE(out.str() == "Names: Beta Serif\nVariable: false\n");
}

TEST_CASE("Listing the cache", "[FontReport]") {
    TempDir dir;
    auto dbPath = dir / MetadataStore::kDatabaseFileName;

    REQUIRE_THROWS_AS(existingDatabasePath(dir.path()), ConfigError);
    REQUIRE_THROWS_AS(existingDatabasePath(dir / "missing.db"), ConfigError);

    MetadataStore store(dbPath, 1);
    store.upsert("/fonts/b.ttf", FileStamp{1, 1}, FontMetadata{});
    store.upsert("/fonts/a.ttf", FileStamp{1, 1}, FontMetadata{});

    REQUIRE(existingDatabasePath(dir.path()) == dbPath);
    REQUIRE(existingDatabasePath(dbPath) == dbPath);

    CollectingSink sink;
    REQUIRE(listCachedFonts(store, sink) == 2);
    REQUIRE(sink.results() == std::vector<std::string>{"/fonts/a.ttf", "/fonts/b.ttf"});
}
