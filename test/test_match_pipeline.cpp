#include <catch2/catch.hpp>

#include "match_pipeline.hpp"
#include "test_helpers.hpp"

using namespace FontGrep;
using namespace FontGrep::Test;

namespace {

FontMetadata sampleMetadata() {
    FontMetadata metadata = makeMetadata({"wght"}, {"smcp", "liga"}, {0x41, 0x42, 0x43}, {"Sample Sans"});
    metadata.scripts = {"latn"};
    metadata.tables = {"GSUB", "fvar"};
    return metadata;
}

} // anonymous namespace

TEST_CASE("A font matching everything passes", "[MatchPipeline]") {
    CriteriaSet criteria;
    criteria.variableOnly = true;
    criteria.addTags(TagCategory::Axis, "wght");
    criteria.addTags(TagCategory::Feature, "smcp,liga");
    criteria.addTags(TagCategory::Script, "latn");
    criteria.addTags(TagCategory::Table, "GSUB");
    criteria.addNamePattern("SAMPLE");
    criteria.addText("ABC");

    CountingFont font(sampleMetadata());
    MatchPipeline pipeline(criteria);
    REQUIRE(pipeline.matches(font));
    REQUIRE(font.loads() == 1);
}

TEST_CASE("Stages fail in cost order", "[MatchPipeline]") {
    CountingFont font(sampleMetadata());

    SECTION("Variable before axes") {
        FontMetadata fixed = sampleMetadata();
        fixed.axes.clear();
        CountingFont staticFont(fixed);

        CriteriaSet criteria;
        criteria.variableOnly = true;
        criteria.addTags(TagCategory::Axis, "wdth");
        REQUIRE(MatchPipeline(criteria).firstFailure(staticFont) == MatchPipeline::Stage::Variable);
    }

    SECTION("Axes") {
        CriteriaSet criteria;
        criteria.addTags(TagCategory::Axis, "wght,wdth");
        REQUIRE(MatchPipeline(criteria).firstFailure(font) == MatchPipeline::Stage::Axes);
    }

    SECTION("Features") {
        CriteriaSet criteria;
        criteria.addTags(TagCategory::Feature, "c2sc");
        REQUIRE(MatchPipeline(criteria).firstFailure(font) == MatchPipeline::Stage::Features);
    }

    SECTION("Scripts") {
        CriteriaSet criteria;
        criteria.addTags(TagCategory::Script, "cyrl");
        REQUIRE(MatchPipeline(criteria).firstFailure(font) == MatchPipeline::Stage::Scripts);
    }

    SECTION("Tables") {
        CriteriaSet criteria;
        criteria.addTags(TagCategory::Table, "COLR");
        REQUIRE(MatchPipeline(criteria).firstFailure(font) == MatchPipeline::Stage::Tables);
    }

    SECTION("Names") {
        CriteriaSet criteria;
        criteria.addNamePattern("serif");
        REQUIRE(MatchPipeline(criteria).firstFailure(font) == MatchPipeline::Stage::Names);
    }

    SECTION("Codepoints") {
        CriteriaSet criteria;
        criteria.addText("ABC");
        criteria.addText("AZ");
        REQUIRE(MatchPipeline(criteria).firstFailure(font) == MatchPipeline::Stage::Codepoints);
    }
}

TEST_CASE("Coverage is loaded only when needed", "[MatchPipeline]") {
    CountingFont font(sampleMetadata());

    SECTION("Not requested") {
        CriteriaSet criteria;
        criteria.addTags(TagCategory::Axis, "wght");
        REQUIRE(MatchPipeline(criteria).matches(font));
        REQUIRE(font.loads() == 0);
        REQUIRE_FALSE(font.codepointsLoaded());
    }

    SECTION("Earlier stage failed") {
        CriteriaSet criteria;
        criteria.addTags(TagCategory::Feature, "c2sc");
        criteria.addText("A");
        REQUIRE_FALSE(MatchPipeline(criteria).matches(font));
        REQUIRE(font.loads() == 0);
    }

    SECTION("Loaded once across evaluations") {
        CriteriaSet criteria;
        criteria.addText("A");
        MatchPipeline pipeline(criteria);
        REQUIRE(pipeline.matches(font));
        REQUIRE(pipeline.matches(font));
        REQUIRE(font.loads() == 1);
        REQUIRE(font.metadata().codepoints == std::set<uint32_t>{0x41, 0x42, 0x43});
    }
}

TEST_CASE("Empty criteria match any font", "[MatchPipeline]") {
    CriteriaSet criteria;
    MetadataFont font(FontMetadata{});
    REQUIRE(MatchPipeline(criteria).matches(font));
}
