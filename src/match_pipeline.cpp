#include "match_pipeline.hpp"
#include <algorithm>

namespace FontGrep {

namespace {

bool containsAll(const std::set<std::string>& available, const std::vector<std::string>& required) {
    return std::all_of(required.begin(), required.end(), [&](const std::string& tag) {
        return available.count(tag) > 0;
    });
}

} // anonymous namespace

std::optional<MatchPipeline::Stage> MatchPipeline::firstFailure(ParsedFont& font) const {
    if (m_criteria.variableOnly && !font.isVariable()) return Stage::Variable;
    if (!containsAll(font.axes(), m_criteria.axes)) return Stage::Axes;
    if (!containsAll(font.features(), m_criteria.features)) return Stage::Features;
    if (!containsAll(font.scripts(), m_criteria.scripts)) return Stage::Scripts;
    if (!containsAll(font.tables(), m_criteria.tables)) return Stage::Tables;
    if (!m_criteria.matchesNames(font.names())) return Stage::Names;

    if (m_criteria.hasCodepoints()) {
        const auto& covered = font.codepoints();
        for (const auto& codepoints : m_criteria.codepointSets) {
            // Both sides are sorted
            if (!std::includes(covered.begin(), covered.end(), codepoints.begin(), codepoints.end())) {
                return Stage::Codepoints;
            }
        }
    }

    return std::nullopt;
}

} // namespace FontGrep
