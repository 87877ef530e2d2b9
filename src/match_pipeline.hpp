/**
 * @file match_pipeline.hpp
 * @brief In-memory evaluation of criteria against one parsed font.
 */

#pragma once

#include "criteria.hpp"
#include "font_parser.hpp"
#include <optional>

namespace FontGrep {

/**
 * @brief Evaluates a CriteriaSet against a ParsedFont.
 *
 * Predicates run from cheapest to most expensive and stop at the first
 * failure. Codepoint coverage comes last: it is the only stage that makes
 * the font walk its character map, and it is skipped entirely when no
 * codepoints were requested or an earlier stage failed.
 *
 * The pipeline holds a reference to the criteria, which must outlive it.
 * It has no mutable state and may be shared between threads.
 */
class MatchPipeline {
public:
    /// Evaluation stages in execution order
    enum class Stage {
        Variable,
        Axes,
        Features,
        Scripts,
        Tables,
        Names,
        Codepoints
    };

    explicit MatchPipeline(const CriteriaSet& criteria) : m_criteria(criteria) {}

    bool matches(ParsedFont& font) const { return !firstFailure(font).has_value(); }

    /**
     * @brief Run the stages until one fails.
     * @return The failing stage, or std::nullopt if the font matches
     */
    std::optional<Stage> firstFailure(ParsedFont& font) const;

private:
    const CriteriaSet& m_criteria;
};

} // namespace FontGrep
