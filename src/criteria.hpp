/**
 * @file criteria.hpp
 * @brief Parsed and validated search criteria.
 */

#pragma once

#include <cstdint>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace FontGrep {

/**
 * @brief Category of a tag criterion.
 */
enum class TagCategory {
    Axis,
    Feature,
    Script,
    Table
};

/**
 * @brief Name of a category as stored in the font_tags table.
 * @return "axis", "feature", "script" or "table"
 */
const char* categoryName(TagCategory category);

/**
 * @brief A compiled case-insensitive name pattern.
 */
struct NamePattern {
    std::string source;     ///< Pattern as given on the command line
    std::regex regex;       ///< Compiled ECMAScript regex (icase)
};

/**
 * @brief Conjunctive set of search criteria.
 *
 * A font matches when it has every requested tag of every category, covers
 * every codepoint of every codepoint set, has at least one name matching
 * each name pattern and, if variableOnly is set, at least one variation
 * axis.
 *
 * Values are validated when added; the add functions throw
 * InvalidCriteriaError so that bad input is rejected before any work starts.
 */
struct CriteriaSet {
    std::vector<std::string> axes;
    std::vector<std::string> features;
    std::vector<std::string> scripts;
    std::vector<std::string> tables;
    std::vector<std::vector<uint32_t>> codepointSets;  ///< Each sorted and duplicate free
    std::vector<NamePattern> namePatterns;
    bool variableOnly = false;

    /**
     * @brief Add one or more comma separated tags to a category.
     *
     * Duplicates already present in the category are ignored.
     * @throws InvalidCriteriaError on an invalid tag
     */
    void addTags(TagCategory category, const std::string& commaList);

    /**
     * @brief Add one codepoint set from a range list such as "U+41-5A,20AC".
     * @throws InvalidCriteriaError on malformed input
     */
    void addCodepointRanges(const std::string& ranges);

    /**
     * @brief Add one codepoint set holding every character of a UTF-8 string.
     * @throws InvalidCriteriaError on malformed UTF-8
     */
    void addText(const std::string& text);

    /**
     * @brief Compile and add a name pattern.
     * @throws InvalidCriteriaError if the regex does not compile
     */
    void addNamePattern(const std::string& pattern);

    /// Tags requested for a category, in the order given
    const std::vector<std::string>& tags(TagCategory category) const;

    bool isEmpty() const;
    bool hasCodepoints() const { return !codepointSets.empty(); }

    /**
     * @brief Check the name patterns against a font's name strings.
     * @return true if every pattern matches at least one name
     */
    bool matchesNames(const std::set<std::string>& names) const;
};

/**
 * @brief Validate a tag and pad it with spaces to 4 characters.
 * @throws InvalidCriteriaError naming the category and the offending text
 */
std::string parseTag(const std::string& text, TagCategory category);

/**
 * @brief Parse a comma separated list of codepoints and ranges.
 *
 * Items are U+hhhh, bare hex (at least two digits), a single UTF-8
 * character, or a range A-B of the first two forms. Surrogates inside a
 * range are skipped.
 *
 * @return Sorted, duplicate free codepoints
 * @throws InvalidCriteriaError on malformed input
 */
std::vector<uint32_t> parseCodepoints(const std::string& text);

/**
 * @brief Decode a UTF-8 string into its sorted, duplicate free codepoints.
 * @throws InvalidCriteriaError on malformed UTF-8
 */
std::vector<uint32_t> textCodepoints(const std::string& text);

} // namespace FontGrep
