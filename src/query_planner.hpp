/**
 * @file query_planner.hpp
 * @brief Translation of search criteria into a parameterized SQL lookup.
 */

#pragma once

#include "criteria.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace FontGrep {

/// Value bound to one '?' placeholder
using QueryParam = std::variant<int64_t, std::string>;

enum class ConstraintKind {
    Path,       ///< Restriction to a single path
    Variable,   ///< At least one axis row
    Tag,        ///< One required axis/feature/script/table tag
    Coverage    ///< Every codepoint of one codepoint set
};

/**
 * @brief One predicate of the WHERE clause.
 *
 * The predicate only contains '?' placeholders; criterion values travel
 * in params, in placeholder order.
 */
struct Constraint {
    ConstraintKind kind;
    std::string alias;              ///< Unique alias of the correlated subquery
    std::string predicate;          ///< SQL fragment over the outer alias "f"
    std::vector<QueryParam> params; ///< Values bound by this fragment

    bool operator==(const Constraint& other) const = default;
};

/**
 * @brief Ordered list of constraints with their parameters.
 */
struct QueryPlan {
    std::vector<Constraint> constraints;

    /// All parameters, in constraint order
    std::vector<QueryParam> parameters() const;

    /**
     * @brief Render the full statement.
     *
     * SELECT f.path FROM fonts f [WHERE c1 AND c2 ...] ORDER BY f.path
     */
    std::string sql() const;
};

/**
 * @brief Builds QueryPlans from criteria.
 *
 * Constraint order is fixed: path, variable, axes, features, scripts,
 * tables, codepoint sets. Aliases come from one counter per plan
 * (ax0, ft1, cp2, ...). Name patterns are not part of the plan; they are
 * applied to the candidate rows by the caller.
 *
 * @par Example:
 * @code
 * CriteriaSet criteria;
 * criteria.addTags(TagCategory::Axis, "wght");
 * QueryPlan plan = QueryPlanner::plan(criteria);
 * // plan.sql():
 * // SELECT f.path FROM fonts f WHERE EXISTS (SELECT 1 FROM font_tags ax0
 * //   WHERE ax0.font_id = f.font_id AND ax0.category = ? AND ax0.tag = ?)
 * //   ORDER BY f.path
 * @endcode
 */
class QueryPlanner {
public:
    static QueryPlan plan(const CriteriaSet& criteria,
                          const std::optional<std::string>& restrictToPath = std::nullopt);
};

} // namespace FontGrep
