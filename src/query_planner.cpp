#include "query_planner.hpp"
#include <sstream>

namespace FontGrep {

namespace {

const char* aliasPrefix(TagCategory category) {
    switch (category) {
        case TagCategory::Axis: return "ax";
        case TagCategory::Feature: return "ft";
        case TagCategory::Script: return "sc";
        case TagCategory::Table: return "tb";
    }
    return "tg";
}

std::string toJsonArray(const std::vector<uint32_t>& codepoints) {
    std::ostringstream json;
    json << '[';
    for (size_t i = 0; i < codepoints.size(); ++i) {
        if (i > 0) json << ',';
        json << codepoints[i];
    }
    json << ']';
    return json.str();
}

} // anonymous namespace

std::vector<QueryParam> QueryPlan::parameters() const {
    std::vector<QueryParam> result;
    for (const auto& constraint : constraints) {
        result.insert(result.end(), constraint.params.begin(), constraint.params.end());
    }
    return result;
}

std::string QueryPlan::sql() const {
    std::string sql = "SELECT f.path FROM fonts f";
    for (size_t i = 0; i < constraints.size(); ++i) {
        sql += i == 0 ? " WHERE " : " AND ";
        sql += constraints[i].predicate;
    }
    sql += " ORDER BY f.path";
    return sql;
}

QueryPlan QueryPlanner::plan(const CriteriaSet& criteria,
                             const std::optional<std::string>& restrictToPath) {
    QueryPlan plan;
    int counter = 0;

    auto nextAlias = [&counter](const char* prefix) {
        return prefix + std::to_string(counter++);
    };

    if (restrictToPath) {
        Constraint c;
        c.kind = ConstraintKind::Path;
        c.alias = "f";
        c.predicate = "f.path = ?";
        c.params.emplace_back(*restrictToPath);
        plan.constraints.push_back(std::move(c));
    }

    if (criteria.variableOnly) {
        Constraint c;
        c.kind = ConstraintKind::Variable;
        c.alias = nextAlias("var");
        c.predicate = "EXISTS (SELECT 1 FROM font_tags " + c.alias + " WHERE " +
                      c.alias + ".font_id = f.font_id AND " + c.alias + ".category = ?)";
        c.params.emplace_back(std::string(categoryName(TagCategory::Axis)));
        plan.constraints.push_back(std::move(c));
    }

    for (auto category : {TagCategory::Axis, TagCategory::Feature, TagCategory::Script, TagCategory::Table}) {
        for (const auto& tag : criteria.tags(category)) {
            Constraint c;
            c.kind = ConstraintKind::Tag;
            c.alias = nextAlias(aliasPrefix(category));
            c.predicate = "EXISTS (SELECT 1 FROM font_tags " + c.alias + " WHERE " +
                          c.alias + ".font_id = f.font_id AND " + c.alias + ".category = ? AND " +
                          c.alias + ".tag = ?)";
            c.params.emplace_back(std::string(categoryName(category)));
            c.params.emplace_back(tag);
            plan.constraints.push_back(std::move(c));
        }
    }

    // One bound JSON array per set keeps large sets under SQLite's variable limit
    for (const auto& codepoints : criteria.codepointSets) {
        Constraint c;
        c.kind = ConstraintKind::Coverage;
        c.alias = nextAlias("cp");
        c.predicate = "NOT EXISTS (SELECT 1 FROM json_each(?) j WHERE NOT EXISTS (SELECT 1 FROM codepoints " +
                      c.alias + " WHERE " + c.alias + ".font_id = f.font_id AND " +
                      c.alias + ".codepoint = j.value))";
        c.params.emplace_back(toJsonArray(codepoints));
        plan.constraints.push_back(std::move(c));
    }

    return plan;
}

} // namespace FontGrep
