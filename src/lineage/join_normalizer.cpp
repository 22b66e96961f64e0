#include <kpi_lineage/lineage/join_normalizer.hpp>

#include <kpi_lineage/lineage/alias_resolver.hpp>

#include "lineage_utils.hpp"

#include <utility>

namespace kpi_lineage {

namespace {

using lineage_utils::IEquals;
using lineage_utils::LastSegment;

// True when ref is qualified by the alias or the name of the table the JOIN
// clause introduced.
bool ReferencesJoinedTable(const ColumnRef& ref, const JoinFact& fact) {
    if (!ref.raw_alias.has_value() || ref.raw_alias->empty()) {
        return false;
    }
    const auto& qualifier = *ref.raw_alias;
    if (fact.right_alias.has_value()) {
        return IEquals(qualifier, *fact.right_alias);
    }
    if (fact.right_table.empty()) {
        return false;
    }
    return IEquals(qualifier, fact.right_table) ||
           IEquals(qualifier, LastSegment(fact.right_table));
}

std::string TableOf(const ColumnRef& ref, const AliasMap& alias_map,
                    const std::string& fallback) {
    if (ref.raw_alias.has_value()) {
        if (auto table = alias_map.Find(*ref.raw_alias)) {
            return *table;
        }
    }
    return fallback;
}

} // anonymous namespace

std::vector<JoinEdge> NormalizeJoins(const std::vector<JoinFact>& joins,
                                     const AliasMap& alias_map) {
    std::vector<JoinEdge> edges;
    edges.reserve(joins.size());
    for (const auto& fact : joins) {
        JoinEdge edge;
        edge.on = lineage_utils::CollapseWhitespace(fact.predicate_text);
        edge.kind = fact.kind;
        edge.clause_index = fact.clause_index;
        edge.form = fact.form;
        edge.left_table = fact.left_table;
        edge.right_table = fact.right_table;

        if (fact.form != JoinForm::Raw && !fact.left.Empty() && !fact.right.Empty()) {
            ColumnRef left = fact.left;
            ColumnRef right = fact.right;
            if (ReferencesJoinedTable(left, fact) && !ReferencesJoinedTable(right, fact)) {
                std::swap(left, right);
            }
            edge.left = ResolveColumnRef(left, alias_map);
            edge.right = ResolveColumnRef(right, alias_map);
            edge.left_table = TableOf(left, alias_map, fact.left_table);
            edge.right_table = TableOf(right, alias_map, fact.right_table);
        } else {
            edge.form = JoinForm::Raw;
        }
        edges.push_back(std::move(edge));
    }
    return edges;
}

} // namespace kpi_lineage
