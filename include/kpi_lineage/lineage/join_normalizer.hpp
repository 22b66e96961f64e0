#pragma once

#include <kpi_lineage/lineage/lineage_facts.hpp>

#include <string>
#include <vector>

namespace kpi_lineage {

// ---------------------------------------------------------------------------
// JoinEdge — canonical form of one join fact.
//
// left/right are display strings ("o.customer_id"); both are empty for a
// raw predicate, in which case `on` carries the whole predicate text.
// ---------------------------------------------------------------------------
struct JoinEdge {
    std::string left;
    std::string right;
    std::string on;
    std::string left_table;
    std::string right_table;
    std::string kind;
    int clause_index = 0;
    JoinForm form = JoinForm::Raw;

    bool operator==(const JoinEdge& other) const {
        return left == other.left && right == other.right && on == other.on &&
               left_table == other.left_table && right_table == other.right_table &&
               kind == other.kind && clause_index == other.clause_index &&
               form == other.form;
    }
    bool operator!=(const JoinEdge& other) const { return !(*this == other); }
};

/// Orient and resolve join facts. Equality sides are swapped when the left
/// side references the JOIN clause's own table, so `right` is always the
/// joined table; otherwise the written order is kept.
std::vector<JoinEdge> NormalizeJoins(const std::vector<JoinFact>& joins,
                                     const AliasMap& alias_map);

} // namespace kpi_lineage
