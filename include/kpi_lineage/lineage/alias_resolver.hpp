#pragma once

#include <kpi_lineage/lineage/lineage_facts.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kpi_lineage {

/// Render a join-side reference for display. A known alias is kept, in its
/// declared spelling ("o.customer_id"), not expanded to the table id. Unknown
/// or absent aliases degrade to the literal text. Never fails.
std::string ResolveColumnRef(const ColumnRef& ref, const AliasMap& alias_map);

/// Map a column qualifier to a table id. Tries, in order: an alias, an exact
/// source id, a source whose trailing segments match ("orders", "d.orders").
/// Matching is case-insensitive; among equal matches the first source wins.
std::optional<std::string> ResolveTable(std::string_view qualifier,
                                        const AliasMap& alias_map,
                                        const std::vector<std::string>& sources);

// ---------------------------------------------------------------------------
// TableResolver — ResolveTable with the source list indexed once, for callers
// that resolve many qualifiers against the same facts.
// ---------------------------------------------------------------------------
class TableResolver {
public:
    TableResolver(const AliasMap& alias_map, const std::vector<std::string>& sources);

    [[nodiscard]] std::optional<std::string> Resolve(std::string_view qualifier) const;

private:
    const AliasMap& alias_map_;
    const std::vector<std::string>& sources_;
    std::unordered_map<std::string, std::size_t> exact_;   // lower-cased id
    std::unordered_map<std::string, std::size_t> suffix_;  // lower-cased tail after a '.'
};

// Sides chosen for a USING join column.
struct UsingSides {
    std::optional<std::string> left_alias;
    std::optional<std::string> right_alias;
};

/// The "two most recently declared aliases" heuristic for USING joins.
///
/// right: the JOIN clause's own alias (declared after join_offset), or none
/// when the joined table is unaliased. left: the most recent alias declared
/// before join_offset other than right. With three or more tables in scope
/// this only guesses the left side; it is not generalized further.
UsingSides InferUsingSides(const AliasMap& alias_map, std::size_t join_offset,
                           const std::optional<std::string>& join_alias);

} // namespace kpi_lineage
