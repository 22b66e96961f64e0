#pragma once

#include <kpi_lineage/lineage/lineage_facts.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kpi_lineage {

/// Extract lineage facts from one SQL text with a fixed set of lexical rules.
///
/// This is not a SQL parser. It recognizes table references after FROM and
/// JOIN, quoted three-part identifiers, ON equality and USING predicates,
/// the WHERE / GROUP BY / HAVING clauses and SELECT-list elements aliased to
/// x, y, label or value. Anything it does not recognize is skipped, so the
/// function never fails on arbitrary text; the worst outcome is empty facts.
///
/// A non-empty known_filter_date_column is taken as is; otherwise the first
/// `DATE(...) AS col` element of the SELECT list supplies it.
LineageFacts ExtractLineageFacts(
    std::string_view sql,
    const std::optional<std::string>& known_filter_date_column = std::nullopt);

/// Column references inside an expression fragment such as a SELECT element
/// or a filter. Qualified references ("o.total") carry their qualifier in
/// raw_alias. Function names, keywords, literals and the name after AS are
/// skipped. Order follows the text; duplicates are kept.
std::vector<ColumnRef> ScanColumnRefs(std::string_view expression);

} // namespace kpi_lineage
