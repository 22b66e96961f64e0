#pragma once

#include <kpi_lineage/lineage/lineage_facts.hpp>
#include <kpi_lineage/lineage/lineage_graph.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace kpi_lineage {

struct GraphBuildOptions {
    bool include_columns = false;
    std::size_t max_nodes = 800;
    std::size_t max_edges = 2000;
    // Per-role display labels; they replace the derived ones.
    std::map<OutputRole, std::string> output_labels;
};

/// Build the typed lineage graph for one set of facts.
///
/// Node order: tables, columns (only with include_columns), joins, outputs.
/// Isolated nodes are pruned and the node/edge caps applied last; a capped
/// graph is marked truncated and carries a warning.
LineageGraph BuildLineageGraph(const LineageFacts& facts,
                               const GraphBuildOptions& options = {});

/// Display label for a SELECT element:
///   "AVG(oi.sale_price) AS value" -> "Average Sale Price"
///   "DATE(o.created_at) AS x"     -> "Created At"
///   "COUNT(*) AS y"               -> "Count"
/// Falls back to the capitalized role name.
std::string FriendlyOutputLabel(std::string_view expression, OutputRole role);

} // namespace kpi_lineage
