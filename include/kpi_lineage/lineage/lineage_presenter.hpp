#pragma once

#include <kpi_lineage/core/result.hpp>
#include <kpi_lineage/core/types.hpp>
#include <kpi_lineage/lineage/flow_layout.hpp>
#include <kpi_lineage/lineage/graph_builder.hpp>
#include <kpi_lineage/lineage/lineage_facts.hpp>
#include <kpi_lineage/lineage/lineage_graph.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kpi_lineage {

// ---------------------------------------------------------------------------
// KpiMetadata — what the query service knows about a KPI besides its SQL.
//
// expected_schema is the KPI's declared result shape, for example
// "timeseries {x:STRING, y:NUMBER}". name labels the metric output.
// ---------------------------------------------------------------------------
struct KpiMetadata {
    std::optional<std::string> name;
    std::optional<std::string> filter_date_column;
    std::optional<std::string> expected_schema;
    std::map<OutputRole, std::string> output_labels;
};

struct LineageJoin {
    std::string left;
    std::string right;
    std::string on;

    bool operator==(const LineageJoin& other) const {
        return left == other.left && right == other.right && on == other.on;
    }
};

// Wire form of extracted lineage.
struct Lineage {
    std::vector<std::string> sources;
    std::vector<LineageJoin> joins;
    std::vector<std::string> filters;
    std::vector<std::string> group_by;
    std::vector<std::string> having;
    std::map<OutputRole, std::string> outputs;
    std::optional<std::string> filter_date_column;

    bool operator==(const Lineage& other) const {
        return sources == other.sources && joins == other.joins &&
               filters == other.filters && group_by == other.group_by &&
               having == other.having && outputs == other.outputs &&
               filter_date_column == other.filter_date_column;
    }
};

struct LineageView {
    LineageGraph graph;
    PositionedGraph positions;
    ViewTransform view_transform;
    bool truncated = false;
};

struct PresenterOptions {
    std::size_t max_sql_bytes = kDefaultMaxSqlBytes;
    GraphBuildOptions graph;
    LayoutOptions layout;
};

/// Validate the text and extract facts. Err(InvalidInput) for oversized
/// text or text with NUL bytes; empty facts are a valid Ok.
[[nodiscard]] Result<LineageFacts, Error> ComputeLineageFacts(
    std::string_view sql, const KpiMetadata& metadata = {},
    const PresenterOptions& options = {});

/// ComputeLineageFacts followed by ToLineage.
[[nodiscard]] Result<Lineage, Error> ComputeLineage(
    std::string_view sql, const KpiMetadata& metadata = {},
    const PresenterOptions& options = {});

/// Join facts normalized; everything else copied.
Lineage ToLineage(const LineageFacts& facts);

/// Graph with output labels resolved from metadata and options. Roles named
/// by metadata.expected_schema but missing from the SELECT list add a graph
/// warning.
LineageGraph BuildGraph(const LineageFacts& facts, const PresenterOptions& options = {},
                        const KpiMetadata& metadata = {});

/// BuildGraph followed by the flow layout.
LineageView BuildGraphAndLayout(const LineageFacts& facts, const Viewport& viewport,
                                const PresenterOptions& options = {},
                                const KpiMetadata& metadata = {});

PositionedGraph Layout(const LineageGraph& graph, const Viewport& viewport,
                       const LayoutOptions& options = {});

/// Roles declared by an expected_schema string, in declaration order:
/// "timeseries {x:STRING, y:NUMBER}" -> {x, y}. Unknown names are ignored.
std::vector<OutputRole> ExpectedSchemaRoles(std::string_view expected_schema);

} // namespace kpi_lineage
