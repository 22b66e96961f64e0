#pragma once

#include <kpi_lineage/core/types.hpp>
#include <kpi_lineage/lineage/lineage_graph.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kpi_lineage {

struct NodeRect {
    double x0 = 0.0;
    double y0 = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;

    [[nodiscard]] double Width() const { return x1 - x0; }
    [[nodiscard]] double Height() const { return y1 - y0; }
};

struct PositionedNode {
    LineageNode node;
    NodeRect rect;
    int column = 0;
    double value = 0.0;
};

struct PositionedEdge {
    LineageEdge edge;
    double width = 0.0;
    double x0 = 0.0;        // source right edge
    double x1 = 0.0;        // target left edge
    double source_y = 0.0;
    double target_y = 0.0;

    // Horizontal cubic Bezier as an SVG path: "M x0,y0 C xm,y0 xm,y1 x1,y1".
    [[nodiscard]] std::string Path() const;
};

struct ViewTransform {
    double scale = 1.0;
    double tx = 0.0;
    double ty = 0.0;
};

struct PositionedGraph {
    std::vector<PositionedNode> nodes;
    std::vector<PositionedEdge> edges;
    ViewTransform view_transform;
    bool truncated = false;

    [[nodiscard]] bool Empty() const noexcept { return nodes.empty(); }
    [[nodiscard]] const PositionedNode* Find(std::string_view id) const;
};

struct LayoutOptions {
    double node_width = 16.0;
    double node_padding = 96.0;
    double margin = 8.0;
    double min_scale = 0.3;
    double max_scale = 1.2;
    double fit_fraction = 0.9;
    std::size_t max_nodes = 800;
    std::size_t max_edges = 2000;
};

/// Directed flow (Sankey-style) layout.
///
/// Columns are longest-path ranks with sinks pushed to the last column.
/// Node height is proportional to max(in-weight, out-weight). A graph with a
/// cycle, a self-loop or an edge whose endpoint is missing lays out as an
/// empty graph; so does an empty input. Pure: equal inputs give equal output.
PositionedGraph LayoutLineageGraph(const LineageGraph& graph, const Viewport& viewport,
                                   const LayoutOptions& options = {});

/// Scale and translation that center bounds in the viewport. Each axis fit
/// is clamped to [min_scale, max_scale] before taking the smaller one.
ViewTransform FitViewTransform(const NodeRect& bounds, const Viewport& viewport,
                               const LayoutOptions& options);

} // namespace kpi_lineage
