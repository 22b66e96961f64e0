#include <kpi_lineage/lineage/flow_layout.hpp>

#include <kpi_lineage/core/log.hpp>

#include <algorithm>
#include <cstdio>
#include <functional>
#include <map>
#include <queue>

namespace kpi_lineage {

namespace {

double Clamp(double value, double lo, double hi) {
    return std::max(lo, std::min(hi, value));
}

std::string FormatCoord(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

PositionedGraph EmptyLayout(bool truncated) {
    PositionedGraph empty;
    empty.truncated = truncated;
    return empty;
}

// Index-based view of a graph whose edges all reference existing nodes.
struct IndexedGraph {
    std::vector<std::vector<std::size_t>> out_edges;
    std::vector<std::vector<std::size_t>> in_edges;
    std::vector<std::size_t> edge_source;
    std::vector<std::size_t> edge_target;
};

// Kahn's algorithm; ready nodes leave in input order. Returns fewer than
// n nodes when the graph has a cycle.
std::vector<std::size_t> TopologicalOrder(const IndexedGraph& indexed, std::size_t n) {
    std::vector<std::size_t> indegree(n, 0);
    for (auto target : indexed.edge_target) {
        ++indegree[target];
    }
    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<std::size_t>> ready;
    for (std::size_t i = 0; i < n; ++i) {
        if (indegree[i] == 0) {
            ready.push(i);
        }
    }
    std::vector<std::size_t> order;
    order.reserve(n);
    while (!ready.empty()) {
        const auto u = ready.top();
        ready.pop();
        order.push_back(u);
        for (auto e : indexed.out_edges[u]) {
            const auto v = indexed.edge_target[e];
            if (--indegree[v] == 0) {
                ready.push(v);
            }
        }
    }
    return order;
}

} // anonymous namespace

std::string PositionedEdge::Path() const {
    const auto xm = FormatCoord((x0 + x1) / 2.0);
    const auto sy = FormatCoord(source_y);
    const auto ty = FormatCoord(target_y);
    return "M" + FormatCoord(x0) + "," + sy + " C" + xm + "," + sy + " " + xm + "," + ty +
           " " + FormatCoord(x1) + "," + ty;
}

const PositionedNode* PositionedGraph::Find(std::string_view id) const {
    for (const auto& node : nodes) {
        if (node.node.id == id) {
            return &node;
        }
    }
    return nullptr;
}

ViewTransform FitViewTransform(const NodeRect& bounds, const Viewport& viewport,
                               const LayoutOptions& options) {
    const double width = viewport.Width();
    const double height = viewport.Height();
    const double bw = bounds.Width();
    const double bh = bounds.Height();

    const double sx = bw > 0.0 ? Clamp(options.fit_fraction * width / bw, options.min_scale,
                                       options.max_scale)
                               : options.max_scale;
    const double sy = bh > 0.0 ? Clamp(options.fit_fraction * height / bh, options.min_scale,
                                       options.max_scale)
                               : options.max_scale;
    ViewTransform transform;
    transform.scale = Clamp(std::min(sx, sy), options.min_scale, options.max_scale);
    transform.tx = width / 2.0 - transform.scale * (bounds.x0 + bw / 2.0);
    transform.ty = height / 2.0 - transform.scale * (bounds.y0 + bh / 2.0);
    return transform;
}

PositionedGraph LayoutLineageGraph(const LineageGraph& graph, const Viewport& viewport,
                                   const LayoutOptions& options) {
    // --- validate: every endpoint exists, no self-loops
    std::map<std::string, std::size_t> input_index;
    for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
        input_index.emplace(graph.nodes[i].id, i);
    }
    for (const auto& edge : graph.edges) {
        if (input_index.count(edge.source) == 0 || input_index.count(edge.target) == 0) {
            LogWarn("layout", "edge " + edge.source + " -> " + edge.target +
                                  " references a missing node; layout skipped");
            return EmptyLayout(graph.truncated);
        }
        if (edge.source == edge.target) {
            LogWarn("layout", "self-loop on " + edge.source + "; layout skipped");
            return EmptyLayout(graph.truncated);
        }
    }

    LineageGraph bounded = graph;
    PruneIsolatedNodes(bounded);
    ApplyGraphLimits(bounded, GraphLimits{options.max_nodes, options.max_edges});
    const bool truncated = graph.truncated || bounded.truncated;
    const auto n = bounded.nodes.size();
    if (n == 0) {
        return EmptyLayout(truncated);
    }

    std::map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < n; ++i) {
        index.emplace(bounded.nodes[i].id, i);
    }
    IndexedGraph indexed;
    indexed.out_edges.resize(n);
    indexed.in_edges.resize(n);
    for (std::size_t e = 0; e < bounded.edges.size(); ++e) {
        const auto s = index.at(bounded.edges[e].source);
        const auto t = index.at(bounded.edges[e].target);
        indexed.edge_source.push_back(s);
        indexed.edge_target.push_back(t);
        indexed.out_edges[s].push_back(e);
        indexed.in_edges[t].push_back(e);
    }

    const auto order = TopologicalOrder(indexed, n);
    if (order.size() != n) {
        LogWarn("layout", "graph has a cycle; layout skipped");
        return EmptyLayout(truncated);
    }

    // --- columns: longest path, sinks justified to the right
    std::vector<int> column(n, 0);
    for (auto u : order) {
        for (auto e : indexed.out_edges[u]) {
            const auto v = indexed.edge_target[e];
            column[v] = std::max(column[v], column[u] + 1);
        }
    }
    const int max_column = *std::max_element(column.begin(), column.end());
    for (std::size_t i = 0; i < n; ++i) {
        if (indexed.out_edges[i].empty()) {
            column[i] = max_column;
        }
    }

    // --- node values
    auto edge_weight = [&](std::size_t e) {
        return static_cast<double>(std::max(1, bounded.edges[e].weight));
    };
    std::vector<double> value(n, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        double in = 0.0;
        double out = 0.0;
        for (auto e : indexed.in_edges[i]) in += edge_weight(e);
        for (auto e : indexed.out_edges[i]) out += edge_weight(e);
        value[i] = std::max(in, out);
    }

    std::vector<std::vector<std::size_t>> columns(static_cast<std::size_t>(max_column) + 1);
    for (std::size_t i = 0; i < n; ++i) {
        columns[static_cast<std::size_t>(column[i])].push_back(i);
    }

    // --- vertical scale
    const double inner_width = std::max(0.0, viewport.Width() - 2.0 * options.margin);
    const double inner_height = std::max(0.0, viewport.Height() - 2.0 * options.margin);
    std::size_t tallest = 0;
    for (const auto& nodes : columns) {
        tallest = std::max(tallest, nodes.size());
    }
    double padding = options.node_padding;
    if (tallest > 1) {
        padding = std::min(padding, inner_height / static_cast<double>(tallest - 1));
    }
    double ky = -1.0;
    for (const auto& nodes : columns) {
        double total = 0.0;
        for (auto i : nodes) total += value[i];
        if (total <= 0.0) {
            continue;
        }
        const double available =
            inner_height - static_cast<double>(nodes.size() - 1) * padding;
        const double k = available / total;
        ky = ky < 0.0 ? k : std::min(ky, k);
    }
    ky = std::max(ky, 0.0);

    // --- node rectangles
    const double kx = max_column > 0
                          ? std::max(0.0, (inner_width - options.node_width) / max_column)
                          : 0.0;
    std::vector<NodeRect> rect(n);
    for (std::size_t c = 0; c < columns.size(); ++c) {
        const auto& nodes = columns[c];
        double total = 0.0;
        for (auto i : nodes) total += std::max(1.0, value[i] * ky);
        total += static_cast<double>(nodes.size() - (nodes.empty() ? 0 : 1)) * padding;
        double y = options.margin + (inner_height - total) / 2.0;
        const double x0 = max_column > 0
                              ? options.margin + static_cast<double>(c) * kx
                              : options.margin + (inner_width - options.node_width) / 2.0;
        for (auto i : nodes) {
            const double h = std::max(1.0, value[i] * ky);
            rect[i] = NodeRect{x0, y, x0 + options.node_width, y + h};
            y += h + padding;
        }
    }

    // --- edges: widths and stacked attachment points
    PositionedGraph result;
    result.truncated = truncated;
    result.edges.resize(bounded.edges.size());
    for (std::size_t e = 0; e < bounded.edges.size(); ++e) {
        auto& pe = result.edges[e];
        pe.edge = bounded.edges[e];
        pe.width = std::max(1.0, edge_weight(e) * ky);
        pe.x0 = rect[indexed.edge_source[e]].x1;
        pe.x1 = rect[indexed.edge_target[e]].x0;
    }
    for (std::size_t i = 0; i < n; ++i) {
        auto outgoing = indexed.out_edges[i];
        std::stable_sort(outgoing.begin(), outgoing.end(), [&](std::size_t a, std::size_t b) {
            return rect[indexed.edge_target[a]].y0 < rect[indexed.edge_target[b]].y0;
        });
        double offset = rect[i].y0;
        for (auto e : outgoing) {
            result.edges[e].source_y = offset + result.edges[e].width / 2.0;
            offset += result.edges[e].width;
        }

        auto incoming = indexed.in_edges[i];
        std::stable_sort(incoming.begin(), incoming.end(), [&](std::size_t a, std::size_t b) {
            return rect[indexed.edge_source[a]].y0 < rect[indexed.edge_source[b]].y0;
        });
        offset = rect[i].y0;
        for (auto e : incoming) {
            result.edges[e].target_y = offset + result.edges[e].width / 2.0;
            offset += result.edges[e].width;
        }
    }

    NodeRect bounds = rect[0];
    result.nodes.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        result.nodes.push_back(PositionedNode{bounded.nodes[i], rect[i], column[i], value[i]});
        bounds.x0 = std::min(bounds.x0, rect[i].x0);
        bounds.y0 = std::min(bounds.y0, rect[i].y0);
        bounds.x1 = std::max(bounds.x1, rect[i].x1);
        bounds.y1 = std::max(bounds.y1, rect[i].y1);
    }
    result.view_transform = FitViewTransform(bounds, viewport, options);
    LogDebug("layout", std::to_string(n) + " nodes in " + std::to_string(columns.size()) +
                           " columns");
    return result;
}

} // namespace kpi_lineage
