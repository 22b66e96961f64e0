#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kpi_lineage {

enum class NodeKind {
    Table,
    Join,
    Output,
    Column,
};

enum class EdgeKind {
    Contains,    // table -> column
    Projection,  // column -> output
    Derives,     // table -> output
    JoinIn,      // table -> join
    JoinOut,     // join -> output
};

/// Stable lowercase wire names: "table", "join_in", ...
const char* NodeKindName(NodeKind kind);
const char* EdgeKindName(EdgeKind kind);
std::optional<NodeKind> ParseNodeKind(std::string_view text);
std::optional<EdgeKind> ParseEdgeKind(std::string_view text);

struct LineageNode {
    std::string id;
    NodeKind kind = NodeKind::Table;
    std::string label;

    bool operator==(const LineageNode& other) const {
        return id == other.id && kind == other.kind && label == other.label;
    }
};

struct LineageEdge {
    std::string source;
    std::string target;
    EdgeKind kind = EdgeKind::Derives;
    int weight = 1;

    bool operator==(const LineageEdge& other) const {
        return source == other.source && target == other.target &&
               kind == other.kind && weight == other.weight;
    }
};

struct GraphLimits {
    std::size_t max_nodes = 800;
    std::size_t max_edges = 2000;
};

// ---------------------------------------------------------------------------
// LineageGraph — typed node/edge lists in first-seen order.
//
// truncated is set when limits dropped nodes or edges; warnings explain
// partial results.
// ---------------------------------------------------------------------------
struct LineageGraph {
    std::vector<LineageNode> nodes;
    std::vector<LineageEdge> edges;
    bool truncated = false;
    std::vector<std::string> warnings;

    [[nodiscard]] const LineageNode* FindNode(std::string_view id) const;
    [[nodiscard]] bool HasEdge(std::string_view source, std::string_view target,
                               EdgeKind kind) const;
    [[nodiscard]] bool Empty() const noexcept { return nodes.empty(); }
};

/// Drop nodes that no edge touches.
void PruneIsolatedNodes(LineageGraph& graph);

/// Add a JOIN_OUT edge from join_id to every output that one of the join's
/// input tables derives. This is a heuristic: the join is assumed to feed
/// each output its inputs feed.
void RouteJoinOutputs(LineageGraph& graph, const std::string& join_id);

/// Route every join node in one pass over the edges.
void RouteJoinOutputs(LineageGraph& graph);

/// Walk edges in first-seen order and keep each one whose endpoints still
/// fit under max_nodes, up to max_edges. A kept join whose JOIN_OUT edges
/// were cut gets them back when the edge cap allows and is dropped
/// otherwise. Nodes keep their order; a node without any edge survives only
/// while room remains. Sets truncated when anything was dropped.
void ApplyGraphLimits(LineageGraph& graph, const GraphLimits& limits);

} // namespace kpi_lineage
