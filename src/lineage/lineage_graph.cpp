#include <kpi_lineage/lineage/lineage_graph.hpp>

#include "lineage_utils.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace kpi_lineage {

const char* NodeKindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::Table: return "table";
        case NodeKind::Join: return "join";
        case NodeKind::Output: return "output";
        case NodeKind::Column: return "column";
    }
    return "table";
}

const char* EdgeKindName(EdgeKind kind) {
    switch (kind) {
        case EdgeKind::Contains: return "contains";
        case EdgeKind::Projection: return "projection";
        case EdgeKind::Derives: return "derives";
        case EdgeKind::JoinIn: return "join_in";
        case EdgeKind::JoinOut: return "join_out";
    }
    return "derives";
}

std::optional<NodeKind> ParseNodeKind(std::string_view text) {
    for (auto kind : {NodeKind::Table, NodeKind::Join, NodeKind::Output, NodeKind::Column}) {
        if (lineage_utils::IEquals(text, NodeKindName(kind))) {
            return kind;
        }
    }
    return std::nullopt;
}

std::optional<EdgeKind> ParseEdgeKind(std::string_view text) {
    for (auto kind : {EdgeKind::Contains, EdgeKind::Projection, EdgeKind::Derives,
                      EdgeKind::JoinIn, EdgeKind::JoinOut}) {
        if (lineage_utils::IEquals(text, EdgeKindName(kind))) {
            return kind;
        }
    }
    return std::nullopt;
}

const LineageNode* LineageGraph::FindNode(std::string_view id) const {
    for (const auto& node : nodes) {
        if (node.id == id) {
            return &node;
        }
    }
    return nullptr;
}

bool LineageGraph::HasEdge(std::string_view source, std::string_view target,
                           EdgeKind kind) const {
    return std::any_of(edges.begin(), edges.end(), [&](const LineageEdge& edge) {
        return edge.kind == kind && edge.source == source && edge.target == target;
    });
}

void PruneIsolatedNodes(LineageGraph& graph) {
    std::unordered_set<std::string> touched;
    for (const auto& edge : graph.edges) {
        touched.insert(edge.source);
        touched.insert(edge.target);
    }
    graph.nodes.erase(std::remove_if(graph.nodes.begin(), graph.nodes.end(),
                                     [&](const LineageNode& node) {
                                         return touched.count(node.id) == 0;
                                     }),
                      graph.nodes.end());
}

// ---------------------------------------------------------------------------
// Join routing
// ---------------------------------------------------------------------------
namespace {

// Edge lookups used by routing, built in one pass.
struct RoutingIndex {
    std::unordered_map<std::string, std::vector<std::string>> join_inputs;
    std::unordered_map<std::string, std::vector<std::size_t>> derives_by_table;
    std::set<std::pair<std::string, std::string>> routed;

    explicit RoutingIndex(const std::vector<LineageEdge>& edges) {
        for (std::size_t i = 0; i < edges.size(); ++i) {
            const auto& edge = edges[i];
            switch (edge.kind) {
                case EdgeKind::JoinIn:
                    join_inputs[edge.target].push_back(edge.source);
                    break;
                case EdgeKind::Derives:
                    derives_by_table[edge.source].push_back(i);
                    break;
                case EdgeKind::JoinOut:
                    routed.emplace(edge.source, edge.target);
                    break;
                default:
                    break;
            }
        }
    }

    // Outputs the join's inputs derive, in edge order, not yet routed.
    std::vector<std::string> Missing(const std::string& join_id,
                                     const std::vector<LineageEdge>& edges) const {
        const auto inputs = join_inputs.find(join_id);
        if (inputs == join_inputs.end()) {
            return {};
        }
        std::vector<std::size_t> indices;
        for (const auto& table : inputs->second) {
            const auto it = derives_by_table.find(table);
            if (it != derives_by_table.end()) {
                indices.insert(indices.end(), it->second.begin(), it->second.end());
            }
        }
        std::sort(indices.begin(), indices.end());
        indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

        std::vector<std::string> targets;
        std::unordered_set<std::string> seen;
        for (auto index : indices) {
            const auto& target = edges[index].target;
            if (routed.count({join_id, target}) == 0 && seen.insert(target).second) {
                targets.push_back(target);
            }
        }
        return targets;
    }
};

void RouteJoins(LineageGraph& graph, const std::vector<std::string>& join_ids) {
    RoutingIndex index(graph.edges);
    for (const auto& join_id : join_ids) {
        for (auto& target : index.Missing(join_id, graph.edges)) {
            index.routed.emplace(join_id, target);
            graph.edges.push_back(LineageEdge{join_id, std::move(target), EdgeKind::JoinOut, 1});
        }
    }
}

std::vector<std::string> JoinIds(const LineageGraph& graph) {
    std::vector<std::string> ids;
    for (const auto& node : graph.nodes) {
        if (node.kind == NodeKind::Join) {
            ids.push_back(node.id);
        }
    }
    return ids;
}

} // anonymous namespace

void RouteJoinOutputs(LineageGraph& graph, const std::string& join_id) {
    RouteJoins(graph, {join_id});
}

void RouteJoinOutputs(LineageGraph& graph) {
    RouteJoins(graph, JoinIds(graph));
}

// ---------------------------------------------------------------------------
// Limits
// ---------------------------------------------------------------------------
void ApplyGraphLimits(LineageGraph& graph, const GraphLimits& limits) {
    std::unordered_map<std::string, std::size_t> position;
    position.reserve(graph.nodes.size());
    for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
        position.emplace(graph.nodes[i].id, i);
    }

    // Edges in first-seen order, each admitted only with both endpoints.
    std::vector<bool> kept_node(graph.nodes.size(), false);
    std::vector<bool> has_edge(graph.nodes.size(), false);
    std::size_t node_count = 0;
    std::vector<LineageEdge> edges;
    bool dropped = false;
    for (const auto& edge : graph.edges) {
        const auto source = position.find(edge.source);
        const auto target = position.find(edge.target);
        if (source == position.end() || target == position.end()) {
            dropped = true;
            continue;
        }
        has_edge[source->second] = true;
        has_edge[target->second] = true;
        std::size_t added = kept_node[source->second] ? 0 : 1;
        if (!kept_node[target->second] && target->second != source->second) {
            ++added;
        }
        if (edges.size() >= limits.max_edges || node_count + added > limits.max_nodes) {
            dropped = true;
            continue;
        }
        kept_node[source->second] = true;
        kept_node[target->second] = true;
        node_count += added;
        edges.push_back(edge);
    }

    // A cut can separate a join from its JOIN_OUT edges. Restore them when
    // the edge budget allows, otherwise drop the join.
    if (dropped) {
        RoutingIndex index(edges);
        std::unordered_map<std::string, std::size_t> degree;
        for (const auto& edge : edges) {
            ++degree[edge.source];
            ++degree[edge.target];
        }
        std::unordered_set<std::string> removed_joins;
        std::size_t edge_count = edges.size();
        std::vector<LineageEdge> restored;
        for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
            const auto& node = graph.nodes[i];
            if (!kept_node[i] || node.kind != NodeKind::Join) {
                continue;
            }
            auto missing = index.Missing(node.id, edges);
            if (missing.empty()) {
                continue;
            }
            if (edge_count + missing.size() <= limits.max_edges) {
                edge_count += missing.size();
                for (auto& target : missing) {
                    restored.push_back(
                        LineageEdge{node.id, std::move(target), EdgeKind::JoinOut, 1});
                }
                continue;
            }
            // Its edges no longer count against the cap.
            removed_joins.insert(node.id);
            edge_count -= degree[node.id];
        }
        if (!removed_joins.empty()) {
            edges.erase(std::remove_if(edges.begin(), edges.end(),
                                       [&](const LineageEdge& edge) {
                                           return removed_joins.count(edge.source) > 0 ||
                                                  removed_joins.count(edge.target) > 0;
                                       }),
                        edges.end());
        }
        edges.insert(edges.end(), std::make_move_iterator(restored.begin()),
                     std::make_move_iterator(restored.end()));
    }

    // Nodes keep their order: every endpoint of a kept edge, plus nodes that
    // never had an edge while room remains.
    std::unordered_set<std::string> endpoints;
    for (const auto& edge : edges) {
        endpoints.insert(edge.source);
        endpoints.insert(edge.target);
    }
    std::size_t isolated_room =
        limits.max_nodes > endpoints.size() ? limits.max_nodes - endpoints.size() : 0;
    std::vector<LineageNode> nodes;
    for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
        auto& node = graph.nodes[i];
        if (endpoints.count(node.id) > 0) {
            nodes.push_back(std::move(node));
        } else if (!has_edge[i] && isolated_room > 0) {
            --isolated_room;
            nodes.push_back(std::move(node));
        } else {
            dropped = true;
        }
    }

    graph.nodes = std::move(nodes);
    graph.edges = std::move(edges);
    if (dropped) {
        graph.truncated = true;
    }
}

} // namespace kpi_lineage
