#include <kpi_lineage/lineage/graph_builder.hpp>

#include <kpi_lineage/core/log.hpp>
#include <kpi_lineage/lineage/alias_resolver.hpp>
#include <kpi_lineage/lineage/join_normalizer.hpp>
#include <kpi_lineage/lineage/pattern_extractor.hpp>
#include <kpi_lineage/lineage/sql_tokenizer.hpp>

#include "lineage_utils.hpp"

#include <cctype>
#include <set>
#include <tuple>
#include <utility>
#include <vector>

namespace kpi_lineage {

namespace {

using lineage_utils::IEquals;
using lineage_utils::LastSegment;
using lineage_utils::ToUpper;

// ---------------------------------------------------------------------------
// GraphAssembler — node/edge lists with id and edge-key dedupe.
// ---------------------------------------------------------------------------
class GraphAssembler {
public:
    void AddNode(LineageNode node) {
        if (node.id.empty() || node_ids_.count(node.id) > 0) {
            return;
        }
        node_ids_.insert(node.id);
        graph_.nodes.push_back(std::move(node));
    }

    // Repeated (source, target, kind) accumulates weight on the first edge.
    void AddEdge(const std::string& source, const std::string& target, EdgeKind kind) {
        if (!HasNode(source) || !HasNode(target) || source == target) {
            return;
        }
        const auto key = std::make_tuple(source, target, kind);
        const auto it = edge_index_.find(key);
        if (it != edge_index_.end()) {
            graph_.edges[it->second].weight += 1;
            return;
        }
        edge_index_.emplace(key, graph_.edges.size());
        graph_.edges.push_back(LineageEdge{source, target, kind, 1});
    }

    [[nodiscard]] bool HasNode(const std::string& id) const {
        return node_ids_.count(id) > 0;
    }

    LineageGraph& Graph() { return graph_; }

private:
    LineageGraph graph_;
    std::set<std::string> node_ids_;
    std::map<std::tuple<std::string, std::string, EdgeKind>, std::size_t> edge_index_;
};

// Expression text without a trailing "AS name".
std::string StripAlias(std::string_view expression) {
    const auto tokens = TokenizeSql(expression);
    auto last = tokens.size();
    if (last >= 3 && tokens[last - 2].IsKeyword("AS") && tokens[last - 1].IsIdentifier() &&
        tokens[last - 2].depth == 0) {
        last -= 2;
    }
    return TokenRangeText(expression, tokens, 0, last);
}

// "sale_price" -> "Sale Price".
std::string Humanize(std::string_view column) {
    std::string out;
    bool word_start = true;
    for (char c : column) {
        if (c == '_' || c == '-' || c == ' ') {
            if (!out.empty() && out.back() != ' ') {
                out.push_back(' ');
            }
            word_start = true;
            continue;
        }
        const auto uc = static_cast<unsigned char>(c);
        out.push_back(word_start ? static_cast<char>(std::toupper(uc)) : c);
        word_start = false;
    }
    while (!out.empty() && out.back() == ' ') {
        out.pop_back();
    }
    return out;
}

std::string AggregatePrefix(std::string_view function) {
    const auto upper = ToUpper(function);
    if (upper == "AVG") return "Average";
    if (upper == "SUM") return "Total";
    if (upper == "COUNT") return "Count of";
    if (upper == "MIN") return "Minimum";
    if (upper == "MAX") return "Maximum";
    return "";
}

// Table id for a column reference, or empty when it cannot be attributed.
std::string TableForRef(const ColumnRef& ref, const LineageFacts& facts,
                        const TableResolver& tables) {
    if (ref.raw_alias.has_value()) {
        return tables.Resolve(*ref.raw_alias).value_or("");
    }
    if (facts.sources.size() == 1) {
        return facts.sources.front();
    }
    return "";
}

std::string OutputNodeId(OutputRole role, const LineageFacts& facts) {
    const std::string name = OutputRoleName(role);
    if (lineage_utils::Contains(facts.sources, name)) {
        return "output:" + name;
    }
    return name;
}

std::string ColumnNodeId(const std::string& table, const std::string& column) {
    return table + "." + column;
}

std::vector<std::string> ColumnExpressions(const LineageFacts& facts) {
    std::vector<std::string> expressions;
    for (const auto& entry : facts.outputs) {
        expressions.push_back(StripAlias(entry.second));
    }
    expressions.insert(expressions.end(), facts.filters.begin(), facts.filters.end());
    expressions.insert(expressions.end(), facts.group_by.begin(), facts.group_by.end());
    expressions.insert(expressions.end(), facts.having.begin(), facts.having.end());
    return expressions;
}

} // anonymous namespace

std::string FriendlyOutputLabel(std::string_view expression, OutputRole role) {
    const auto body = StripAlias(expression);
    const auto tokens = TokenizeSql(body);
    const auto refs = ScanColumnRefs(body);

    // FUNC(...) spanning the whole expression.
    if (tokens.size() >= 3 && tokens[0].kind == SqlTokenKind::Word &&
        tokens[1].IsSymbol("(") && tokens.back().IsSymbol(")") &&
        tokens.back().depth == tokens[1].depth) {
        bool single_call = true;
        for (std::size_t i = 2; i + 1 < tokens.size(); ++i) {
            if (tokens[i].depth <= tokens[1].depth) {
                single_call = false;
                break;
            }
        }
        if (single_call) {
            const auto prefix = AggregatePrefix(tokens[0].text);
            if (refs.empty()) {
                if (ToUpper(tokens[0].text) == "COUNT") {
                    return "Count";
                }
            } else if (refs.size() == 1) {
                const auto column = Humanize(refs.front().column);
                return prefix.empty() ? column : prefix + " " + column;
            }
        }
    }

    if (refs.size() == 1 && tokens.size() <= 3) {
        return Humanize(refs.front().column);
    }
    return Humanize(OutputRoleName(role));
}

LineageGraph BuildLineageGraph(const LineageFacts& facts, const GraphBuildOptions& options) {
    GraphAssembler graph;
    const TableResolver tables(facts.alias_map, facts.sources);

    // --- tables
    for (const auto& table : facts.sources) {
        graph.AddNode(LineageNode{table, NodeKind::Table, LastSegment(table)});
    }

    // --- columns
    if (options.include_columns) {
        for (const auto& expression : ColumnExpressions(facts)) {
            for (const auto& ref : ScanColumnRefs(expression)) {
                const auto table = TableForRef(ref, facts, tables);
                if (table.empty()) {
                    continue;
                }
                graph.AddNode(LineageNode{ColumnNodeId(table, ref.column), NodeKind::Column,
                                          ref.column});
            }
        }
    }

    // --- joins
    const auto joins = NormalizeJoins(facts.joins, facts.alias_map);
    std::vector<std::string> join_ids;
    for (std::size_t i = 0; i < joins.size(); ++i) {
        const auto n = std::to_string(i + 1);
        join_ids.push_back("__join__" + n);
        graph.AddNode(LineageNode{join_ids.back(), NodeKind::Join, "JOIN " + n});
    }

    // --- outputs
    for (const auto& entry : facts.outputs) {
        const auto role = entry.first;
        std::string label;
        const auto override_it = options.output_labels.find(role);
        if (override_it != options.output_labels.end() && !override_it->second.empty()) {
            label = override_it->second;
        } else {
            label = FriendlyOutputLabel(entry.second, role);
        }
        graph.AddNode(LineageNode{OutputNodeId(role, facts), NodeKind::Output, label});
    }

    // --- edges
    for (const auto& entry : facts.outputs) {
        const auto output_id = OutputNodeId(entry.first, facts);
        for (const auto& ref : ScanColumnRefs(StripAlias(entry.second))) {
            const auto table = TableForRef(ref, facts, tables);
            if (table.empty()) {
                continue;
            }
            graph.AddEdge(table, output_id, EdgeKind::Derives);
            if (options.include_columns) {
                graph.AddEdge(ColumnNodeId(table, ref.column), output_id,
                              EdgeKind::Projection);
            }
        }
    }

    if (options.include_columns) {
        for (const auto& expression : ColumnExpressions(facts)) {
            for (const auto& ref : ScanColumnRefs(expression)) {
                const auto table = TableForRef(ref, facts, tables);
                if (!table.empty()) {
                    graph.AddEdge(table, ColumnNodeId(table, ref.column), EdgeKind::Contains);
                }
            }
        }
    }

    for (std::size_t i = 0; i < joins.size(); ++i) {
        const auto& join = joins[i];
        for (const auto& side : {join.left_table, join.right_table}) {
            if (side.empty()) {
                continue;
            }
            const auto table = tables.Resolve(side);
            if (table.has_value()) {
                graph.AddEdge(*table, join_ids[i], EdgeKind::JoinIn);
            }
        }
    }
    RouteJoinOutputs(graph.Graph());

    LineageGraph result = std::move(graph.Graph());
    PruneIsolatedNodes(result);
    ApplyGraphLimits(result, GraphLimits{options.max_nodes, options.max_edges});
    if (result.truncated) {
        const auto message = "graph truncated to " + std::to_string(result.nodes.size()) +
                             " nodes and " + std::to_string(result.edges.size()) + " edges";
        result.warnings.push_back(message);
        LogWarn("graph", message);
    }
    LogDebug("graph", std::to_string(result.nodes.size()) + " nodes, " +
                          std::to_string(result.edges.size()) + " edges");
    return result;
}

} // namespace kpi_lineage
