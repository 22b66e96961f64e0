#include <kpi_lineage/lineage/lineage_json.hpp>

#include <optional>

namespace kpi_lineage {

namespace {

// Member as a string, fallback when absent; nullopt when present with
// another type.
std::optional<std::string> StringMember(const nlohmann::json& j, const char* key,
                                        const std::string& fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j[key].is_string()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

} // anonymous namespace

void to_json(nlohmann::json& j, const Lineage& lineage) {
    j = nlohmann::json::object();
    j["sources"] = lineage.sources;
    j["joins"] = nlohmann::json::array();
    for (const auto& join : lineage.joins) {
        j["joins"].push_back({{"left", join.left}, {"right", join.right}, {"on", join.on}});
    }
    if (!lineage.filters.empty()) {
        j["filters"] = lineage.filters;
    }
    if (!lineage.group_by.empty()) {
        j["group_by"] = lineage.group_by;
    }
    if (!lineage.having.empty()) {
        j["having"] = lineage.having;
    }
    if (!lineage.outputs.empty()) {
        nlohmann::json outputs = nlohmann::json::object();
        for (const auto& entry : lineage.outputs) {
            outputs[OutputRoleName(entry.first)] = entry.second;
        }
        j["outputs"] = std::move(outputs);
    }
    if (lineage.filter_date_column.has_value()) {
        j["filter_date_column"] = *lineage.filter_date_column;
    }
}

void to_json(nlohmann::json& j, const LineageGraph& graph) {
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& node : graph.nodes) {
        nodes.push_back({{"id", node.id},
                         {"type", NodeKindName(node.kind)},
                         {"label", node.label}});
    }
    nlohmann::json edges = nlohmann::json::array();
    for (const auto& edge : graph.edges) {
        edges.push_back({{"source", edge.source},
                         {"target", edge.target},
                         {"type", EdgeKindName(edge.kind)},
                         {"weight", edge.weight}});
    }
    j = nlohmann::json{{"nodes", std::move(nodes)}, {"edges", std::move(edges)}};
    if (!graph.warnings.empty()) {
        j["warnings"] = graph.warnings;
    }
}

// {<id>: {x0, y0, x1, y1}}; edge geometry is rendered separately as links.
void to_json(nlohmann::json& j, const PositionedGraph& positions) {
    j = nlohmann::json::object();
    for (const auto& node : positions.nodes) {
        j[node.node.id] = {{"x0", node.rect.x0},
                           {"y0", node.rect.y0},
                           {"x1", node.rect.x1},
                           {"y1", node.rect.y1}};
    }
}

void to_json(nlohmann::json& j, const LineageView& view) {
    nlohmann::json links = nlohmann::json::array();
    for (const auto& edge : view.positions.edges) {
        links.push_back({{"source", edge.edge.source},
                         {"target", edge.edge.target},
                         {"width", edge.width},
                         {"path", edge.Path()}});
    }
    j = nlohmann::json{
        {"graph", view.graph},
        {"positions", view.positions},
        {"links", std::move(links)},
        {"view_transform",
         {{"scale", view.view_transform.scale},
          {"tx", view.view_transform.tx},
          {"ty", view.view_transform.ty}}},
        {"truncated", view.truncated},
    };
}

Result<LineageGraph, std::string> LineageGraphFromJson(const nlohmann::json& j) {
    using R = Result<LineageGraph, std::string>;
    if (!j.is_object() || !j.contains("nodes") || !j["nodes"].is_array()) {
        return R::Err("graph must be an object with a 'nodes' array");
    }
    LineageGraph graph;
    for (const auto& node : j["nodes"]) {
        if (!node.is_object() || !node.contains("id") || !node["id"].is_string()) {
            return R::Err("every node needs a string 'id'");
        }
        LineageNode parsed;
        parsed.id = node["id"].get<std::string>();
        const auto type = StringMember(node, "type", "table");
        const auto label = StringMember(node, "label", parsed.id);
        if (!type.has_value() || !label.has_value()) {
            return R::Err("node '" + parsed.id + "' has a non-string type or label");
        }
        const auto kind = ParseNodeKind(*type);
        if (!kind.has_value()) {
            return R::Err("node '" + parsed.id + "' has unknown type '" + *type + "'");
        }
        parsed.kind = *kind;
        parsed.label = *label;
        graph.nodes.push_back(std::move(parsed));
    }

    if (j.contains("edges")) {
        if (!j["edges"].is_array()) {
            return R::Err("'edges' must be an array");
        }
        for (const auto& edge : j["edges"]) {
            if (!edge.is_object() || !edge.contains("source") || !edge.contains("target") ||
                !edge["source"].is_string() || !edge["target"].is_string()) {
                return R::Err("every edge needs string 'source' and 'target'");
            }
            LineageEdge parsed;
            parsed.source = edge["source"].get<std::string>();
            parsed.target = edge["target"].get<std::string>();
            const auto type = StringMember(edge, "type", "derives");
            const auto kind = type.has_value() ? ParseEdgeKind(*type) : std::nullopt;
            if (!kind.has_value()) {
                return R::Err("edge " + parsed.source + " -> " + parsed.target +
                              " has unknown type '" + type.value_or("") + "'");
            }
            parsed.kind = *kind;
            if (edge.contains("weight")) {
                if (!edge["weight"].is_number_integer()) {
                    return R::Err("edge weight must be an integer");
                }
                parsed.weight = edge["weight"].get<int>();
            }
            graph.edges.push_back(std::move(parsed));
        }
    }
    if (j.contains("truncated")) {
        if (!j["truncated"].is_boolean()) {
            return R::Err("'truncated' must be a boolean");
        }
        graph.truncated = j["truncated"].get<bool>();
    }
    return R::Ok(std::move(graph));
}

} // namespace kpi_lineage
