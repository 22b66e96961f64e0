#include <kpi_lineage/mcp/mcp_tool_handlers.hpp>

#include <kpi_lineage/core/log.hpp>
#include <kpi_lineage/lineage/lineage_json.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace kpi_lineage {

namespace {

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

ToolResult MakeOkResult(const nlohmann::json& data) {
    return MakeTextResult(
        false, data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

ToolResult MakeErrorResult(const Error& error) {
    LogWarn("mcp", error.ToString());
    return MakeTextResult(true, error.ToJson());
}

ToolResult MakeParamError(const std::string& msg) {
    return MakeTextResult(true, msg);
}

// Get a required string param. Returns nullopt and sets out_error on failure.
// Empty SQL is a valid request, so only presence and type are checked.
std::optional<std::string> RequireString(const nlohmann::json& params,
                                         const std::string& key,
                                         ToolResult& out_error) {
    if (!params.contains(key) || !params[key].is_string()) {
        out_error = MakeParamError("Missing required parameter: " + key);
        return std::nullopt;
    }
    return params[key].get<std::string>();
}

std::optional<std::string> OptString(const nlohmann::json& params, const std::string& key) {
    if (params.contains(key) && params[key].is_string() &&
        !params[key].get<std::string>().empty()) {
        return params[key].get<std::string>();
    }
    return std::nullopt;
}

bool OptBool(const nlohmann::json& params, const std::string& key, bool default_val) {
    if (params.contains(key) && params[key].is_boolean()) {
        return params[key].get<bool>();
    }
    return default_val;
}

double OptNumber(const nlohmann::json& params, const std::string& key, double default_val) {
    if (params.contains(key) && params[key].is_number()) {
        return params[key].get<double>();
    }
    return default_val;
}

KpiMetadata MetadataFromParams(const nlohmann::json& params) {
    KpiMetadata metadata;
    metadata.filter_date_column = OptString(params, "filter_date_column");
    metadata.name = OptString(params, "name");
    metadata.expected_schema = OptString(params, "expected_schema");
    return metadata;
}

Result<Viewport, Error> ViewportFromParams(const nlohmann::json& params,
                                           const LineageToolDefaults& defaults) {
    auto viewport = Viewport::Create(OptNumber(params, "width", defaults.width),
                                     OptNumber(params, "height", defaults.height));
    if (viewport.IsErr()) {
        return Result<Viewport, Error>::Err(
            Error::InvalidInput("viewport", viewport.Error()));
    }
    return Result<Viewport, Error>::Ok(viewport.Value());
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json NumberProp(const std::string& desc) {
    return {{"type", "number"}, {"description", desc}};
}

nlohmann::json BoolProp(const std::string& desc) {
    return {{"type", "boolean"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

nlohmann::json KpiProps() {
    return {
        {"sql", StringProp("SQL text of the KPI query")},
        {"filter_date_column", StringProp("Known date filter column; skips inference")},
        {"name", StringProp("KPI name, used as the metric output label")},
        {"expected_schema", StringProp("Declared result shape, e.g. \"timeseries {x:STRING, y:NUMBER}\"")},
    };
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// compute_lineage
ToolResult HandleComputeLineage(const LineageToolDefaults& defaults,
                                const nlohmann::json& params) {
    ToolResult err;
    auto sql = RequireString(params, "sql", err);
    if (!sql) return err;

    auto result = ComputeLineage(*sql, MetadataFromParams(params), defaults.options);
    if (result.IsErr()) return MakeErrorResult(result.Error());
    return MakeOkResult(nlohmann::json(result.Value()));
}

// build_lineage_graph
ToolResult HandleBuildLineageGraph(const LineageToolDefaults& defaults,
                                   const nlohmann::json& params) {
    ToolResult err;
    auto sql = RequireString(params, "sql", err);
    if (!sql) return err;

    auto viewport = ViewportFromParams(params, defaults);
    if (viewport.IsErr()) return MakeErrorResult(viewport.Error());

    auto options = defaults.options;
    options.graph.include_columns =
        OptBool(params, "include_columns", options.graph.include_columns);
    const auto metadata = MetadataFromParams(params);

    auto facts = ComputeLineageFacts(*sql, metadata, options);
    if (facts.IsErr()) return MakeErrorResult(facts.Error());

    const auto view = BuildGraphAndLayout(facts.Value(), viewport.Value(), options, metadata);
    return MakeOkResult(nlohmann::json(view));
}

// layout_lineage_graph
ToolResult HandleLayoutLineageGraph(const LineageToolDefaults& defaults,
                                    const nlohmann::json& params) {
    if (!params.contains("graph")) {
        return MakeParamError("Missing required parameter: graph");
    }
    auto graph = LineageGraphFromJson(params["graph"]);
    if (graph.IsErr()) {
        return MakeErrorResult(Error::InvalidInput("layout_lineage_graph", graph.Error()));
    }

    auto viewport = ViewportFromParams(params, defaults);
    if (viewport.IsErr()) return MakeErrorResult(viewport.Error());

    LineageView view;
    view.graph = graph.Value();
    view.positions = Layout(view.graph, viewport.Value(), defaults.options.layout);
    view.view_transform = view.positions.view_transform;
    view.truncated = view.graph.truncated || view.positions.truncated;
    return MakeOkResult(nlohmann::json(view));
}

} // anonymous namespace

void RegisterLineageTools(ToolRegistry& registry, const LineageToolDefaults& defaults) {
    registry.Register(
        "compute_lineage",
        "Extract sources, joins, filters, group-by and output fields from a SQL query.",
        MakeSchema(KpiProps(), {"sql"}),
        [defaults](const nlohmann::json& params) {
            return HandleComputeLineage(defaults, params);
        });

    auto graph_props = KpiProps();
    graph_props["include_columns"] = BoolProp("Add column nodes with contains/projection edges");
    graph_props["width"] = NumberProp("Viewport width");
    graph_props["height"] = NumberProp("Viewport height");
    registry.Register(
        "build_lineage_graph",
        "Build the typed lineage graph of a SQL query and lay it out as a flow diagram.",
        MakeSchema(graph_props, {"sql"}),
        [defaults](const nlohmann::json& params) {
            return HandleBuildLineageGraph(defaults, params);
        });

    registry.Register(
        "layout_lineage_graph",
        "Lay out an existing lineage graph ({nodes, edges}) as a flow diagram.",
        MakeSchema({{"graph", {{"type", "object"},
                               {"description", "Graph with nodes [{id,type,label}] and "
                                               "edges [{source,target,type,weight}]"}}},
                    {"width", NumberProp("Viewport width")},
                    {"height", NumberProp("Viewport height")}},
                   {"graph"}),
        [defaults](const nlohmann::json& params) {
            return HandleLayoutLineageGraph(defaults, params);
        });
}

} // namespace kpi_lineage
