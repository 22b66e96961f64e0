#include <kpi_lineage/lineage/lineage_presenter.hpp>

#include <kpi_lineage/core/log.hpp>
#include <kpi_lineage/lineage/join_normalizer.hpp>
#include <kpi_lineage/lineage/pattern_extractor.hpp>

#include <algorithm>
#include <cctype>

namespace kpi_lineage {

namespace {

std::string_view Trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

// Labels in precedence order: metadata per role, configured per role, the
// KPI name on its metric output.
std::map<OutputRole, std::string> ResolveOutputLabels(const LineageFacts& facts,
                                                      const PresenterOptions& options,
                                                      const KpiMetadata& metadata) {
    auto labels = options.graph.output_labels;
    if (metadata.name.has_value() && !metadata.name->empty()) {
        for (auto role : {OutputRole::Value, OutputRole::Y}) {
            if (facts.outputs.count(role) > 0) {
                if (labels.count(role) == 0) {
                    labels[role] = *metadata.name;
                }
                break;
            }
        }
    }
    for (const auto& entry : metadata.output_labels) {
        labels[entry.first] = entry.second;
    }
    return labels;
}

} // anonymous namespace

std::vector<OutputRole> ExpectedSchemaRoles(std::string_view expected_schema) {
    auto body = expected_schema;
    const auto open = body.find('{');
    if (open != std::string_view::npos) {
        body.remove_prefix(open + 1);
        const auto close = body.find('}');
        if (close != std::string_view::npos) {
            body = body.substr(0, close);
        }
    }

    std::vector<OutputRole> roles;
    while (!body.empty()) {
        const auto comma = body.find(',');
        auto entry = body.substr(0, comma);
        body = comma == std::string_view::npos ? std::string_view{} : body.substr(comma + 1);

        const auto colon = entry.find(':');
        const auto name = Trim(entry.substr(0, colon));
        const auto role = ParseOutputRole(name);
        if (role.has_value() && std::find(roles.begin(), roles.end(), *role) == roles.end()) {
            roles.push_back(*role);
        }
    }
    return roles;
}

Result<LineageFacts, Error> ComputeLineageFacts(std::string_view sql,
                                                const KpiMetadata& metadata,
                                                const PresenterOptions& options) {
    auto text = SqlText::Create(sql, options.max_sql_bytes);
    if (text.IsErr()) {
        return Result<LineageFacts, Error>::Err(
            Error::InvalidInput("compute_lineage", text.Error()));
    }

    auto facts = ExtractLineageFacts(text.Value().Value(), metadata.filter_date_column);
    LogDebug("extract", std::to_string(facts.sources.size()) + " sources, " +
                            std::to_string(facts.joins.size()) + " joins, " +
                            std::to_string(facts.filters.size()) + " filters, " +
                            std::to_string(facts.outputs.size()) + " outputs");
    return Result<LineageFacts, Error>::Ok(std::move(facts));
}

Result<Lineage, Error> ComputeLineage(std::string_view sql, const KpiMetadata& metadata,
                                      const PresenterOptions& options) {
    return ComputeLineageFacts(sql, metadata, options).Map(
        [](const LineageFacts& facts) { return ToLineage(facts); });
}

Lineage ToLineage(const LineageFacts& facts) {
    Lineage lineage;
    lineage.sources = facts.sources;
    for (const auto& edge : NormalizeJoins(facts.joins, facts.alias_map)) {
        lineage.joins.push_back(LineageJoin{edge.left, edge.right, edge.on});
    }
    lineage.filters = facts.filters;
    lineage.group_by = facts.group_by;
    lineage.having = facts.having;
    lineage.outputs = facts.outputs;
    lineage.filter_date_column = facts.filter_date_column;
    return lineage;
}

LineageGraph BuildGraph(const LineageFacts& facts, const PresenterOptions& options,
                        const KpiMetadata& metadata) {
    auto graph_options = options.graph;
    graph_options.output_labels = ResolveOutputLabels(facts, options, metadata);

    auto graph = BuildLineageGraph(facts, graph_options);
    if (metadata.expected_schema.has_value()) {
        for (auto role : ExpectedSchemaRoles(*metadata.expected_schema)) {
            if (facts.outputs.count(role) == 0) {
                graph.warnings.push_back(std::string("expected output '") +
                                         OutputRoleName(role) +
                                         "' not found in SELECT list");
            }
        }
    }
    return graph;
}

LineageView BuildGraphAndLayout(const LineageFacts& facts, const Viewport& viewport,
                                const PresenterOptions& options,
                                const KpiMetadata& metadata) {
    LineageView view;
    view.graph = BuildGraph(facts, options, metadata);
    view.positions = LayoutLineageGraph(view.graph, viewport, options.layout);
    view.view_transform = view.positions.view_transform;
    view.truncated = view.graph.truncated || view.positions.truncated;
    return view;
}

PositionedGraph Layout(const LineageGraph& graph, const Viewport& viewport,
                       const LayoutOptions& options) {
    return LayoutLineageGraph(graph, viewport, options);
}

} // namespace kpi_lineage
