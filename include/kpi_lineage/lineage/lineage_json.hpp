#pragma once

#include <kpi_lineage/core/result.hpp>
#include <kpi_lineage/lineage/flow_layout.hpp>
#include <kpi_lineage/lineage/lineage_graph.hpp>
#include <kpi_lineage/lineage/lineage_presenter.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace kpi_lineage {

// nlohmann::json serializers for the wire shapes. Optional members are
// omitted when empty; `sources` and `joins` are always present.
void to_json(nlohmann::json& j, const Lineage& lineage);
void to_json(nlohmann::json& j, const LineageGraph& graph);
void to_json(nlohmann::json& j, const PositionedGraph& positions);
void to_json(nlohmann::json& j, const LineageView& view);

/// Parse a {nodes:[{id,type,label}], edges:[{source,target,type,weight}]}
/// document. Unknown node or edge types are rejected.
[[nodiscard]] Result<LineageGraph, std::string> LineageGraphFromJson(const nlohmann::json& j);

} // namespace kpi_lineage
