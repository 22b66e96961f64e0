#pragma once

#include <kpi_lineage/lineage/lineage_presenter.hpp>
#include <kpi_lineage/mcp/tool_registry.hpp>

namespace kpi_lineage {

// Settings a tool call falls back to when an argument is absent.
struct LineageToolDefaults {
    PresenterOptions options;
    double width = 960.0;
    double height = 540.0;
};

// Register compute_lineage, build_lineage_graph and layout_lineage_graph.
// Handlers copy the defaults; they hold no other state.
void RegisterLineageTools(ToolRegistry& registry,
                          const LineageToolDefaults& defaults = {});

} // namespace kpi_lineage
