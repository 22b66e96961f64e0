#pragma once

#include <kpi_lineage/core/terminal.hpp>
#include <kpi_lineage/core/types.hpp>
#include <kpi_lineage/lineage/lineage_facts.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace kpi_lineage {

struct GraphConfig {
    bool include_columns = false;
    std::size_t max_nodes = 800;
    std::size_t max_edges = 2000;
};

struct LayoutConfig {
    double width = 960.0;
    double height = 540.0;
    double node_width = 16.0;
    double node_padding = 96.0;
    double margin = 8.0;
    double min_scale = 0.3;
    double max_scale = 1.2;
    double fit_fraction = 0.9;
};

// Where the SQL comes from and what is known about the KPI. CLI only.
struct InputConfig {
    std::optional<std::string> sql;
    std::optional<std::string> sql_file;   // stdin when neither is set
    std::optional<std::string> filter_date_column;
    std::optional<std::string> kpi_name;
    std::optional<std::string> expected_schema;
};

struct EngineConfig {
    std::size_t max_sql_bytes = kDefaultMaxSqlBytes;
    GraphConfig graph;
    LayoutConfig layout;
    std::map<OutputRole, std::string> output_labels;
    InputConfig input;
    std::optional<std::string> config_path;
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
    ColorMode color = ColorMode::Auto;
};

} // namespace kpi_lineage
