#include <kpi_lineage/config/config_loader.hpp>

#include <kpi_lineage/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>

namespace kpi_lineage {

namespace {

Error MakeConfigError(const std::string& message, const std::string& subject = "") {
    return Error{"ConfigLoader", subject, message, std::nullopt, ErrorCategory::Config};
}

std::optional<ColorMode> ParseColorMode(const std::string& text) {
    if (text == "auto") return ColorMode::Auto;
    if (text == "always" || text == "true") return ColorMode::Always;
    if (text == "never" || text == "false") return ColorMode::Never;
    return std::nullopt;
}

template <typename T>
void ReadScalar(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

Result<void, Error> ParseYamlGraph(const YAML::Node& node, GraphConfig& graph) {
    ReadScalar(node, "include_columns", graph.include_columns);
    if (node["max_nodes"]) {
        const auto value = node["max_nodes"].as<long long>();
        if (value <= 0) {
            return Result<void, Error>::Err(
                MakeConfigError("graph.max_nodes must be positive"));
        }
        graph.max_nodes = static_cast<std::size_t>(value);
    }
    if (node["max_edges"]) {
        const auto value = node["max_edges"].as<long long>();
        if (value <= 0) {
            return Result<void, Error>::Err(
                MakeConfigError("graph.max_edges must be positive"));
        }
        graph.max_edges = static_cast<std::size_t>(value);
    }
    return Result<void, Error>::Ok();
}

void ParseYamlLayout(const YAML::Node& node, LayoutConfig& layout) {
    ReadScalar(node, "width", layout.width);
    ReadScalar(node, "height", layout.height);
    ReadScalar(node, "node_width", layout.node_width);
    ReadScalar(node, "node_padding", layout.node_padding);
    ReadScalar(node, "margin", layout.margin);
    ReadScalar(node, "min_scale", layout.min_scale);
    ReadScalar(node, "max_scale", layout.max_scale);
    ReadScalar(node, "fit_fraction", layout.fit_fraction);
}

Result<EngineConfig, Error> ParseYamlRoot(const YAML::Node& root) {
    EngineConfig config;
    if (!root || root.IsNull()) {
        return Result<EngineConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<EngineConfig, Error>::Err(
            MakeConfigError("Config root must be a mapping"));
    }

    if (root["max_sql_bytes"]) {
        const auto value = root["max_sql_bytes"].as<long long>();
        if (value <= 0) {
            return Result<EngineConfig, Error>::Err(
                MakeConfigError("max_sql_bytes must be positive"));
        }
        config.max_sql_bytes = static_cast<std::size_t>(value);
    }

    // -- Graph --
    if (root["graph"]) {
        auto graph_result = ParseYamlGraph(root["graph"], config.graph);
        if (graph_result.IsErr()) {
            return Result<EngineConfig, Error>::Err(graph_result.Error());
        }
    }

    // -- Layout --
    if (root["layout"]) {
        ParseYamlLayout(root["layout"], config.layout);
    }

    // -- Output labels --
    if (root["output_labels"]) {
        for (const auto& entry : root["output_labels"]) {
            const auto key = entry.first.as<std::string>();
            const auto role = ParseOutputRole(key);
            if (!role.has_value()) {
                return Result<EngineConfig, Error>::Err(MakeConfigError(
                    "Unknown output role '" + key + "' (expected x, y, label or value)",
                    "output_labels"));
            }
            config.output_labels[*role] = entry.second.as<std::string>();
        }
    }

    // -- Options --
    if (root["log_file"]) {
        config.log_file = root["log_file"].as<std::string>();
    }
    ReadScalar(root, "json_output", config.json_output);
    ReadScalar(root, "verbose", config.verbose);
    ReadScalar(root, "quiet", config.quiet);
    if (root["color"]) {
        const auto text = root["color"].as<std::string>();
        const auto mode = ParseColorMode(text);
        if (!mode.has_value()) {
            return Result<EngineConfig, Error>::Err(MakeConfigError(
                "Invalid color mode '" + text + "' (expected auto, always or never)",
                "color"));
        }
        config.color = *mode;
    }

    return Result<EngineConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<EngineConfig, Error> LoadFromYaml(std::string_view file_path) {
    try {
        const auto root = YAML::LoadFile(std::string(file_path));
        auto result = ParseYamlRoot(root);
        if (result.IsErr()) {
            auto error = result.Error();
            if (error.subject.empty()) {
                error.subject = std::string(file_path);
            }
            return Result<EngineConfig, Error>::Err(std::move(error));
        }
        auto config = std::move(result).Value();
        config.config_path = std::string(file_path);
        return Result<EngineConfig, Error>::Ok(std::move(config));
    } catch (const YAML::BadFile& e) {
        return Result<EngineConfig, Error>::Err(Error{
            "ConfigLoader", std::string(file_path),
            "Cannot read config file: " + std::string(e.what()), std::nullopt,
            ErrorCategory::Io});
    } catch (const YAML::Exception& e) {
        return Result<EngineConfig, Error>::Err(MakeConfigError(
            "Failed to parse YAML file: " + std::string(e.what()), std::string(file_path)));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<EngineConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("kpi-lineage", kVersion,
                                     argparse::default_arguments::none);

    // Input flags
    program.add_argument("--sql")
        .help("SQL text to analyze");
    program.add_argument("--file")
        .help("Read SQL from a file");
    program.add_argument("--filter-date-column")
        .help("Known date filter column (skips inference)");
    program.add_argument("--name")
        .help("KPI name, used as the metric output label");
    program.add_argument("--expected-schema")
        .help("Declared result shape, e.g. \"timeseries {x:STRING, y:NUMBER}\"");

    // Graph and layout flags
    program.add_argument("--columns")
        .help("Include column nodes")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--max-nodes")
        .help("Node cap")
        .scan<'i', int>();
    program.add_argument("--max-edges")
        .help("Edge cap")
        .scan<'i', int>();
    program.add_argument("--width")
        .help("Viewport width")
        .scan<'g', double>();
    program.add_argument("--height")
        .help("Viewport height")
        .scan<'g', double>();
    program.add_argument("--max-sql-bytes")
        .help("Input size cap in bytes (never below 1 MiB)")
        .scan<'i', int>();

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<EngineConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    EngineConfig config;

    // Input
    if (auto val = program.present("--sql")) {
        config.input.sql = *val;
    }
    if (auto val = program.present("--file")) {
        config.input.sql_file = *val;
    }
    if (auto val = program.present("--filter-date-column")) {
        config.input.filter_date_column = *val;
    }
    if (auto val = program.present("--name")) {
        config.input.kpi_name = *val;
    }
    if (auto val = program.present("--expected-schema")) {
        config.input.expected_schema = *val;
    }

    // Graph and layout
    if (program.get<bool>("--columns")) {
        config.graph.include_columns = true;
    }
    if (auto val = program.present<int>("--max-nodes")) {
        if (*val <= 0) {
            return Result<EngineConfig, Error>::Err(
                MakeConfigError("--max-nodes must be positive"));
        }
        config.graph.max_nodes = static_cast<std::size_t>(*val);
    }
    if (auto val = program.present<int>("--max-edges")) {
        if (*val <= 0) {
            return Result<EngineConfig, Error>::Err(
                MakeConfigError("--max-edges must be positive"));
        }
        config.graph.max_edges = static_cast<std::size_t>(*val);
    }
    if (auto val = program.present<double>("--width")) {
        config.layout.width = *val;
    }
    if (auto val = program.present<double>("--height")) {
        config.layout.height = *val;
    }
    if (auto val = program.present<int>("--max-sql-bytes")) {
        if (*val <= 0) {
            return Result<EngineConfig, Error>::Err(
                MakeConfigError("--max-sql-bytes must be positive"));
        }
        config.max_sql_bytes = static_cast<std::size_t>(*val);
    }

    // Options
    if (auto val = program.present("--config")) {
        config.config_path = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }
    if (program.get<bool>("--color")) {
        config.color = ColorMode::Always;
    }
    if (program.get<bool>("--no-color")) {
        config.color = ColorMode::Never;
    }

    return Result<EngineConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
EngineConfig MergeConfigs(const EngineConfig& yaml_base, const EngineConfig& cli_overrides) {
    const EngineConfig defaults;
    EngineConfig merged = yaml_base;

    if (cli_overrides.max_sql_bytes != defaults.max_sql_bytes) {
        merged.max_sql_bytes = cli_overrides.max_sql_bytes;
    }

    // Graph overrides
    if (cli_overrides.graph.include_columns) {
        merged.graph.include_columns = true;
    }
    if (cli_overrides.graph.max_nodes != defaults.graph.max_nodes) {
        merged.graph.max_nodes = cli_overrides.graph.max_nodes;
    }
    if (cli_overrides.graph.max_edges != defaults.graph.max_edges) {
        merged.graph.max_edges = cli_overrides.graph.max_edges;
    }

    // Layout overrides (only the viewport is exposed on the command line)
    if (cli_overrides.layout.width != defaults.layout.width) {
        merged.layout.width = cli_overrides.layout.width;
    }
    if (cli_overrides.layout.height != defaults.layout.height) {
        merged.layout.height = cli_overrides.layout.height;
    }

    for (const auto& entry : cli_overrides.output_labels) {
        merged.output_labels[entry.first] = entry.second;
    }

    // Input is per invocation
    merged.input = cli_overrides.input;
    if (cli_overrides.config_path.has_value()) {
        merged.config_path = cli_overrides.config_path;
    }

    // Options
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.color != ColorMode::Auto) {
        merged.color = cli_overrides.color;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const EngineConfig& config) {
    if (config.max_sql_bytes == 0) {
        return Result<void, Error>::Err(MakeConfigError("max_sql_bytes must be positive"));
    }
    if (config.graph.max_nodes == 0 || config.graph.max_edges == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("graph.max_nodes and graph.max_edges must be positive"));
    }

    const auto& layout = config.layout;
    auto viewport = Viewport::Create(layout.width, layout.height);
    if (viewport.IsErr()) {
        return Result<void, Error>::Err(MakeConfigError(viewport.Error(), "layout"));
    }
    if (!std::isfinite(layout.node_width) || layout.node_width <= 0.0) {
        return Result<void, Error>::Err(
            MakeConfigError("layout.node_width must be positive"));
    }
    if (!std::isfinite(layout.node_padding) || layout.node_padding < 0.0 ||
        !std::isfinite(layout.margin) || layout.margin < 0.0) {
        return Result<void, Error>::Err(
            MakeConfigError("layout.node_padding and layout.margin must not be negative"));
    }
    if (!(layout.min_scale > 0.0) || !(layout.max_scale >= layout.min_scale)) {
        return Result<void, Error>::Err(MakeConfigError(
            "layout scale bounds must satisfy 0 < min_scale <= max_scale"));
    }
    if (!(layout.fit_fraction > 0.0 && layout.fit_fraction <= 1.0)) {
        return Result<void, Error>::Err(
            MakeConfigError("layout.fit_fraction must be in (0, 1]"));
    }

    if (config.input.sql.has_value() && config.input.sql_file.has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --sql and --file"));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace kpi_lineage
