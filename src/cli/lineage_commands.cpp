#include <kpi_lineage/cli/lineage_commands.hpp>

#include <kpi_lineage/core/log.hpp>
#include <kpi_lineage/core/terminal.hpp>
#include <kpi_lineage/lineage/lineage_json.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>

namespace kpi_lineage {

namespace {

constexpr int kExitSuccess = 0;

// Minimal ANSI helper for help text.
struct Ansi {
    std::ostream& out;
    bool color;

    Ansi& Bold(const std::string& s) {
        if (color) out << ansi::kBold;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Dim(const std::string& s) {
        if (color) out << ansi::kDim;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Normal(const std::string& s) {
        out << s;
        return *this;
    }

    Ansi& Nl() {
        out << "\n";
        return *this;
    }
};

std::string FormatNumber(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

int Fail(const OutputFormatter& formatter, const Error& error) {
    formatter.PrintError(error);
    return error.ExitCode();
}

void PrintWarnings(const OutputFormatter& formatter, const LineageGraph& graph) {
    for (const auto& warning : graph.warnings) {
        formatter.PrintWarning(warning);
    }
}

// ---------------------------------------------------------------------------
// extract
// ---------------------------------------------------------------------------
int PrintLineage(const Lineage& lineage, const OutputFormatter& formatter) {
    if (formatter.IsJsonMode()) {
        formatter.PrintJson(nlohmann::json(lineage).dump());
        return kExitSuccess;
    }

    std::vector<DetailSection> sections;
    DetailSection sources{"Sources", {}};
    for (const auto& source : lineage.sources) {
        sources.entries.emplace_back("table", source);
    }
    sections.push_back(std::move(sources));

    DetailSection joins{"Joins", {}};
    for (std::size_t i = 0; i < lineage.joins.size(); ++i) {
        const auto& join = lineage.joins[i];
        const auto text = join.left.empty() ? join.on : join.left + " = " + join.right;
        joins.entries.emplace_back("JOIN " + std::to_string(i + 1), text);
    }
    sections.push_back(std::move(joins));

    DetailSection filters{"Filters", {}};
    for (const auto& filter : lineage.filters) {
        filters.entries.emplace_back("where", filter);
    }
    for (const auto& predicate : lineage.having) {
        filters.entries.emplace_back("having", predicate);
    }
    sections.push_back(std::move(filters));

    DetailSection group_by{"Group by", {}};
    for (const auto& item : lineage.group_by) {
        group_by.entries.emplace_back("column", item);
    }
    sections.push_back(std::move(group_by));

    DetailSection outputs{"Outputs", {}};
    for (const auto& entry : lineage.outputs) {
        outputs.entries.emplace_back(OutputRoleName(entry.first), entry.second);
    }
    sections.push_back(std::move(outputs));

    if (lineage.filter_date_column.has_value()) {
        sections.push_back(DetailSection{"", {{"filter_date_column", *lineage.filter_date_column}}});
    }

    const bool empty = lineage.sources.empty() && lineage.joins.empty() &&
                       lineage.filters.empty() && lineage.outputs.empty();
    if (empty) {
        formatter.PrintSuccess("No lineage found");
        return kExitSuccess;
    }
    formatter.PrintDetail("Lineage", sections);
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// graph
// ---------------------------------------------------------------------------
int PrintGraph(const LineageGraph& graph, const OutputFormatter& formatter) {
    if (formatter.IsJsonMode()) {
        formatter.PrintJson(
            nlohmann::json{{"graph", graph}, {"truncated", graph.truncated}}.dump());
        return kExitSuccess;
    }

    std::vector<std::vector<std::string>> node_rows;
    for (const auto& node : graph.nodes) {
        node_rows.push_back({node.id, NodeKindName(node.kind), node.label});
    }
    formatter.PrintTable({"ID", "TYPE", "LABEL"}, node_rows);

    std::vector<std::vector<std::string>> edge_rows;
    for (const auto& edge : graph.edges) {
        edge_rows.push_back({edge.source, edge.target, EdgeKindName(edge.kind),
                             std::to_string(edge.weight)});
    }
    formatter.PrintTable({"SOURCE", "TARGET", "TYPE", "WEIGHT"}, edge_rows);
    PrintWarnings(formatter, graph);
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// layout
// ---------------------------------------------------------------------------
int PrintLayout(const LineageView& view, const OutputFormatter& formatter) {
    if (formatter.IsJsonMode()) {
        formatter.PrintJson(nlohmann::json(view).dump());
        return kExitSuccess;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& node : view.positions.nodes) {
        rows.push_back({node.node.id, std::to_string(node.column),
                        FormatNumber(node.rect.x0), FormatNumber(node.rect.y0),
                        FormatNumber(node.rect.x1), FormatNumber(node.rect.y1)});
    }
    formatter.PrintTable({"ID", "COLUMN", "X0", "Y0", "X1", "Y1"}, rows);
    formatter.PrintSuccess("scale " + FormatNumber(view.view_transform.scale) + ", translate " +
                           FormatNumber(view.view_transform.tx) + "," +
                           FormatNumber(view.view_transform.ty) +
                           (view.truncated ? " (truncated)" : ""));
    PrintWarnings(formatter, view.graph);
    return kExitSuccess;
}

} // anonymous namespace

std::optional<Subcommand> ParseSubcommandName(std::string_view name) {
    if (name == "extract") return Subcommand::Extract;
    if (name == "graph") return Subcommand::Graph;
    if (name == "layout") return Subcommand::Layout;
    if (name == "serve") return Subcommand::Serve;
    return std::nullopt;
}

const char* SubcommandName(Subcommand command) {
    switch (command) {
        case Subcommand::Extract: return "extract";
        case Subcommand::Graph: return "graph";
        case Subcommand::Layout: return "layout";
        case Subcommand::Serve: return "serve";
    }
    return "extract";
}

Result<std::string, Error> ReadSqlInput(const InputConfig& input, std::istream& in) {
    if (input.sql.has_value()) {
        return Result<std::string, Error>::Ok(*input.sql);
    }
    if (input.sql_file.has_value()) {
        std::ifstream file(*input.sql_file, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::Err(
                Error{"ReadSqlInput", *input.sql_file, "Cannot open SQL file",
                      std::nullopt, ErrorCategory::Io});
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        LogDebug("cli", "read " + std::to_string(buffer.str().size()) + " bytes from " +
                            *input.sql_file);
        return Result<std::string, Error>::Ok(buffer.str());
    }
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return Result<std::string, Error>::Err(
            Error{"ReadSqlInput", "stdin", "Failed to read SQL from standard input",
                  std::nullopt, ErrorCategory::Io});
    }
    return Result<std::string, Error>::Ok(std::move(text));
}

PresenterOptions PresenterOptionsFromConfig(const EngineConfig& config) {
    PresenterOptions options;
    options.max_sql_bytes = config.max_sql_bytes;
    options.graph.include_columns = config.graph.include_columns;
    options.graph.max_nodes = config.graph.max_nodes;
    options.graph.max_edges = config.graph.max_edges;
    options.graph.output_labels = config.output_labels;
    options.layout.node_width = config.layout.node_width;
    options.layout.node_padding = config.layout.node_padding;
    options.layout.margin = config.layout.margin;
    options.layout.min_scale = config.layout.min_scale;
    options.layout.max_scale = config.layout.max_scale;
    options.layout.fit_fraction = config.layout.fit_fraction;
    options.layout.max_nodes = config.graph.max_nodes;
    options.layout.max_edges = config.graph.max_edges;
    return options;
}

KpiMetadata MetadataFromConfig(const EngineConfig& config) {
    KpiMetadata metadata;
    metadata.name = config.input.kpi_name;
    metadata.filter_date_column = config.input.filter_date_column;
    metadata.expected_schema = config.input.expected_schema;
    return metadata;
}

int RunLineageCommand(Subcommand command, const EngineConfig& config, std::istream& in,
                      const OutputFormatter& formatter) {
    if (command == Subcommand::Serve) {
        return Fail(formatter, Error{"RunLineageCommand", "serve",
                                     "serve runs the tool server, not a batch command",
                                     std::nullopt, ErrorCategory::Internal});
    }

    auto sql = ReadSqlInput(config.input, in);
    if (sql.IsErr()) {
        return Fail(formatter, sql.Error());
    }

    const auto options = PresenterOptionsFromConfig(config);
    const auto metadata = MetadataFromConfig(config);
    LogInfo("cli", std::string("running ") + SubcommandName(command));

    if (command == Subcommand::Extract) {
        auto lineage = ComputeLineage(sql.Value(), metadata, options);
        if (lineage.IsErr()) {
            return Fail(formatter, lineage.Error());
        }
        return PrintLineage(lineage.Value(), formatter);
    }

    auto facts = ComputeLineageFacts(sql.Value(), metadata, options);
    if (facts.IsErr()) {
        return Fail(formatter, facts.Error());
    }

    if (command == Subcommand::Graph) {
        return PrintGraph(BuildGraph(facts.Value(), options, metadata), formatter);
    }

    auto viewport = Viewport::Create(config.layout.width, config.layout.height);
    if (viewport.IsErr()) {
        return Fail(formatter, Error::InvalidInput("layout", viewport.Error()));
    }
    return PrintLayout(BuildGraphAndLayout(facts.Value(), viewport.Value(), options, metadata),
                       formatter);
}

void PrintTopLevelHelp(std::ostream& out, bool use_color) {
    Ansi a{out, use_color};

    a.Bold("kpi-lineage").Normal(" - SQL lineage and dependency graphs for KPI queries").Nl().Nl();
    a.Dim("  Pattern-based: no SQL grammar, never fails on odd input.").Nl();
    a.Dim("  All commands accept --json for machine-readable output.").Nl();

    out << "\n";
    a.Bold("USAGE").Nl();
    out << "  kpi-lineage <command> [flags]\n";

    out << "\n";
    a.Bold("COMMANDS").Nl();
    out << "  extract   Sources, joins, filters, group-by and outputs of a query\n";
    out << "  graph     Typed lineage graph (tables, joins, outputs, columns)\n";
    out << "  layout    Graph with flow layout positions and view transform\n";
    out << "  serve     JSON-RPC tool server on stdin/stdout\n";

    out << "\n";
    a.Bold("INPUT").Nl();
    out << "  --sql <text>                 SQL text (default: read stdin)\n";
    out << "  --file <path>                Read SQL from a file\n";
    out << "  --filter-date-column <col>   Known date filter column\n";
    out << "  --name <text>                KPI name, labels the metric output\n";
    out << "  --expected-schema <text>     e.g. \"timeseries {x:STRING, y:NUMBER}\"\n";

    out << "\n";
    a.Bold("GRAPH / LAYOUT").Nl();
    out << "  --columns                    Include column nodes\n";
    out << "  --max-nodes <n>              Node cap (default 800)\n";
    out << "  --max-edges <n>              Edge cap (default 2000)\n";
    out << "  --width <w> --height <h>     Viewport (default 960x540)\n";

    out << "\n";
    a.Bold("GLOBAL FLAGS").Nl();
    out << "  -c, --config <yaml>          Config file\n";
    out << "  --max-sql-bytes <n>          Input cap (default 4 MiB, never below 1 MiB)\n";
    out << "  --json                       JSON output\n";
    out << "  -v, --verbose                Debug logging\n";
    out << "  -q, --quiet                  Errors only\n";
    out << "  --color / --no-color         Force or disable colors\n";
    out << "  --log-file <path>            Append logs to a file\n";
    out << "  --version                    Print version\n";
    out << "  -h, --help                   Print this help\n";

    out << "\n";
    a.Bold("EXIT CODES").Nl();
    a.Dim("  0 ok, 2 invalid input, 3 config, 4 I/O, 99 internal").Nl();
}

} // namespace kpi_lineage
