#include <catch2/catch_test_macros.hpp>

#include <kpi_lineage/cli/lineage_commands.hpp>

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>

using namespace kpi_lineage;
using json = nlohmann::json;

namespace {

constexpr const char* kOrdersKpi =
    "SELECT DATE(o.created_at) AS x, SUM(o.amount) AS y "
    "FROM `p.d.orders` o JOIN `p.d.customers` c ON o.customer_id = c.id "
    "WHERE o.status = 'paid' GROUP BY x";

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/cli
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

EngineConfig ConfigWithSql(const std::string& sql) {
    EngineConfig config;
    config.input.sql = sql;
    return config;
}

struct CommandRun {
    int exit_code = 0;
    std::string out;
    std::string err;
};

CommandRun Run(Subcommand command, const EngineConfig& config, bool json_mode,
               const std::string& stdin_text = "") {
    std::istringstream in(stdin_text);
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter formatter(json_mode, false, out, err);
    CommandRun run;
    run.exit_code = RunLineageCommand(command, config, in, formatter);
    run.out = out.str();
    run.err = err.str();
    return run;
}

} // anonymous namespace

// ===========================================================================
// Subcommand names
// ===========================================================================

TEST_CASE("ParseSubcommandName: known commands", "[cli][commands]") {
    CHECK(ParseSubcommandName("extract") == Subcommand::Extract);
    CHECK(ParseSubcommandName("graph") == Subcommand::Graph);
    CHECK(ParseSubcommandName("layout") == Subcommand::Layout);
    CHECK(ParseSubcommandName("serve") == Subcommand::Serve);
    CHECK_FALSE(ParseSubcommandName("Extract").has_value());
    CHECK_FALSE(ParseSubcommandName("").has_value());
}

TEST_CASE("SubcommandName: inverse of ParseSubcommandName", "[cli][commands]") {
    for (auto command : {Subcommand::Extract, Subcommand::Graph, Subcommand::Layout,
                         Subcommand::Serve}) {
        CHECK(ParseSubcommandName(SubcommandName(command)) == command);
    }
}

// ===========================================================================
// ReadSqlInput
// ===========================================================================

TEST_CASE("ReadSqlInput: --sql wins over stdin", "[cli][input]") {
    InputConfig input;
    input.sql = "SELECT 1 AS y";
    std::istringstream in("SELECT 2 AS y");
    auto result = ReadSqlInput(input, in);
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "SELECT 1 AS y");
}

TEST_CASE("ReadSqlInput: reads stdin when no source is given", "[cli][input]") {
    std::istringstream in("SELECT a AS x\nFROM t\n");
    auto result = ReadSqlInput(InputConfig{}, in);
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "SELECT a AS x\nFROM t\n");
}

TEST_CASE("ReadSqlInput: reads a file", "[cli][input]") {
    InputConfig input;
    input.sql_file = TestDataPath("orders_kpi.sql");
    std::istringstream in;
    auto result = ReadSqlInput(input, in);
    REQUIRE(result.IsOk());
    CHECK(result.Value().find("FROM `p.d.orders` o") != std::string::npos);
}

TEST_CASE("ReadSqlInput: missing file is an I/O error", "[cli][input]") {
    InputConfig input;
    input.sql_file = "/nonexistent/kpi.sql";
    std::istringstream in;
    auto result = ReadSqlInput(input, in);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Io);
    CHECK(result.Error().subject == "/nonexistent/kpi.sql");
}

// ===========================================================================
// Config mapping
// ===========================================================================

TEST_CASE("PresenterOptionsFromConfig: copies caps and layout tuning", "[cli][config]") {
    EngineConfig config;
    config.max_sql_bytes = 2 * 1024 * 1024;
    config.graph.include_columns = true;
    config.graph.max_nodes = 10;
    config.graph.max_edges = 20;
    config.layout.node_padding = 30.0;
    config.layout.fit_fraction = 0.8;
    config.output_labels[OutputRole::Y] = "Revenue";

    auto options = PresenterOptionsFromConfig(config);
    CHECK(options.max_sql_bytes == 2 * 1024 * 1024);
    CHECK(options.graph.include_columns);
    CHECK(options.graph.max_nodes == 10);
    CHECK(options.graph.max_edges == 20);
    CHECK(options.graph.output_labels.at(OutputRole::Y) == "Revenue");
    CHECK(options.layout.node_padding == 30.0);
    CHECK(options.layout.fit_fraction == 0.8);
    CHECK(options.layout.max_nodes == 10);
    CHECK(options.layout.max_edges == 20);
}

TEST_CASE("MetadataFromConfig: input fields become KPI metadata", "[cli][config]") {
    EngineConfig config;
    config.input.kpi_name = "Revenue";
    config.input.filter_date_column = "order_day";
    config.input.expected_schema = "timeseries {x:STRING, y:NUMBER}";
    auto metadata = MetadataFromConfig(config);
    CHECK(metadata.name == std::optional<std::string>("Revenue"));
    CHECK(metadata.filter_date_column == std::optional<std::string>("order_day"));
    CHECK(metadata.expected_schema ==
          std::optional<std::string>("timeseries {x:STRING, y:NUMBER}"));
}

// ===========================================================================
// extract
// ===========================================================================

TEST_CASE("extract: JSON output", "[cli][commands][extract]") {
    auto run = Run(Subcommand::Extract, ConfigWithSql(kOrdersKpi), true);
    REQUIRE(run.exit_code == 0);
    auto j = json::parse(run.out);
    CHECK(j["sources"] == json::array({"p.d.orders", "p.d.customers"}));
    CHECK(j["joins"][0]["left"] == "o.customer_id");
    CHECK(j["outputs"]["y"] == "SUM(o.amount) AS y");
    CHECK(run.err.empty());
}

TEST_CASE("extract: human output is a tree", "[cli][commands][extract]") {
    auto run = Run(Subcommand::Extract, ConfigWithSql(kOrdersKpi), false);
    REQUIRE(run.exit_code == 0);
    CHECK(run.out.rfind("Lineage\n", 0) == 0);
    CHECK(run.out.find("|-- Sources") != std::string::npos);
    CHECK(run.out.find("table: p.d.orders") != std::string::npos);
    CHECK(run.out.find("JOIN 1: o.customer_id = c.id") != std::string::npos);
    CHECK(run.out.find("where: o.status = 'paid'") != std::string::npos);
    CHECK(run.out.find("+-- filter_date_column: x") != std::string::npos);
}

TEST_CASE("extract: reads stdin", "[cli][commands][extract]") {
    auto run = Run(Subcommand::Extract, EngineConfig{}, true,
                   "SELECT COUNT(*) AS y FROM `a.b.events`");
    REQUIRE(run.exit_code == 0);
    CHECK(json::parse(run.out)["sources"] == json::array({"a.b.events"}));
}

TEST_CASE("extract: reads a SQL file", "[cli][commands][extract]") {
    EngineConfig config;
    config.input.sql_file = TestDataPath("orders_kpi.sql");
    auto run = Run(Subcommand::Extract, config, true);
    REQUIRE(run.exit_code == 0);
    auto j = json::parse(run.out);
    CHECK(j["sources"] == json::array({"p.d.orders", "p.d.customers"}));
    CHECK(j["filter_date_column"] == "x");
}

TEST_CASE("extract: empty input reports no lineage", "[cli][commands][extract]") {
    auto run = Run(Subcommand::Extract, ConfigWithSql(""), false);
    CHECK(run.exit_code == 0);
    CHECK(run.out == "No lineage found\n");
}

TEST_CASE("extract: NUL byte exits with invalid input", "[cli][commands][extract]") {
    auto run = Run(Subcommand::Extract, ConfigWithSql(std::string("SELECT\0", 7)), true);
    CHECK(run.exit_code == 2);
    CHECK(run.out.empty());
    CHECK(run.err.find("\"category\":\"invalid_input\"") != std::string::npos);
}

TEST_CASE("extract: missing file exits with I/O error", "[cli][commands][extract]") {
    EngineConfig config;
    config.input.sql_file = "/nonexistent/kpi.sql";
    auto run = Run(Subcommand::Extract, config, false);
    CHECK(run.exit_code == 4);
    CHECK(run.err.find("Cannot open SQL file") != std::string::npos);
}

// ===========================================================================
// graph
// ===========================================================================

TEST_CASE("graph: JSON output", "[cli][commands][graph]") {
    auto run = Run(Subcommand::Graph, ConfigWithSql(kOrdersKpi), true);
    REQUIRE(run.exit_code == 0);
    auto j = json::parse(run.out);
    CHECK(j["graph"]["nodes"].size() == 5);
    CHECK(j["graph"]["edges"].size() == 6);
    CHECK(j["truncated"] == false);
}

TEST_CASE("graph: human output prints node and edge tables", "[cli][commands][graph]") {
    auto run = Run(Subcommand::Graph, ConfigWithSql(kOrdersKpi), false);
    REQUIRE(run.exit_code == 0);
    CHECK(run.out.find("LABEL") != std::string::npos);
    CHECK(run.out.find("Total Amount") != std::string::npos);
    CHECK(run.out.find("WEIGHT") != std::string::npos);
    CHECK(run.out.find("join_out") != std::string::npos);
}

TEST_CASE("graph: truncation warning goes to stderr", "[cli][commands][graph]") {
    auto config = ConfigWithSql(kOrdersKpi);
    config.graph.max_edges = 3;
    auto run = Run(Subcommand::Graph, config, false);
    REQUIRE(run.exit_code == 0);
    CHECK(run.err.find("Warning: graph truncated") != std::string::npos);
}

TEST_CASE("graph: KPI name and expected schema", "[cli][commands][graph]") {
    auto config = ConfigWithSql(kOrdersKpi);
    config.input.kpi_name = "Paid revenue";
    config.input.expected_schema = "categorical {label:STRING, value:NUMBER}";
    auto run = Run(Subcommand::Graph, config, true);
    REQUIRE(run.exit_code == 0);
    auto j = json::parse(run.out);
    CHECK(j["graph"]["nodes"][4]["label"] == "Paid revenue");
    REQUIRE(j["graph"]["warnings"].size() == 2);
    CHECK(j["graph"]["warnings"][0] == "expected output 'label' not found in SELECT list");
}

// ===========================================================================
// layout
// ===========================================================================

TEST_CASE("layout: JSON output", "[cli][commands][layout]") {
    auto run = Run(Subcommand::Layout, ConfigWithSql(kOrdersKpi), true);
    REQUIRE(run.exit_code == 0);
    auto j = json::parse(run.out);
    CHECK(j["positions"].size() == 5);
    CHECK(j["links"].size() == 6);
    const double scale = j["view_transform"]["scale"].get<double>();
    CHECK(scale >= 0.3);
    CHECK(scale <= 1.2);
}

TEST_CASE("layout: human output prints positions", "[cli][commands][layout]") {
    auto run = Run(Subcommand::Layout, ConfigWithSql(kOrdersKpi), false);
    REQUIRE(run.exit_code == 0);
    CHECK(run.out.find("COLUMN") != std::string::npos);
    CHECK(run.out.find("__join__1") != std::string::npos);
    CHECK(run.out.find("scale ") != std::string::npos);
}

TEST_CASE("layout: invalid viewport exits with invalid input", "[cli][commands][layout]") {
    auto config = ConfigWithSql(kOrdersKpi);
    config.layout.width = -1.0;
    auto run = Run(Subcommand::Layout, config, true);
    CHECK(run.exit_code == 2);
    CHECK(run.err.find("\"operation\":\"layout\"") != std::string::npos);
}

TEST_CASE("RunLineageCommand: serve is not a batch command", "[cli][commands]") {
    auto run = Run(Subcommand::Serve, EngineConfig{}, false);
    CHECK(run.exit_code == 99);
    CHECK_FALSE(run.err.empty());
}

// ===========================================================================
// Help
// ===========================================================================

TEST_CASE("PrintTopLevelHelp: lists every command", "[cli][help]") {
    std::ostringstream out;
    PrintTopLevelHelp(out, false);
    auto text = out.str();
    for (auto command : {"extract", "graph", "layout", "serve"}) {
        CHECK(text.find(std::string("  ") + command + " ") != std::string::npos);
    }
    CHECK(text.find("EXIT CODES") != std::string::npos);
    CHECK(text.find("\033[") == std::string::npos);
}

TEST_CASE("PrintTopLevelHelp: color adds ANSI codes", "[cli][help]") {
    std::ostringstream out;
    PrintTopLevelHelp(out, true);
    CHECK(out.str().find("\033[1m") != std::string::npos);
}
