#include <catch2/catch_test_macros.hpp>

#include <kpi_lineage/cli/output_formatter.hpp>

#include <sstream>
#include <string>

using namespace kpi_lineage;

// ===========================================================================
// PrintTable — human-readable
// ===========================================================================

TEST_CASE("OutputFormatter: table with headers and rows", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    std::vector<std::string> headers = {"ID", "TYPE", "LABEL"};
    std::vector<std::vector<std::string>> rows = {
        {"p.d.orders", "table", "orders"},
        {"__join__1", "join", "JOIN 1"},
    };

    fmt.PrintTable(headers, rows);

    auto output = out.str();
    CHECK(output.find("ID") != std::string::npos);
    CHECK(output.find("TYPE") != std::string::npos);
    CHECK(output.find("LABEL") != std::string::npos);
    CHECK(output.find("p.d.orders") != std::string::npos);
    CHECK(output.find("__join__1") != std::string::npos);
    // Should have separator line with dashes.
    CHECK(output.find("---") != std::string::npos);
}

TEST_CASE("OutputFormatter: table columns are padded", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintTable({"ID", "TYPE"}, {{"customers", "table"}});

    CHECK(out.str() ==
          "ID         TYPE \n"
          "---------  -----\n"
          "customers  table\n");
}

TEST_CASE("OutputFormatter: table with empty rows", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintTable({"A", "B"}, {});

    auto output = out.str();
    CHECK(output.find("A") != std::string::npos);
    CHECK(output.find("B") != std::string::npos);
}

// ===========================================================================
// PrintTable — JSON mode
// ===========================================================================

TEST_CASE("OutputFormatter: table in JSON mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    std::vector<std::string> headers = {"id", "type"};
    std::vector<std::vector<std::string>> rows = {
        {"p.d.orders", "table"},
    };

    fmt.PrintTable(headers, rows);

    auto output = out.str();
    CHECK(output.find("[{") != std::string::npos);
    CHECK(output.find("\"id\":\"p.d.orders\"") != std::string::npos);
    CHECK(output.find("\"type\":\"table\"") != std::string::npos);
}

TEST_CASE("OutputFormatter: table JSON empty rows", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    fmt.PrintTable({"a"}, {});

    CHECK(out.str() == "[]\n");
}

// ===========================================================================
// PrintDetail
// ===========================================================================

TEST_CASE("OutputFormatter: detail tree in plain mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintDetail("Lineage", {
        {"Sources", {{"table", "p.d.orders"}, {"table", "p.d.customers"}}},
        {"Filters", {}},
        {"", {{"filter_date_column", "x"}}},
    });

    CHECK(out.str() ==
          "Lineage\n"
          "|-- Sources\n"
          "    |-- table: p.d.orders\n"
          "    +-- table: p.d.customers\n"
          "+-- filter_date_column: x\n");
}

TEST_CASE("OutputFormatter: detail tree in color mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, true, out, err);

    fmt.PrintDetail("Lineage", {{"Outputs", {{"y", "SUM(o.amount) AS y"}}}});

    auto output = out.str();
    CHECK(output.find("\033[1mLineage") != std::string::npos);
    CHECK(output.find("y: SUM(o.amount) AS y") != std::string::npos);
    // Tree branches use box-drawing characters.
    CHECK(output.find("\xe2\x94\x94") != std::string::npos);
}

// ===========================================================================
// PrintJson
// ===========================================================================

TEST_CASE("OutputFormatter: PrintJson", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintJson(R"({"sources":[]})");

    CHECK(out.str() == "{\"sources\":[]}\n");
}

// ===========================================================================
// PrintError
// ===========================================================================

TEST_CASE("OutputFormatter: PrintError human mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    Error e{"ReadSqlInput", "kpi.sql", "Cannot open SQL file", std::nullopt,
            ErrorCategory::Io};
    fmt.PrintError(e);

    CHECK(err.str() ==
          "Error: ReadSqlInput [kpi.sql]\n"
          "  Cannot open SQL file\n");
    CHECK(out.str().empty());
}

TEST_CASE("OutputFormatter: PrintError human mode with hint", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    Error e{"ConfigLoader", "color", "Invalid color mode 'rainbow'",
            std::string("use auto, always or never"), ErrorCategory::Config};
    fmt.PrintError(e);

    CHECK(err.str().find("  Hint: use auto, always or never\n") != std::string::npos);
}

TEST_CASE("OutputFormatter: PrintError JSON mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    fmt.PrintError(Error::InvalidInput("compute_lineage", "SQL text contains a NUL byte"));

    auto error_output = err.str();
    CHECK(error_output.find("\"category\":\"invalid_input\"") != std::string::npos);
    CHECK(error_output.find("\"operation\":\"compute_lineage\"") != std::string::npos);
    CHECK(error_output.find("\"exit_code\":2") != std::string::npos);
    CHECK(out.str().empty());
}

// ===========================================================================
// PrintWarning
// ===========================================================================

TEST_CASE("OutputFormatter: PrintWarning goes to stderr", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintWarning("graph truncated to 800 nodes and 2000 edges");

    CHECK(err.str() == "Warning: graph truncated to 800 nodes and 2000 edges\n");
    CHECK(out.str().empty());
}

TEST_CASE("OutputFormatter: PrintWarning is silent in JSON mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    fmt.PrintWarning("ignored");

    CHECK(err.str().empty());
    CHECK(out.str().empty());
}

// ===========================================================================
// PrintSuccess
// ===========================================================================

TEST_CASE("OutputFormatter: PrintSuccess human mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintSuccess("No lineage found");

    CHECK(out.str() == "No lineage found\n");
}

TEST_CASE("OutputFormatter: PrintSuccess JSON mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    fmt.PrintSuccess("Done");

    auto output = out.str();
    CHECK(output.find("\"success\":true") != std::string::npos);
    CHECK(output.find("\"message\":\"Done\"") != std::string::npos);
}

// ===========================================================================
// IsJsonMode
// ===========================================================================

TEST_CASE("OutputFormatter: IsJsonMode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;

    OutputFormatter human(false, false, out, err);
    CHECK_FALSE(human.IsJsonMode());

    OutputFormatter json(true, false, out, err);
    CHECK(json.IsJsonMode());
}

// ===========================================================================
// Color mode — PrintTable
// ===========================================================================

TEST_CASE("OutputFormatter: color table uses FTXUI box-drawing", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, true, out, err);

    std::vector<std::string> headers = {"SOURCE", "TARGET"};
    std::vector<std::vector<std::string>> rows = {
        {"p.d.orders", "__join__1"},
    };

    fmt.PrintTable(headers, rows);

    auto output = out.str();
    CHECK(output.find("SOURCE") != std::string::npos);
    CHECK(output.find("p.d.orders") != std::string::npos);
    // FTXUI tables use Unicode box-drawing characters.
    CHECK(output.find("\xe2\x94") != std::string::npos); // UTF-8 prefix for box-drawing
}

TEST_CASE("OutputFormatter: color table empty rows still renders", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, true, out, err);

    fmt.PrintTable({"A", "B"}, {});

    auto output = out.str();
    CHECK(output.find("A") != std::string::npos);
    CHECK(output.find("B") != std::string::npos);
}

// ===========================================================================
// Color mode — PrintError / PrintWarning / PrintSuccess
// ===========================================================================

TEST_CASE("OutputFormatter: color error has red ANSI codes", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, true, out, err);

    Error e{"ConfigLoader", "kpi.yaml", "Failed to parse YAML file",
            std::string("check indentation"), ErrorCategory::Config};
    fmt.PrintError(e);

    auto error_output = err.str();
    CHECK(error_output.find("\033[1;31m") != std::string::npos);
    CHECK(error_output.find("Error:") != std::string::npos);
    CHECK(error_output.find("Failed to parse YAML file") != std::string::npos);
    CHECK(error_output.find("Hint: ") != std::string::npos);
}

TEST_CASE("OutputFormatter: color warning has yellow ANSI codes", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, true, out, err);

    fmt.PrintWarning("expected output 'label' not found in SELECT list");

    CHECK(err.str().find("\033[33mWarning: ") != std::string::npos);
}

TEST_CASE("OutputFormatter: color success has green ANSI codes", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, true, out, err);

    fmt.PrintSuccess("scale 1.00");

    auto output = out.str();
    CHECK(output.find("\033[1;32m") != std::string::npos);
    CHECK(output.find("OK") != std::string::npos);
    CHECK(output.find("scale 1.00") != std::string::npos);
}

// ===========================================================================
// Color mode — JSON wins over color
// ===========================================================================

TEST_CASE("OutputFormatter: JSON mode overrides color mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, true, out, err);

    CHECK(fmt.IsJsonMode());
    CHECK_FALSE(fmt.IsColorMode());

    fmt.PrintSuccess("Done");
    auto output = out.str();
    CHECK(output.find("\033[") == std::string::npos);
    CHECK(output.find("\"success\":true") != std::string::npos);
}

TEST_CASE("OutputFormatter: IsColorMode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;

    OutputFormatter plain(false, false, out, err);
    CHECK_FALSE(plain.IsColorMode());

    OutputFormatter colored(false, true, out, err);
    CHECK(colored.IsColorMode());

    OutputFormatter json_color(true, true, out, err);
    CHECK_FALSE(json_color.IsColorMode());
}
