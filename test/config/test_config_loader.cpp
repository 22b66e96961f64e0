#include <catch2/catch_test_macros.hpp>

#include <kpi_lineage/config/config_loader.hpp>

#include <string>

using namespace kpi_lineage;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests are run from the build directory; testdata lives in the source tree.
// Use __FILE__ to get the absolute path of this test file and derive it.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.max_sql_bytes == 2097152);
    CHECK(config.graph.include_columns == true);
    CHECK(config.graph.max_nodes == 200);
    CHECK(config.graph.max_edges == 500);

    CHECK(config.layout.width == 1280.0);
    CHECK(config.layout.height == 720.0);
    CHECK(config.layout.node_padding == 48.0);
    CHECK(config.layout.margin == 12.0);
    // Untouched keys keep their defaults.
    CHECK(config.layout.node_width == 16.0);
    CHECK(config.layout.max_scale == 1.2);

    REQUIRE(config.output_labels.size() == 2);
    CHECK(config.output_labels.at(OutputRole::Y) == "Revenue");
    CHECK(config.output_labels.at(OutputRole::X) == "Order Day");

    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/kpi-lineage.log");
    CHECK(config.color == ColorMode::Never);
    CHECK(config.verbose == true);
    CHECK(config.quiet == false);
    REQUIRE(config.config_path.has_value());
    CHECK(*config.config_path == TestDataPath("valid_config.yaml"));
}

TEST_CASE("LoadFromYaml: minimal config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.graph.max_nodes == 100);
    CHECK(config.graph.max_edges == 2000);
    CHECK(config.max_sql_bytes == kDefaultMaxSqlBytes);
    CHECK(config.output_labels.empty());
    CHECK_FALSE(config.log_file.has_value());
    CHECK(config.color == ColorMode::Auto);
}

TEST_CASE("LoadFromYaml: empty document gives defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("empty_config.yaml"));
    REQUIRE(result.IsOk());
    CHECK(result.Value().graph.max_nodes == 800);
    CHECK(result.Value().layout.width == 960.0);
}

TEST_CASE("LoadFromYaml: file not found", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/kpi.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Io);
    CHECK(result.Error().subject == "/nonexistent/path/kpi.yaml");
    CHECK(result.Error().message.find("Cannot read config file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("Failed to parse YAML") != std::string::npos);
}

TEST_CASE("LoadFromYaml: unknown output role", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_role.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().subject == "output_labels");
    CHECK(result.Error().message.find("'z'") != std::string::npos);
    CHECK(result.Error().ExitCode() == 3);
}

TEST_CASE("LoadFromYaml: invalid color mode", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_color.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().subject == "color");
    CHECK(result.Error().message.find("rainbow") != std::string::npos);
}

TEST_CASE("LoadFromYaml: non-positive limit", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("negative_limit.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "graph.max_edges must be positive");
    // Errors without a subject are attributed to the file.
    CHECK(result.Error().subject == TestDataPath("negative_limit.yaml"));
}

TEST_CASE("LoadFromYaml: wrong scalar type", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_scalar.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: root must be a mapping", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("list_root.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Config root must be a mapping");
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no args gives defaults", "[config][cli]") {
    const char* argv[] = {"kpi-lineage"};
    auto result = LoadFromCli(1, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK_FALSE(config.input.sql.has_value());
    CHECK_FALSE(config.input.sql_file.has_value());
    CHECK(config.graph.include_columns == false);
    CHECK(config.color == ColorMode::Auto);
    CHECK(config.json_output == false);
}

TEST_CASE("LoadFromCli: input flags", "[config][cli]") {
    const char* argv[] = {
        "kpi-lineage",
        "--sql", "SELECT COUNT(*) AS y FROM t",
        "--filter-date-column", "order_day",
        "--name", "Orders",
        "--expected-schema", "timeseries {x:STRING, y:NUMBER}"
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& input = result.Value().input;
    CHECK(input.sql == std::optional<std::string>("SELECT COUNT(*) AS y FROM t"));
    CHECK(input.filter_date_column == std::optional<std::string>("order_day"));
    CHECK(input.kpi_name == std::optional<std::string>("Orders"));
    CHECK(input.expected_schema ==
          std::optional<std::string>("timeseries {x:STRING, y:NUMBER}"));
}

TEST_CASE("LoadFromCli: graph and layout flags", "[config][cli]") {
    const char* argv[] = {
        "kpi-lineage",
        "--file", "kpi.sql",
        "--columns",
        "--max-nodes", "50",
        "--max-edges", "75",
        "--width", "1024.5",
        "--height", "600",
        "--max-sql-bytes", "2000000"
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.input.sql_file == std::optional<std::string>("kpi.sql"));
    CHECK(config.graph.include_columns == true);
    CHECK(config.graph.max_nodes == 50);
    CHECK(config.graph.max_edges == 75);
    CHECK(config.layout.width == 1024.5);
    CHECK(config.layout.height == 600.0);
    CHECK(config.max_sql_bytes == 2000000);
}

TEST_CASE("LoadFromCli: option flags", "[config][cli]") {
    const char* argv[] = {
        "kpi-lineage",
        "-v",
        "--json",
        "--no-color",
        "--log-file", "run.log",
        "-c", "kpi.yaml"
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.verbose == true);
    CHECK(config.json_output == true);
    CHECK(config.color == ColorMode::Never);
    CHECK(config.log_file == std::optional<std::string>("run.log"));
    CHECK(config.config_path == std::optional<std::string>("kpi.yaml"));
}

TEST_CASE("LoadFromCli: --color forces color", "[config][cli]") {
    const char* argv[] = {"kpi-lineage", "--color"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().color == ColorMode::Always);
}

TEST_CASE("LoadFromCli: non-positive cap is rejected", "[config][cli]") {
    const char* argv[] = {"kpi-lineage", "--max-nodes", "0"};
    auto result = LoadFromCli(3, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("--max-nodes") != std::string::npos);
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromCli: unknown flag is a parse error", "[config][cli]") {
    const char* argv[] = {"kpi-lineage", "--bogus"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML values", "[config][merge]") {
    auto yaml_result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml_result.IsOk());

    const char* argv[] = {
        "kpi-lineage",
        "--max-nodes", "50",
        "--width", "800",
        "--color",
        "--sql", "SELECT 1 AS y"
    };
    int argc = sizeof(argv) / sizeof(argv[0]);
    auto cli_result = LoadFromCli(argc, argv);
    REQUIRE(cli_result.IsOk());

    auto merged = MergeConfigs(yaml_result.Value(), cli_result.Value());

    CHECK(merged.graph.max_nodes == 50);
    CHECK(merged.graph.max_edges == 500);
    CHECK(merged.layout.width == 800.0);
    CHECK(merged.layout.height == 720.0);
    CHECK(merged.color == ColorMode::Always);
    CHECK(merged.input.sql == std::optional<std::string>("SELECT 1 AS y"));
    // YAML-only settings are preserved.
    CHECK(merged.graph.include_columns == true);
    CHECK(merged.output_labels.at(OutputRole::Y) == "Revenue");
    CHECK(merged.log_file == std::optional<std::string>("/tmp/kpi-lineage.log"));
}

TEST_CASE("MergeConfigs: YAML values preserved when CLI not set", "[config][merge]") {
    auto yaml_result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(yaml_result.IsOk());

    const char* argv[] = {"kpi-lineage"};
    auto cli_result = LoadFromCli(1, argv);
    REQUIRE(cli_result.IsOk());

    auto merged = MergeConfigs(yaml_result.Value(), cli_result.Value());
    CHECK(merged.graph.max_nodes == 100);
    CHECK(merged.config_path == std::optional<std::string>(TestDataPath("minimal_config.yaml")));
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(EngineConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: --sql and --file conflict", "[config][validate]") {
    EngineConfig config;
    config.input.sql = "SELECT 1 AS y";
    config.input.sql_file = "kpi.sql";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Cannot use both --sql and --file");
}

TEST_CASE("ValidateConfig: --verbose and --quiet conflict", "[config][validate]") {
    EngineConfig config;
    config.verbose = true;
    config.quiet = true;
    REQUIRE(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: invalid viewport", "[config][validate]") {
    EngineConfig config;
    config.layout.width = 0.0;
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().subject == "layout");
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("ValidateConfig: layout tuning bounds", "[config][validate]") {
    SECTION("node width") {
        EngineConfig config;
        config.layout.node_width = 0.0;
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("negative margin") {
        EngineConfig config;
        config.layout.margin = -1.0;
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("inverted scale bounds") {
        EngineConfig config;
        config.layout.min_scale = 2.0;
        config.layout.max_scale = 1.0;
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("fit fraction above one") {
        EngineConfig config;
        config.layout.fit_fraction = 1.5;
        CHECK(ValidateConfig(config).IsErr());
    }
}

TEST_CASE("ValidateConfig: zero caps", "[config][validate]") {
    EngineConfig config;
    config.graph.max_edges = 0;
    CHECK(ValidateConfig(config).IsErr());
}
