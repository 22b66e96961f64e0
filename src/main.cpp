#include <kpi_lineage/cli/lineage_commands.hpp>
#include <kpi_lineage/cli/output_formatter.hpp>
#include <kpi_lineage/config/config_loader.hpp>
#include <kpi_lineage/core/log.hpp>
#include <kpi_lineage/core/terminal.hpp>
#include <kpi_lineage/core/version.hpp>
#include <kpi_lineage/mcp/mcp_server.hpp>
#include <kpi_lineage/mcp/mcp_tool_handlers.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess      = 0;
constexpr int kExitInvalidInput = 2;
constexpr int kExitIo           = 4;

struct SubcommandParse {
    std::optional<kpi_lineage::Subcommand> cmd;
    bool found_subcommand;
};

// The subcommand is the first argument; anything else is a usage error.
SubcommandParse ParseSubcommand(int argc, const char* const* argv) {
    if (argc < 2) {
        return {std::nullopt, false};
    }
    std::string_view arg1{argv[1]};
    if (!arg1.empty() && arg1[0] == '-') {
        return {std::nullopt, false};
    }
    return {kpi_lineage::ParseSubcommandName(arg1), true};
}

// Resolve color mode for help output (stdout-based, before logger init).
bool ResolveColorForHelp(int argc, const char* const* argv) {
    auto mode = kpi_lineage::ColorMode::Auto;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--color") mode = kpi_lineage::ColorMode::Always;
        if (arg == "--no-color") mode = kpi_lineage::ColorMode::Never;
    }
    return kpi_lineage::ShouldUseColor(mode, kpi_lineage::IsStdoutTty());
}

bool HasFlag(int argc, const char* const* argv, std::string_view flag,
             std::string_view short_flag = {}) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == flag || (!short_flag.empty() && arg == short_flag)) {
            return true;
        }
        // Everything after --sql is SQL text, not a flag.
        if (arg == "--sql") ++i;
    }
    return false;
}

// Build argv without the subcommand token, so LoadFromCli sees plain flags.
std::vector<const char*> StripSubcommand(int argc, const char* const* argv,
                                         bool has_subcommand) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        if (has_subcommand && i == 1) {
            continue; // skip the subcommand token
        }
        stripped.push_back(argv[i]);
    }
    return stripped;
}

kpi_lineage::LogLevel LogLevelFor(const kpi_lineage::EngineConfig& config) {
    if (config.verbose) return kpi_lineage::LogLevel::Debug;
    if (config.quiet) return kpi_lineage::LogLevel::Error;
    return kpi_lineage::LogLevel::Warn;
}

// CLI flags, then the YAML file named by -c/--config underneath them.
kpi_lineage::Result<kpi_lineage::EngineConfig, kpi_lineage::Error> LoadConfig(
    int argc, const char* const* argv) {
    using namespace kpi_lineage;

    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        return cli_result;
    }
    auto config = std::move(cli_result).Value();

    if (config.config_path.has_value()) {
        auto yaml_result = LoadFromYaml(*config.config_path);
        if (yaml_result.IsErr()) {
            return yaml_result;
        }
        config = MergeConfigs(std::move(yaml_result).Value(), config);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<EngineConfig, Error>::Err(valid.Error());
    }
    return Result<EngineConfig, Error>::Ok(std::move(config));
}

int RunServer(const kpi_lineage::EngineConfig& config) {
    using namespace kpi_lineage;

    LineageToolDefaults defaults;
    defaults.options = PresenterOptionsFromConfig(config);
    defaults.width = config.layout.width;
    defaults.height = config.layout.height;

    ToolRegistry registry;
    RegisterLineageTools(registry, defaults);

    // Blocks until EOF on stdin.
    McpServer server(std::move(registry));
    server.Run();
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace kpi_lineage;

    // No arguments: print top-level help.
    if (argc == 1) {
        PrintTopLevelHelp(std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    if (HasFlag(argc, argv, "--version")) {
        std::cout << "kpi-lineage " << kVersion << "\n";
        return kExitSuccess;
    }

    if (HasFlag(argc, argv, "--help", "-h")) {
        PrintTopLevelHelp(std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    const auto parsed = ParseSubcommand(argc, argv);
    if (!parsed.cmd.has_value()) {
        if (parsed.found_subcommand) {
            std::cerr << "Unknown command: " << argv[1] << "\n\n";
        }
        PrintTopLevelHelp(std::cerr, false);
        return kExitInvalidInput;
    }

    auto stripped = StripSubcommand(argc, argv, parsed.found_subcommand);
    auto config_result = LoadConfig(static_cast<int>(stripped.size()), stripped.data());
    if (config_result.IsErr()) {
        OutputFormatter formatter(HasFlag(argc, argv, "--json"));
        formatter.PrintError(config_result.Error());
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    const auto level = LogLevelFor(config);
    if (config.log_file.has_value()) {
        auto sink = std::make_unique<FileSink>(*config.log_file);
        if (!sink->IsOpen()) {
            Error error{"main", *config.log_file, "Cannot open log file",
                        std::nullopt, ErrorCategory::Io};
            OutputFormatter(config.json_output, false).PrintError(error);
            return kExitIo;
        }
        InitGlobalLogger(std::move(sink), level);
    } else if (config.json_output) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
    } else {
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(
                             ShouldUseColor(config.color, IsStderrTty())),
                         level);
    }

    if (*parsed.cmd == Subcommand::Serve) {
        return RunServer(config);
    }

    OutputFormatter formatter(config.json_output,
                              ShouldUseColor(config.color, IsStdoutTty()));
    return RunLineageCommand(*parsed.cmd, config, std::cin, formatter);
}
