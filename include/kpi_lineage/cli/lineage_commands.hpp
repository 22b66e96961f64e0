#pragma once

#include <kpi_lineage/cli/output_formatter.hpp>
#include <kpi_lineage/config/engine_config.hpp>
#include <kpi_lineage/core/result.hpp>
#include <kpi_lineage/lineage/lineage_presenter.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace kpi_lineage {

enum class Subcommand {
    Extract,
    Graph,
    Layout,
    Serve,
};

std::optional<Subcommand> ParseSubcommandName(std::string_view name);
const char* SubcommandName(Subcommand command);

// SQL from --sql, --file, or the input stream when neither is given.
// An unreadable file is an Io error.
[[nodiscard]] Result<std::string, Error> ReadSqlInput(const InputConfig& input,
                                                      std::istream& in);

PresenterOptions PresenterOptionsFromConfig(const EngineConfig& config);
KpiMetadata MetadataFromConfig(const EngineConfig& config);

// Run extract, graph or layout and print the result. Returns the exit code.
int RunLineageCommand(Subcommand command, const EngineConfig& config, std::istream& in,
                      const OutputFormatter& formatter);

void PrintTopLevelHelp(std::ostream& out, bool use_color);

} // namespace kpi_lineage
