#pragma once

#include <kpi_lineage/config/engine_config.hpp>
#include <kpi_lineage/core/result.hpp>

#include <string>
#include <string_view>

namespace kpi_lineage {

// Parse a YAML config file into an EngineConfig.
Result<EngineConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI flags (subcommand already stripped) into an EngineConfig.
Result<EngineConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// A CLI field replaces the YAML one when it differs from the default.
EngineConfig MergeConfigs(const EngineConfig& yaml_base, const EngineConfig& cli_overrides);

// Validate that values are sane and flags do not conflict.
Result<void, Error> ValidateConfig(const EngineConfig& config);

} // namespace kpi_lineage
