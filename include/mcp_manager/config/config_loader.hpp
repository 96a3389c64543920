#pragma once

#include <mcp_manager/config/app_config.hpp>
#include <mcp_manager/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_manager {

// Global options parsed from argv, plus the command tokens that follow them.
struct CliInvocation {
    AppConfig overrides;
    std::optional<std::string> config_path;
    std::vector<std::string> command;
};

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse the global options in argv. An ad-hoc server given with --command
// or --url becomes the only server of the override config.
Result<CliInvocation, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate server definitions and option ranges.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Look up a server by id.
Result<ServerConfig, Error> FindServer(const AppConfig& config, std::string_view id);

} // namespace mcp_manager
