#pragma once

#include <mcp_manager/cli/command_router.hpp>
#include <mcp_manager/config/app_config.hpp>
#include <mcp_manager/registry/process_registry.hpp>

#include <iosfwd>
#include <optional>
#include <string>

namespace mcp_manager {

// ---------------------------------------------------------------------------
// CommandContext: what every command handler runs against.
//
// References must outlive the router the commands are registered with.
// ---------------------------------------------------------------------------
struct CommandContext {
    const AppConfig& config;
    ProcessRegistry& registry;
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
    bool color = false;
    // The --config file, if any; exported hub entries point back at it.
    std::optional<std::string> config_path;
};

// Register the servers, tools, resources, prompts, rpc and hub groups.
void RegisterAllCommands(CommandRouter& router, CommandContext& context);

} // namespace mcp_manager
