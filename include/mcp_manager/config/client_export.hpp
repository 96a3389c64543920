#pragma once

#include <mcp_manager/config/app_config.hpp>
#include <mcp_manager/core/result.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcp_manager {

// ---------------------------------------------------------------------------
// Client config export: the {"mcpServers": {...}} document MCP clients
// (Claude Desktop, Cursor, Windsurf, ...) read their server list from.
//
//   Hub     one entry that launches "mcp-manager hub serve", or points at
//           hub_url when given.
//   Direct  one entry per active server with its own command or url.
// ---------------------------------------------------------------------------

enum class ExportMode {
    Hub,
    Direct,
};

struct ExportOptions {
    ExportMode mode = ExportMode::Hub;
    std::string hub_command = "mcp-manager";
    // Passed to the hub command as --config when set.
    std::optional<std::string> config_path;
    std::optional<std::string> hub_url;
};

Result<ExportMode, Error> ParseExportMode(std::string_view text);
const char* ExportModeName(ExportMode mode);

nlohmann::json BuildClientConfig(const AppConfig& config, const ExportOptions& options);

} // namespace mcp_manager
