#pragma once

namespace mcp_manager {

constexpr const char* kVersion = "0.3.0";
constexpr const char* kClientName = "mcp-manager";
constexpr const char* kHubServerName = "mcp-manager-hub";

} // namespace mcp_manager
