#pragma once

#include <mcp_manager/hub/mcp_hub.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace mcp_manager {

// ---------------------------------------------------------------------------
// HubServer: the hub served as an MCP server over stdin/stdout.
//
// Implements JSON-RPC 2.0 with MCP methods:
//   - initialize
//   - tools/list, tools/call
//   - resources/list, resources/read
//   - prompts/list, prompts/get
//   - ping
// Notifications are accepted and never answered.
// ---------------------------------------------------------------------------
class HubServer {
public:
    explicit HubServer(McpHub& hub,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Serve until EOF on the input stream.
    void Run();

    // Process one JSON-RPC message. Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

private:
    nlohmann::json HandleInitialize(const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    nlohmann::json HandleResourcesList(const nlohmann::json& id);
    nlohmann::json HandleResourcesRead(const nlohmann::json& params,
                                       const nlohmann::json& id);
    nlohmann::json HandlePromptsList(const nlohmann::json& id);
    nlohmann::json HandlePromptsGet(const nlohmann::json& params,
                                    const nlohmann::json& id);

    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);
    // Downstream JSON-RPC errors pass through; everything else is -32603,
    // routing failures are -32602.
    static nlohmann::json ErrorResponse(const nlohmann::json& id, const Error& error);

    McpHub& hub_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace mcp_manager
