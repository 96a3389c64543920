#pragma once

#include <mcp_manager/config/app_config.hpp>
#include <mcp_manager/core/result.hpp>
#include <mcp_manager/handler/mcp_types.hpp>
#include <mcp_manager/rpc/request_correlator.hpp>
#include <mcp_manager/transport/log_channel.hpp>
#include <mcp_manager/transport/stdio_transport.hpp>
#include <mcp_manager/transport/stream_transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcp_manager {

struct HandlerOptions {
    // Per-request deadline; std::nullopt waits until the transport dies.
    std::optional<std::chrono::milliseconds> request_timeout;
    StreamOptions stream;
};

// ---------------------------------------------------------------------------
// McpHandler: uniform MCP operations over either transport.
// ---------------------------------------------------------------------------
class McpHandler {
public:
    using Transport = std::variant<std::unique_ptr<StdioTransport>,
                                   std::unique_ptr<StreamTransport>>;

    /// Start the transport the server config calls for.
    static Result<std::unique_ptr<McpHandler>, Error> Start(
        const ServerConfig& config, std::shared_ptr<LogChannel> logs,
        const HandlerOptions& options = {});

    McpHandler(Transport transport, HandlerOptions options = {});

    McpHandler(const McpHandler&) = delete;
    McpHandler& operator=(const McpHandler&) = delete;

    [[nodiscard]] TransportKind Kind() const;

    RpcResult SendRequest(std::string_view method, const nlohmann::json& params);
    Result<void, Error> SendNotification(std::string_view method,
                                         const nlohmann::json& params);

    Result<std::vector<Tool>, Error> ListTools();
    Result<std::vector<Resource>, Error> ListResources();
    Result<std::vector<Prompt>, Error> ListPrompts();
    Result<CallToolResult, Error> CallTool(const std::string& name,
                                           const nlohmann::json& arguments);
    Result<ReadResourceResult, Error> ReadResource(const std::string& uri);
    Result<GetPromptResult, Error> GetPrompt(const std::string& name,
                                             const nlohmann::json& arguments);

    /// initialize + notifications/initialized.
    Result<ServerInfo, Error> Initialize(const std::string& client_name,
                                         const std::string& client_version);

    /// Stdio servers are ready at once; stream servers once the reply-to
    /// URL has been announced.
    bool WaitUntilReady(std::chrono::milliseconds timeout) const;

    Result<void, Error> Kill();
    void CancelPending(const Error& reason);

    [[nodiscard]] const RequestCorrelator& Correlator() const;

private:
    Transport transport_;
    HandlerOptions options_;
};

} // namespace mcp_manager
