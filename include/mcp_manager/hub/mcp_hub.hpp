#pragma once

#include <mcp_manager/config/app_config.hpp>
#include <mcp_manager/core/result.hpp>
#include <mcp_manager/core/types.hpp>
#include <mcp_manager/handler/mcp_types.hpp>
#include <mcp_manager/registry/process_registry.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace mcp_manager {

// ---------------------------------------------------------------------------
// Hub naming. Tools and prompts are exposed as "<server>__<name>",
// resources as "mcp://<server>/<uri>".
// ---------------------------------------------------------------------------

constexpr const char* kHubSeparator = "__";
constexpr const char* kHubUriScheme = "mcp://";

std::string NamespaceName(const ServerId& server, const std::string& name);
std::string NamespaceUri(const ServerId& server, const std::string& uri);

struct QualifiedName {
    ServerId server;
    std::string name;  // tool/prompt name or resource URI on that server
};

struct HubFailure {
    ServerId server;
    Error error;
};

// Aggregated listing; servers that failed are reported, not fatal.
template <typename T>
struct HubListing {
    std::vector<T> items;
    std::vector<HubFailure> failures;
};

struct HubOptions {
    bool handshake = false;
    std::chrono::milliseconds endpoint_wait{0};
};

// ---------------------------------------------------------------------------
// McpHub: one MCP surface over every active server.
//
// Listings fan out to each active server in configuration order and
// namespace the results. Calls with a namespaced name are routed to the
// owning server with the plain name. Servers are started through the
// registry on first use and stay up until Disconnect().
// Not thread-safe.
// ---------------------------------------------------------------------------
class McpHub {
public:
    McpHub(ProcessRegistry& registry, const std::vector<ServerConfig>& servers,
           HubOptions options = {});
    ~McpHub();

    McpHub(const McpHub&) = delete;
    McpHub& operator=(const McpHub&) = delete;

    [[nodiscard]] std::vector<ServerId> ActiveServers() const;

    HubListing<Tool> ListTools();
    HubListing<Resource> ListResources();
    HubListing<Prompt> ListPrompts();

    Result<CallToolResult, Error> CallTool(const std::string& name,
                                           const nlohmann::json& arguments);
    Result<ReadResourceResult, Error> ReadResource(const std::string& uri);
    Result<GetPromptResult, Error> GetPrompt(const std::string& name,
                                             const nlohmann::json& arguments);

    /// Split "<server>__<name>" against the active server ids. The longest
    /// matching id wins, so ids that themselves contain "__" still resolve.
    Result<QualifiedName, Error> ResolveName(const std::string& name) const;

    /// Split "mcp://<server>/<uri>".
    Result<QualifiedName, Error> ResolveUri(const std::string& uri) const;

    /// Stop every server this hub started.
    void Disconnect();

private:
    Result<std::shared_ptr<McpHandler>, Error> Connect(const ServerConfig& config);
    Result<std::shared_ptr<McpHandler>, Error> Connect(const ServerId& id);
    const ServerConfig* FindActive(const ServerId& id) const;

    ProcessRegistry& registry_;
    std::vector<ServerConfig> servers_;
    HubOptions options_;
    std::set<ServerId> connected_;
};

} // namespace mcp_manager
