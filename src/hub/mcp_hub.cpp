#include <mcp_manager/hub/mcp_hub.hpp>
#include <mcp_manager/core/log.hpp>
#include <mcp_manager/core/version.hpp>

#include <cstring>

namespace mcp_manager {

namespace {

Error HubError(const std::string& operation, const std::string& target,
               const std::string& message) {
    return Error{operation, target, std::nullopt, message, std::nullopt,
                 std::nullopt, ErrorCategory::Config};
}

std::string Tagged(const ServerId& server, const std::optional<std::string>& text) {
    std::string tag = "[" + server.Value() + "]";
    return text ? tag + " " + *text : tag;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() &&
           text.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

std::string NamespaceName(const ServerId& server, const std::string& name) {
    return server.Value() + kHubSeparator + name;
}

std::string NamespaceUri(const ServerId& server, const std::string& uri) {
    return std::string(kHubUriScheme) + server.Value() + "/" + uri;
}

McpHub::McpHub(ProcessRegistry& registry, const std::vector<ServerConfig>& servers,
               HubOptions options)
    : registry_(registry), options_(options) {
    for (const auto& server : servers) {
        if (server.active) {
            servers_.push_back(server);
        }
    }
}

McpHub::~McpHub() {
    Disconnect();
}

std::vector<ServerId> McpHub::ActiveServers() const {
    std::vector<ServerId> ids;
    for (const auto& server : servers_) {
        ids.push_back(server.id);
    }
    return ids;
}

const ServerConfig* McpHub::FindActive(const ServerId& id) const {
    for (const auto& server : servers_) {
        if (server.id == id) {
            return &server;
        }
    }
    return nullptr;
}

Result<std::shared_ptr<McpHandler>, Error> McpHub::Connect(const ServerConfig& config) {
    using R = Result<std::shared_ptr<McpHandler>, Error>;

    const bool fresh = connected_.count(config.id) == 0;
    auto started = registry_.Start(config);
    if (started.IsErr()) {
        return R::Err(started.Error());
    }
    connected_.insert(config.id);

    auto handler = registry_.RequireHandler(config.id);
    if (handler.IsErr()) {
        return handler;
    }
    if (!fresh) {
        return handler;
    }

    auto& h = *handler.Value();
    if (!h.WaitUntilReady(options_.endpoint_wait)) {
        LogWarn("hub", "Endpoint of '" + config.id.Value() + "' not announced yet");
    }
    if (options_.handshake) {
        auto info = h.Initialize(kClientName, kVersion);
        if (info.IsErr()) {
            registry_.Stop(config.id);
            connected_.erase(config.id);
            return R::Err(info.Error());
        }
        LogInfo("hub", "Initialized " + info.Value().name + " " + info.Value().version +
                           " as '" + config.id.Value() + "'");
    }
    return handler;
}

Result<std::shared_ptr<McpHandler>, Error> McpHub::Connect(const ServerId& id) {
    const auto* config = FindActive(id);
    if (config == nullptr) {
        return Result<std::shared_ptr<McpHandler>, Error>::Err(
            HubError("Hub", id.Value(), "Server " + id.Value() + " not found or inactive"));
    }
    return Connect(*config);
}

HubListing<Tool> McpHub::ListTools() {
    HubListing<Tool> listing;
    for (const auto& server : servers_) {
        auto handler = Connect(server);
        auto tools = handler.IsOk() ? handler.Value()->ListTools()
                                    : Result<std::vector<Tool>, Error>::Err(handler.Error());
        if (tools.IsErr()) {
            LogWarn("hub", "Failed to fetch tools from " + server.id.Value() + ": " +
                               tools.Error().ToString());
            listing.failures.push_back({server.id, tools.Error()});
            continue;
        }
        for (auto tool : tools.Value()) {
            tool.description = Tagged(server.id, tool.description);
            tool.name = NamespaceName(server.id, tool.name);
            listing.items.push_back(std::move(tool));
        }
    }
    return listing;
}

HubListing<Resource> McpHub::ListResources() {
    HubListing<Resource> listing;
    for (const auto& server : servers_) {
        auto handler = Connect(server);
        auto resources = handler.IsOk()
                             ? handler.Value()->ListResources()
                             : Result<std::vector<Resource>, Error>::Err(handler.Error());
        if (resources.IsErr()) {
            LogWarn("hub", "Failed to fetch resources from " + server.id.Value() + ": " +
                               resources.Error().ToString());
            listing.failures.push_back({server.id, resources.Error()});
            continue;
        }
        for (auto resource : resources.Value()) {
            resource.uri = NamespaceUri(server.id, resource.uri);
            resource.name = Tagged(server.id, resource.name);
            listing.items.push_back(std::move(resource));
        }
    }
    return listing;
}

HubListing<Prompt> McpHub::ListPrompts() {
    HubListing<Prompt> listing;
    for (const auto& server : servers_) {
        auto handler = Connect(server);
        auto prompts = handler.IsOk()
                           ? handler.Value()->ListPrompts()
                           : Result<std::vector<Prompt>, Error>::Err(handler.Error());
        if (prompts.IsErr()) {
            LogWarn("hub", "Failed to fetch prompts from " + server.id.Value() + ": " +
                               prompts.Error().ToString());
            listing.failures.push_back({server.id, prompts.Error()});
            continue;
        }
        for (auto prompt : prompts.Value()) {
            prompt.description = Tagged(server.id, prompt.description);
            prompt.name = NamespaceName(server.id, prompt.name);
            listing.items.push_back(std::move(prompt));
        }
    }
    return listing;
}

Result<QualifiedName, Error> McpHub::ResolveName(const std::string& name) const {
    using R = Result<QualifiedName, Error>;

    const ServerConfig* owner = nullptr;
    for (const auto& server : servers_) {
        auto prefix = server.id.Value() + kHubSeparator;
        if (StartsWith(name, prefix) &&
            (owner == nullptr || server.id.Value().size() > owner->id.Value().size())) {
            owner = &server;
        }
    }
    if (owner == nullptr) {
        auto sep = name.find(kHubSeparator);
        if (sep == std::string::npos) {
            return R::Err(HubError("Hub", name, "Expected <server>__<name>, got '" + name + "'"));
        }
        auto server = name.substr(0, sep);
        return R::Err(HubError("Hub", server, "Server " + server + " not found or inactive"));
    }

    auto plain = name.substr(owner->id.Value().size() + std::strlen(kHubSeparator));
    if (plain.empty()) {
        return R::Err(HubError("Hub", name, "Missing name after '" + owner->id.Value() +
                                                kHubSeparator + "'"));
    }
    return R::Ok(QualifiedName{owner->id, std::move(plain)});
}

Result<QualifiedName, Error> McpHub::ResolveUri(const std::string& uri) const {
    using R = Result<QualifiedName, Error>;

    if (!StartsWith(uri, kHubUriScheme)) {
        return R::Err(HubError("Hub", uri, "Expected mcp://<server>/<uri>, got '" + uri + "'"));
    }
    auto rest = uri.substr(std::strlen(kHubUriScheme));
    auto slash = rest.find('/');
    if (slash == std::string::npos || slash + 1 == rest.size()) {
        return R::Err(HubError("Hub", uri, "Expected mcp://<server>/<uri>, got '" + uri + "'"));
    }
    auto server = rest.substr(0, slash);
    auto id = ServerId::Create(server);
    if (id.IsErr() || FindActive(id.Value()) == nullptr) {
        return R::Err(HubError("Hub", server, "Server " + server + " not found or inactive"));
    }
    return R::Ok(QualifiedName{id.Value(), rest.substr(slash + 1)});
}

Result<CallToolResult, Error> McpHub::CallTool(const std::string& name,
                                               const nlohmann::json& arguments) {
    using R = Result<CallToolResult, Error>;
    auto target = ResolveName(name);
    if (target.IsErr()) {
        return R::Err(target.Error());
    }
    auto handler = Connect(target.Value().server);
    if (handler.IsErr()) {
        return R::Err(handler.Error());
    }
    LogDebug("hub", "tools/call " + target.Value().name + " -> " +
                        target.Value().server.Value());
    return handler.Value()->CallTool(target.Value().name, arguments);
}

Result<ReadResourceResult, Error> McpHub::ReadResource(const std::string& uri) {
    using R = Result<ReadResourceResult, Error>;
    auto target = ResolveUri(uri);
    if (target.IsErr()) {
        return R::Err(target.Error());
    }
    auto handler = Connect(target.Value().server);
    if (handler.IsErr()) {
        return R::Err(handler.Error());
    }
    return handler.Value()->ReadResource(target.Value().name);
}

Result<GetPromptResult, Error> McpHub::GetPrompt(const std::string& name,
                                                 const nlohmann::json& arguments) {
    using R = Result<GetPromptResult, Error>;
    auto target = ResolveName(name);
    if (target.IsErr()) {
        return R::Err(target.Error());
    }
    auto handler = Connect(target.Value().server);
    if (handler.IsErr()) {
        return R::Err(handler.Error());
    }
    return handler.Value()->GetPrompt(target.Value().name, arguments);
}

void McpHub::Disconnect() {
    for (const auto& id : connected_) {
        registry_.Stop(id);
    }
    connected_.clear();
}

} // namespace mcp_manager
