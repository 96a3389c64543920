#include <mcp_manager/hub/hub_server.hpp>
#include <mcp_manager/core/log.hpp>
#include <mcp_manager/core/version.hpp>

namespace mcp_manager {

namespace {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

constexpr const char* kProtocolVersion = "2024-11-05";

std::optional<std::string> StringParam(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

nlohmann::json ObjectParam(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_object()) {
        return nlohmann::json::object();
    }
    return *it;
}

} // anonymous namespace

HubServer::HubServer(McpHub& hub, std::istream& in, std::ostream& out)
    : hub_(hub), in_(in), out_(out) {}

void HubServer::Run() {
    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty()) continue;

        auto message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            out_ << MakeError(nullptr, kParseError, "Parse error").dump() << "\n";
            out_.flush();
            continue;
        }

        auto response = HandleMessage(message);
        if (response) {
            out_ << response->dump(-1, ' ', false,
                                   nlohmann::json::error_handler_t::replace)
                 << "\n";
            out_.flush();
        }
    }
    LogDebug("hub", "Input closed, hub server stopping");
}

std::optional<nlohmann::json> HubServer::HandleMessage(const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, kInvalidRequest, "Request must be a JSON object");
    }
    auto version = message.find("jsonrpc");
    if (version == message.end() || *version != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], kInvalidRequest, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    auto method = StringParam(message, "method").value_or("");
    if (!message.contains("id")) {
        LogDebug("hub", "Notification " + method);
        return std::nullopt;
    }

    const auto& id = message["id"];
    auto params = message.contains("params") && message["params"].is_object()
                      ? message["params"]
                      : nlohmann::json::object();

    if (method == "initialize") {
        return HandleInitialize(id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else if (method == "resources/list") {
        return HandleResourcesList(id);
    } else if (method == "resources/read") {
        return HandleResourcesRead(params, id);
    } else if (method == "prompts/list") {
        return HandlePromptsList(id);
    } else if (method == "prompts/get") {
        return HandlePromptsGet(params, id);
    }
    return MakeError(id, kMethodNotFound, "Method not found: " + method);
}

nlohmann::json HubServer::HandleInitialize(const nlohmann::json& id) {
    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()},
        {"resources", nlohmann::json::object()},
        {"prompts", nlohmann::json::object()},
    };
    result["serverInfo"] = {
        {"name", kHubServerName},
        {"version", kVersion},
    };
    return MakeResult(id, result);
}

nlohmann::json HubServer::HandleToolsList(const nlohmann::json& id) {
    auto listing = hub_.ListTools();
    return MakeResult(id, {{"tools", listing.items}});
}

nlohmann::json HubServer::HandleToolsCall(const nlohmann::json& params,
                                          const nlohmann::json& id) {
    auto name = StringParam(params, "name");
    if (!name) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }
    auto result = hub_.CallTool(*name, ObjectParam(params, "arguments"));
    if (result.IsErr()) {
        return ErrorResponse(id, result.Error());
    }
    return MakeResult(id, result.Value());
}

nlohmann::json HubServer::HandleResourcesList(const nlohmann::json& id) {
    auto listing = hub_.ListResources();
    return MakeResult(id, {{"resources", listing.items}});
}

nlohmann::json HubServer::HandleResourcesRead(const nlohmann::json& params,
                                              const nlohmann::json& id) {
    auto uri = StringParam(params, "uri");
    if (!uri) {
        return MakeError(id, kInvalidParams, "Missing 'uri' parameter");
    }
    auto result = hub_.ReadResource(*uri);
    if (result.IsErr()) {
        return ErrorResponse(id, result.Error());
    }
    return MakeResult(id, result.Value());
}

nlohmann::json HubServer::HandlePromptsList(const nlohmann::json& id) {
    auto listing = hub_.ListPrompts();
    return MakeResult(id, {{"prompts", listing.items}});
}

nlohmann::json HubServer::HandlePromptsGet(const nlohmann::json& params,
                                           const nlohmann::json& id) {
    auto name = StringParam(params, "name");
    if (!name) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }
    auto result = hub_.GetPrompt(*name, ObjectParam(params, "arguments"));
    if (result.IsErr()) {
        return ErrorResponse(id, result.Error());
    }
    return MakeResult(id, result.Value());
}

nlohmann::json HubServer::MakeError(const nlohmann::json& id, int code,
                                    const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json HubServer::MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json HubServer::ErrorResponse(const nlohmann::json& id, const Error& error) {
    if (error.category == ErrorCategory::Protocol && error.rpc_code) {
        return MakeError(id, *error.rpc_code, error.message);
    }
    if (error.category == ErrorCategory::Config) {
        return MakeError(id, kInvalidParams, error.message);
    }
    return MakeError(id, kInternalError, error.ToString());
}

} // namespace mcp_manager
