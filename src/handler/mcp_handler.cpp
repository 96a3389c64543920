#include <mcp_manager/handler/mcp_handler.hpp>
#include <mcp_manager/core/log.hpp>

namespace mcp_manager {

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Decode `field` of a result (or the whole result if field is empty).
template <typename T>
Result<T, Error> DecodeAs(const RpcResult& reply, std::string_view method,
                          const char* field = nullptr) {
    if (reply.IsErr()) {
        return Result<T, Error>::Err(reply.Error());
    }
    try {
        const auto& value = reply.Value();
        if (field != nullptr) {
            return Result<T, Error>::Ok(value.at(field).get<T>());
        }
        return Result<T, Error>::Ok(value.get<T>());
    } catch (const nlohmann::json::exception& e) {
        return Result<T, Error>::Err(Error{
            std::string(method), "", std::nullopt,
            std::string("Unexpected result shape: ") + e.what(), std::nullopt,
            std::nullopt, ErrorCategory::Decode});
    }
}

nlohmann::json ArgumentsOrEmpty(const nlohmann::json& arguments) {
    return arguments.is_null() ? nlohmann::json::object() : arguments;
}

} // anonymous namespace

Result<std::unique_ptr<McpHandler>, Error> McpHandler::Start(
    const ServerConfig& config, std::shared_ptr<LogChannel> logs,
    const HandlerOptions& options) {
    using R = Result<std::unique_ptr<McpHandler>, Error>;

    if (config.command.has_value()) {
        StdioLaunch launch{*config.command, config.args, config.env};
        auto started = StdioTransport::Start(launch, std::move(logs));
        if (started.IsErr()) {
            return R::Err(started.Error());
        }
        return R::Ok(std::make_unique<McpHandler>(std::move(started).Value(), options));
    }
    if (config.url.has_value()) {
        auto started = StreamTransport::Start(*config.url, std::move(logs), options.stream);
        if (started.IsErr()) {
            return R::Err(started.Error());
        }
        return R::Ok(std::make_unique<McpHandler>(std::move(started).Value(), options));
    }
    return R::Err(Error{"Start", config.id.Value(), std::nullopt,
                        "Server has neither a command nor a url", std::nullopt,
                        std::nullopt, ErrorCategory::Config});
}

McpHandler::McpHandler(Transport transport, HandlerOptions options)
    : transport_(std::move(transport)), options_(std::move(options)) {}

TransportKind McpHandler::Kind() const {
    return std::holds_alternative<std::unique_ptr<StdioTransport>>(transport_)
               ? TransportKind::Stdio
               : TransportKind::Stream;
}

RpcResult McpHandler::SendRequest(std::string_view method, const nlohmann::json& params) {
    return std::visit(
        [&](auto& transport) {
            return transport->SendRequest(method, params, options_.request_timeout);
        },
        transport_);
}

Result<void, Error> McpHandler::SendNotification(std::string_view method,
                                                 const nlohmann::json& params) {
    return std::visit(
        [&](auto& transport) { return transport->SendNotification(method, params); },
        transport_);
}

Result<std::vector<Tool>, Error> McpHandler::ListTools() {
    return DecodeAs<std::vector<Tool>>(SendRequest("tools/list", nullptr),
                                       "tools/list", "tools");
}

Result<std::vector<Resource>, Error> McpHandler::ListResources() {
    return DecodeAs<std::vector<Resource>>(SendRequest("resources/list", nullptr),
                                           "resources/list", "resources");
}

Result<std::vector<Prompt>, Error> McpHandler::ListPrompts() {
    return DecodeAs<std::vector<Prompt>>(SendRequest("prompts/list", nullptr),
                                         "prompts/list", "prompts");
}

Result<CallToolResult, Error> McpHandler::CallTool(const std::string& name,
                                                   const nlohmann::json& arguments) {
    nlohmann::json params = {
        {"name", name},
        {"arguments", ArgumentsOrEmpty(arguments)},
    };
    return DecodeAs<CallToolResult>(SendRequest("tools/call", params), "tools/call");
}

Result<ReadResourceResult, Error> McpHandler::ReadResource(const std::string& uri) {
    nlohmann::json params = {{"uri", uri}};
    return DecodeAs<ReadResourceResult>(SendRequest("resources/read", params),
                                        "resources/read");
}

Result<GetPromptResult, Error> McpHandler::GetPrompt(const std::string& name,
                                                     const nlohmann::json& arguments) {
    nlohmann::json params = {
        {"name", name},
        {"arguments", ArgumentsOrEmpty(arguments)},
    };
    return DecodeAs<GetPromptResult>(SendRequest("prompts/get", params), "prompts/get");
}

Result<ServerInfo, Error> McpHandler::Initialize(const std::string& client_name,
                                                 const std::string& client_version) {
    nlohmann::json params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", client_name}, {"version", client_version}}},
    };
    auto info = DecodeAs<ServerInfo>(SendRequest("initialize", params), "initialize");
    if (info.IsErr()) {
        return info;
    }
    auto notified = SendNotification("notifications/initialized", nullptr);
    if (notified.IsErr()) {
        return Result<ServerInfo, Error>::Err(notified.Error());
    }
    LogInfo("handler", "Initialized " + info.Value().name + " " + info.Value().version +
                           " (protocol " + info.Value().protocol_version + ")");
    return info;
}

bool McpHandler::WaitUntilReady(std::chrono::milliseconds timeout) const {
    return std::visit(
        Overloaded{
            [](const std::unique_ptr<StdioTransport>&) { return true; },
            [&](const std::unique_ptr<StreamTransport>& stream) {
                return stream->WaitForReplyTo(timeout);
            },
        },
        transport_);
}

Result<void, Error> McpHandler::Kill() {
    return std::visit([](auto& transport) { return transport->Kill(); }, transport_);
}

void McpHandler::CancelPending(const Error& reason) {
    std::visit([&](auto& transport) { transport->CancelPending(reason); }, transport_);
}

const RequestCorrelator& McpHandler::Correlator() const {
    return std::visit(
        [](const auto& transport) -> const RequestCorrelator& {
            return transport->Correlator();
        },
        transport_);
}

} // namespace mcp_manager
