#include <mcp_manager/handler/mcp_types.hpp>

namespace mcp_manager {

namespace {

std::optional<std::string> OptionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

template <typename T>
std::vector<T> OptionalArray(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    return it->get<std::vector<T>>();
}

void PutOptional(nlohmann::json& j, const char* key, const std::optional<std::string>& value) {
    if (value) {
        j[key] = *value;
    }
}

} // anonymous namespace

void from_json(const nlohmann::json& j, Tool& tool) {
    j.at("name").get_to(tool.name);
    tool.description = OptionalString(j, "description");
    auto schema = j.find("inputSchema");
    tool.input_schema = (schema != j.end()) ? *schema : nlohmann::json::object();
}

void from_json(const nlohmann::json& j, Resource& resource) {
    j.at("uri").get_to(resource.uri);
    j.at("name").get_to(resource.name);
    resource.description = OptionalString(j, "description");
    resource.mime_type = OptionalString(j, "mimeType");
}

void from_json(const nlohmann::json& j, PromptArgument& argument) {
    j.at("name").get_to(argument.name);
    argument.description = OptionalString(j, "description");
    auto required = j.find("required");
    if (required != j.end() && !required->is_null()) {
        argument.required = required->get<bool>();
    }
}

void from_json(const nlohmann::json& j, Prompt& prompt) {
    j.at("name").get_to(prompt.name);
    prompt.description = OptionalString(j, "description");
    prompt.arguments = OptionalArray<PromptArgument>(j, "arguments");
}

void from_json(const nlohmann::json& j, Content& content) {
    j.at("type").get_to(content.type);
    content.text = OptionalString(j, "text");
    content.mime_type = OptionalString(j, "mimeType");
    content.data = OptionalString(j, "data");
}

void from_json(const nlohmann::json& j, CallToolResult& result) {
    result.content = OptionalArray<Content>(j, "content");
    auto is_error = j.find("isError");
    result.is_error = (is_error != j.end() && !is_error->is_null()) && is_error->get<bool>();
}

void from_json(const nlohmann::json& j, ResourceContent& content) {
    j.at("uri").get_to(content.uri);
    content.mime_type = OptionalString(j, "mimeType");
    content.text = OptionalString(j, "text");
    content.blob = OptionalString(j, "blob");
}

void from_json(const nlohmann::json& j, ReadResourceResult& result) {
    result.contents = OptionalArray<ResourceContent>(j, "contents");
}

void from_json(const nlohmann::json& j, PromptMessage& message) {
    j.at("role").get_to(message.role);
    j.at("content").get_to(message.content);
}

void from_json(const nlohmann::json& j, GetPromptResult& result) {
    result.description = OptionalString(j, "description");
    result.messages = OptionalArray<PromptMessage>(j, "messages");
}

void from_json(const nlohmann::json& j, ServerInfo& info) {
    j.at("protocolVersion").get_to(info.protocol_version);
    auto server = j.find("serverInfo");
    if (server != j.end() && server->is_object()) {
        info.name = server->value("name", "");
        info.version = server->value("version", "");
    }
    auto capabilities = j.find("capabilities");
    if (capabilities != j.end() && capabilities->is_object()) {
        info.capabilities = *capabilities;
    }
}

// ---------------------------------------------------------------------------
// to_json
// ---------------------------------------------------------------------------

void to_json(nlohmann::json& j, const Tool& tool) {
    j = {{"name", tool.name}, {"inputSchema", tool.input_schema}};
    PutOptional(j, "description", tool.description);
}

void to_json(nlohmann::json& j, const Resource& resource) {
    j = {{"uri", resource.uri}, {"name", resource.name}};
    PutOptional(j, "description", resource.description);
    PutOptional(j, "mimeType", resource.mime_type);
}

void to_json(nlohmann::json& j, const PromptArgument& argument) {
    j = {{"name", argument.name}};
    PutOptional(j, "description", argument.description);
    if (argument.required) {
        j["required"] = *argument.required;
    }
}

void to_json(nlohmann::json& j, const Prompt& prompt) {
    j = {{"name", prompt.name}, {"arguments", prompt.arguments}};
    PutOptional(j, "description", prompt.description);
}

void to_json(nlohmann::json& j, const Content& content) {
    j = {{"type", content.type}};
    PutOptional(j, "text", content.text);
    PutOptional(j, "mimeType", content.mime_type);
    PutOptional(j, "data", content.data);
}

void to_json(nlohmann::json& j, const CallToolResult& result) {
    j = {{"content", result.content}, {"isError", result.is_error}};
}

void to_json(nlohmann::json& j, const ResourceContent& content) {
    j = {{"uri", content.uri}};
    PutOptional(j, "mimeType", content.mime_type);
    PutOptional(j, "text", content.text);
    PutOptional(j, "blob", content.blob);
}

void to_json(nlohmann::json& j, const ReadResourceResult& result) {
    j = {{"contents", result.contents}};
}

void to_json(nlohmann::json& j, const PromptMessage& message) {
    j = {{"role", message.role}, {"content", message.content}};
}

void to_json(nlohmann::json& j, const GetPromptResult& result) {
    j = {{"messages", result.messages}};
    PutOptional(j, "description", result.description);
}

} // namespace mcp_manager
