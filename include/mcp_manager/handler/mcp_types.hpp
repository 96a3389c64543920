#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcp_manager {

// ---------------------------------------------------------------------------
// Typed shapes of the MCP results the handler decodes. Field names follow
// the protocol's camelCase keys; unknown keys are ignored.
// ---------------------------------------------------------------------------

struct Tool {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json input_schema = nlohmann::json::object();
};

struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
};

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    std::optional<bool> required;
};

struct Prompt {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;
};

// One item of tool output or prompt message content.
struct Content {
    std::string type;
    std::optional<std::string> text;
    std::optional<std::string> mime_type;
    std::optional<std::string> data;
};

struct CallToolResult {
    std::vector<Content> content;
    bool is_error = false;
};

struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;
};

struct ReadResourceResult {
    std::vector<ResourceContent> contents;
};

struct PromptMessage {
    std::string role;
    Content content;
};

struct GetPromptResult {
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;
};

struct ServerInfo {
    std::string protocol_version;
    std::string name;
    std::string version;
    nlohmann::json capabilities = nlohmann::json::object();
};

void from_json(const nlohmann::json& j, Tool& tool);
void from_json(const nlohmann::json& j, Resource& resource);
void from_json(const nlohmann::json& j, PromptArgument& argument);
void from_json(const nlohmann::json& j, Prompt& prompt);
void from_json(const nlohmann::json& j, Content& content);
void from_json(const nlohmann::json& j, CallToolResult& result);
void from_json(const nlohmann::json& j, ResourceContent& content);
void from_json(const nlohmann::json& j, ReadResourceResult& result);
void from_json(const nlohmann::json& j, PromptMessage& message);
void from_json(const nlohmann::json& j, GetPromptResult& result);
void from_json(const nlohmann::json& j, ServerInfo& info);

// Re-encoding, for serving results onward. Absent optionals are omitted.
void to_json(nlohmann::json& j, const Tool& tool);
void to_json(nlohmann::json& j, const Resource& resource);
void to_json(nlohmann::json& j, const PromptArgument& argument);
void to_json(nlohmann::json& j, const Prompt& prompt);
void to_json(nlohmann::json& j, const Content& content);
void to_json(nlohmann::json& j, const CallToolResult& result);
void to_json(nlohmann::json& j, const ResourceContent& content);
void to_json(nlohmann::json& j, const ReadResourceResult& result);
void to_json(nlohmann::json& j, const PromptMessage& message);
void to_json(nlohmann::json& j, const GetPromptResult& result);

} // namespace mcp_manager
