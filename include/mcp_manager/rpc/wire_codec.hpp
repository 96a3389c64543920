#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_manager {

// ---------------------------------------------------------------------------
// JSON-RPC 2.0 envelopes exchanged with an MCP server.
// ---------------------------------------------------------------------------

constexpr const char* kJsonRpcVersion = "2.0";

struct RequestEnvelope {
    std::string method;
    nlohmann::json params;  // null is sent as {}
    uint64_t id = 0;
};

struct ResponseEnvelope {
    uint64_t id = 0;
    std::optional<nlohmann::json> result;
    std::optional<nlohmann::json> error;

    [[nodiscard]] bool IsError() const { return error.has_value(); }
};

/// Serialize a request as a single line of JSON (no trailing newline).
std::string EncodeRequest(const RequestEnvelope& request);

/// Serialize a notification (a request without id) as a single line.
std::string EncodeNotification(std::string_view method, const nlohmann::json& params);

/// Decode one line of server output. Returns std::nullopt for anything that
/// is not a reply: invalid JSON, non-objects, a missing "jsonrpc" string,
/// a missing or non-integer "id", or a "method" member (a server-initiated
/// request). A reply carrying neither "result" nor "error" succeeds with null.
std::optional<ResponseEnvelope> DecodeResponse(std::string_view line);

} // namespace mcp_manager
