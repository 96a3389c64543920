#pragma once

#include <mcp_manager/core/types.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp_manager {

enum class TransportKind {
    Stdio,
    Stream,
};

struct ServerConfig {
    ServerId id;
    std::string name;
    std::optional<std::string> description;
    // Declared kind ("stdio" or "sse" in YAML); inferred when absent.
    std::optional<TransportKind> declared_kind;
    std::optional<std::string> command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> url;
    bool active = true;

    /// Stdio when a command is configured, otherwise stream.
    [[nodiscard]] TransportKind Kind() const {
        return command.has_value() ? TransportKind::Stdio : TransportKind::Stream;
    }

    /// Human-readable launch target: the command line or the URL.
    [[nodiscard]] std::string Target() const;
};

struct AppConfig {
    std::vector<ServerConfig> servers;
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
    int request_timeout_seconds = 0;  // 0 waits indefinitely
    int connect_timeout_seconds = 10;
    int endpoint_wait_seconds = 5;
    bool handshake = false;
};

const char* TransportKindName(TransportKind kind);

} // namespace mcp_manager
