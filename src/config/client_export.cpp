#include <mcp_manager/config/client_export.hpp>
#include <mcp_manager/core/version.hpp>

namespace mcp_manager {

namespace {

nlohmann::json HubEntry(const ExportOptions& options) {
    if (options.hub_url) {
        return {{"url", *options.hub_url}};
    }
    nlohmann::json args = nlohmann::json::array();
    if (options.config_path) {
        args.push_back("--config");
        args.push_back(*options.config_path);
    }
    args.push_back("hub");
    args.push_back("serve");
    return {{"command", options.hub_command}, {"args", args}};
}

nlohmann::json DirectEntry(const ServerConfig& server) {
    nlohmann::json entry = nlohmann::json::object();
    if (server.command) {
        entry["command"] = *server.command;
        entry["args"] = server.args;
        if (!server.env.empty()) {
            entry["env"] = server.env;
        }
    } else if (server.url) {
        entry["url"] = *server.url;
    }
    return entry;
}

} // anonymous namespace

Result<ExportMode, Error> ParseExportMode(std::string_view text) {
    if (text == "hub") return Result<ExportMode, Error>::Ok(ExportMode::Hub);
    if (text == "direct") return Result<ExportMode, Error>::Ok(ExportMode::Direct);
    return Result<ExportMode, Error>::Err(
        Error{"Export", "", std::nullopt,
              "Unknown export mode '" + std::string(text) + "' (expected hub or direct)",
              std::nullopt, std::nullopt, ErrorCategory::Config});
}

const char* ExportModeName(ExportMode mode) {
    switch (mode) {
        case ExportMode::Hub:    return "hub";
        case ExportMode::Direct: return "direct";
    }
    return "unknown";
}

nlohmann::json BuildClientConfig(const AppConfig& config, const ExportOptions& options) {
    nlohmann::json servers = nlohmann::json::object();
    if (options.mode == ExportMode::Hub) {
        servers[kHubServerName] = HubEntry(options);
    } else {
        for (const auto& server : config.servers) {
            if (server.active) {
                servers[server.id.Value()] = DirectEntry(server);
            }
        }
    }
    return {{"mcpServers", servers}};
}

} // namespace mcp_manager
