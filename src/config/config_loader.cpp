#include <mcp_manager/config/config_loader.hpp>

#include <mcp_manager/core/url.hpp>
#include <mcp_manager/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <set>
#include <utility>

namespace mcp_manager {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 std::nullopt, ErrorCategory::Config};
}

Result<TransportKind, Error> ParseKind(const std::string& text) {
    if (text == "stdio") {
        return Result<TransportKind, Error>::Ok(TransportKind::Stdio);
    }
    if (text == "sse" || text == "stream") {
        return Result<TransportKind, Error>::Ok(TransportKind::Stream);
    }
    return Result<TransportKind, Error>::Err(
        MakeConfigError("Unknown server type '" + text + "' (expected stdio or sse)"));
}

// Split "KEY=VALUE". The key must be non-empty.
Result<std::pair<std::string, std::string>, Error> ParseEnvAssignment(
    const std::string& assignment) {
    using R = Result<std::pair<std::string, std::string>, Error>;
    auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        return R::Err(MakeConfigError("Invalid --env '" + assignment +
                                      "' (expected KEY=VALUE)"));
    }
    return R::Ok(std::make_pair(assignment.substr(0, eq), assignment.substr(eq + 1)));
}

// Build a ServerConfig from a parsed YAML node.
Result<ServerConfig, Error> ParseYamlServer(const YAML::Node& node) {
    using R = Result<ServerConfig, Error>;

    if (!node["id"]) {
        return R::Err(MakeConfigError("Server entry missing 'id' field"));
    }
    auto id_result = ServerId::Create(node["id"].as<std::string>());
    if (id_result.IsErr()) {
        return R::Err(MakeConfigError("Invalid server id: " + id_result.Error()));
    }

    ServerConfig server{std::move(id_result).Value(), "", std::nullopt, std::nullopt,
                        std::nullopt, {}, {}, std::nullopt, true};
    server.name = node["name"] ? node["name"].as<std::string>() : server.id.Value();
    if (node["description"]) {
        server.description = node["description"].as<std::string>();
    }
    if (node["type"]) {
        auto kind = ParseKind(node["type"].as<std::string>());
        if (kind.IsErr()) {
            return R::Err(kind.Error());
        }
        server.declared_kind = kind.Value();
    }
    if (node["command"]) {
        server.command = node["command"].as<std::string>();
    }
    if (node["args"]) {
        for (const auto& arg : node["args"]) {
            server.args.push_back(arg.as<std::string>());
        }
    }
    if (node["env"]) {
        if (!node["env"].IsMap()) {
            return R::Err(MakeConfigError("Server '" + server.id.Value() +
                                          "': 'env' must be a mapping"));
        }
        for (const auto& entry : node["env"]) {
            server.env[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
    if (node["url"]) {
        server.url = node["url"].as<std::string>();
    }
    if (node["active"]) {
        server.active = node["active"].as<bool>();
    }
    return R::Ok(std::move(server));
}

} // anonymous namespace

const char* TransportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio:  return "stdio";
        case TransportKind::Stream: return "sse";
    }
    return "unknown";
}

std::string ServerConfig::Target() const {
    if (command.has_value()) {
        std::string line = *command;
        for (const auto& arg : args) {
            line += " " + arg;
        }
        return line;
    }
    return url.value_or("");
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    try {
        // -- Servers --
        if (root["servers"]) {
            if (!root["servers"].IsSequence()) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("'servers' must be a list"));
            }
            for (const auto& server_node : root["servers"]) {
                auto server_result = ParseYamlServer(server_node);
                if (server_result.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(server_result).Error());
                }
                config.servers.push_back(std::move(server_result).Value());
            }
        }

        // -- Options --
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
        if (root["request_timeout"]) {
            config.request_timeout_seconds = root["request_timeout"].as<int>();
        }
        if (root["connect_timeout"]) {
            config.connect_timeout_seconds = root["connect_timeout"].as<int>();
        }
        if (root["endpoint_wait"]) {
            config.endpoint_wait_seconds = root["endpoint_wait"].as<int>();
        }
        if (root["handshake"]) {
            config.handshake = root["handshake"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " + e.what()));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliInvocation, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-manager", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");

    // Ad-hoc server
    program.add_argument("--id")
        .help("Id of the ad-hoc server (default: adhoc)");
    program.add_argument("--command")
        .help("Executable of an ad-hoc stdio server");
    program.add_argument("--arg")
        .help("Argument for --command (repeatable, use --arg=-x for dashes)")
        .append();
    program.add_argument("--env")
        .help("KEY=VALUE environment entry for --command (repeatable)")
        .append();
    program.add_argument("--url")
        .help("Event stream URL of an ad-hoc SSE server");

    // Options
    program.add_argument("--timeout")
        .help("Request timeout in seconds (0 waits indefinitely)")
        .scan<'i', int>();
    program.add_argument("--connect-timeout")
        .help("Event stream connect timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--endpoint-wait")
        .help("Seconds to wait for an SSE server's endpoint announcement")
        .scan<'i', int>();
    program.add_argument("--handshake")
        .help("Send initialize before running the command")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path (JSON lines)");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("command")
        .help("<group> <action> [args...]")
        .remaining();

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliInvocation, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliInvocation invocation;
    auto& config = invocation.overrides;

    if (auto val = program.present("--config")) {
        invocation.config_path = *val;
    }

    // Ad-hoc server
    auto command = program.present("--command");
    auto url = program.present("--url");
    if (command.has_value() || url.has_value()) {
        auto id_result = ServerId::Create(program.present("--id").value_or("adhoc"));
        if (id_result.IsErr()) {
            return Result<CliInvocation, Error>::Err(
                MakeConfigError("Invalid --id: " + id_result.Error()));
        }
        ServerConfig server{std::move(id_result).Value(), "", std::nullopt,
                            std::nullopt, command, {}, {}, url, true};
        server.name = server.id.Value();
        if (auto args = program.present<std::vector<std::string>>("--arg")) {
            server.args = *args;
        }
        if (auto envs = program.present<std::vector<std::string>>("--env")) {
            for (const auto& assignment : *envs) {
                auto parsed = ParseEnvAssignment(assignment);
                if (parsed.IsErr()) {
                    return Result<CliInvocation, Error>::Err(parsed.Error());
                }
                server.env.insert(parsed.Value());
            }
        }
        config.servers.push_back(std::move(server));
    }

    // Options
    if (auto val = program.present<int>("--timeout")) {
        config.request_timeout_seconds = *val;
    }
    if (auto val = program.present<int>("--connect-timeout")) {
        config.connect_timeout_seconds = *val;
    }
    if (auto val = program.present<int>("--endpoint-wait")) {
        config.endpoint_wait_seconds = *val;
    }
    if (program.get<bool>("--handshake")) {
        config.handshake = true;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }

    if (auto tokens = program.present<std::vector<std::string>>("command")) {
        invocation.command = *tokens;
    }

    return Result<CliInvocation, Error>::Ok(std::move(invocation));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    // CLI servers replace YAML servers with the same id.
    for (const auto& server : cli_overrides.servers) {
        auto it = std::find_if(merged.servers.begin(), merged.servers.end(),
                               [&](const ServerConfig& s) { return s.id == server.id; });
        if (it != merged.servers.end()) {
            *it = server;
        } else {
            merged.servers.push_back(server);
        }
    }

    // Options
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.handshake) {
        merged.handshake = true;
    }
    if (cli_overrides.request_timeout_seconds != defaults.request_timeout_seconds) {
        merged.request_timeout_seconds = cli_overrides.request_timeout_seconds;
    }
    if (cli_overrides.connect_timeout_seconds != defaults.connect_timeout_seconds) {
        merged.connect_timeout_seconds = cli_overrides.connect_timeout_seconds;
    }
    if (cli_overrides.endpoint_wait_seconds != defaults.endpoint_wait_seconds) {
        merged.endpoint_wait_seconds = cli_overrides.endpoint_wait_seconds;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    std::set<std::string> seen;
    for (const auto& server : config.servers) {
        const auto& id = server.id.Value();
        if (!seen.insert(id).second) {
            return Result<void, Error>::Err(MakeConfigError("Duplicate server id: " + id));
        }
        if (server.command.has_value() == server.url.has_value()) {
            return Result<void, Error>::Err(MakeConfigError(
                "Server '" + id + "' must have exactly one of 'command' or 'url'"));
        }
        if (server.command.has_value() && server.command->empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Server '" + id + "' has an empty command"));
        }
        if (server.url.has_value()) {
            auto parsed = ParseHttpUrl(*server.url);
            if (parsed.IsErr()) {
                return Result<void, Error>::Err(
                    MakeConfigError("Server '" + id + "': " + parsed.Error()));
            }
        }
        if (server.declared_kind.has_value() && *server.declared_kind != server.Kind()) {
            return Result<void, Error>::Err(MakeConfigError(
                "Server '" + id + "' is declared as " +
                TransportKindName(*server.declared_kind) + " but configures " +
                (server.command.has_value() ? "a command" : "a url")));
        }
    }
    if (config.request_timeout_seconds < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid request timeout: " + std::to_string(config.request_timeout_seconds)));
    }
    if (config.connect_timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid connect timeout: " + std::to_string(config.connect_timeout_seconds)));
    }
    if (config.endpoint_wait_seconds < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid endpoint wait: " + std::to_string(config.endpoint_wait_seconds)));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("--verbose and --quiet are mutually exclusive"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// FindServer
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> FindServer(const AppConfig& config, std::string_view id) {
    for (const auto& server : config.servers) {
        if (server.id.Value() == id) {
            return Result<ServerConfig, Error>::Ok(server);
        }
    }
    return Result<ServerConfig, Error>::Err(
        MakeConfigError("Unknown server id: " + std::string(id)));
}

} // namespace mcp_manager
