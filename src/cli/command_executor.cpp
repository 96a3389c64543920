#include <mcp_manager/cli/command_executor.hpp>
#include <mcp_manager/cli/output_formatter.hpp>
#include <mcp_manager/config/client_export.hpp>
#include <mcp_manager/config/config_loader.hpp>
#include <mcp_manager/core/log.hpp>
#include <mcp_manager/core/url.hpp>
#include <mcp_manager/core/version.hpp>
#include <mcp_manager/hub/hub_server.hpp>
#include <mcp_manager/hub/mcp_hub.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace mcp_manager {

namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::string GetFlag(const CommandArgs& args, const std::string& key,
                    const std::string& default_val = "") {
    auto it = args.flags.find(key);
    return (it != args.flags.end()) ? it->second : default_val;
}

bool HasFlag(const CommandArgs& args, const std::string& key) {
    return args.flags.count(key) > 0;
}

bool JsonMode(const CommandContext& ctx, const CommandArgs& args) {
    return ctx.config.json_output || GetFlag(args, "json") == "true";
}

bool ColorMode(const CommandContext& ctx, const CommandArgs& args) {
    if (JsonMode(ctx, args)) return false;
    if (GetFlag(args, "no-color") == "true") return false;
    return ctx.color;
}

OutputFormatter MakeFormatter(const CommandContext& ctx, const CommandArgs& args) {
    return OutputFormatter(JsonMode(ctx, args), ColorMode(ctx, args), ctx.out, ctx.err);
}

Error MakeUsageError(const std::string& message) {
    return Error{"Command", "", std::nullopt, message, std::nullopt,
                 std::nullopt, ErrorCategory::Config};
}

int Fail(const OutputFormatter& fmt, const Error& error) {
    fmt.PrintError(error);
    return error.ExitCode();
}

// Parse a --args/--params flag. Absent flags yield an empty object.
Result<nlohmann::json, Error> ParseJsonFlag(const CommandArgs& args,
                                            const std::string& key) {
    using R = Result<nlohmann::json, Error>;
    if (!HasFlag(args, key)) {
        return R::Ok(nlohmann::json::object());
    }
    auto parsed = nlohmann::json::parse(GetFlag(args, key), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return R::Err(MakeUsageError("--" + key + " must be a JSON object"));
    }
    return R::Ok(std::move(parsed));
}

nlohmann::json ContentToJson(const Content& content) {
    nlohmann::json j{{"type", content.type}};
    if (content.text) j["text"] = *content.text;
    if (content.mime_type) j["mimeType"] = *content.mime_type;
    if (content.data) j["data"] = *content.data;
    return j;
}

std::string ContentToText(const Content& content) {
    if (content.text) {
        return *content.text;
    }
    std::string text = "[" + content.type;
    if (content.mime_type) {
        text += " " + *content.mime_type;
    }
    if (content.data) {
        text += ", " + std::to_string(content.data->size()) + " bytes";
    }
    return text + "]";
}

// Tool-level failures only change the exit code.
int PrintToolResult(const OutputFormatter& out, const CallToolResult& call) {
    if (out.IsJsonMode()) {
        nlohmann::json content = nlohmann::json::array();
        for (const auto& c : call.content) {
            content.push_back(ContentToJson(c));
        }
        out.PrintJson(nlohmann::json{{"content", content},
                                     {"isError", call.is_error}}.dump());
    } else {
        for (const auto& c : call.content) {
            out.PrintText(ContentToText(c));
        }
    }
    return call.is_error ? 1 : 0;
}

void PrintResourceContents(const OutputFormatter& out, const ReadResourceResult& result) {
    if (out.IsJsonMode()) {
        nlohmann::json contents = nlohmann::json::array();
        for (const auto& c : result.contents) {
            nlohmann::json entry{{"uri", c.uri}};
            if (c.mime_type) entry["mimeType"] = *c.mime_type;
            if (c.text) entry["text"] = *c.text;
            if (c.blob) entry["blob"] = *c.blob;
            contents.push_back(std::move(entry));
        }
        out.PrintJson(nlohmann::json{{"contents", contents}}.dump());
        return;
    }
    for (const auto& c : result.contents) {
        if (c.text) {
            out.PrintText(*c.text);
        } else {
            out.PrintText("[" + c.uri + ": " + c.mime_type.value_or("binary") + ", " +
                          std::to_string(c.blob ? c.blob->size() : 0) +
                          " bytes base64]");
        }
    }
}

void PrintPromptResult(const OutputFormatter& out, const GetPromptResult& prompt) {
    if (out.IsJsonMode()) {
        nlohmann::json messages = nlohmann::json::array();
        for (const auto& m : prompt.messages) {
            messages.push_back({{"role", m.role}, {"content", ContentToJson(m.content)}});
        }
        nlohmann::json j{{"messages", messages}};
        if (prompt.description) j["description"] = *prompt.description;
        out.PrintJson(j.dump());
        return;
    }
    if (prompt.description) {
        out.PrintText(*prompt.description);
    }
    for (const auto& m : prompt.messages) {
        out.PrintText(m.role + ": " + ContentToText(m.content));
    }
}

std::string ArgumentSummary(const Prompt& prompt) {
    std::string arguments;
    for (const auto& a : prompt.arguments) {
        if (!arguments.empty()) arguments += ", ";
        arguments += a.name;
        if (a.required.value_or(false)) arguments += "*";
    }
    return arguments;
}

void DumpLogs(const CommandContext& ctx, const ServerId& id) {
    auto buffer = ctx.registry.Logs(id);
    if (!buffer) {
        return;
    }
    ctx.err << "--- logs: " << id.Value() << " ---\n" << buffer->Snapshot();
}

using ServerAction = std::function<int(McpHandler& handler, const OutputFormatter& fmt)>;

// Start the server named by the first positional argument, run the action
// and stop the server again.
int RunWithServer(CommandContext& ctx, const CommandArgs& args, const std::string& usage,
                  const ServerAction& action) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError("Missing server id. Usage: " + usage));
    }

    auto server = FindServer(ctx.config, args.positional[0]);
    if (server.IsErr()) {
        return Fail(fmt, server.Error());
    }
    const auto& config = server.Value();
    const bool show_logs = GetFlag(args, "show-logs") == "true";

    auto started = ctx.registry.Start(config);
    if (started.IsErr()) {
        if (show_logs) {
            DumpLogs(ctx, config.id);
        }
        return Fail(fmt, started.Error());
    }

    int rc = 0;
    auto handler = ctx.registry.RequireHandler(config.id);
    if (handler.IsErr()) {
        rc = Fail(fmt, handler.Error());
    } else {
        auto& h = *handler.Value();
        if (!h.WaitUntilReady(std::chrono::seconds(ctx.config.endpoint_wait_seconds))) {
            LogWarn("cli", "Endpoint of '" + config.id.Value() +
                               "' not announced within " +
                               std::to_string(ctx.config.endpoint_wait_seconds) + "s");
        }
        if (ctx.config.handshake) {
            auto info = h.Initialize(kClientName, kVersion);
            if (info.IsErr()) {
                rc = Fail(fmt, info.Error());
            } else {
                LogInfo("cli", "Initialized " + info.Value().name + " " +
                                   info.Value().version + " (protocol " +
                                   info.Value().protocol_version + ")");
            }
        }
        if (rc == 0) {
            rc = action(h, fmt);
        }
    }

    if (show_logs) {
        DumpLogs(ctx, config.id);
    }
    ctx.registry.Stop(config.id);
    return rc;
}

// ---------------------------------------------------------------------------
// servers list
// ---------------------------------------------------------------------------
int HandleServersList(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);

    if (fmt.IsJsonMode()) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& s : ctx.config.servers) {
            nlohmann::json entry{{"id", s.id.Value()},
                                 {"name", s.name},
                                 {"type", TransportKindName(s.Kind())},
                                 {"target", s.Target()},
                                 {"active", s.active},
                                 {"state", ServerStateName(ctx.registry.State(s.id))}};
            if (s.description) {
                entry["description"] = *s.description;
            }
            j.push_back(std::move(entry));
        }
        fmt.PrintJson(j.dump());
        return 0;
    }

    std::vector<std::string> headers = {"ID", "Name", "Type", "Active", "Target"};
    std::vector<std::vector<std::string>> rows;
    for (const auto& s : ctx.config.servers) {
        rows.push_back({s.id.Value(), s.name, TransportKindName(s.Kind()),
                        s.active ? "yes" : "no", s.Target()});
    }
    fmt.PrintTable(headers, rows);
    return 0;
}

// ---------------------------------------------------------------------------
// servers ping
// ---------------------------------------------------------------------------
int HandleServersPing(CommandContext& ctx, const CommandArgs& args) {
    return RunWithServer(ctx, args, "mcp-manager servers ping <id>",
                         [&](McpHandler&, const OutputFormatter& fmt) {
        const auto& id = args.positional[0];
        auto server_id = ServerId::Create(id).Value();
        auto latency = ctx.registry.Ping(server_id);
        if (latency.IsErr()) {
            return Fail(fmt, latency.Error());
        }
        auto ms = latency.Value().count();
        if (fmt.IsJsonMode()) {
            fmt.PrintJson(nlohmann::json{{"id", id}, {"latency_ms", ms}}.dump());
        } else {
            fmt.PrintSuccess(id + " responded in " + std::to_string(ms) + " ms");
        }
        return 0;
    });
}

// ---------------------------------------------------------------------------
// servers logs
// ---------------------------------------------------------------------------
int HandleServersLogs(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    int wait_seconds = 1;
    if (HasFlag(args, "wait")) {
        try {
            wait_seconds = std::stoi(GetFlag(args, "wait"));
        } catch (const std::exception&) {
            return Fail(fmt, MakeUsageError("--wait must be a number of seconds"));
        }
        if (wait_seconds < 0) {
            return Fail(fmt, MakeUsageError("--wait must not be negative"));
        }
    }

    return RunWithServer(ctx, args, "mcp-manager servers logs <id> [--wait <s>]",
                         [&](McpHandler&, const OutputFormatter& out) {
        std::this_thread::sleep_for(std::chrono::seconds(wait_seconds));
        auto server_id = ServerId::Create(args.positional[0]).Value();
        auto buffer = ctx.registry.Logs(server_id);
        auto text = buffer ? buffer->Snapshot() : std::string();
        if (out.IsJsonMode()) {
            out.PrintJson(nlohmann::json{{"id", server_id.Value()}, {"logs", text}}.dump());
        } else {
            out.PrintText(text);
        }
        return 0;
    });
}

// ---------------------------------------------------------------------------
// tools list
// ---------------------------------------------------------------------------
int HandleToolsList(CommandContext& ctx, const CommandArgs& args) {
    return RunWithServer(ctx, args, "mcp-manager tools list <id>",
                         [](McpHandler& handler, const OutputFormatter& fmt) {
        auto tools = handler.ListTools();
        if (tools.IsErr()) {
            return Fail(fmt, tools.Error());
        }
        if (fmt.IsJsonMode()) {
            nlohmann::json j = nlohmann::json::array();
            for (const auto& t : tools.Value()) {
                j.push_back({{"name", t.name},
                             {"description", t.description.value_or("")},
                             {"inputSchema", t.input_schema}});
            }
            fmt.PrintJson(j.dump());
        } else {
            std::vector<std::vector<std::string>> rows;
            for (const auto& t : tools.Value()) {
                rows.push_back({t.name, t.description.value_or("")});
            }
            fmt.PrintTable({"Name", "Description"}, rows);
        }
        return 0;
    });
}

// ---------------------------------------------------------------------------
// tools call
// ---------------------------------------------------------------------------
int HandleToolsCall(CommandContext& ctx, const CommandArgs& args) {
    const std::string usage = "mcp-manager tools call <id> <tool> [--args <json>]";
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.size() < 2) {
        return Fail(fmt, MakeUsageError("Missing tool name. Usage: " + usage));
    }
    auto arguments = ParseJsonFlag(args, "args");
    if (arguments.IsErr()) {
        return Fail(fmt, arguments.Error());
    }

    return RunWithServer(ctx, args, usage,
                         [&](McpHandler& handler, const OutputFormatter& out) {
        auto result = handler.CallTool(args.positional[1], arguments.Value());
        if (result.IsErr()) {
            return Fail(out, result.Error());
        }
        return PrintToolResult(out, result.Value());
    });
}

// ---------------------------------------------------------------------------
// resources list / read
// ---------------------------------------------------------------------------
int HandleResourcesList(CommandContext& ctx, const CommandArgs& args) {
    return RunWithServer(ctx, args, "mcp-manager resources list <id>",
                         [](McpHandler& handler, const OutputFormatter& fmt) {
        auto resources = handler.ListResources();
        if (resources.IsErr()) {
            return Fail(fmt, resources.Error());
        }
        if (fmt.IsJsonMode()) {
            nlohmann::json j = nlohmann::json::array();
            for (const auto& r : resources.Value()) {
                nlohmann::json entry{{"uri", r.uri}, {"name", r.name}};
                if (r.description) entry["description"] = *r.description;
                if (r.mime_type) entry["mimeType"] = *r.mime_type;
                j.push_back(std::move(entry));
            }
            fmt.PrintJson(j.dump());
        } else {
            std::vector<std::vector<std::string>> rows;
            for (const auto& r : resources.Value()) {
                rows.push_back({r.uri, r.name, r.mime_type.value_or(""),
                                r.description.value_or("")});
            }
            fmt.PrintTable({"URI", "Name", "MIME", "Description"}, rows);
        }
        return 0;
    });
}

int HandleResourcesRead(CommandContext& ctx, const CommandArgs& args) {
    const std::string usage = "mcp-manager resources read <id> <uri>";
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.size() < 2) {
        return Fail(fmt, MakeUsageError("Missing resource URI. Usage: " + usage));
    }

    return RunWithServer(ctx, args, usage,
                         [&](McpHandler& handler, const OutputFormatter& out) {
        auto result = handler.ReadResource(args.positional[1]);
        if (result.IsErr()) {
            return Fail(out, result.Error());
        }
        PrintResourceContents(out, result.Value());
        return 0;
    });
}

// ---------------------------------------------------------------------------
// prompts list / get
// ---------------------------------------------------------------------------
int HandlePromptsList(CommandContext& ctx, const CommandArgs& args) {
    return RunWithServer(ctx, args, "mcp-manager prompts list <id>",
                         [](McpHandler& handler, const OutputFormatter& fmt) {
        auto prompts = handler.ListPrompts();
        if (prompts.IsErr()) {
            return Fail(fmt, prompts.Error());
        }
        if (fmt.IsJsonMode()) {
            nlohmann::json j = nlohmann::json::array();
            for (const auto& p : prompts.Value()) {
                nlohmann::json arguments = nlohmann::json::array();
                for (const auto& a : p.arguments) {
                    arguments.push_back({{"name", a.name},
                                         {"description", a.description.value_or("")},
                                         {"required", a.required.value_or(false)}});
                }
                j.push_back({{"name", p.name},
                             {"description", p.description.value_or("")},
                             {"arguments", arguments}});
            }
            fmt.PrintJson(j.dump());
        } else {
            std::vector<std::vector<std::string>> rows;
            for (const auto& p : prompts.Value()) {
                rows.push_back({p.name, ArgumentSummary(p), p.description.value_or("")});
            }
            fmt.PrintTable({"Name", "Arguments", "Description"}, rows);
        }
        return 0;
    });
}

int HandlePromptsGet(CommandContext& ctx, const CommandArgs& args) {
    const std::string usage = "mcp-manager prompts get <id> <name> [--args <json>]";
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.size() < 2) {
        return Fail(fmt, MakeUsageError("Missing prompt name. Usage: " + usage));
    }
    auto arguments = ParseJsonFlag(args, "args");
    if (arguments.IsErr()) {
        return Fail(fmt, arguments.Error());
    }

    return RunWithServer(ctx, args, usage,
                         [&](McpHandler& handler, const OutputFormatter& out) {
        auto result = handler.GetPrompt(args.positional[1], arguments.Value());
        if (result.IsErr()) {
            return Fail(out, result.Error());
        }
        PrintPromptResult(out, result.Value());
        return 0;
    });
}

// ---------------------------------------------------------------------------
// rpc send
// ---------------------------------------------------------------------------
int HandleRpcSend(CommandContext& ctx, const CommandArgs& args) {
    const std::string usage = "mcp-manager rpc send <id> <method> [--params <json>]";
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.size() < 2) {
        return Fail(fmt, MakeUsageError("Missing method. Usage: " + usage));
    }
    auto params = ParseJsonFlag(args, "params");
    if (params.IsErr()) {
        return Fail(fmt, params.Error());
    }

    return RunWithServer(ctx, args, usage,
                         [&](McpHandler& handler, const OutputFormatter& out) {
        auto reply = handler.SendRequest(args.positional[1], params.Value());
        if (reply.IsErr()) {
            return Fail(out, reply.Error());
        }
        out.PrintJson(out.IsJsonMode() ? reply.Value().dump() : reply.Value().dump(2));
        return 0;
    });
}

// ---------------------------------------------------------------------------
// servers export
// ---------------------------------------------------------------------------
int HandleServersExport(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);

    ExportOptions options;
    auto mode = ParseExportMode(GetFlag(args, "mode", "hub"));
    if (mode.IsErr()) {
        return Fail(fmt, mode.Error());
    }
    options.mode = mode.Value();
    if (HasFlag(args, "hub-command")) {
        options.hub_command = GetFlag(args, "hub-command");
    }
    if (HasFlag(args, "hub-url")) {
        auto url = GetFlag(args, "hub-url");
        if (!IsAbsoluteHttpUrl(url)) {
            return Fail(fmt, MakeUsageError("--hub-url must be an absolute http(s) URL, got '" +
                                            url + "'"));
        }
        options.hub_url = url;
    }
    if (ctx.config_path) {
        // Clients start the hub from their own working directory.
        std::error_code ec;
        auto absolute = std::filesystem::absolute(*ctx.config_path, ec);
        options.config_path = ec ? *ctx.config_path : absolute.string();
    }

    auto document = BuildClientConfig(ctx.config, options);
    fmt.PrintJson(fmt.IsJsonMode() ? document.dump() : document.dump(2));
    return 0;
}

// ---------------------------------------------------------------------------
// hub
// ---------------------------------------------------------------------------
HubOptions HubOptionsFor(const CommandContext& ctx) {
    HubOptions options;
    options.handshake = ctx.config.handshake;
    options.endpoint_wait = std::chrono::seconds(ctx.config.endpoint_wait_seconds);
    return options;
}

// Failed servers never fail a listing: text mode notes them on stderr,
// JSON mode reports them next to the items.
template <typename T>
nlohmann::json FailuresToJson(const HubListing<T>& listing) {
    nlohmann::json failures = nlohmann::json::array();
    for (const auto& f : listing.failures) {
        failures.push_back({{"server", f.server.Value()},
                            {"error", nlohmann::json::parse(f.error.ToJson())}});
    }
    return failures;
}

template <typename T>
void PrintSkipped(const CommandContext& ctx, const HubListing<T>& listing) {
    for (const auto& f : listing.failures) {
        ctx.err << "Skipped " << f.server.Value() << ": " << f.error.message << "\n";
    }
}

int HandleHubTools(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    McpHub hub(ctx.registry, ctx.config.servers, HubOptionsFor(ctx));
    auto listing = hub.ListTools();

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(nlohmann::json{{"tools", listing.items},
                                     {"failures", FailuresToJson(listing)}}.dump());
        return 0;
    }
    PrintSkipped(ctx, listing);
    std::vector<std::vector<std::string>> rows;
    for (const auto& t : listing.items) {
        rows.push_back({t.name, t.description.value_or("")});
    }
    fmt.PrintTable({"Name", "Description"}, rows);
    return 0;
}

int HandleHubResources(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    McpHub hub(ctx.registry, ctx.config.servers, HubOptionsFor(ctx));
    auto listing = hub.ListResources();

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(nlohmann::json{{"resources", listing.items},
                                     {"failures", FailuresToJson(listing)}}.dump());
        return 0;
    }
    PrintSkipped(ctx, listing);
    std::vector<std::vector<std::string>> rows;
    for (const auto& r : listing.items) {
        rows.push_back({r.uri, r.name, r.mime_type.value_or("")});
    }
    fmt.PrintTable({"URI", "Name", "MIME"}, rows);
    return 0;
}

int HandleHubPrompts(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    McpHub hub(ctx.registry, ctx.config.servers, HubOptionsFor(ctx));
    auto listing = hub.ListPrompts();

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(nlohmann::json{{"prompts", listing.items},
                                     {"failures", FailuresToJson(listing)}}.dump());
        return 0;
    }
    PrintSkipped(ctx, listing);
    std::vector<std::vector<std::string>> rows;
    for (const auto& p : listing.items) {
        rows.push_back({p.name, ArgumentSummary(p), p.description.value_or("")});
    }
    fmt.PrintTable({"Name", "Arguments", "Description"}, rows);
    return 0;
}

int HandleHubCall(CommandContext& ctx, const CommandArgs& args) {
    const std::string usage = "mcp-manager hub call <server>__<tool> [--args <json>]";
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError("Missing tool name. Usage: " + usage));
    }
    auto arguments = ParseJsonFlag(args, "args");
    if (arguments.IsErr()) {
        return Fail(fmt, arguments.Error());
    }

    McpHub hub(ctx.registry, ctx.config.servers, HubOptionsFor(ctx));
    auto result = hub.CallTool(args.positional[0], arguments.Value());
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    return PrintToolResult(fmt, result.Value());
}

int HandleHubRead(CommandContext& ctx, const CommandArgs& args) {
    const std::string usage = "mcp-manager hub read mcp://<server>/<uri>";
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError("Missing resource URI. Usage: " + usage));
    }

    McpHub hub(ctx.registry, ctx.config.servers, HubOptionsFor(ctx));
    auto result = hub.ReadResource(args.positional[0]);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    PrintResourceContents(fmt, result.Value());
    return 0;
}

int HandleHubPrompt(CommandContext& ctx, const CommandArgs& args) {
    const std::string usage = "mcp-manager hub prompt <server>__<name> [--args <json>]";
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError("Missing prompt name. Usage: " + usage));
    }
    auto arguments = ParseJsonFlag(args, "args");
    if (arguments.IsErr()) {
        return Fail(fmt, arguments.Error());
    }

    McpHub hub(ctx.registry, ctx.config.servers, HubOptionsFor(ctx));
    auto result = hub.GetPrompt(args.positional[0], arguments.Value());
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    PrintPromptResult(fmt, result.Value());
    return 0;
}

int HandleHubServe(CommandContext& ctx, const CommandArgs&) {
    McpHub hub(ctx.registry, ctx.config.servers, HubOptionsFor(ctx));
    LogInfo("hub", "Serving " + std::to_string(hub.ActiveServers().size()) +
                       " server(s) on stdio");
    HubServer server(hub, ctx.in, ctx.out);
    server.Run();
    return 0;
}

const FlagHelp kShowLogsFlag{"show-logs", "", "Print the server's log buffer to stderr", false};
const FlagHelp kJsonFlag{"json", "", "Machine-readable JSON output", false};

} // anonymous namespace

void RegisterAllCommands(CommandRouter& router, CommandContext& context) {
    auto wrap = [&context](int (*fn)(CommandContext&, const CommandArgs&)) {
        return [&context, fn](const CommandArgs& args) { return fn(context, args); };
    };

    router.SetGroupDescription("servers", "Inspect configured MCP servers");
    router.SetGroupDescription("tools", "List and call server tools");
    router.SetGroupDescription("resources", "List and read server resources");
    router.SetGroupDescription("prompts", "List and render server prompts");
    router.SetGroupDescription("rpc", "Send raw JSON-RPC requests");
    router.SetGroupDescription("hub", "Aggregate every active server behind one MCP surface");

    router.Register("servers", "list", "List configured servers",
                    wrap(HandleServersList),
                    CommandHelp{"mcp-manager servers list [--json]", "", "",
                                {kJsonFlag},
                                {"mcp-manager -c servers.yaml servers list"}});

    router.Register("servers", "ping", "Measure a tools/list round trip",
                    wrap(HandleServersPing),
                    CommandHelp{"mcp-manager servers ping <id>",
                                "<id>  Server id from the configuration", "",
                                {kJsonFlag, kShowLogsFlag},
                                {"mcp-manager -c servers.yaml servers ping files"}});

    router.Register("servers", "logs", "Start a server and print what it logs",
                    wrap(HandleServersLogs),
                    CommandHelp{"mcp-manager servers logs <id> [--wait <s>]",
                                "<id>  Server id from the configuration",
                                "Starts the server, waits, prints its stderr, stdout and stream "
                                "lines, and stops it.",
                                {{"wait", "<s>", "Seconds to collect output (default: 1)", false},
                                 kJsonFlag},
                                {"mcp-manager -c servers.yaml servers logs files --wait 3"}});

    router.Register("servers", "export", "Print an mcpServers block for MCP clients",
                    wrap(HandleServersExport),
                    CommandHelp{"mcp-manager servers export [--mode hub|direct]", "",
                                "hub mode emits one entry that runs 'mcp-manager hub serve' "
                                "(or points at --hub-url); direct mode emits every active "
                                "server.",
                                {{"mode", "<hub|direct>", "Export mode (default: hub)", false},
                                 {"hub-url", "<url>", "Point the hub entry at a running hub", false},
                                 {"hub-command", "<cmd>", "Executable for the hub entry "
                                  "(default: mcp-manager)", false},
                                 kJsonFlag},
                                {"mcp-manager -c servers.yaml servers export --mode direct"}});

    router.Register("tools", "list", "List the tools a server offers",
                    wrap(HandleToolsList),
                    CommandHelp{"mcp-manager tools list <id>",
                                "<id>  Server id from the configuration", "",
                                {kJsonFlag, kShowLogsFlag},
                                {"mcp-manager -c servers.yaml tools list files"}});

    router.Register("tools", "call", "Call a tool",
                    wrap(HandleToolsCall),
                    CommandHelp{"mcp-manager tools call <id> <tool> [--args <json>]",
                                "<id>    Server id from the configuration\n"
                                "  <tool>  Tool name",
                                "Exits with 1 when the tool reports isError.",
                                {{"args", "<json>", "Tool arguments as a JSON object", false},
                                 kJsonFlag, kShowLogsFlag},
                                {"mcp-manager -c servers.yaml tools call files read_file "
                                 "--args '{\"path\":\"/tmp/x\"}'"}});

    router.Register("resources", "list", "List the resources a server offers",
                    wrap(HandleResourcesList),
                    CommandHelp{"mcp-manager resources list <id>",
                                "<id>  Server id from the configuration", "",
                                {kJsonFlag, kShowLogsFlag}, {}});

    router.Register("resources", "read", "Read a resource",
                    wrap(HandleResourcesRead),
                    CommandHelp{"mcp-manager resources read <id> <uri>",
                                "<id>   Server id from the configuration\n"
                                "  <uri>  Resource URI", "",
                                {kJsonFlag, kShowLogsFlag},
                                {"mcp-manager -c servers.yaml resources read files file:///tmp/x"}});

    router.Register("prompts", "list", "List the prompts a server offers",
                    wrap(HandlePromptsList),
                    CommandHelp{"mcp-manager prompts list <id>",
                                "<id>  Server id from the configuration",
                                "Required arguments are marked with *.",
                                {kJsonFlag, kShowLogsFlag}, {}});

    router.Register("prompts", "get", "Render a prompt",
                    wrap(HandlePromptsGet),
                    CommandHelp{"mcp-manager prompts get <id> <name> [--args <json>]",
                                "<id>    Server id from the configuration\n"
                                "  <name>  Prompt name", "",
                                {{"args", "<json>", "Prompt arguments as a JSON object", false},
                                 kJsonFlag, kShowLogsFlag}, {}});

    router.Register("rpc", "send", "Send a JSON-RPC request and print the result",
                    wrap(HandleRpcSend),
                    CommandHelp{"mcp-manager rpc send <id> <method> [--params <json>]",
                                "<id>      Server id from the configuration\n"
                                "  <method>  JSON-RPC method name", "",
                                {{"params", "<json>", "Request params as a JSON object", false},
                                 kJsonFlag, kShowLogsFlag},
                                {"mcp-manager -c servers.yaml rpc send files tools/list"}});

    router.Register("hub", "tools", "List the tools of every active server",
                    wrap(HandleHubTools),
                    CommandHelp{"mcp-manager hub tools [--json]", "",
                                "Names are <server>__<tool>. Servers that fail are skipped.",
                                {kJsonFlag},
                                {"mcp-manager -c servers.yaml hub tools"}});

    router.Register("hub", "resources", "List the resources of every active server",
                    wrap(HandleHubResources),
                    CommandHelp{"mcp-manager hub resources [--json]", "",
                                "URIs are mcp://<server>/<uri>. Servers that fail are skipped.",
                                {kJsonFlag}, {}});

    router.Register("hub", "prompts", "List the prompts of every active server",
                    wrap(HandleHubPrompts),
                    CommandHelp{"mcp-manager hub prompts [--json]", "",
                                "Names are <server>__<prompt>. Required arguments are "
                                "marked with *.",
                                {kJsonFlag}, {}});

    router.Register("hub", "call", "Call a namespaced tool",
                    wrap(HandleHubCall),
                    CommandHelp{"mcp-manager hub call <server>__<tool> [--args <json>]",
                                "<server>__<tool>  Namespaced tool name from 'hub tools'",
                                "Exits with 1 when the tool reports isError.",
                                {{"args", "<json>", "Tool arguments as a JSON object", false},
                                 kJsonFlag},
                                {"mcp-manager -c servers.yaml hub call files__read_file "
                                 "--args '{\"path\":\"/tmp/x\"}'"}});

    router.Register("hub", "read", "Read a namespaced resource",
                    wrap(HandleHubRead),
                    CommandHelp{"mcp-manager hub read mcp://<server>/<uri>",
                                "mcp://<server>/<uri>  Namespaced URI from 'hub resources'", "",
                                {kJsonFlag},
                                {"mcp-manager -c servers.yaml hub read mcp://files/file:///tmp/x"}});

    router.Register("hub", "prompt", "Render a namespaced prompt",
                    wrap(HandleHubPrompt),
                    CommandHelp{"mcp-manager hub prompt <server>__<name> [--args <json>]",
                                "<server>__<name>  Namespaced prompt name from 'hub prompts'", "",
                                {{"args", "<json>", "Prompt arguments as a JSON object", false},
                                 kJsonFlag}, {}});

    router.Register("hub", "serve", "Serve the hub as an MCP server on stdio",
                    wrap(HandleHubServe),
                    CommandHelp{"mcp-manager hub serve", "",
                                "Reads JSON-RPC requests from stdin until EOF. Servers start "
                                "on first use and stop on exit.",
                                {}, {"mcp-manager -c servers.yaml hub serve"}});
}

} // namespace mcp_manager
