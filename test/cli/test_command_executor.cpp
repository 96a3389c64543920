#include <catch2/catch_test_macros.hpp>

#include <mcp_manager/cli/command_executor.hpp>
#include <mcp_manager/cli/command_router.hpp>

#include "support/capture_sink.hpp"
#include "support/mock_server.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace mcp_manager;

namespace {

// A router wired to one scripted stdio server with id "mock".
struct CliFixture {
    testing::ScopedCaptureLogger logger;
    AppConfig config;
    ProcessRegistry registry;
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    CommandContext context;
    CommandRouter router;

    explicit CliFixture(bool json = false)
        : registry(Options()),
          context{config, registry, in, out, err, false, std::nullopt} {
        config.servers.push_back(testing::MockServerConfig());
        auto remote = testing::StreamServerConfig("remote", "http://127.0.0.1:1/sse");
        remote.description = "Unreachable";
        remote.active = false;
        config.servers.push_back(remote);
        config.json_output = json;
        RegisterAllCommands(router, context);
    }

    int Run(const std::vector<std::string>& tokens) {
        return router.Dispatch(tokens, config.json_output, out, err);
    }

    static HandlerOptions Options() {
        HandlerOptions options;
        options.request_timeout = std::chrono::milliseconds(5000);
        options.stream.connect_timeout = std::chrono::seconds(2);
        return options;
    }
};

} // anonymous namespace

// ===========================================================================
// servers
// ===========================================================================

TEST_CASE("servers list: table of configured servers", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"servers", "list"}) == 0);

    auto text = f.out.str();
    CHECK(text.find("ID") == 0);
    CHECK(text.find("mock") != std::string::npos);
    CHECK(text.find("stdio") != std::string::npos);
    CHECK(text.find("remote") != std::string::npos);
    CHECK(text.find("http://127.0.0.1:1/sse") != std::string::npos);
    CHECK(f.registry.RunningServers().empty());
}

TEST_CASE("servers list: JSON entries", "[cli][executor]") {
    CliFixture f(true);
    CHECK(f.Run({"servers", "list"}) == 0);

    auto j = nlohmann::json::parse(f.out.str());
    REQUIRE(j.size() == 2);
    CHECK(j[0]["id"] == "mock");
    CHECK(j[0]["type"] == "stdio");
    CHECK(j[0]["state"] == "stopped");
    CHECK(j[0]["active"] == true);
    CHECK_FALSE(j[0].contains("description"));
    CHECK(j[1]["type"] == "sse");
    CHECK(j[1]["active"] == false);
    CHECK(j[1]["description"] == "Unreachable");
}

TEST_CASE("servers ping: reports latency", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"servers", "ping", "mock"}) == 0);
    CHECK(f.out.str().find("mock responded in ") == 0);
    CHECK(f.registry.RunningServers().empty());
}

TEST_CASE("servers ping: JSON output", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"servers", "ping", "mock", "--json"}) == 0);
    auto j = nlohmann::json::parse(f.out.str());
    CHECK(j["id"] == "mock");
    CHECK(j["latency_ms"].is_number_integer());
}

TEST_CASE("servers ping: unreachable stream server", "[cli][executor]") {
    CliFixture f;
    int rc = f.Run({"servers", "ping", "remote"});
    CHECK((rc == 1 || rc == 6));
    CHECK(f.err.str().find("Error: Connect") != std::string::npos);
}

TEST_CASE("servers logs: prints the captured output", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"servers", "logs", "mock", "--wait", "1"}) == 0);
    CHECK(f.out.str().find("[stderr] mock server starting") != std::string::npos);
    CHECK(f.out.str().find("[stdout] mock banner on stdout") != std::string::npos);
}

TEST_CASE("servers logs: rejects a bad wait", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"servers", "logs", "mock", "--wait", "soon"}) == 9);
    CHECK(f.err.str().find("--wait must be a number of seconds") != std::string::npos);

    CliFixture g;
    CHECK(g.Run({"servers", "logs", "mock", "--wait=-1"}) == 9);
    CHECK(g.err.str().find("--wait must not be negative") != std::string::npos);
}

// ===========================================================================
// Server resolution
// ===========================================================================

TEST_CASE("commands: missing server id", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"tools", "list"}) == 9);
    CHECK(f.err.str().find("Missing server id. Usage: mcp-manager tools list <id>") !=
          std::string::npos);
}

TEST_CASE("commands: unknown server id", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"tools", "list", "nope"}) == 9);
    CHECK(f.err.str().find("Unknown server id: nope") != std::string::npos);
}

TEST_CASE("commands: unknown server id in JSON mode", "[cli][executor]") {
    CliFixture f(true);
    CHECK(f.Run({"tools", "list", "nope"}) == 9);
    CHECK(f.out.str().empty());
    auto j = nlohmann::json::parse(f.err.str());
    CHECK(j["error"]["category"] == "config");
    CHECK(j["error"]["exit_code"] == 9);
}

// ===========================================================================
// tools
// ===========================================================================

TEST_CASE("tools list: table", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"tools", "list", "mock"}) == 0);
    auto text = f.out.str();
    CHECK(text.find("Name") == 0);
    CHECK(text.find("echo    Echo text back") != std::string::npos);
    CHECK(text.find("broken") != std::string::npos);
    CHECK(f.registry.State(ServerId::Create("mock").Value()) == ServerState::Stopped);
}

TEST_CASE("tools list: JSON includes the input schema", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"tools", "list", "mock", "--json"}) == 0);
    auto j = nlohmann::json::parse(f.out.str());
    REQUIRE(j.size() == 2);
    CHECK(j[0]["name"] == "echo");
    CHECK(j[0]["inputSchema"]["type"] == "object");
    CHECK(j[1]["description"] == "");
}

TEST_CASE("tools call: prints text content", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"tools", "call", "mock", "echo", "--args", R"({"text":"hi"})"}) == 0);
    CHECK(f.out.str() == "called echo\n");
}

TEST_CASE("tools call: isError sets the exit code", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"tools", "call", "mock", "broken", "--json"}) == 1);
    auto j = nlohmann::json::parse(f.out.str());
    CHECK(j["isError"] == true);
    CHECK(j["content"][0]["text"] == "tool failed");
}

TEST_CASE("tools call: missing tool name", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"tools", "call", "mock"}) == 9);
    CHECK(f.err.str().find("Missing tool name") != std::string::npos);
}

TEST_CASE("tools call: arguments must be a JSON object", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"tools", "call", "mock", "echo", "--args", "[1,2]"}) == 9);
    CHECK(f.err.str().find("--args must be a JSON object") != std::string::npos);

    CliFixture g;
    CHECK(g.Run({"tools", "call", "mock", "echo", "--args", "{oops"}) == 9);
}

TEST_CASE("tools list: --show-logs dumps the buffer to stderr", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"tools", "list", "mock", "--show-logs", "--json"}) == 0);
    CHECK(f.err.str().find("--- logs: mock ---\n") == 0);
    CHECK_NOTHROW(nlohmann::json::parse(f.out.str()));
}

TEST_CASE("tools list: handshake runs initialize first", "[cli][executor]") {
    CliFixture f;
    f.config.handshake = true;
    CHECK(f.Run({"tools", "list", "mock"}) == 0);
    CHECK(f.logger.Sink().Contains("cli", "Initialized mock 1.0.0"));
}

// ===========================================================================
// resources / prompts
// ===========================================================================

TEST_CASE("resources list: table", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"resources", "list", "mock"}) == 0);
    CHECK(f.out.str().find("file:///tmp/a.txt") != std::string::npos);
    CHECK(f.out.str().find("text/plain") != std::string::npos);
}

TEST_CASE("resources read: prints text", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"resources", "read", "mock", "file:///tmp/a.txt"}) == 0);
    CHECK(f.out.str() == "hello from a\n");
}

TEST_CASE("resources read: missing URI", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"resources", "read", "mock"}) == 9);
    CHECK(f.err.str().find("Missing resource URI") != std::string::npos);
}

TEST_CASE("prompts list: required arguments are starred", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"prompts", "list", "mock"}) == 0);
    CHECK(f.out.str().find("greet") != std::string::npos);
    CHECK(f.out.str().find("who*") != std::string::npos);
}

TEST_CASE("prompts get: description and messages", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"prompts", "get", "mock", "greet", "--args", R"({"who":"you"})"}) == 0);
    CHECK(f.out.str() == "Greeting\nuser: Hello there\n");
}

// ===========================================================================
// rpc
// ===========================================================================

TEST_CASE("rpc send: prints the raw result", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"rpc", "send", "mock", "tools/list", "--json"}) == 0);
    auto j = nlohmann::json::parse(f.out.str());
    CHECK(j["tools"].size() == 2);
}

TEST_CASE("rpc send: protocol error exit code", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"rpc", "send", "mock", "no/such/method"}) == 4);
    CHECK(f.err.str().find("Method not found") != std::string::npos);
    CHECK(f.err.str().find("RPC: ") != std::string::npos);
}

TEST_CASE("rpc send: params must be a JSON object", "[cli][executor]") {
    CliFixture f;
    CHECK(f.Run({"rpc", "send", "mock", "tools/list", "--params", "7"}) == 9);
}

// ===========================================================================
// servers export
// ===========================================================================

TEST_CASE("servers export: hub mode by default", "[cli][executor][export]") {
    CliFixture f;
    CHECK(f.Run({"servers", "export"}) == 0);
    auto j = nlohmann::json::parse(f.out.str());
    const auto& hub = j["mcpServers"]["mcp-manager-hub"];
    CHECK(hub["command"] == "mcp-manager");
    CHECK(hub["args"] == nlohmann::json::array({"hub", "serve"}));
    // Text mode is indented for pasting into a client config.
    CHECK(f.out.str().find("\n  \"mcpServers\"") != std::string::npos);
}

TEST_CASE("servers export: config path is made absolute", "[cli][executor][export]") {
    CliFixture f;
    f.context.config_path = "/etc/mcp/servers.yaml";
    CHECK(f.Run({"servers", "export", "--json"}) == 0);
    auto j = nlohmann::json::parse(f.out.str());
    CHECK(j["mcpServers"]["mcp-manager-hub"]["args"] ==
          nlohmann::json::array({"--config", "/etc/mcp/servers.yaml", "hub", "serve"}));

    CliFixture g;
    g.context.config_path = "servers.yaml";
    CHECK(g.Run({"servers", "export", "--json"}) == 0);
    auto relative = nlohmann::json::parse(g.out.str());
    auto path = relative["mcpServers"]["mcp-manager-hub"]["args"][1].get<std::string>();
    CHECK(path.front() == '/');
    CHECK(path.find("servers.yaml") != std::string::npos);
}

TEST_CASE("servers export: direct mode", "[cli][executor][export]") {
    CliFixture f;
    CHECK(f.Run({"servers", "export", "--mode", "direct", "--json"}) == 0);
    auto j = nlohmann::json::parse(f.out.str());
    const auto& servers = j["mcpServers"];
    REQUIRE(servers.size() == 1);
    CHECK(servers["mock"]["command"] == "/bin/sh");
    CHECK_FALSE(servers.contains("remote"));
}

TEST_CASE("servers export: hub URL", "[cli][executor][export]") {
    CliFixture f;
    CHECK(f.Run({"servers", "export", "--hub-url", "http://localhost:3282/mcp", "--json"}) == 0);
    CHECK(f.out.str() ==
          "{\"mcpServers\":{\"mcp-manager-hub\":{\"url\":\"http://localhost:3282/mcp\"}}}\n");

    CliFixture g;
    CHECK(g.Run({"servers", "export", "--hub-url", "localhost:3282"}) == 9);
    CHECK(g.err.str().find("--hub-url must be an absolute") != std::string::npos);
}

TEST_CASE("servers export: unknown mode", "[cli][executor][export]") {
    CliFixture f;
    CHECK(f.Run({"servers", "export", "--mode", "proxy"}) == 9);
    CHECK(f.err.str().find("Unknown export mode 'proxy'") != std::string::npos);
    CHECK(f.out.str().empty());
}

// ===========================================================================
// hub
// ===========================================================================

TEST_CASE("hub tools: namespaced table", "[cli][executor][hub]") {
    CliFixture f;
    CHECK(f.Run({"hub", "tools"}) == 0);
    CHECK(f.out.str().find("mock__echo") != std::string::npos);
    CHECK(f.out.str().find("[mock] Echo text back") != std::string::npos);
    CHECK(f.out.str().find("remote") == std::string::npos);
    CHECK(f.registry.RunningServers().empty());
}

TEST_CASE("hub tools: failing servers are reported, not fatal", "[cli][executor][hub]") {
    CliFixture f(true);
    ServerConfig broken{ServerId::Create("gone").Value()};
    broken.command = "/definitely/not/a/binary";
    f.config.servers.push_back(broken);

    CHECK(f.Run({"hub", "tools"}) == 0);
    auto j = nlohmann::json::parse(f.out.str());
    CHECK(j["tools"].size() == 2);
    REQUIRE(j["failures"].size() == 1);
    CHECK(j["failures"][0]["server"] == "gone");
    CHECK(j["failures"][0]["error"]["category"] == "spawn");

    CliFixture g;
    g.config.servers.push_back(broken);
    CHECK(g.Run({"hub", "tools"}) == 0);
    CHECK(g.err.str().find("Skipped gone: ") == 0);
}

TEST_CASE("hub resources and prompts", "[cli][executor][hub]") {
    CliFixture f;
    CHECK(f.Run({"hub", "resources"}) == 0);
    CHECK(f.out.str().find("mcp://mock/file:///tmp/a.txt") != std::string::npos);

    CliFixture g;
    CHECK(g.Run({"hub", "prompts"}) == 0);
    CHECK(g.out.str().find("mock__greet") != std::string::npos);
    CHECK(g.out.str().find("who*") != std::string::npos);
}

TEST_CASE("hub call: routes to the owning server", "[cli][executor][hub]") {
    CliFixture f;
    CHECK(f.Run({"hub", "call", "mock__echo", "--args", R"({"text":"hi"})"}) == 0);
    CHECK(f.out.str() == "called echo\n");
    CHECK(f.registry.RunningServers().empty());

    CliFixture g;
    CHECK(g.Run({"hub", "call", "mock__broken"}) == 1);
}

TEST_CASE("hub call: routing errors", "[cli][executor][hub]") {
    CliFixture f;
    CHECK(f.Run({"hub", "call", "remote__search"}) == 9);
    CHECK(f.err.str().find("Server remote not found or inactive") != std::string::npos);

    CliFixture g;
    CHECK(g.Run({"hub", "call"}) == 9);
    CHECK(g.err.str().find("Missing tool name") != std::string::npos);
}

TEST_CASE("hub read and prompt", "[cli][executor][hub]") {
    CliFixture f;
    CHECK(f.Run({"hub", "read", "mcp://mock/file:///tmp/a.txt"}) == 0);
    CHECK(f.out.str() == "hello from a\n");

    CliFixture g;
    CHECK(g.Run({"hub", "prompt", "mock__greet", "--args", R"({"who":"you"})"}) == 0);
    CHECK(g.out.str() == "Greeting\nuser: Hello there\n");
}

TEST_CASE("hub serve: answers requests from the input stream", "[cli][executor][hub]") {
    CliFixture f;
    f.in.str(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
             R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n");
    CHECK(f.Run({"hub", "serve"}) == 0);

    std::istringstream lines(f.out.str());
    std::string first, second;
    REQUIRE(std::getline(lines, first));
    REQUIRE(std::getline(lines, second));
    CHECK(nlohmann::json::parse(first)["result"]["serverInfo"]["name"] == "mcp-manager-hub");
    CHECK(nlohmann::json::parse(second)["result"]["tools"][0]["name"] == "mock__echo");
    CHECK(f.registry.RunningServers().empty());
}

// ===========================================================================
// Registration
// ===========================================================================

TEST_CASE("RegisterAllCommands: every command has help", "[cli][executor]") {
    CliFixture f;
    CHECK(f.router.Groups() ==
          std::vector<std::string>{"hub", "prompts", "resources", "rpc", "servers", "tools"});
    for (const auto& group : f.router.Groups()) {
        CHECK_FALSE(f.router.GroupDescription(group).empty());
        for (const auto& cmd : f.router.CommandsForGroup(group)) {
            INFO(group << " " << cmd.action);
            REQUIRE(cmd.help.has_value());
            CHECK(cmd.help->usage.find("mcp-manager " + group + " " + cmd.action) == 0);
        }
    }
}
