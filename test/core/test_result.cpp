#include <catch2/catch_test_macros.hpp>

#include <mcp_manager/core/result.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

using namespace mcp_manager;

namespace {

Error MakeError(ErrorCategory category, std::string message = "boom") {
    return Error{"Op", "", std::nullopt, std::move(message), std::nullopt,
                 std::nullopt, category};
}

} // anonymous namespace

// ===========================================================================
// Result<T, E>
// ===========================================================================

TEST_CASE("Result: Ok and Err are distinguishable", "[result]") {
    auto ok = Result<int, std::string>::Ok(7);
    auto err = Result<int, std::string>::Err("nope");

    REQUIRE(ok.IsOk());
    CHECK(ok.Value() == 7);
    CHECK(static_cast<bool>(ok));
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "nope");
    CHECK(err.ValueOr(3) == 3);
}

TEST_CASE("Result: move-only values move out", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(5));
    auto p = std::move(r).Value();
    REQUIRE(p);
    CHECK(*p == 5);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, Error>::Ok();
    auto err = Result<void, Error>::Err(MakeError(ErrorCategory::NotRunning));
    CHECK(ok.IsOk());
    REQUIRE(err.IsErr());
    CHECK(err.Error().category == ErrorCategory::NotRunning);
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: ToString includes endpoint, status and RPC code", "[error]") {
    Error e{"Post", "http://localhost:9000/messages", 500, "Server internal error",
            std::nullopt, -32601, ErrorCategory::HttpStatus};
    auto s = e.ToString();
    CHECK(s.find("Post") != std::string::npos);
    CHECK(s.find("[http://localhost:9000/messages]") != std::string::npos);
    CHECK(s.find("(HTTP 500)") != std::string::npos);
    CHECK(s.find("(RPC -32601)") != std::string::npos);
    CHECK(s.find("Server internal error") != std::string::npos);
}

TEST_CASE("Error: ToString omits absent fields", "[error]") {
    auto s = MakeError(ErrorCategory::Cancelled, "Request cancelled or process died").ToString();
    CHECK(s == "Op: Request cancelled or process died");
}

TEST_CASE("Error: equality covers category", "[error]") {
    CHECK(MakeError(ErrorCategory::Timeout) == MakeError(ErrorCategory::Timeout));
    CHECK(MakeError(ErrorCategory::Timeout) != MakeError(ErrorCategory::Cancelled));
}

TEST_CASE("Error: every category has a distinct name and an exit code", "[error]") {
    CHECK(MakeError(ErrorCategory::Spawn).ExitCode() == 1);
    CHECK(MakeError(ErrorCategory::Connection).ExitCode() == 1);
    CHECK(MakeError(ErrorCategory::HttpStatus).ExitCode() == 2);
    CHECK(MakeError(ErrorCategory::EndpointUnavailable).ExitCode() == 3);
    CHECK(MakeError(ErrorCategory::Protocol).ExitCode() == 4);
    CHECK(MakeError(ErrorCategory::Cancelled).ExitCode() == 5);
    CHECK(MakeError(ErrorCategory::Timeout).ExitCode() == 6);
    CHECK(MakeError(ErrorCategory::Decode).ExitCode() == 7);
    CHECK(MakeError(ErrorCategory::NotRunning).ExitCode() == 8);
    CHECK(MakeError(ErrorCategory::Config).ExitCode() == 9);
    CHECK(MakeError(ErrorCategory::Internal).ExitCode() == 99);

    CHECK(MakeError(ErrorCategory::EndpointUnavailable).CategoryName() == "endpoint_unavailable");
    CHECK(MakeError(ErrorCategory::NotRunning).CategoryName() == "not_running");
}

TEST_CASE("Error: ToJson embeds the JSON-RPC error payload", "[error]") {
    Error e{"tools/call", "", std::nullopt, "Unknown tool",
            std::string(R"({"code":-32602,"message":"Unknown tool"})"), -32602,
            ErrorCategory::Protocol};

    auto j = nlohmann::json::parse(e.ToJson());
    const auto& body = j["error"];
    CHECK(body["category"] == "protocol");
    CHECK(body["operation"] == "tools/call");
    CHECK(body["exit_code"] == 4);
    CHECK(body["rpc_code"] == -32602);
    CHECK(body["rpc_error"]["message"] == "Unknown tool");
    CHECK_FALSE(body.contains("http_status"));
    CHECK_FALSE(body.contains("endpoint"));
}

TEST_CASE("Error: ToJson escapes message text", "[error]") {
    auto j = nlohmann::json::parse(MakeError(ErrorCategory::Spawn, "bad \"cmd\"\n").ToJson());
    CHECK(j["error"]["message"] == "bad \"cmd\"\n");
}

// ===========================================================================
// FromHttpStatus
// ===========================================================================

TEST_CASE("FromHttpStatus: 404 is an HTTP status error", "[error]") {
    auto e = Error::FromHttpStatus("Connect", "http://h/sse", 404);
    CHECK(e.category == ErrorCategory::HttpStatus);
    CHECK(e.http_status == 404);
    CHECK(e.message == "Not found");
    CHECK(e.endpoint == "http://h/sse");
}

TEST_CASE("FromHttpStatus: 408 is a timeout", "[error]") {
    CHECK(Error::FromHttpStatus("Post", "", 408).category == ErrorCategory::Timeout);
}

TEST_CASE("FromHttpStatus: gateway errors are connection failures", "[error]") {
    CHECK(Error::FromHttpStatus("Post", "", 502).category == ErrorCategory::Connection);
    CHECK(Error::FromHttpStatus("Post", "", 503).category == ErrorCategory::Connection);
    CHECK(Error::FromHttpStatus("Post", "", 504).category == ErrorCategory::Connection);
}

TEST_CASE("FromHttpStatus: reason taken from a JSON body", "[error]") {
    auto e = Error::FromHttpStatus("Post", "", 400, R"({"error":"session not found"})");
    CHECK(e.message == "Bad request: session not found");

    auto nested = Error::FromHttpStatus("Post", "", 400,
                                        R"({"error":{"message":"bad id"}})");
    CHECK(nested.message == "Bad request: bad id");
}

TEST_CASE("FromHttpStatus: short plain body is appended, HTML is not", "[error]") {
    auto plain = Error::FromHttpStatus("Post", "", 500, "database down\n");
    CHECK(plain.message == "Server internal error: database down");

    auto html = Error::FromHttpStatus("Post", "", 500, "<html><body>oops</body></html>");
    CHECK(html.message == "Server internal error");
}

TEST_CASE("FromHttpStatus: unknown status names the code", "[error]") {
    auto e = Error::FromHttpStatus("Connect", "", 418);
    CHECK(e.message == "Unexpected HTTP 418");
    CHECK(e.category == ErrorCategory::HttpStatus);
}
