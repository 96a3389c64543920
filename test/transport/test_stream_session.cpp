#include <catch2/catch_test_macros.hpp>

#include <mcp_manager/transport/stream_session.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_manager;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> Lines(LogChannel& channel) {
    std::vector<std::string> lines;
    while (auto event = channel.PopFor(1ms)) {
        CHECK(event->stream == LogStream::Stream);
        lines.push_back(event->line);
    }
    return lines;
}

const char* kStreamUrl = "http://localhost:8000/sse";

} // anonymous namespace

TEST_CASE("StreamSession: endpoint event announces a relative reply-to URL", "[stream_session]") {
    auto logs = std::make_shared<LogChannel>();
    StreamSession session(kStreamUrl, logs);

    session.OnBytes("event: endpoint\ndata: /messages?sessionId=abc\n\n");

    REQUIRE(session.ReplyToUrl().has_value());
    CHECK(*session.ReplyToUrl() == "http://localhost:8000/messages?sessionId=abc");
    CHECK(Lines(*logs) ==
          std::vector<std::string>{"Connected to endpoint: http://localhost:8000/messages?sessionId=abc"});
}

TEST_CASE("StreamSession: bare absolute URL data line is adopted", "[stream_session]") {
    auto logs = std::make_shared<LogChannel>();
    StreamSession session(kStreamUrl, logs);

    session.OnLine("data: http://other:9000/post");

    REQUIRE(session.ReplyToUrl().has_value());
    CHECK(*session.ReplyToUrl() == "http://other:9000/post");
}

TEST_CASE("StreamSession: first endpoint wins", "[stream_session]") {
    auto logs = std::make_shared<LogChannel>();
    StreamSession session(kStreamUrl, logs);

    session.OnBytes("event: endpoint\ndata: /first\n\n");
    session.OnBytes("event: endpoint\ndata: /second\n\n");
    session.OnLine("data: http://third/x");

    CHECK(*session.ReplyToUrl() == "http://localhost:8000/first");
    auto lines = Lines(*logs);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "Connected to endpoint: http://localhost:8000/first");
    // The unannounced URL after discovery is ordinary data.
    CHECK(lines[1] == "http://third/x");
}

TEST_CASE("StreamSession: reply on the stream resolves a pending request", "[stream_session]") {
    auto logs = std::make_shared<LogChannel>();
    StreamSession session(kStreamUrl, logs);
    auto ticket = session.Correlator().Register();

    session.OnBytes("event: message\n");
    session.OnBytes("data: {\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"tools\":[]}}\n\n");

    auto reply = session.Correlator().Await(ticket, 1s);
    REQUIRE(reply.IsOk());
    CHECK(reply.Value()["tools"].is_array());
    // Event names other than "endpoint" are logged; the consumed reply is not.
    CHECK(Lines(*logs) == std::vector<std::string>{"event: message"});
}

TEST_CASE("StreamSession: unmatched data and other lines are logged", "[stream_session]") {
    auto logs = std::make_shared<LogChannel>();
    StreamSession session(kStreamUrl, logs);

    session.OnLine("data: {\"jsonrpc\":\"2.0\",\"id\":42,\"result\":{}}");
    session.OnLine("data: hello");
    session.OnLine(": keep-alive");
    session.OnLine("id: 7");

    CHECK(Lines(*logs) == std::vector<std::string>{
                              "{\"jsonrpc\":\"2.0\",\"id\":42,\"result\":{}}",
                              "hello", ": keep-alive", "id: 7"});
    CHECK_FALSE(session.ReplyToUrl().has_value());
}

TEST_CASE("StreamSession: data without a space after the colon", "[stream_session]") {
    auto logs = std::make_shared<LogChannel>();
    StreamSession session(kStreamUrl, logs);

    session.OnBytes("event:endpoint\r\ndata:/messages\r\n\r\n");

    REQUIRE(session.ReplyToUrl().has_value());
    CHECK(*session.ReplyToUrl() == "http://localhost:8000/messages");
}

TEST_CASE("StreamSession: chunk boundaries inside a line", "[stream_session]") {
    auto logs = std::make_shared<LogChannel>();
    StreamSession session(kStreamUrl, logs);

    session.OnBytes("event: end");
    session.OnBytes("point\ndata: /mess");
    CHECK_FALSE(session.ReplyToUrl().has_value());
    session.OnBytes("ages\n");

    CHECK(*session.ReplyToUrl() == "http://localhost:8000/messages");
}

TEST_CASE("StreamSession: end of stream fails pending requests", "[stream_session]") {
    auto logs = std::make_shared<LogChannel>();
    StreamSession session(kStreamUrl, logs);
    auto ticket = session.Correlator().Register();

    session.OnBytes("data: trailing");
    session.OnStreamEnded("SSE stream closed by server");

    auto reply = session.Correlator().Await(ticket, 1s);
    REQUIRE(reply.IsErr());
    CHECK(reply.Error().category == ErrorCategory::Cancelled);
    CHECK(reply.Error().message == "Request cancelled or connection lost");
    CHECK(Lines(*logs) == std::vector<std::string>{"trailing", "SSE stream closed by server"});
    CHECK(session.Correlator().IsClosed());
}

TEST_CASE("StreamSession: WaitForReplyTo wakes on discovery", "[stream_session]") {
    auto logs = std::make_shared<LogChannel>();
    StreamSession session(kStreamUrl, logs);

    CHECK_FALSE(session.WaitForReplyTo(10ms));

    std::thread feeder([&session] {
        std::this_thread::sleep_for(20ms);
        session.OnBytes("event: endpoint\ndata: /m\n\n");
    });
    bool ready = session.WaitForReplyTo(5s);
    feeder.join();
    CHECK(ready);
}
