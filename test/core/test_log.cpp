#include <catch2/catch_test_macros.hpp>

#include <mcp_manager/core/log.hpp>

#include "support/capture_sink.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_manager;
using mcp_manager::testing::CaptureSink;

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode writes level and component", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Warn, "stdio", "child exited");

    auto line = oss.str();
    CHECK(line.find("[WARN]") != std::string::npos);
    CHECK(line.find("[stdio]") != std::string::npos);
    CHECK(line.find("child exited") != std::string::npos);
    CHECK(line.find('\033') == std::string::npos);
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
}

TEST_CASE("ColorConsoleSink: color mode emits ANSI escapes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Error, "sse", "stream closed");

    auto line = oss.str();
    CHECK(line.find('\033') != std::string::npos);
    CHECK(line.find("stream closed") != std::string::npos);
}

// ===========================================================================
// JsonSink / JsonFileSink
// ===========================================================================

TEST_CASE("JsonSink: one JSON object per record", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "registry", "Process a killed");
    sink.Write(LogLevel::Debug, "server:a", "[stderr] boom");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);
    CHECK(output.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(output.find("\"level\":\"DEBUG\"") != std::string::npos);
    CHECK(output.find("\"component\":\"server:a\"") != std::string::npos);
    CHECK(output.find("\"ts\":\"") != std::string::npos);
}

TEST_CASE("ColorConsoleSink: server output is prefixed with the server id", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Debug, ServerLogComponent("files"), "[stderr] listening");

    auto line = oss.str();
    CHECK(line.find("files |") != std::string::npos);
    CHECK(line.find("[stderr] listening") != std::string::npos);
    CHECK(line.find("DEBUG") == std::string::npos);
}

TEST_CASE("JsonSink: server records carry the server id", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, ServerLogComponent("files"), "[stdout] ready");
    sink.Write(LogLevel::Info, "registry", "files is running");

    std::istringstream lines(oss.str());
    std::string first, second;
    std::getline(lines, first);
    std::getline(lines, second);
    CHECK(first.find("\"server\":\"files\"") != std::string::npos);
    CHECK(first.find("\"component\":\"server:files\"") != std::string::npos);
    CHECK(second.find("\"server\"") == std::string::npos);
}

TEST_CASE("JsonSink: invalid UTF-8 from a server does not throw", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    CHECK_NOTHROW(sink.Write(LogLevel::Debug, "server:bin", std::string("bad \xff byte")));
    CHECK(oss.str().find("bad ") != std::string::npos);
}

TEST_CASE("ServerIdOfComponent: only server components match", "[log]") {
    CHECK(ServerIdOfComponent("server:files") == std::optional<std::string_view>("files"));
    CHECK_FALSE(ServerIdOfComponent("server:").has_value());
    CHECK_FALSE(ServerIdOfComponent("registry").has_value());
    CHECK(ServerLogComponent("a.b") == "server:a.b");
}

TEST_CASE("JsonSink: escapes quotes, newlines and control bytes", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "c", std::string("say \"hi\"\nnext\x01"));

    auto output = oss.str();
    CHECK(output.find("say \\\"hi\\\"\\nnext\\u0001") != std::string::npos);
}

TEST_CASE("JsonFileSink: appends records to the file", "[log]") {
    auto path = std::string("mcp_manager_test_log_") +
                std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) +
                ".jsonl";
    std::remove(path.c_str());
    {
        JsonFileSink sink(path);
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Warn, "cli", "first");
        sink.Write(LogLevel::Warn, "cli", "second");
    }

    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    std::remove(path.c_str());

    REQUIRE(lines.size() == 2);
    CHECK(lines[0].find("\"message\":\"first\"") != std::string::npos);
    CHECK(lines[1].find("\"message\":\"second\"") != std::string::npos);
}

TEST_CASE("JsonFileSink: unwritable path is reported", "[log]") {
    JsonFileSink sink("/nonexistent-dir/mcp-manager.log");
    CHECK_FALSE(sink.IsOpen());
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: drops records below the minimum level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "d");
    logger.Info("c", "i");
    logger.Warn("c", "w");
    logger.Error("c", "e");

    auto messages = sink_ptr->Messages();
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].level == LogLevel::Warn);
    CHECK(messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: IsEnabled follows SetLevel", "[log]") {
    Logger logger(std::make_unique<CaptureSink>(), LogLevel::Error);
    CHECK_FALSE(logger.IsEnabled(LogLevel::Debug));
    CHECK(logger.IsEnabled(LogLevel::Error));

    logger.SetLevel(LogLevel::Debug);
    CHECK(logger.IsEnabled(LogLevel::Debug));
}

TEST_CASE("Logger: concurrent writers lose no records", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                logger.Info("t" + std::to_string(t), std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(sink_ptr->Messages().size() == static_cast<size_t>(kThreads * kPerThread));
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("GlobalLogger: free functions reach the installed sink", "[log]") {
    mcp_manager::testing::ScopedCaptureLogger capture(LogLevel::Info);

    LogDebug("registry", "hidden");
    LogInfo("registry", "shown");

    CHECK(capture.Sink().Contains("registry", "shown"));
    CHECK_FALSE(capture.Sink().Contains("registry", "hidden"));
}
