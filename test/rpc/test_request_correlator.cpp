#include <catch2/catch_test_macros.hpp>

#include <mcp_manager/rpc/request_correlator.hpp>

#include <chrono>
#include <set>
#include <thread>
#include <vector>

using namespace mcp_manager;
using namespace std::chrono_literals;

namespace {

Error Cancelled(const std::string& message) {
    return Error{"Request", "", std::nullopt, message, std::nullopt, std::nullopt,
                 ErrorCategory::Cancelled};
}

ResponseEnvelope Reply(uint64_t id, nlohmann::json result) {
    ResponseEnvelope r;
    r.id = id;
    r.result = std::move(result);
    return r;
}

} // anonymous namespace

TEST_CASE("RequestCorrelator: ids start at 1 and increase", "[correlator]") {
    RequestCorrelator correlator;
    auto a = correlator.Register();
    auto b = correlator.Register();
    auto c = correlator.Register();
    CHECK(a.id == 1);
    CHECK(b.id == 2);
    CHECK(c.id == 3);
    CHECK(correlator.LastAssignedId() == 3);
    CHECK(correlator.PendingCount() == 3);
}

TEST_CASE("RequestCorrelator: reply resolves the matching ticket only", "[correlator]") {
    RequestCorrelator correlator;
    auto first = correlator.Register();
    auto second = correlator.Register();

    REQUIRE(correlator.Dispatch(Reply(second.id, {{"ok", true}})));

    auto reply = correlator.Await(second);
    REQUIRE(reply.IsOk());
    CHECK(reply.Value()["ok"] == true);
    CHECK(correlator.IsPending(first.id));
    CHECK_FALSE(correlator.IsPending(second.id));
}

TEST_CASE("RequestCorrelator: unknown and repeated replies are ignored", "[correlator]") {
    RequestCorrelator correlator;
    auto t = correlator.Register();

    CHECK_FALSE(correlator.Dispatch(Reply(99, 1)));
    CHECK(correlator.Dispatch(Reply(t.id, 1)));
    CHECK_FALSE(correlator.Dispatch(Reply(t.id, 2)));
    CHECK(correlator.Await(t).Value() == 1);
}

TEST_CASE("RequestCorrelator: error reply becomes a Protocol error", "[correlator]") {
    RequestCorrelator correlator("stdio:srv");
    auto t = correlator.Register();

    ResponseEnvelope r;
    r.id = t.id;
    r.error = nlohmann::json{{"code", -32602}, {"message", "Invalid params"}};
    REQUIRE(correlator.Dispatch(r));

    auto reply = correlator.Await(t);
    REQUIRE(reply.IsErr());
    CHECK(reply.Error().category == ErrorCategory::Protocol);
    CHECK(reply.Error().message == "Invalid params");
    CHECK(reply.Error().rpc_code == -32602);
    CHECK(reply.Error().endpoint == "stdio:srv");
    REQUIRE(reply.Error().rpc_error.has_value());
    CHECK(reply.Error().rpc_error->find("Invalid params") != std::string::npos);
}

TEST_CASE("RequestCorrelator: non-object error payload keeps its text", "[correlator]") {
    auto e = RequestCorrelator::ProtocolError("plain failure", "");
    CHECK(e.message == "plain failure");
    CHECK_FALSE(e.rpc_code.has_value());
}

TEST_CASE("RequestCorrelator: Close fails every pending request", "[correlator]") {
    RequestCorrelator correlator;
    auto a = correlator.Register();
    auto b = correlator.Register();

    correlator.Close(Cancelled("Request cancelled or process died"));

    for (auto* t : {&a, &b}) {
        auto reply = correlator.Await(*t);
        REQUIRE(reply.IsErr());
        CHECK(reply.Error().category == ErrorCategory::Cancelled);
        CHECK(reply.Error().message == "Request cancelled or process died");
    }
    CHECK(correlator.PendingCount() == 0);
    CHECK(correlator.IsClosed());
}

TEST_CASE("RequestCorrelator: registering after Close fails at once", "[correlator]") {
    RequestCorrelator correlator;
    correlator.Close(Cancelled("first"));
    correlator.Close(Cancelled("second"));

    auto t = correlator.Register();
    CHECK(t.reply.wait_for(0ms) == std::future_status::ready);
    auto reply = t.reply.get();
    REQUIRE(reply.IsErr());
    CHECK(reply.Error().message == "first");
    CHECK(correlator.PendingCount() == 0);
}

TEST_CASE("RequestCorrelator: Await with timeout fails an unanswered id", "[correlator]") {
    RequestCorrelator correlator;
    auto t = correlator.Register();

    auto reply = correlator.Await(t, 20ms);
    REQUIRE(reply.IsErr());
    CHECK(reply.Error().category == ErrorCategory::Timeout);
    CHECK_FALSE(correlator.IsPending(t.id));
    CHECK_FALSE(correlator.Dispatch(Reply(t.id, 1)));
}

TEST_CASE("RequestCorrelator: reply from another thread wakes the waiter", "[correlator]") {
    RequestCorrelator correlator;
    auto t = correlator.Register();
    auto id = t.id;

    std::thread replier([&correlator, id]() {
        std::this_thread::sleep_for(10ms);
        correlator.Dispatch(Reply(id, "late"));
    });
    auto reply = correlator.Await(t, 5s);
    replier.join();

    REQUIRE(reply.IsOk());
    CHECK(reply.Value() == "late");
}

TEST_CASE("RequestCorrelator: concurrent registrations get distinct ids", "[correlator]") {
    RequestCorrelator correlator;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;
    std::vector<std::vector<uint64_t>> ids(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&correlator, &ids, i]() {
            for (int n = 0; n < kPerThread; ++n) {
                ids[i].push_back(correlator.Register().id);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::set<uint64_t> unique;
    for (const auto& v : ids) {
        unique.insert(v.begin(), v.end());
    }
    CHECK(unique.size() == static_cast<size_t>(kThreads * kPerThread));
    CHECK(*unique.begin() == 1);
    CHECK(*unique.rbegin() == static_cast<uint64_t>(kThreads * kPerThread));
}
