#pragma once

#include <mcp_manager/core/result.hpp>
#include <mcp_manager/rpc/wire_codec.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mcp_manager {

using RpcResult = Result<nlohmann::json, Error>;

// ---------------------------------------------------------------------------
// RequestCorrelator: assigns request ids and matches replies to waiters.
//
// Each registered id owns a single-use reply slot. A slot is removed from the
// table and resolved exactly once: by a matching reply, by Fail(), or by
// Close(). Ids start at 1 and are never reused by the same correlator.
// ---------------------------------------------------------------------------
class RequestCorrelator {
public:
    struct Ticket {
        uint64_t id = 0;
        std::future<RpcResult> reply;
    };

    /// `endpoint` labels the errors produced by this correlator.
    explicit RequestCorrelator(std::string endpoint = "");

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /// Allocate the next id and register its reply slot. After Close() the
    /// returned future is already resolved with the close reason.
    Ticket Register();

    /// Resolve a pending id with a decoded reply. False if the id is unknown.
    bool Dispatch(const ResponseEnvelope& response);

    /// Resolve a pending id with an explicit value or error. False if unknown.
    bool Resolve(uint64_t id, RpcResult result);
    bool Fail(uint64_t id, const Error& error);

    /// Block until the reply arrives. With a timeout, an unanswered id is
    /// failed with a Timeout error unless its reply wins the race.
    RpcResult Await(Ticket& ticket,
                    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Fail every pending id with `reason` and reject future registrations.
    /// Idempotent; only the first reason is kept.
    void Close(const Error& reason);

    [[nodiscard]] size_t PendingCount() const;
    [[nodiscard]] bool IsPending(uint64_t id) const;
    [[nodiscard]] bool IsClosed() const;
    [[nodiscard]] uint64_t LastAssignedId() const;

    /// Map a JSON-RPC error payload to a Protocol error.
    static Error ProtocolError(const nlohmann::json& payload,
                               const std::string& endpoint);

private:
    std::string endpoint_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::map<uint64_t, std::promise<RpcResult>> pending_;
    std::optional<Error> closed_reason_;
};

} // namespace mcp_manager
