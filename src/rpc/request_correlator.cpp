#include <mcp_manager/rpc/request_correlator.hpp>
#include <mcp_manager/core/log.hpp>

namespace mcp_manager {

RequestCorrelator::RequestCorrelator(std::string endpoint)
    : endpoint_(std::move(endpoint)) {}

RequestCorrelator::Ticket RequestCorrelator::Register() {
    std::promise<RpcResult> promise;
    Ticket ticket;
    ticket.reply = promise.get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    ticket.id = next_id_++;
    if (closed_reason_.has_value()) {
        promise.set_value(RpcResult::Err(*closed_reason_));
        return ticket;
    }
    pending_.emplace(ticket.id, std::move(promise));
    return ticket;
}

bool RequestCorrelator::Dispatch(const ResponseEnvelope& response) {
    if (response.IsError()) {
        return Resolve(response.id,
                       RpcResult::Err(ProtocolError(*response.error, endpoint_)));
    }
    return Resolve(response.id,
                   RpcResult::Ok(response.result.value_or(nlohmann::json())));
}

bool RequestCorrelator::Resolve(uint64_t id, RpcResult result) {
    std::promise<RpcResult> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        promise = std::move(it->second);
        pending_.erase(it);
    }
    promise.set_value(std::move(result));
    return true;
}

bool RequestCorrelator::Fail(uint64_t id, const Error& error) {
    return Resolve(id, RpcResult::Err(error));
}

RpcResult RequestCorrelator::Await(Ticket& ticket,
                                   std::optional<std::chrono::milliseconds> timeout) {
    if (timeout.has_value() &&
        ticket.reply.wait_for(*timeout) != std::future_status::ready) {
        Error error{"Request", endpoint_, std::nullopt,
                    "No reply for request " + std::to_string(ticket.id) +
                        " within " + std::to_string(timeout->count()) + " ms",
                    std::nullopt, std::nullopt, ErrorCategory::Timeout};
        if (Fail(ticket.id, error)) {
            LogDebug("rpc", "Request " + std::to_string(ticket.id) + " timed out");
        }
        // If the reply landed first, the future already holds it.
    }
    return ticket.reply.get();
}

void RequestCorrelator::Close(const Error& reason) {
    std::map<uint64_t, std::promise<RpcResult>> orphaned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_reason_.has_value()) {
            closed_reason_ = reason;
        }
        orphaned.swap(pending_);
    }
    for (auto& [id, promise] : orphaned) {
        promise.set_value(RpcResult::Err(reason));
    }
    if (!orphaned.empty()) {
        LogDebug("rpc", "Cancelled " + std::to_string(orphaned.size()) +
                            " pending request(s): " + reason.message);
    }
}

size_t RequestCorrelator::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool RequestCorrelator::IsPending(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) > 0;
}

bool RequestCorrelator::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_reason_.has_value();
}

uint64_t RequestCorrelator::LastAssignedId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

Error RequestCorrelator::ProtocolError(const nlohmann::json& payload,
                                       const std::string& endpoint) {
    Error error{"Request", endpoint, std::nullopt, payload.dump(), payload.dump(),
                std::nullopt, ErrorCategory::Protocol};
    if (payload.is_object()) {
        auto message = payload.find("message");
        if (message != payload.end() && message->is_string()) {
            error.message = message->get<std::string>();
        }
        auto code = payload.find("code");
        if (code != payload.end() && code->is_number_integer()) {
            error.rpc_code = code->get<int>();
        }
    } else if (payload.is_string()) {
        error.message = payload.get<std::string>();
    }
    return error;
}

} // namespace mcp_manager
