#pragma once

#include <mcp_manager/core/result.hpp>
#include <mcp_manager/rpc/request_correlator.hpp>
#include <mcp_manager/transport/log_channel.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_manager {

struct StreamOptions {
    std::chrono::seconds connect_timeout{10};
    // Longest silence tolerated on the event stream.
    std::chrono::seconds read_timeout{3600};
    std::chrono::seconds post_timeout{30};
    bool verify_tls = true;
};

// ---------------------------------------------------------------------------
// StreamTransport: an MCP server reached over server-sent events.
//
// A background GET keeps the event stream open. Requests are POSTed to the
// reply-to URL the server announces on that stream; replies come back on
// the stream. Requests issued before the announcement fail immediately.
// ---------------------------------------------------------------------------
class StreamTransport {
public:
    /// Open the event stream. Fails if the URL is invalid, the connection is
    /// refused, or the server answers with a non-2xx status.
    static Result<std::unique_ptr<StreamTransport>, Error> Start(
        const std::string& url, std::shared_ptr<LogChannel> logs,
        const StreamOptions& options = {});

    ~StreamTransport();

    StreamTransport(const StreamTransport&) = delete;
    StreamTransport& operator=(const StreamTransport&) = delete;
    StreamTransport(StreamTransport&&) = delete;
    StreamTransport& operator=(StreamTransport&&) = delete;

    RpcResult SendRequest(std::string_view method, const nlohmann::json& params,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    Result<void, Error> SendNotification(std::string_view method,
                                         const nlohmann::json& params);

    /// Abandon the event stream. Always succeeds.
    Result<void, Error> Kill();

    void CancelPending(const Error& reason);

    [[nodiscard]] std::optional<std::string> ReplyToUrl() const;
    bool WaitForReplyTo(std::chrono::milliseconds timeout) const;

    [[nodiscard]] const RequestCorrelator& Correlator() const;

private:
    struct Impl;
    explicit StreamTransport(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_manager
