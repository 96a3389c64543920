#pragma once

#include <mcp_manager/core/result.hpp>
#include <mcp_manager/rpc/request_correlator.hpp>
#include <mcp_manager/transport/line_splitter.hpp>
#include <mcp_manager/transport/log_channel.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_manager {

// ---------------------------------------------------------------------------
// StreamSession: line dispatch for one server-sent-events connection.
//
// Knows nothing about sockets: the stream transport feeds it bytes and it
// discovers the reply-to URL, resolves pending requests and emits log lines.
// The reply-to URL is taken from the first "data:" line that either follows
// "event: endpoint" or is itself an absolute http(s) URL; later ones are
// ignored.
// ---------------------------------------------------------------------------
class StreamSession {
public:
    StreamSession(std::string stream_url, std::shared_ptr<LogChannel> logs);

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    /// Feed raw bytes from the stream body.
    void OnBytes(std::string_view chunk);

    /// Dispatch one complete line.
    void OnLine(std::string_view line);

    /// The stream is gone: flush partial input, fail pending requests.
    void OnStreamEnded(const std::string& reason);

    [[nodiscard]] std::optional<std::string> ReplyToUrl() const;

    /// Block until the reply-to URL is known or `timeout` passes.
    bool WaitForReplyTo(std::chrono::milliseconds timeout) const;

    [[nodiscard]] const std::string& StreamUrl() const { return stream_url_; }
    RequestCorrelator& Correlator() { return correlator_; }
    const RequestCorrelator& Correlator() const { return correlator_; }

private:
    void Emit(std::string line);
    bool TryAdoptEndpoint(std::string_view payload, bool announced);

    std::string stream_url_;
    std::shared_ptr<LogChannel> logs_;
    RequestCorrelator correlator_;
    LineSplitter splitter_;
    bool endpoint_announced_ = false;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::optional<std::string> reply_to_;
};

} // namespace mcp_manager
