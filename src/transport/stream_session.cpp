#include <mcp_manager/transport/stream_session.hpp>
#include <mcp_manager/core/log.hpp>
#include <mcp_manager/core/url.hpp>
#include <mcp_manager/rpc/wire_codec.hpp>

namespace mcp_manager {

namespace {

bool StartsWith(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

// Value of an SSE field line ("name: value"), one leading space dropped.
std::string_view FieldValue(std::string_view line, size_t name_length) {
    auto value = line.substr(name_length);
    if (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
    }
    return value;
}

} // anonymous namespace

StreamSession::StreamSession(std::string stream_url, std::shared_ptr<LogChannel> logs)
    : stream_url_(std::move(stream_url)),
      logs_(std::move(logs)),
      correlator_(stream_url_) {}

void StreamSession::OnBytes(std::string_view chunk) {
    for (const auto& line : splitter_.Feed(chunk)) {
        OnLine(line);
    }
}

void StreamSession::OnLine(std::string_view line) {
    if (line.empty()) {
        endpoint_announced_ = false;
        return;
    }

    if (StartsWith(line, "event:")) {
        if (FieldValue(line, 6) == "endpoint") {
            endpoint_announced_ = true;
            return;
        }
        Emit(std::string(line));
        return;
    }

    if (StartsWith(line, "data:")) {
        auto payload = FieldValue(line, 5);
        bool announced = endpoint_announced_;
        endpoint_announced_ = false;
        if ((announced || IsAbsoluteHttpUrl(payload)) &&
            TryAdoptEndpoint(payload, announced)) {
            return;
        }
        auto response = DecodeResponse(payload);
        if (response.has_value() && correlator_.Dispatch(*response)) {
            return;
        }
        Emit(std::string(payload));
        return;
    }

    Emit(std::string(line));
}

bool StreamSession::TryAdoptEndpoint(std::string_view payload, bool announced) {
    std::string url;
    if (IsAbsoluteHttpUrl(payload)) {
        url = std::string(payload);
    } else {
        auto resolved = ResolveUrlReference(stream_url_, payload);
        if (resolved.IsErr()) {
            LogWarn("stream", "Cannot resolve endpoint '" + std::string(payload) +
                                  "': " + resolved.Error());
            return false;
        }
        url = std::move(resolved).Value();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reply_to_.has_value()) {
            LogDebug("stream", "Ignoring repeated endpoint announcement: " + url);
            // An unannounced URL after discovery is just data.
            return announced;
        }
        reply_to_ = url;
    }
    cv_.notify_all();

    LogInfo("stream", "Connected to endpoint: " + url);
    Emit("Connected to endpoint: " + url);
    return true;
}

void StreamSession::OnStreamEnded(const std::string& reason) {
    for (const auto& line : splitter_.Flush()) {
        OnLine(line);
    }
    Emit(reason);
    correlator_.Close(Error{"Request", stream_url_, std::nullopt,
                            "Request cancelled or connection lost", std::nullopt,
                            std::nullopt, ErrorCategory::Cancelled});
}

std::optional<std::string> StreamSession::ReplyToUrl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reply_to_;
}

bool StreamSession::WaitForReplyTo(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return reply_to_.has_value(); });
}

void StreamSession::Emit(std::string line) {
    logs_->Push(LogEvent{LogStream::Stream, std::move(line)});
}

} // namespace mcp_manager
