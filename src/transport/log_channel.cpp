#include <mcp_manager/transport/log_channel.hpp>

namespace mcp_manager {

std::string FormatLogEvent(const LogEvent& event) {
    switch (event.stream) {
        case LogStream::Stdout: return "[stdout] " + event.line + "\n";
        case LogStream::Stderr: return "[stderr] " + event.line + "\n";
        case LogStream::Stream: return event.line + "\n";
    }
    return event.line + "\n";
}

bool LogChannel::Push(LogEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

std::optional<LogEvent> LogChannel::Pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !events_.empty(); });
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<LogEvent> LogChannel::PopFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); });
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void LogChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool LogChannel::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace mcp_manager
