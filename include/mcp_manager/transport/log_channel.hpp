#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace mcp_manager {

// Where a non-reply line came from.
enum class LogStream {
    Stdout,
    Stderr,
    Stream,
};

struct LogEvent {
    LogStream stream = LogStream::Stdout;
    std::string line;
};

/// Render an event the way it is stored in a server's log buffer:
/// "[stdout] line\n", "[stderr] line\n", or "line\n" for stream events.
std::string FormatLogEvent(const LogEvent& event);

// ---------------------------------------------------------------------------
// LogChannel: unbounded multi-producer queue of log events for one server.
// Transports push; the registry's drain thread pops until Close().
// ---------------------------------------------------------------------------
class LogChannel {
public:
    LogChannel() = default;
    LogChannel(const LogChannel&) = delete;
    LogChannel& operator=(const LogChannel&) = delete;

    /// Enqueue an event. Returns false (and drops it) once closed.
    bool Push(LogEvent event);

    /// Block until an event is available. Returns std::nullopt once the
    /// channel is closed and drained.
    std::optional<LogEvent> Pop();

    /// Like Pop(), but gives up after `timeout`.
    std::optional<LogEvent> PopFor(std::chrono::milliseconds timeout);

    void Close();
    [[nodiscard]] bool IsClosed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<LogEvent> events_;
    bool closed_ = false;
};

} // namespace mcp_manager
