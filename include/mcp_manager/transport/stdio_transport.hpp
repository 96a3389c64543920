#pragma once

#include <mcp_manager/core/result.hpp>
#include <mcp_manager/rpc/request_correlator.hpp>
#include <mcp_manager/transport/log_channel.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_manager {

struct StdioLaunch {
    std::string command;
    std::vector<std::string> args;
    // Overlaid on the parent environment.
    std::map<std::string, std::string> env;
};

// ---------------------------------------------------------------------------
// StdioTransport: an MCP server running as a child process.
//
// Requests are written to the child's stdin one per line. Stdout lines that
// are replies to a pending request resolve it; every other stdout line and
// every stderr line is pushed to the log channel. When stdout reaches EOF
// all pending requests fail and later requests fail immediately.
// ---------------------------------------------------------------------------
class StdioTransport {
public:
    /// Spawn the child. Fails synchronously if the command cannot be executed.
    /// The first call sets SIGPIPE to SIG_IGN for the whole process, so a
    /// write to a child that has exited fails with EPIPE instead of killing
    /// the caller.
    static Result<std::unique_ptr<StdioTransport>, Error> Start(
        const StdioLaunch& launch, std::shared_ptr<LogChannel> logs);

    ~StdioTransport();

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;
    StdioTransport(StdioTransport&&) = delete;
    StdioTransport& operator=(StdioTransport&&) = delete;

    RpcResult SendRequest(std::string_view method, const nlohmann::json& params,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    Result<void, Error> SendNotification(std::string_view method,
                                         const nlohmann::json& params);

    /// SIGKILL and reap the child. Safe to call more than once.
    Result<void, Error> Kill();

    /// Fail every pending request with `reason` and reject new ones.
    void CancelPending(const Error& reason);

    [[nodiscard]] int Pid() const;
    [[nodiscard]] const RequestCorrelator& Correlator() const;

private:
    struct Impl;
    explicit StdioTransport(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_manager
