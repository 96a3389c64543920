#pragma once

#include <mcp_manager/config/app_config.hpp>
#include <mcp_manager/core/result.hpp>
#include <mcp_manager/core/types.hpp>
#include <mcp_manager/handler/mcp_handler.hpp>
#include <mcp_manager/registry/log_buffer.hpp>
#include <mcp_manager/transport/log_channel.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mcp_manager {

enum class ServerState {
    Stopped,
    Starting,
    Running,
};

const char* ServerStateName(ServerState state);

// ---------------------------------------------------------------------------
// ProcessRegistry: at most one running handler per server id.
//
// Start is idempotent and serialised per id; Stop kills the handler, fails
// its outstanding requests and discards its log buffer. A failed start
// leaves the log buffer in place so the failure can be inspected.
// ---------------------------------------------------------------------------
class ProcessRegistry {
public:
    /// Builds the handler for a server; McpHandler::Start by default.
    using HandlerFactory = std::function<Result<std::unique_ptr<McpHandler>, Error>(
        const ServerConfig&, std::shared_ptr<LogChannel>, const HandlerOptions&)>;

    explicit ProcessRegistry(HandlerOptions options = {});
    ProcessRegistry(HandlerOptions options, HandlerFactory factory);
    ~ProcessRegistry();

    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    Result<void, Error> Start(const ServerConfig& config);
    void Stop(const ServerId& id);
    void StopAll();

    [[nodiscard]] ServerState State(const ServerId& id) const;
    [[nodiscard]] std::vector<ServerId> RunningServers() const;

    /// The running handler, or nullptr.
    [[nodiscard]] std::shared_ptr<McpHandler> Handler(const ServerId& id) const;

    /// The running handler, or a NotRunning error.
    Result<std::shared_ptr<McpHandler>, Error> RequireHandler(const ServerId& id) const;

    /// The server's log buffer, or nullptr if none is registered.
    [[nodiscard]] std::shared_ptr<LogBuffer> Logs(const ServerId& id) const;

    /// Round-trip time of a tools/list request.
    Result<std::chrono::milliseconds, Error> Ping(const ServerId& id);

private:
    struct Slot {
        ServerState state = ServerState::Stopped;
        std::shared_ptr<McpHandler> handler;
        std::shared_ptr<LogChannel> channel;
        std::thread drain;
    };

    static void Drain(std::string component, std::shared_ptr<LogChannel> channel,
                      std::shared_ptr<LogBuffer> buffer);
    static void StopDrain(Slot& slot);

    Result<std::unique_ptr<McpHandler>, Error> CreateHandler(
        const ServerConfig& config, std::shared_ptr<LogChannel> channel);

    HandlerOptions options_;
    HandlerFactory factory_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<ServerId, Slot> slots_;
    std::map<ServerId, std::shared_ptr<LogBuffer>> logs_;
};

} // namespace mcp_manager
