#include <mcp_manager/registry/process_registry.hpp>
#include <mcp_manager/core/log.hpp>

#include <exception>

namespace mcp_manager {

namespace {

Error NotRunning(const ServerId& id) {
    return Error{"Registry", id.Value(), std::nullopt, "Process not running",
                 std::nullopt, std::nullopt, ErrorCategory::NotRunning};
}

} // anonymous namespace

const char* ServerStateName(ServerState state) {
    switch (state) {
        case ServerState::Stopped:  return "stopped";
        case ServerState::Starting: return "starting";
        case ServerState::Running:  return "running";
    }
    return "unknown";
}

ProcessRegistry::ProcessRegistry(HandlerOptions options)
    : ProcessRegistry(std::move(options), &McpHandler::Start) {}

ProcessRegistry::ProcessRegistry(HandlerOptions options, HandlerFactory factory)
    : options_(std::move(options)), factory_(std::move(factory)) {}

ProcessRegistry::~ProcessRegistry() {
    StopAll();
}

void ProcessRegistry::Drain(std::string component, std::shared_ptr<LogChannel> channel,
                            std::shared_ptr<LogBuffer> buffer) {
    while (auto event = channel->Pop()) {
        LogDebug(component, event->line);
        buffer->Append(FormatLogEvent(*event));
    }
}

void ProcessRegistry::StopDrain(Slot& slot) {
    if (slot.channel) {
        slot.channel->Close();
    }
    if (slot.drain.joinable()) {
        slot.drain.join();
    }
}

// Exceptions from the factory become an Internal error so the slot can
// never be left in Starting.
Result<std::unique_ptr<McpHandler>, Error> ProcessRegistry::CreateHandler(
    const ServerConfig& config, std::shared_ptr<LogChannel> channel) {
    try {
        return factory_(config, std::move(channel), options_);
    } catch (const std::exception& e) {
        return Result<std::unique_ptr<McpHandler>, Error>::Err(
            Error{"Start", config.id.Value(), std::nullopt,
                  std::string("Unexpected failure: ") + e.what(), std::nullopt,
                  std::nullopt, ErrorCategory::Internal});
    }
}

Result<void, Error> ProcessRegistry::Start(const ServerConfig& config) {
    const auto& id = config.id;
    std::shared_ptr<LogChannel> channel;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] {
            auto it = slots_.find(id);
            return it == slots_.end() || it->second.state != ServerState::Starting;
        });
        auto it = slots_.find(id);
        if (it != slots_.end() && it->second.state == ServerState::Running) {
            LogDebug("registry", id.Value() + " is already running");
            return Result<void, Error>::Ok();
        }

        channel = std::make_shared<LogChannel>();
        auto buffer = std::make_shared<LogBuffer>();
        logs_[id] = buffer;

        auto& slot = slots_[id];
        slot.state = ServerState::Starting;
        slot.channel = channel;
        slot.drain = std::thread(&ProcessRegistry::Drain, ServerLogComponent(id.Value()),
                                 channel, buffer);
    }

    LogInfo("registry", "Starting " + id.Value() + " (" +
                            TransportKindName(config.Kind()) + ": " + config.Target() + ")");
    auto started = CreateHandler(config, channel);

    std::unique_lock<std::mutex> lock(mutex_);
    auto it = slots_.find(id);
    if (started.IsErr()) {
        Slot failed = std::move(it->second);
        slots_.erase(it);
        lock.unlock();
        cv_.notify_all();
        StopDrain(failed);
        LogWarn("registry", "Failed to start " + id.Value() + ": " +
                                started.Error().message);
        return Result<void, Error>::Err(started.Error());
    }
    it->second.handler = std::shared_ptr<McpHandler>(std::move(started).Value());
    it->second.state = ServerState::Running;
    lock.unlock();
    cv_.notify_all();
    LogInfo("registry", id.Value() + " is running");
    return Result<void, Error>::Ok();
}

void ProcessRegistry::Stop(const ServerId& id) {
    Slot slot;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] {
            auto it = slots_.find(id);
            return it == slots_.end() || it->second.state != ServerState::Starting;
        });
        logs_.erase(id);
        auto it = slots_.find(id);
        if (it == slots_.end()) {
            return;
        }
        slot = std::move(it->second);
        slots_.erase(it);
    }
    cv_.notify_all();

    if (slot.handler) {
        auto killed = slot.handler->Kill();
        if (killed.IsErr()) {
            LogError("registry", "Failed to kill " + id.Value() + ": " +
                                     killed.Error().ToString());
        } else {
            LogInfo("registry", "Process " + id.Value() + " killed");
        }
        slot.handler->CancelPending(Error{"Stop", id.Value(), std::nullopt,
                                          "Server stopped", std::nullopt,
                                          std::nullopt, ErrorCategory::Cancelled});
    }
    StopDrain(slot);
}

void ProcessRegistry::StopAll() {
    std::vector<ServerId> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, slot] : slots_) {
            ids.push_back(id);
        }
        for (const auto& [id, buffer] : logs_) {
            if (slots_.count(id) == 0) {
                ids.push_back(id);
            }
        }
    }
    for (const auto& id : ids) {
        Stop(id);
    }
}

ServerState ProcessRegistry::State(const ServerId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(id);
    return it == slots_.end() ? ServerState::Stopped : it->second.state;
}

std::vector<ServerId> ProcessRegistry::RunningServers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerId> ids;
    for (const auto& [id, slot] : slots_) {
        if (slot.state == ServerState::Running) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::shared_ptr<McpHandler> ProcessRegistry::Handler(const ServerId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(id);
    if (it == slots_.end() || it->second.state != ServerState::Running) {
        return nullptr;
    }
    return it->second.handler;
}

Result<std::shared_ptr<McpHandler>, Error> ProcessRegistry::RequireHandler(
    const ServerId& id) const {
    auto handler = Handler(id);
    if (!handler) {
        return Result<std::shared_ptr<McpHandler>, Error>::Err(NotRunning(id));
    }
    return Result<std::shared_ptr<McpHandler>, Error>::Ok(std::move(handler));
}

std::shared_ptr<LogBuffer> ProcessRegistry::Logs(const ServerId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = logs_.find(id);
    return it == logs_.end() ? nullptr : it->second;
}

Result<std::chrono::milliseconds, Error> ProcessRegistry::Ping(const ServerId& id) {
    auto handler = RequireHandler(id);
    if (handler.IsErr()) {
        return Result<std::chrono::milliseconds, Error>::Err(handler.Error());
    }
    const auto start = std::chrono::steady_clock::now();
    auto tools = handler.Value()->ListTools();
    if (tools.IsErr()) {
        return Result<std::chrono::milliseconds, Error>::Err(tools.Error());
    }
    return Result<std::chrono::milliseconds, Error>::Ok(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start));
}

} // namespace mcp_manager
