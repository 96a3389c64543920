#include <mcp_manager/transport/stdio_transport.hpp>
#include <mcp_manager/core/log.hpp>
#include <mcp_manager/rpc/wire_codec.hpp>
#include <mcp_manager/transport/line_splitter.hpp>

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcp_manager {

namespace {

constexpr int kPollIntervalMs = 100;

void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

Error SpawnError(const std::string& command, const std::string& message) {
    return Error{"Start", command, std::nullopt, message, std::nullopt,
                 std::nullopt, ErrorCategory::Spawn};
}

Error ProcessGone(const std::string& command) {
    return Error{"Request", command, std::nullopt,
                 "Request cancelled or process died", std::nullopt, std::nullopt,
                 ErrorCategory::Cancelled};
}

bool WriteAll(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

// Parent environment with `overrides` replacing or adding entries.
std::vector<std::string> BuildEnvironment(
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view kv(*entry);
        auto eq = kv.find('=');
        auto key = std::string(kv.substr(0, eq));
        if (overrides.count(key) == 0) {
            env.emplace_back(kv);
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> ToArgv(std::vector<std::string>& strings) {
    std::vector<char*> argv;
    argv.reserve(strings.size() + 1);
    for (auto& s : strings) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);
    return argv;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct StdioTransport::Impl {
    std::string command;
    std::shared_ptr<LogChannel> logs;
    RequestCorrelator correlator;

    pid_t pid = -1;
    std::mutex child_mutex;
    bool reaped = false;

    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;

    std::mutex writer_mutex;
    std::condition_variable writer_cv;
    std::deque<std::string> outbox;
    bool writer_stop = false;
    bool writer_dead = false;

    std::atomic<bool> stopping{false};
    std::thread writer;
    std::thread stdout_reader;
    std::thread stderr_reader;

    Impl(std::string cmd, std::shared_ptr<LogChannel> channel)
        : command(std::move(cmd)), logs(std::move(channel)), correlator(command) {}

    void StartThreads() {
        writer = std::thread([this] { WriteLoop(); });
        stdout_reader = std::thread([this] { ReadLoop(stdout_fd, LogStream::Stdout); });
        stderr_reader = std::thread([this] { ReadLoop(stderr_fd, LogStream::Stderr); });
    }

    bool Enqueue(std::string line) {
        {
            std::lock_guard<std::mutex> lock(writer_mutex);
            if (writer_stop || writer_dead) {
                return false;
            }
            outbox.push_back(std::move(line));
        }
        writer_cv.notify_one();
        return true;
    }

    void WriteLoop() {
        while (true) {
            std::string line;
            {
                std::unique_lock<std::mutex> lock(writer_mutex);
                writer_cv.wait(lock, [this] { return writer_stop || !outbox.empty(); });
                if (writer_stop) {
                    return;
                }
                line = std::move(outbox.front());
                outbox.pop_front();
            }
            if (!WriteAll(stdin_fd, line)) {
                LogDebug("stdio", "Write to '" + command + "' failed: " +
                                      std::strerror(errno));
                std::lock_guard<std::mutex> lock(writer_mutex);
                writer_dead = true;
                return;
            }
        }
    }

    void HandleLine(LogStream stream, std::string line) {
        if (stream == LogStream::Stdout) {
            auto response = DecodeResponse(line);
            if (response.has_value() && correlator.Dispatch(*response)) {
                return;
            }
        }
        logs->Push(LogEvent{stream, std::move(line)});
    }

    void ReadLoop(int fd, LogStream stream) {
        LineSplitter splitter;
        char buffer[4096];
        while (!stopping.load()) {
            pollfd pfd{fd, POLLIN, 0};
            int rc = ::poll(&pfd, 1, kPollIntervalMs);
            if (rc < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (rc == 0) {
                continue;
            }
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                break;
            }
            if (n == 0) {
                break;
            }
            for (auto& line : splitter.Feed(std::string_view(buffer, static_cast<size_t>(n)))) {
                HandleLine(stream, std::move(line));
            }
        }
        for (auto& line : splitter.Flush()) {
            HandleLine(stream, std::move(line));
        }
        if (stream == LogStream::Stdout) {
            LogDebug("stdio", "stdout of '" + command + "' closed");
            correlator.Close(ProcessGone(command));
        }
    }

    Result<void, Error> Kill() {
        std::lock_guard<std::mutex> lock(child_mutex);
        if (reaped || pid <= 0) {
            return Result<void, Error>::Ok();
        }
        if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
            return Result<void, Error>::Err(Error{
                "Kill", command, std::nullopt,
                std::string("kill failed: ") + std::strerror(errno),
                std::nullopt, std::nullopt, ErrorCategory::Internal});
        }
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        reaped = true;
        return Result<void, Error>::Ok();
    }

    void Shutdown() {
        auto killed = Kill();
        if (killed.IsErr()) {
            LogWarn("stdio", killed.Error().ToString());
        }
        stopping.store(true);
        {
            std::lock_guard<std::mutex> lock(writer_mutex);
            writer_stop = true;
        }
        writer_cv.notify_all();
        if (writer.joinable()) writer.join();
        if (stdout_reader.joinable()) stdout_reader.join();
        if (stderr_reader.joinable()) stderr_reader.join();
        CloseFd(stdin_fd);
        CloseFd(stdout_fd);
        CloseFd(stderr_fd);
        correlator.Close(ProcessGone(command));
    }
};

// ---------------------------------------------------------------------------
// StdioTransport
// ---------------------------------------------------------------------------
StdioTransport::StdioTransport(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

StdioTransport::~StdioTransport() {
    if (impl_) {
        impl_->Shutdown();
    }
}

Result<std::unique_ptr<StdioTransport>, Error> StdioTransport::Start(
    const StdioLaunch& launch, std::shared_ptr<LogChannel> logs) {
    using R = Result<std::unique_ptr<StdioTransport>, Error>;

    if (launch.command.empty()) {
        return R::Err(SpawnError(launch.command, "No command configured"));
    }
    IgnoreSigpipeOnce();

    int in[2] = {-1, -1};
    int out[2] = {-1, -1};
    int err[2] = {-1, -1};
    int status[2] = {-1, -1};
    auto close_all = [&] {
        for (int* fds : {in, out, err, status}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
    };
    if (::pipe2(in, O_CLOEXEC) != 0 || ::pipe2(out, O_CLOEXEC) != 0 ||
        ::pipe2(err, O_CLOEXEC) != 0 || ::pipe2(status, O_CLOEXEC) != 0) {
        auto message = std::string("Failed to create pipes: ") + std::strerror(errno);
        close_all();
        return R::Err(SpawnError(launch.command, message));
    }

    // Everything the child needs is prepared before fork().
    std::vector<std::string> arg_strings;
    arg_strings.push_back(launch.command);
    arg_strings.insert(arg_strings.end(), launch.args.begin(), launch.args.end());
    auto argv = ToArgv(arg_strings);
    auto env_strings = BuildEnvironment(launch.env);
    auto envp = ToArgv(env_strings);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto message = std::string("fork failed: ") + std::strerror(errno);
        close_all();
        return R::Err(SpawnError(launch.command, message));
    }

    if (pid == 0) {
        std::signal(SIGPIPE, SIG_DFL);
        ::dup2(in[0], STDIN_FILENO);
        ::dup2(out[1], STDOUT_FILENO);
        ::dup2(err[1], STDERR_FILENO);
        ::execvpe(argv[0], argv.data(), envp.data());
        int code = errno;
        ssize_t ignored = ::write(status[1], &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    }

    CloseFd(in[0]);
    CloseFd(out[1]);
    CloseFd(err[1]);
    CloseFd(status[1]);

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(status[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int ignored_status = 0;
        while (::waitpid(pid, &ignored_status, 0) < 0 && errno == EINTR) {
        }
        close_all();
        return R::Err(SpawnError(launch.command,
                                 "Failed to start '" + launch.command +
                                     "': " + std::strerror(child_errno)));
    }

    auto impl = std::make_unique<Impl>(launch.command, std::move(logs));
    impl->pid = pid;
    impl->stdin_fd = in[1];
    impl->stdout_fd = out[0];
    impl->stderr_fd = err[0];
    impl->StartThreads();

    LogInfo("stdio", "Started '" + launch.command + "' (pid " + std::to_string(pid) + ")");
    return R::Ok(std::unique_ptr<StdioTransport>(new StdioTransport(std::move(impl))));
}

RpcResult StdioTransport::SendRequest(std::string_view method,
                                      const nlohmann::json& params,
                                      std::optional<std::chrono::milliseconds> timeout) {
    auto ticket = impl_->correlator.Register();
    if (ticket.reply.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        return ticket.reply.get();
    }

    LogDebug("stdio", "-> " + std::string(method) + " #" + std::to_string(ticket.id));
    RequestEnvelope request{std::string(method), params, ticket.id};
    if (!impl_->Enqueue(EncodeRequest(request) + "\n")) {
        impl_->correlator.Fail(ticket.id, ProcessGone(impl_->command));
    }
    return impl_->correlator.Await(ticket, timeout);
}

Result<void, Error> StdioTransport::SendNotification(std::string_view method,
                                                     const nlohmann::json& params) {
    if (!impl_->Enqueue(EncodeNotification(method, params) + "\n")) {
        return Result<void, Error>::Err(ProcessGone(impl_->command));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> StdioTransport::Kill() {
    auto result = impl_->Kill();
    if (result.IsOk()) {
        LogInfo("stdio", "Killed '" + impl_->command + "' (pid " +
                             std::to_string(impl_->pid) + ")");
    }
    return result;
}

void StdioTransport::CancelPending(const Error& reason) {
    impl_->correlator.Close(reason);
}

int StdioTransport::Pid() const {
    return static_cast<int>(impl_->pid);
}

const RequestCorrelator& StdioTransport::Correlator() const {
    return impl_->correlator;
}

} // namespace mcp_manager
