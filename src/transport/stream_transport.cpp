#include <mcp_manager/transport/stream_transport.hpp>
#include <mcp_manager/core/log.hpp>
#include <mcp_manager/core/url.hpp>
#include <mcp_manager/rpc/wire_codec.hpp>
#include <mcp_manager/transport/stream_session.hpp>

#include <httplib.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace mcp_manager {

namespace {

Error MakeStreamError(const std::string& operation,
                      const std::string& endpoint,
                      const std::string& message,
                      ErrorCategory category = ErrorCategory::Connection) {
    return Error{operation, endpoint, std::nullopt, message, std::nullopt,
                 std::nullopt, category};
}

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

bool IsSuccess(int status) {
    return status >= 200 && status < 300;
}

std::unique_ptr<httplib::Client> MakeClient(const HttpUrl& url,
                                            const StreamOptions& options,
                                            std::chrono::seconds read_timeout) {
    auto client = std::make_unique<httplib::Client>(url.Origin());
    client->set_connection_timeout(options.connect_timeout);
    client->set_read_timeout(read_timeout);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https" && !options.verify_tls) {
        client->enable_server_certificate_verification(false);
    }
#endif
    return client;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the stream client and the session state.
// ---------------------------------------------------------------------------
struct StreamTransport::Impl {
    HttpUrl url;
    std::string url_text;
    StreamOptions options;
    std::shared_ptr<LogChannel> logs;
    StreamSession session;
    std::unique_ptr<httplib::Client> client;

    std::atomic<bool> stopping{false};
    std::thread reader;

    std::mutex connect_mutex;
    std::condition_variable connect_cv;
    std::optional<Result<void, Error>> connect_result;

    Impl(HttpUrl parsed, const StreamOptions& opts, std::shared_ptr<LogChannel> channel)
        : url(std::move(parsed)),
          url_text(url.ToString()),
          options(opts),
          logs(channel),
          session(url_text, channel),
          client(MakeClient(url, opts, opts.read_timeout)) {}

    // Only the first outcome counts.
    void SignalConnected(Result<void, Error> outcome) {
        {
            std::lock_guard<std::mutex> lock(connect_mutex);
            if (connect_result.has_value()) {
                return;
            }
            connect_result.emplace(std::move(outcome));
        }
        connect_cv.notify_all();
    }

    void ReadLoop() {
        httplib::Headers headers = {{"Accept", "text/event-stream"}};
        LogInfo("stream", "GET " + url_text);

        auto res = client->Get(
            url.target, headers,
            [this](const httplib::Response& response) {
                if (IsSuccess(response.status)) {
                    SignalConnected(Result<void, Error>::Ok());
                    return true;
                }
                auto error = Error::FromHttpStatus("Connect", url_text, response.status);
                logs->Push(LogEvent{LogStream::Stream,
                                    "Failed to connect to SSE: " + error.message});
                SignalConnected(Result<void, Error>::Err(error));
                return false;
            },
            [this](const char* data, size_t length) {
                if (stopping.load()) {
                    return false;
                }
                session.OnBytes(std::string_view(data, length));
                return !stopping.load();
            });

        std::string reason;
        if (!res) {
            const auto http_error = res.error();
            if (stopping.load()) {
                reason = "SSE stream closed";
            } else {
                reason = "SSE stream error: " + httplib::to_string(http_error);
            }
            session.OnStreamEnded(reason);
            SignalConnected(Result<void, Error>::Err(MakeStreamError(
                "Connect", url_text,
                "Failed to connect to SSE: " + httplib::to_string(http_error),
                CategoryFromHttpTransportError(http_error))));
        } else {
            reason = "SSE stream closed by server";
            session.OnStreamEnded(reason);
            SignalConnected(Result<void, Error>::Err(
                MakeStreamError("Connect", url_text, reason)));
        }
        LogInfo("stream", reason + " (" + url_text + ")");
    }

    Result<void, Error> AwaitConnected() {
        // The client's own connect timeout normally fires first.
        auto deadline = options.connect_timeout * 2 + std::chrono::seconds(1);
        std::unique_lock<std::mutex> lock(connect_mutex);
        if (!connect_cv.wait_for(lock, deadline, [this] { return connect_result.has_value(); })) {
            return Result<void, Error>::Err(MakeStreamError(
                "Connect", url_text, "Timed out waiting for the event stream",
                ErrorCategory::Timeout));
        }
        return *connect_result;
    }

    Result<void, Error> Post(const HttpUrl& target, const std::string& body) {
        auto post_client = MakeClient(target, options, options.post_timeout);
        LogDebug("stream", "POST " + target.ToString());
        auto res = post_client->Post(target.target, body, "application/json");
        if (!res) {
            const auto http_error = res.error();
            return Result<void, Error>::Err(MakeStreamError(
                "Post", target.ToString(),
                "HTTP request failed: " + httplib::to_string(http_error),
                CategoryFromHttpTransportError(http_error)));
        }
        if (!IsSuccess(res->status)) {
            return Result<void, Error>::Err(
                Error::FromHttpStatus("Post", target.ToString(), res->status, res->body));
        }
        return Result<void, Error>::Ok();
    }

    Result<HttpUrl, Error> ReplyTarget() {
        auto reply_to = session.ReplyToUrl();
        if (!reply_to.has_value()) {
            return Result<HttpUrl, Error>::Err(MakeStreamError(
                "Request", url_text, "Endpoint not yet received",
                ErrorCategory::EndpointUnavailable));
        }
        auto parsed = ParseHttpUrl(*reply_to);
        if (parsed.IsErr()) {
            return Result<HttpUrl, Error>::Err(MakeStreamError(
                "Request", *reply_to, parsed.Error(), ErrorCategory::Internal));
        }
        return Result<HttpUrl, Error>::Ok(std::move(parsed).Value());
    }

    void Stop() {
        if (!stopping.exchange(true)) {
            client->stop();
        }
    }

    void Shutdown() {
        Stop();
        if (reader.joinable()) {
            reader.join();
        }
    }
};

// ---------------------------------------------------------------------------
// StreamTransport
// ---------------------------------------------------------------------------
StreamTransport::StreamTransport(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

StreamTransport::~StreamTransport() {
    if (impl_) {
        impl_->Shutdown();
    }
}

Result<std::unique_ptr<StreamTransport>, Error> StreamTransport::Start(
    const std::string& url, std::shared_ptr<LogChannel> logs,
    const StreamOptions& options) {
    using R = Result<std::unique_ptr<StreamTransport>, Error>;

    auto parsed = ParseHttpUrl(url);
    if (parsed.IsErr()) {
        return R::Err(MakeStreamError("Connect", url, parsed.Error(),
                                      ErrorCategory::Config));
    }

    auto impl = std::make_unique<Impl>(std::move(parsed).Value(), options, std::move(logs));
    auto* raw = impl.get();
    std::unique_ptr<StreamTransport> transport(new StreamTransport(std::move(impl)));
    raw->reader = std::thread([raw] { raw->ReadLoop(); });

    auto connected = raw->AwaitConnected();
    if (connected.IsErr()) {
        return R::Err(connected.Error());
    }
    return R::Ok(std::move(transport));
}

RpcResult StreamTransport::SendRequest(std::string_view method,
                                       const nlohmann::json& params,
                                       std::optional<std::chrono::milliseconds> timeout) {
    auto target = impl_->ReplyTarget();
    if (target.IsErr()) {
        return RpcResult::Err(target.Error());
    }

    auto& correlator = impl_->session.Correlator();
    auto ticket = correlator.Register();
    if (ticket.reply.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        return ticket.reply.get();
    }

    RequestEnvelope request{std::string(method), params, ticket.id};
    auto posted = impl_->Post(target.Value(), EncodeRequest(request));
    if (posted.IsErr()) {
        if (correlator.Fail(ticket.id, posted.Error())) {
            return RpcResult::Err(posted.Error());
        }
        // The reply raced ahead of the POST outcome.
        return ticket.reply.get();
    }
    return correlator.Await(ticket, timeout);
}

Result<void, Error> StreamTransport::SendNotification(std::string_view method,
                                                      const nlohmann::json& params) {
    auto target = impl_->ReplyTarget();
    if (target.IsErr()) {
        return Result<void, Error>::Err(target.Error());
    }
    return impl_->Post(target.Value(), EncodeNotification(method, params));
}

Result<void, Error> StreamTransport::Kill() {
    impl_->Stop();
    return Result<void, Error>::Ok();
}

void StreamTransport::CancelPending(const Error& reason) {
    impl_->session.Correlator().Close(reason);
}

std::optional<std::string> StreamTransport::ReplyToUrl() const {
    return impl_->session.ReplyToUrl();
}

bool StreamTransport::WaitForReplyTo(std::chrono::milliseconds timeout) const {
    return impl_->session.WaitForReplyTo(timeout);
}

const RequestCorrelator& StreamTransport::Correlator() const {
    return impl_->session.Correlator();
}

} // namespace mcp_manager
