#include "presencelink/async/async_ipc_client.hpp"
#include "presencelink/async/worker_stream.hpp"
#include "presencelink/core/ipc_connection.hpp"
#include "presencelink/utils/logging.hpp"

#include <functional>

#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/system_error.hpp>

namespace presencelink {
namespace async {

using nlohmann::json;

namespace {

bool retryableWhileWaiting(const IpcError& error) {
    return error.isConnectionError() && error.code() != ErrorCode::PermissionDenied;
}

/**
 * @brief One-shot timer that runs onExpire if it fires while still armed.
 *
 * Disarmed on destruction, so a completion already queued when the guarded
 * operation finishes never touches the caller's stack.
 */
class Deadline {
public:
    Deadline(boost::asio::io_context& io, std::chrono::milliseconds timeout,
             std::function<void()> onExpire)
        : timer_(io, timeout), state_(std::make_shared<State>()) {
        state_->onExpire = std::move(onExpire);
        std::shared_ptr<State> state = state_;
        timer_.async_wait([state](const boost::system::error_code& ec) {
            if (ec || !state->armed) {
                return;
            }
            state->expired = true;
            state->onExpire();
        });
    }

    ~Deadline() {
        state_->armed = false;
        state_->onExpire = nullptr;
    }

    Deadline(const Deadline&) = delete;
    Deadline& operator=(const Deadline&) = delete;

    bool expired() const { return state_->expired; }

private:
    struct State {
        bool armed = true;
        bool expired = false;
        std::function<void()> onExpire;
    };

    boost::asio::steady_timer timer_;
    std::shared_ptr<State> state_;
};

} // namespace

Backend defaultBackend() {
#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)
    return Backend::NativeSocket;
#else
    return Backend::BlockingWorker;
#endif
}

const char* toString(Backend backend) {
    switch (backend) {
        case Backend::NativeSocket: return "native-socket";
        case Backend::BlockingWorker: return "blocking-worker";
    }
    return "unknown";
}

AsyncIpcClient::AsyncIpcClient(boost::asio::io_context& io, std::string clientId,
                               core::ClientOptions options, Backend backend)
    : io_(io)
    , clientId_(std::move(clientId))
    , options_(std::move(options))
    , backend_(backend)
    , workers_(1) {}

AsyncIpcClient::~AsyncIpcClient() {
    close();
}

Result<json> AsyncIpcClient::connect(const boost::asio::yield_context& yield) {
    return establish(std::nullopt, yield);
}

Result<json> AsyncIpcClient::connectWithTimeout(std::chrono::milliseconds timeout,
                                                const boost::asio::yield_context& yield) {
    return establish(timeout, yield);
}

Result<json> AsyncIpcClient::reconnect(const boost::asio::yield_context& yield) {
    PLINK_LOG_INFO("reconnecting client " << clientId_ << " (" << toString(backend_) << ")");
    return establish(std::nullopt, yield);
}

Result<json> AsyncIpcClient::establish(std::optional<std::chrono::milliseconds> handshakeTimeout,
                                       const boost::asio::yield_context& yield) {
    close();

    auto stream = openStream(yield);
    if (stream.has_error()) {
        PLINK_LOG_WARN("transport for " << options_.pipe.describe()
                       << " unavailable: " << stream.error().toString());
        return stream.error();
    }

    CoroutineStream* raw = stream.value().get();
    auto engine = std::make_unique<core::ProtocolEngine>(clientId_, std::move(stream).value(), options_.ipc);

    std::optional<Deadline> deadline;
    if (handshakeTimeout) {
        deadline.emplace(io_, *handshakeTimeout, [raw] { raw->close(); });
    }

    Result<json> ready = [&] {
        YieldScope scope(*raw, yield);
        return engine->connect();
    }();

    if (deadline && deadline->expired()) {
        PLINK_LOG_WARN("handshake timed out after " << handshakeTimeout->count() << " ms");
        std::optional<std::string> lastError;
        if (ready.has_error()) {
            lastError = ready.error().toString();
        }
        return IpcError::connectionTimeout(static_cast<uint64_t>(handshakeTimeout->count()), lastError);
    }
    if (ready.has_error()) {
        PLINK_LOG_WARN("handshake failed: " << ready.error().toString());
        return ready.error();
    }

    engine_ = std::move(engine);
    stream_ = raw;
    return ready;
}

AsyncIpcClient::StreamResult AsyncIpcClient::openStream(const boost::asio::yield_context& yield) {
#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)
    if (backend_ == Backend::NativeSocket) {
        return openNative(yield);
    }
#else
    if (backend_ == Backend::NativeSocket) {
        PLINK_LOG_WARN("native sockets unavailable on this platform, using worker backend");
    }
#endif
    return openWorker(yield);
}

AsyncIpcClient::StreamResult AsyncIpcClient::openWorker(const boost::asio::yield_context& yield) {
    const core::ClientOptions options = options_;
    auto connection = runOnWorker(io_, workers_, [options] {
        return options.connectTimeout
            ? core::IpcConnection::openWithTimeout(options.pipe, *options.connectTimeout, options.ipc)
            : core::IpcConnection::open(options.pipe, options.ipc);
    }, yield);
    if (connection.has_error()) {
        return connection.error();
    }
    return std::unique_ptr<CoroutineStream>(
        new WorkerStream(io_, workers_, std::move(connection).value()));
}

#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)

AsyncIpcClient::StreamResult AsyncIpcClient::openNative(const boost::asio::yield_context& yield) {
    auto valid = options_.ipc.validate();
    if (valid.has_error()) {
        return valid.error();
    }
    valid = options_.pipe.validate(options_.ipc);
    if (valid.has_error()) {
        return valid.error();
    }

    const auto paths = core::candidatePaths(options_.pipe, options_.ipc);
    LocalSocket* inFlight = nullptr;
    if (!options_.connectTimeout) {
        return probeNative(paths, inFlight, yield);
    }

    const auto timeout = *options_.connectTimeout;
    boost::asio::steady_timer pause(io_);
    Deadline deadline(io_, timeout, [&inFlight, &pause] {
        if (inFlight != nullptr) {
            boost::system::error_code ignored;
            inFlight->close(ignored);
        }
        pause.cancel();
    });

    std::optional<std::string> lastError;
    while (true) {
        auto stream = probeNative(paths, inFlight, yield);
        if (stream.has_value()) {
            return stream;
        }
        if (deadline.expired()) {
            break;
        }
        if (!retryableWhileWaiting(stream.error())) {
            return stream.error();
        }
        lastError = stream.error().toString();

        pause.expires_after(options_.ipc.retryInterval());
        boost::system::error_code ec;
        pause.async_wait(yield[ec]);
        if (deadline.expired()) {
            break;
        }
    }

    PLINK_LOG_WARN("connection timed out after " << timeout.count() << " ms");
    return IpcError::connectionTimeout(static_cast<uint64_t>(timeout.count()), lastError);
}

AsyncIpcClient::StreamResult AsyncIpcClient::probeNative(const std::vector<core::CandidatePath>& paths,
                                                         LocalSocket*& inFlight,
                                                         const boost::asio::yield_context& yield) {
    std::vector<std::string> attempted;
    bool sawPermissionDenied = false;
    std::string lastReason = "no candidate paths";

    for (const auto& candidate : paths) {
        attempted.push_back(candidate.path);

        LocalEndpoint endpoint;
        try {
            endpoint = LocalEndpoint(candidate.path);
        } catch (const boost::system::system_error& e) {
            lastReason = e.what();
            continue;
        }

        LocalSocket socket(io_);
        boost::system::error_code ec;
        inFlight = &socket;
        socket.async_connect(endpoint, yield[ec]);
        inFlight = nullptr;

        if (!ec) {
            PLINK_LOG_DEBUG("connected to " << candidate.path);
            return std::unique_ptr<CoroutineStream>(new AsioLocalStream(std::move(socket)));
        }
        if (ec == boost::asio::error::access_denied || ec == boost::asio::error::no_permission) {
            sawPermissionDenied = true;
        }
        lastReason = ec.message();
        PLINK_LOG_DEBUG("probe of " << candidate.path << " failed: " << lastReason);
        if (ec == boost::asio::error::operation_aborted) {
            break;
        }
    }

    if (options_.pipe.mode() == core::PipeConfig::Mode::CustomPath) {
        if (sawPermissionDenied) {
            return IpcError::permissionDenied(options_.pipe.path());
        }
        return IpcError::connectionFailed(options_.pipe.path(), lastReason);
    }
    if (sawPermissionDenied) {
        IpcError error(ErrorCode::PermissionDenied, "permission denied while probing IPC sockets");
        error.withAttemptedPaths(std::move(attempted));
        return error;
    }
    return IpcError::discoveryFailed(std::move(attempted), lastReason);
}

#endif // BOOST_ASIO_HAS_LOCAL_SOCKETS

Result<void> AsyncIpcClient::setActivity(const activity::Activity& activity,
                                         const boost::asio::yield_context& yield) {
    auto valid = activity.validate();
    if (valid.has_error()) {
        return valid;
    }
    if (!engine_) {
        return IpcError::notConnected();
    }
    YieldScope scope(*stream_, yield);
    return engine_->setActivity(activity);
}

Result<json> AsyncIpcClient::clearActivity(const boost::asio::yield_context& yield) {
    if (!engine_) {
        return IpcError::notConnected();
    }
    YieldScope scope(*stream_, yield);
    return engine_->clearActivity();
}

Result<void> AsyncIpcClient::sendMessage(core::Opcode opcode, const json& payload,
                                         const boost::asio::yield_context& yield) {
    if (!engine_) {
        return IpcError::notConnected();
    }
    YieldScope scope(*stream_, yield);
    return engine_->sendMessage(opcode, payload);
}

Result<core::Frame> AsyncIpcClient::recvMessage(const boost::asio::yield_context& yield) {
    if (!engine_) {
        return IpcError::notConnected();
    }
    YieldScope scope(*stream_, yield);
    return engine_->recvMessage();
}

size_t AsyncIpcClient::cleanupPending(std::chrono::milliseconds maxAge) {
    return engine_ ? engine_->cleanupPending(maxAge) : 0;
}

void AsyncIpcClient::close() {
    if (engine_) {
        engine_->close();
        engine_.reset();
    }
    stream_ = nullptr;
}

bool AsyncIpcClient::isConnected() const {
    return engine_ && engine_->isConnected();
}

} // namespace async
} // namespace presencelink
