#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include "presencelink/activity/activity.hpp"
#include "presencelink/async/asio_stream.hpp"
#include "presencelink/core/pipe_config.hpp"
#include "presencelink/core/protocol_engine.hpp"
#include "presencelink/core/socket_paths.hpp"

namespace presencelink {
namespace async {

/**
 * @brief How the cooperative client reaches the peer.
 */
enum class Backend {
    NativeSocket,   ///< boost::asio local stream socket
    BlockingWorker  ///< Blocking IpcConnection driven from a worker thread
};

/// NativeSocket where asio has local sockets, BlockingWorker otherwise.
Backend defaultBackend();
const char* toString(Backend backend);

/**
 * @brief Reconnecting client for Boost.Asio stackful coroutines.
 *
 * Same operations as core::IpcClient, each taking the caller's
 * yield_context and suspending it instead of blocking. The io_context is
 * expected to be run by a single thread.
 *
 * @code
 * boost::asio::io_context io;
 * boost::asio::spawn(io, [&](boost::asio::yield_context yield) {
 *     AsyncIpcClient client(io, "123456789012345678");
 *     if (client.connect(yield)) {
 *         client.clearActivity(yield);
 *     }
 * });
 * io.run();
 * @endcode
 */
class AsyncIpcClient {
public:
    AsyncIpcClient(boost::asio::io_context& io, std::string clientId,
                   core::ClientOptions options = core::ClientOptions(),
                   Backend backend = defaultBackend());
    ~AsyncIpcClient();

    AsyncIpcClient(const AsyncIpcClient&) = delete;
    AsyncIpcClient& operator=(const AsyncIpcClient&) = delete;

    /**
     * @brief Open the transport and handshake.
     *
     * With options.connectTimeout set, discovery is raced against a timer;
     * on expiry the socket in flight is closed and ConnectionTimeout returned.
     */
    Result<nlohmann::json> connect(const boost::asio::yield_context& yield);

    /**
     * @brief connect() with the handshake itself also bounded by timeout.
     */
    Result<nlohmann::json> connectWithTimeout(std::chrono::milliseconds timeout,
                                              const boost::asio::yield_context& yield);

    Result<nlohmann::json> reconnect(const boost::asio::yield_context& yield);

    Result<void> setActivity(const activity::Activity& activity, const boost::asio::yield_context& yield);
    Result<nlohmann::json> clearActivity(const boost::asio::yield_context& yield);
    Result<void> sendMessage(core::Opcode opcode, const nlohmann::json& payload,
                             const boost::asio::yield_context& yield);
    Result<core::Frame> recvMessage(const boost::asio::yield_context& yield);
    size_t cleanupPending(std::chrono::milliseconds maxAge);

    void close();
    bool isConnected() const;

    Backend backend() const { return backend_; }
    const std::string& clientId() const { return clientId_; }
    const core::ClientOptions& options() const { return options_; }

private:
    using StreamResult = Result<std::unique_ptr<CoroutineStream>>;

    Result<nlohmann::json> establish(std::optional<std::chrono::milliseconds> handshakeTimeout,
                                     const boost::asio::yield_context& yield);
    StreamResult openStream(const boost::asio::yield_context& yield);
    StreamResult openWorker(const boost::asio::yield_context& yield);
#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)
    StreamResult openNative(const boost::asio::yield_context& yield);
    StreamResult probeNative(const std::vector<core::CandidatePath>& paths, LocalSocket*& inFlight,
                             const boost::asio::yield_context& yield);
#endif

    boost::asio::io_context& io_;
    std::string clientId_;
    core::ClientOptions options_;
    Backend backend_;
    boost::asio::thread_pool workers_;
    std::unique_ptr<core::ProtocolEngine> engine_;
    CoroutineStream* stream_ = nullptr;  // owned by engine_
};

} // namespace async
} // namespace presencelink
