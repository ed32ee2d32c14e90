#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "presencelink/activity/activity.hpp"
#include "presencelink/core/pipe_config.hpp"
#include "presencelink/core/protocol_engine.hpp"

namespace presencelink {
namespace core {

/**
 * @brief Blocking client that can rebuild its connection.
 *
 * Keeps the client id and ClientOptions so reconnect() can open a fresh
 * transport and engine. A new engine replaces the old one only after its
 * handshake succeeds; until then every operation fails with NotConnected.
 *
 * @code
 * IpcClient client("123456789012345678");
 * auto ready = withRetry(RetryConfig(), [&] { return client.connect(); });
 * if (ready) {
 *     client.setActivity(ActivityBuilder().state("Idle").build());
 * }
 * @endcode
 */
class IpcClient {
public:
    /**
     * @brief Stores the parameters. Performs no I/O.
     */
    explicit IpcClient(std::string clientId, ClientOptions options = ClientOptions());
    ~IpcClient();

    IpcClient(const IpcClient&) = delete;
    IpcClient& operator=(const IpcClient&) = delete;

    /**
     * @brief Open the transport and perform the handshake.
     *
     * @return The peer's ready payload.
     */
    Result<nlohmann::json> connect();

    /**
     * @brief Drop the current connection and connect again.
     */
    Result<nlohmann::json> reconnect();

    Result<void> setActivity(const activity::Activity& activity);
    Result<nlohmann::json> clearActivity();
    Result<void> sendMessage(Opcode opcode, const nlohmann::json& payload);
    Result<Frame> recvMessage();
    size_t cleanupPending(std::chrono::milliseconds maxAge);

    void close();
    bool isConnected() const;

    const std::string& clientId() const { return clientId_; }
    const ClientOptions& options() const { return options_; }

private:
    Result<std::unique_ptr<ByteStream>> openTransport() const;

    std::string clientId_;
    ClientOptions options_;
    std::unique_ptr<ProtocolEngine> engine_;
};

} // namespace core
} // namespace presencelink
