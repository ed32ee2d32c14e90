#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "presencelink/activity/activity.hpp"
#include "presencelink/core/byte_stream.hpp"
#include "presencelink/core/frame_codec.hpp"
#include "presencelink/core/ipc_config.hpp"

namespace presencelink {
namespace core {

/**
 * @brief Inbound frame that did not match the nonce being awaited.
 */
struct PendingMessage {
    Frame frame;
    std::chrono::steady_clock::time_point receivedAt;
};

enum class EngineState {
    Unconnected,
    Connected
};

/**
 * @brief Handshake, presence commands and nonce correlation over one stream.
 *
 * The engine is written against ByteStream only, so the same logic runs on
 * a blocking IpcConnection or on a coroutine adapter. It is not thread safe:
 * one caller issues one command and awaits its response before the next.
 * Frames that arrive while a specific response is awaited are kept in
 * arrival order and handed out by recvMessage().
 */
class ProtocolEngine {
public:
    /**
     * @brief Takes ownership of an open stream. Performs no I/O.
     */
    ProtocolEngine(std::string clientId, std::unique_ptr<ByteStream> stream,
                   const IpcConfig& config = IpcConfig());
    ~ProtocolEngine();

    ProtocolEngine(const ProtocolEngine&) = delete;
    ProtocolEngine& operator=(const ProtocolEngine&) = delete;

    /**
     * @brief Send the handshake and wait for the acknowledgement.
     *
     * The peer acknowledges with a Frame opcode; any other opcode is a
     * HandshakeFailed. An "error" object in the reply becomes PeerError.
     *
     * @return The acknowledgement body (the ready event).
     */
    Result<nlohmann::json> connect();

    /**
     * @brief Validate the activity locally, then send SET_ACTIVITY and await its response.
     */
    Result<void> setActivity(const activity::Activity& activity);

    /**
     * @brief Send SET_ACTIVITY with a null activity.
     *
     * @return The full response body.
     */
    Result<nlohmann::json> clearActivity();

    /**
     * @brief Send an arbitrary frame.
     */
    Result<void> sendMessage(Opcode opcode, const nlohmann::json& payload);

    /**
     * @brief Oldest buffered frame, or the next frame from the stream.
     */
    Result<Frame> recvMessage();

    /**
     * @brief Drop buffered frames older than maxAge; zero drops all.
     *
     * @return Number of frames dropped.
     */
    size_t cleanupPending(std::chrono::milliseconds maxAge);

    size_t pendingCount() const { return pending_.size(); }

    /**
     * @brief Release the stream and forget buffered frames.
     */
    void close();

    bool isConnected() const;
    EngineState state() const { return state_; }
    const std::string& clientId() const { return clientId_; }
    const IpcConfig& config() const { return config_; }

private:
    Result<nlohmann::json> sendCommand(const std::string& nonce, nlohmann::json activity);
    Result<Frame> recvForNonce(const std::string& nonce);
    std::optional<Frame> takePendingByNonce(const std::string& nonce);

    std::string clientId_;
    std::unique_ptr<ByteStream> stream_;
    IpcConfig config_;
    FrameCodec codec_;
    std::deque<PendingMessage> pending_;
    EngineState state_ = EngineState::Unconnected;
};

/**
 * @brief True when payload is an object whose "nonce" string equals nonce.
 */
bool hasNonce(const nlohmann::json& payload, const std::string& nonce);

/// Id of the calling process, sent as "pid".
int64_t currentProcessId();

} // namespace core
} // namespace presencelink
