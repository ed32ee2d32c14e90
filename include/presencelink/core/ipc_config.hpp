#pragma once

#include <chrono>
#include <cstdint>

#include "presencelink/core/opcode.hpp"
#include "presencelink/utils/result.hpp"

namespace presencelink {
namespace core {

/**
 * @brief Tunables for discovery and framing.
 */
struct IpcConfig {
    /**
     * @brief Number of numbered sockets probed per candidate directory.
     */
    uint32_t maxSockets = MAX_IPC_SOCKETS;

    /**
     * @brief Delay between connection rounds while a deadline is running.
     */
    uint32_t retryIntervalMs = DEFAULT_RETRY_INTERVAL_MS;

    /**
     * @brief Largest frame body accepted or sent, in bytes.
     */
    uint32_t maxPayloadSize = MAX_PAYLOAD_SIZE;

    /**
     * @brief Protocol version sent in the handshake.
     */
    uint32_t ipcVersion = PROTOCOL_VERSION;

    /// Fewer sockets, shorter interval. Suited to a peer that is already running.
    static IpcConfig fastConnect();
    /// Full socket range with a longer interval, for a peer that is still starting.
    static IpcConfig extended();

    IpcConfig& withMaxSockets(uint32_t value) { maxSockets = value; return *this; }
    IpcConfig& withRetryIntervalMs(uint32_t value) { retryIntervalMs = value; return *this; }
    IpcConfig& withMaxPayloadSize(uint32_t value) { maxPayloadSize = value; return *this; }

    std::chrono::milliseconds retryInterval() const {
        return std::chrono::milliseconds(retryIntervalMs);
    }

    /**
     * @brief Checks ranges: maxSockets 1..100, retryIntervalMs 1..10000,
     * maxPayloadSize 1 KiB..100 MiB.
     */
    Result<void> validate() const;
};

} // namespace core
} // namespace presencelink
