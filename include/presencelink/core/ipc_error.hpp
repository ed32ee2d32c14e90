#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace presencelink {
namespace core {

/**
 * @brief Error codes for IPC operations
 */
enum class ErrorCode {
    ConnectionFailed,       ///< Connecting to an explicit path failed
    ConnectionTimeout,      ///< Connection deadline expired
    NoValidSocket,          ///< No candidate socket or pipe accepted a connection
    DiscoveryFailed,        ///< Auto-discovery exhausted every candidate path
    SocketClosed,           ///< Peer closed the channel mid-frame
    PermissionDenied,       ///< A candidate path exists but is not accessible
    InvalidPipeNumber,      ///< Requested pipe number is outside the valid range
    NotConnected,           ///< Operation requires a completed handshake
    SerializationFailed,    ///< Outgoing payload could not be encoded
    DeserializationFailed,  ///< Incoming payload is not valid JSON
    InvalidResponse,        ///< Response has an unexpected shape or nonce
    HandshakeFailed,        ///< Handshake was rejected or answered with a bad opcode
    InvalidOpcode,          ///< Frame header carries an opcode outside 0..4
    ProtocolViolation,      ///< Peer broke the framing contract
    PayloadTooLarge,        ///< Frame length exceeds the configured maximum
    PeerError,              ///< Peer replied with an explicit error object
    InvalidActivity,        ///< Activity payload failed local validation
    InvalidConfig,          ///< Configuration values are out of range
    InternalError           ///< Local facility failure (e.g. RNG unavailable)
};

/**
 * @brief Broad classification of an error code
 */
enum class ErrorCategory {
    Connection,
    Protocol,
    Serialization,
    Application,
    Other
};

/**
 * @brief Opcode details attached to protocol violations.
 */
struct ProtocolContext {
    std::optional<uint32_t> expectedOpcode;
    std::optional<uint32_t> receivedOpcode;
    std::optional<uint32_t> payloadSize;
};

/**
 * @brief Typed error value returned by every fallible operation.
 *
 * Carries a code, a human readable message and, depending on the code,
 * the peer's error code, opcode context, the list of attempted paths or the
 * last underlying error seen before a timeout.
 */
class IpcError {
public:
    IpcError(ErrorCode code, std::string message);

    static IpcError connectionFailed(const std::string& path, const std::string& reason);
    static IpcError connectionTimeout(uint64_t timeoutMs, std::optional<std::string> lastError);
    static IpcError noValidSocket(std::vector<std::string> attempted);
    static IpcError discoveryFailed(std::vector<std::string> attempted, const std::string& reason);
    static IpcError permissionDenied(const std::string& path);
    static IpcError socketClosed(const std::string& detail);
    static IpcError notConnected();
    static IpcError invalidOpcode(uint32_t received, std::optional<uint32_t> payloadSize = std::nullopt);
    static IpcError payloadTooLarge(uint32_t declared, uint32_t maximum);
    static IpcError protocolViolation(std::string message, ProtocolContext context);
    static IpcError peerError(int64_t code, std::string message);
    static IpcError invalidResponse(std::string message);
    static IpcError handshakeFailed(std::string message);

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    ErrorCategory category() const;

    /**
     * @brief Whether retry/backoff may re-invoke the failed operation.
     */
    bool isRecoverable() const;
    bool isConnectionError() const { return category() == ErrorCategory::Connection; }

    const std::optional<int64_t>& peerCode() const { return peerCode_; }
    const std::optional<ProtocolContext>& protocolContext() const { return context_; }
    const std::vector<std::string>& attemptedPaths() const { return attemptedPaths_; }
    const std::optional<std::string>& lastError() const { return lastError_; }

    IpcError& withProtocolContext(ProtocolContext context);
    IpcError& withAttemptedPaths(std::vector<std::string> paths);
    IpcError& withLastError(std::string lastError);

    std::string toString() const;

    bool operator==(const IpcError& other) const {
        return code_ == other.code_ && message_ == other.message_;
    }
    bool operator!=(const IpcError& other) const { return !(*this == other); }

private:
    ErrorCode code_;
    std::string message_;
    std::optional<int64_t> peerCode_;
    std::optional<ProtocolContext> context_;
    std::vector<std::string> attemptedPaths_;
    std::optional<std::string> lastError_;
};

ErrorCategory categoryOf(ErrorCode code);
bool isRecoverable(ErrorCode code);
const char* toString(ErrorCode code);
const char* toString(ErrorCategory category);

} // namespace core
} // namespace presencelink
