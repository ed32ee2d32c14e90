#include "presencelink/core/ipc_error.hpp"

#include <sstream>

namespace presencelink {
namespace core {

namespace {

std::string joinPaths(const std::vector<std::string>& paths) {
    std::ostringstream oss;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << paths[i];
    }
    return oss.str();
}

} // namespace

ErrorCategory categoryOf(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionTimeout:
        case ErrorCode::NoValidSocket:
        case ErrorCode::DiscoveryFailed:
        case ErrorCode::SocketClosed:
        case ErrorCode::PermissionDenied:
        case ErrorCode::NotConnected:
            return ErrorCategory::Connection;
        case ErrorCode::InvalidResponse:
        case ErrorCode::HandshakeFailed:
        case ErrorCode::InvalidOpcode:
        case ErrorCode::ProtocolViolation:
        case ErrorCode::PayloadTooLarge:
            return ErrorCategory::Protocol;
        case ErrorCode::SerializationFailed:
        case ErrorCode::DeserializationFailed:
            return ErrorCategory::Serialization;
        case ErrorCode::PeerError:
            return ErrorCategory::Application;
        case ErrorCode::InvalidActivity:
        case ErrorCode::InvalidConfig:
        case ErrorCode::InvalidPipeNumber:
        case ErrorCode::InternalError:
            return ErrorCategory::Other;
    }
    return ErrorCategory::Other;
}

bool isRecoverable(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionTimeout:
        case ErrorCode::SocketClosed:
        case ErrorCode::InvalidResponse:
        case ErrorCode::DiscoveryFailed:
        case ErrorCode::NoValidSocket:
            return true;
        default:
            return false;
    }
}

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionFailed: return "ConnectionFailed";
        case ErrorCode::ConnectionTimeout: return "ConnectionTimeout";
        case ErrorCode::NoValidSocket: return "NoValidSocket";
        case ErrorCode::DiscoveryFailed: return "DiscoveryFailed";
        case ErrorCode::SocketClosed: return "SocketClosed";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::InvalidPipeNumber: return "InvalidPipeNumber";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::SerializationFailed: return "SerializationFailed";
        case ErrorCode::DeserializationFailed: return "DeserializationFailed";
        case ErrorCode::InvalidResponse: return "InvalidResponse";
        case ErrorCode::HandshakeFailed: return "HandshakeFailed";
        case ErrorCode::InvalidOpcode: return "InvalidOpcode";
        case ErrorCode::ProtocolViolation: return "ProtocolViolation";
        case ErrorCode::PayloadTooLarge: return "PayloadTooLarge";
        case ErrorCode::PeerError: return "PeerError";
        case ErrorCode::InvalidActivity: return "InvalidActivity";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::InternalError: return "InternalError";
    }
    return "Unknown";
}

const char* toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Connection: return "connection";
        case ErrorCategory::Protocol: return "protocol";
        case ErrorCategory::Serialization: return "serialization";
        case ErrorCategory::Application: return "application";
        case ErrorCategory::Other: return "other";
    }
    return "other";
}

IpcError::IpcError(ErrorCode code, std::string message)
    : code_(code), message_(std::move(message)) {}

IpcError IpcError::connectionFailed(const std::string& path, const std::string& reason) {
    return IpcError(ErrorCode::ConnectionFailed,
                    "failed to connect to " + path + ": " + reason);
}

IpcError IpcError::connectionTimeout(uint64_t timeoutMs, std::optional<std::string> lastError) {
    IpcError error(ErrorCode::ConnectionTimeout,
                   "connection timed out after " + std::to_string(timeoutMs) + " ms");
    if (lastError) {
        error.withLastError(std::move(*lastError));
    }
    return error;
}

IpcError IpcError::noValidSocket(std::vector<std::string> attempted) {
    IpcError error(ErrorCode::NoValidSocket, "no valid IPC socket found");
    error.withAttemptedPaths(std::move(attempted));
    return error;
}

IpcError IpcError::discoveryFailed(std::vector<std::string> attempted, const std::string& reason) {
    IpcError error(ErrorCode::DiscoveryFailed,
                   "IPC discovery failed after " + std::to_string(attempted.size()) +
                   " paths: " + reason);
    error.withAttemptedPaths(std::move(attempted));
    return error;
}

IpcError IpcError::permissionDenied(const std::string& path) {
    return IpcError(ErrorCode::PermissionDenied, "permission denied for " + path);
}

IpcError IpcError::socketClosed(const std::string& detail) {
    return IpcError(ErrorCode::SocketClosed, "socket closed: " + detail);
}

IpcError IpcError::notConnected() {
    return IpcError(ErrorCode::NotConnected, "not connected: handshake has not completed");
}

IpcError IpcError::invalidOpcode(uint32_t received, std::optional<uint32_t> payloadSize) {
    IpcError error(ErrorCode::InvalidOpcode, "invalid opcode " + std::to_string(received));
    ProtocolContext context;
    context.receivedOpcode = received;
    context.payloadSize = payloadSize;
    error.withProtocolContext(context);
    return error;
}

IpcError IpcError::protocolViolation(std::string message, ProtocolContext context) {
    IpcError error(ErrorCode::ProtocolViolation, std::move(message));
    error.withProtocolContext(context);
    return error;
}

IpcError IpcError::payloadTooLarge(uint32_t declared, uint32_t maximum) {
    IpcError error(ErrorCode::PayloadTooLarge,
                   "payload of " + std::to_string(declared) +
                   " bytes exceeds maximum of " + std::to_string(maximum));
    ProtocolContext context;
    context.payloadSize = declared;
    error.withProtocolContext(context);
    return error;
}

IpcError IpcError::peerError(int64_t code, std::string message) {
    IpcError error(ErrorCode::PeerError, std::move(message));
    error.peerCode_ = code;
    return error;
}

IpcError IpcError::invalidResponse(std::string message) {
    return IpcError(ErrorCode::InvalidResponse, std::move(message));
}

IpcError IpcError::handshakeFailed(std::string message) {
    return IpcError(ErrorCode::HandshakeFailed, std::move(message));
}

ErrorCategory IpcError::category() const {
    return categoryOf(code_);
}

bool IpcError::isRecoverable() const {
    return core::isRecoverable(code_);
}

IpcError& IpcError::withProtocolContext(ProtocolContext context) {
    context_ = context;
    return *this;
}

IpcError& IpcError::withAttemptedPaths(std::vector<std::string> paths) {
    attemptedPaths_ = std::move(paths);
    return *this;
}

IpcError& IpcError::withLastError(std::string lastError) {
    lastError_ = std::move(lastError);
    return *this;
}

std::string IpcError::toString() const {
    std::ostringstream oss;
    oss << core::toString(code_);
    if (peerCode_) {
        oss << " (" << *peerCode_ << ")";
    }
    oss << ": " << message_;
    if (context_) {
        if (context_->expectedOpcode) {
            oss << " [expected opcode " << *context_->expectedOpcode << "]";
        }
        if (context_->receivedOpcode) {
            oss << " [received opcode " << *context_->receivedOpcode << "]";
        }
    }
    if (!attemptedPaths_.empty()) {
        oss << " [tried: " << joinPaths(attemptedPaths_) << "]";
    }
    if (lastError_) {
        oss << " [last error: " << *lastError_ << "]";
    }
    return oss.str();
}

} // namespace core
} // namespace presencelink
