#include "presencelink/core/protocol_engine.hpp"
#include "presencelink/core/nonce.hpp"
#include "presencelink/utils/logging.hpp"

#include <algorithm>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace presencelink {
namespace core {

using nlohmann::json;

namespace {

// Returns the peer's error if the payload carries an "error" member.
std::optional<IpcError> peerErrorOf(const json& payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    auto it = payload.find("error");
    if (it == payload.end()) {
        return std::nullopt;
    }
    if (it->is_object()) {
        auto code = it->find("code");
        auto message = it->find("message");
        if (code != it->end() && code->is_number_integer() &&
            message != it->end() && message->is_string()) {
            return IpcError::peerError(code->get<int64_t>(), message->get<std::string>());
        }
    }
    return IpcError::invalidResponse("malformed error object: " + it->dump());
}

} // namespace

bool hasNonce(const json& payload, const std::string& nonce) {
    if (!payload.is_object()) {
        return false;
    }
    auto it = payload.find("nonce");
    return it != payload.end() && it->is_string() && it->get_ref<const std::string&>() == nonce;
}

int64_t currentProcessId() {
#ifdef _WIN32
    return static_cast<int64_t>(GetCurrentProcessId());
#else
    return static_cast<int64_t>(::getpid());
#endif
}

ProtocolEngine::ProtocolEngine(std::string clientId, std::unique_ptr<ByteStream> stream,
                               const IpcConfig& config)
    : clientId_(std::move(clientId))
    , stream_(std::move(stream))
    , config_(config)
    , codec_(config.maxPayloadSize) {}

ProtocolEngine::~ProtocolEngine() {
    close();
}

bool ProtocolEngine::isConnected() const {
    return state_ == EngineState::Connected && stream_ && stream_->isOpen();
}

Result<json> ProtocolEngine::connect() {
    if (!stream_ || !stream_->isOpen()) {
        return IpcError::notConnected();
    }
    pending_.clear();
    state_ = EngineState::Unconnected;

    json handshake = {{"v", config_.ipcVersion}, {"client_id", clientId_}};
    auto sent = codec_.send(*stream_, Opcode::Handshake, handshake);
    if (sent.has_error()) {
        return sent.error();
    }

    auto response = codec_.recv(*stream_);
    if (response.has_error()) {
        return response.error();
    }
    const Frame& frame = response.value();

    if (frame.payload.is_object() && frame.payload.contains("error")) {
        auto peerError = peerErrorOf(frame.payload);
        if (peerError && peerError->code() == ErrorCode::PeerError) {
            return *peerError;
        }
        return IpcError::handshakeFailed("handshake rejected: " + frame.payload.dump());
    }

    // The peer acknowledges the handshake with Frame, not Handshake.
    if (frame.opcode != Opcode::Frame) {
        IpcError error = IpcError::handshakeFailed(
            std::string("unexpected handshake response opcode ") + toString(frame.opcode) +
            ": " + frame.payload.dump());
        ProtocolContext context;
        context.expectedOpcode = toU32(Opcode::Frame);
        context.receivedOpcode = toU32(frame.opcode);
        context.payloadSize = frame.length;
        error.withProtocolContext(context);
        return error;
    }

    state_ = EngineState::Connected;
    pending_.clear();
    PLINK_LOG_INFO("handshake completed for client " << clientId_);
    return frame.payload;
}

Result<void> ProtocolEngine::setActivity(const activity::Activity& activity) {
    auto valid = activity.validate();
    if (valid.has_error()) {
        PLINK_LOG_WARN("activity rejected: " << valid.error().message());
        return valid;
    }
    if (!isConnected()) {
        return IpcError::notConnected();
    }

    auto nonce = generateNonce(SET_ACTIVITY_NONCE_PREFIX);
    if (nonce.has_error()) {
        return nonce.error();
    }
    auto response = sendCommand(nonce.value(), json(activity));
    if (response.has_error()) {
        return response.error();
    }
    return Result<void>();
}

Result<json> ProtocolEngine::clearActivity() {
    if (!isConnected()) {
        return IpcError::notConnected();
    }
    auto nonce = generateNonce(CLEAR_ACTIVITY_NONCE_PREFIX);
    if (nonce.has_error()) {
        return nonce.error();
    }
    return sendCommand(nonce.value(), json(nullptr));
}

Result<json> ProtocolEngine::sendCommand(const std::string& nonce, json activity) {
    json payload = {
        {"cmd", toString(Command::SetActivity)},
        {"args", {{"pid", currentProcessId()}, {"activity", std::move(activity)}}},
        {"nonce", nonce}
    };

    auto sent = codec_.send(*stream_, Opcode::Frame, payload);
    if (sent.has_error()) {
        return sent.error();
    }

    auto response = recvForNonce(nonce);
    if (response.has_error()) {
        return response.error();
    }
    Frame frame = std::move(response).value();

    if (frame.opcode != Opcode::Frame) {
        IpcError error = IpcError::invalidResponse(
            std::string("unexpected response opcode ") + toString(frame.opcode));
        ProtocolContext context;
        context.expectedOpcode = toU32(Opcode::Frame);
        context.receivedOpcode = toU32(frame.opcode);
        context.payloadSize = frame.length;
        error.withProtocolContext(context);
        return error;
    }

    if (auto peerError = peerErrorOf(frame.payload)) {
        return *peerError;
    }

    if (frame.payload.is_object()) {
        auto it = frame.payload.find("nonce");
        if (it != frame.payload.end() && !(it->is_string() && it->get_ref<const std::string&>() == nonce)) {
            return IpcError::invalidResponse("nonce mismatch: expected " + nonce +
                                             ", got " + it->dump());
        }
    }

    return std::move(frame.payload);
}

Result<void> ProtocolEngine::sendMessage(Opcode opcode, const json& payload) {
    if (!stream_ || !stream_->isOpen()) {
        return IpcError::notConnected();
    }
    return codec_.send(*stream_, opcode, payload);
}

Result<Frame> ProtocolEngine::recvMessage() {
    if (!pending_.empty()) {
        Frame frame = std::move(pending_.front().frame);
        pending_.pop_front();
        return frame;
    }
    if (!stream_ || !stream_->isOpen()) {
        return IpcError::notConnected();
    }
    return codec_.recv(*stream_);
}

Result<Frame> ProtocolEngine::recvForNonce(const std::string& nonce) {
    if (auto buffered = takePendingByNonce(nonce)) {
        return std::move(*buffered);
    }

    while (true) {
        auto frame = codec_.recv(*stream_);
        if (frame.has_error()) {
            return frame.error();
        }
        // Handshake frames only ever travel from client to peer.
        if (frame.value().opcode == Opcode::Handshake) {
            ProtocolContext context;
            context.expectedOpcode = toU32(Opcode::Frame);
            context.receivedOpcode = toU32(Opcode::Handshake);
            context.payloadSize = frame.value().length;
            return IpcError::protocolViolation("peer sent a handshake frame after the handshake", context);
        }
        if (hasNonce(frame.value().payload, nonce)) {
            return frame;
        }
        PLINK_LOG_DEBUG("buffering unrelated " << toString(frame.value().opcode) << " frame");
        pending_.push_back(PendingMessage{std::move(frame).value(), std::chrono::steady_clock::now()});
    }
}

std::optional<Frame> ProtocolEngine::takePendingByNonce(const std::string& nonce) {
    auto it = std::find_if(pending_.begin(), pending_.end(), [&nonce](const PendingMessage& message) {
        return hasNonce(message.frame.payload, nonce);
    });
    if (it == pending_.end()) {
        return std::nullopt;
    }
    Frame frame = std::move(it->frame);
    pending_.erase(it);
    return frame;
}

size_t ProtocolEngine::cleanupPending(std::chrono::milliseconds maxAge) {
    const size_t before = pending_.size();
    if (maxAge <= std::chrono::milliseconds::zero()) {
        pending_.clear();
        return before;
    }

    const auto now = std::chrono::steady_clock::now();
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [&](const PendingMessage& message) {
                                      return now - message.receivedAt > maxAge;
                                  }),
                   pending_.end());
    return before - pending_.size();
}

void ProtocolEngine::close() {
    if (stream_) {
        stream_->close();
    }
    pending_.clear();
    state_ = EngineState::Unconnected;
}

} // namespace core
} // namespace presencelink
