#include "presencelink/core/ipc_client.hpp"
#include "presencelink/core/ipc_connection.hpp"
#include "presencelink/utils/logging.hpp"

namespace presencelink {
namespace core {

IpcClient::IpcClient(std::string clientId, ClientOptions options)
    : clientId_(std::move(clientId)), options_(std::move(options)) {}

IpcClient::~IpcClient() {
    close();
}

Result<std::unique_ptr<ByteStream>> IpcClient::openTransport() const {
    auto connection = options_.connectTimeout
        ? IpcConnection::openWithTimeout(options_.pipe, *options_.connectTimeout, options_.ipc)
        : IpcConnection::open(options_.pipe, options_.ipc);
    if (connection.has_error()) {
        return connection.error();
    }
    return std::unique_ptr<ByteStream>(std::move(connection).value());
}

Result<nlohmann::json> IpcClient::connect() {
    close();

    auto transport = openTransport();
    if (transport.has_error()) {
        PLINK_LOG_WARN("transport for " << options_.pipe.describe()
                       << " unavailable: " << transport.error().toString());
        return transport.error();
    }

    auto engine = std::make_unique<ProtocolEngine>(clientId_, std::move(transport).value(), options_.ipc);
    auto ready = engine->connect();
    if (ready.has_error()) {
        PLINK_LOG_WARN("handshake failed: " << ready.error().toString());
        return ready.error();
    }

    engine_ = std::move(engine);
    return ready;
}

Result<nlohmann::json> IpcClient::reconnect() {
    PLINK_LOG_INFO("reconnecting client " << clientId_);
    return connect();
}

Result<void> IpcClient::setActivity(const activity::Activity& activity) {
    auto valid = activity.validate();
    if (valid.has_error()) {
        return valid;
    }
    if (!engine_) {
        return IpcError::notConnected();
    }
    return engine_->setActivity(activity);
}

Result<nlohmann::json> IpcClient::clearActivity() {
    if (!engine_) {
        return IpcError::notConnected();
    }
    return engine_->clearActivity();
}

Result<void> IpcClient::sendMessage(Opcode opcode, const nlohmann::json& payload) {
    if (!engine_) {
        return IpcError::notConnected();
    }
    return engine_->sendMessage(opcode, payload);
}

Result<Frame> IpcClient::recvMessage() {
    if (!engine_) {
        return IpcError::notConnected();
    }
    return engine_->recvMessage();
}

size_t IpcClient::cleanupPending(std::chrono::milliseconds maxAge) {
    return engine_ ? engine_->cleanupPending(maxAge) : 0;
}

void IpcClient::close() {
    if (engine_) {
        engine_->close();
        engine_.reset();
    }
}

bool IpcClient::isConnected() const {
    return engine_ && engine_->isConnected();
}

} // namespace core
} // namespace presencelink
