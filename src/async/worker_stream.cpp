#include "presencelink/async/worker_stream.hpp"

namespace presencelink {
namespace async {

WorkerStream::WorkerStream(boost::asio::io_context& io, boost::asio::thread_pool& pool,
                           std::unique_ptr<core::IpcConnection> connection)
    : io_(io), pool_(pool), connection_(std::move(connection)) {}

// A job still in flight holds its own reference and releases the handle on return.
WorkerStream::~WorkerStream() {
    if (!connection_) {
        return;
    }
    if (busy_) {
        connection_->cancel();
    } else {
        connection_->close();
    }
}

template <typename Job>
Result<size_t> WorkerStream::runJob(Job job) {
    if (!yield_) {
        return unboundError();
    }
    if (!isOpen()) {
        return IpcError::notConnected();
    }
    std::shared_ptr<core::IpcConnection> connection = connection_;
    busy_ = true;
    auto result = runOnWorker(io_, pool_, [connection, job] {
        return job(*connection);
    }, *yield_);
    busy_ = false;

    if (closing_) {
        connection_->close();
    }
    return result;
}

Result<size_t> WorkerStream::readSome(uint8_t* buffer, size_t size) {
    return runJob([buffer, size](core::IpcConnection& connection) {
        return connection.readSome(buffer, size);
    });
}

Result<size_t> WorkerStream::writeSome(const uint8_t* data, size_t size) {
    return runJob([data, size](core::IpcConnection& connection) {
        return connection.writeSome(data, size);
    });
}

Result<void> WorkerStream::flush() {
    if (!isOpen()) {
        return IpcError::notConnected();
    }
    return connection_->flush();
}

void WorkerStream::close() {
    if (!connection_) {
        return;
    }
    if (busy_) {
        closing_ = true;
        connection_->cancel();
        return;
    }
    connection_->close();
}

bool WorkerStream::isOpen() const {
    return !closing_ && connection_ && connection_->isOpen();
}

} // namespace async
} // namespace presencelink
