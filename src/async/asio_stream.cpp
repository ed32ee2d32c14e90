#include "presencelink/async/asio_stream.hpp"
#include "presencelink/utils/logging.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

namespace presencelink {
namespace async {

IpcError CoroutineStream::unboundError() {
    return IpcError(ErrorCode::InternalError, "stream used outside of a bound coroutine");
}

#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)

AsioLocalStream::AsioLocalStream(LocalSocket socket)
    : socket_(std::move(socket)) {}

AsioLocalStream::~AsioLocalStream() {
    close();
}

Result<size_t> AsioLocalStream::readSome(uint8_t* buffer, size_t size) {
    if (!yield_) {
        return unboundError();
    }
    boost::system::error_code ec;
    size_t received = socket_.async_read_some(boost::asio::buffer(buffer, size), (*yield_)[ec]);
    if (ec == boost::asio::error::eof) {
        return size_t{0};
    }
    if (ec) {
        return IpcError::socketClosed("read: " + ec.message());
    }
    return received;
}

Result<size_t> AsioLocalStream::writeSome(const uint8_t* data, size_t size) {
    if (!yield_) {
        return unboundError();
    }
    boost::system::error_code ec;
    size_t sent = socket_.async_write_some(boost::asio::buffer(data, size), (*yield_)[ec]);
    if (ec) {
        return IpcError::socketClosed("write: " + ec.message());
    }
    return sent;
}

Result<void> AsioLocalStream::flush() {
    if (!socket_.is_open()) {
        return IpcError::notConnected();
    }
    return Result<void>();
}

void AsioLocalStream::close() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ignored;
    socket_.shutdown(LocalSocket::shutdown_both, ignored);
    socket_.close(ignored);
    PLINK_LOG_DEBUG("closed local socket");
}

bool AsioLocalStream::isOpen() const {
    return socket_.is_open();
}

#endif // BOOST_ASIO_HAS_LOCAL_SOCKETS

} // namespace async
} // namespace presencelink
