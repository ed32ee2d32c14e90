#pragma once

#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>

#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)
#include <boost/asio/local/stream_protocol.hpp>
#endif

#include "presencelink/core/byte_stream.hpp"

namespace presencelink {
namespace async {

/**
 * @brief ByteStream whose reads and writes suspend the bound coroutine.
 *
 * The protocol engine calls readSome()/writeSome() without knowing about
 * coroutines, so the caller binds its yield_context for the duration of
 * each engine call (see YieldScope). Calling I/O while unbound fails with
 * InternalError.
 */
class CoroutineStream : public core::ByteStream {
public:
    void bind(const boost::asio::yield_context& yield) { yield_.emplace(yield); }
    void unbind() { yield_.reset(); }
    bool isBound() const { return yield_.has_value(); }

protected:
    static IpcError unboundError();

    std::optional<boost::asio::yield_context> yield_;
};

/**
 * @brief Binds a coroutine to a stream for the lifetime of the scope.
 */
class YieldScope {
public:
    YieldScope(CoroutineStream& stream, const boost::asio::yield_context& yield)
        : stream_(stream) {
        stream_.bind(yield);
    }
    ~YieldScope() { stream_.unbind(); }

    YieldScope(const YieldScope&) = delete;
    YieldScope& operator=(const YieldScope&) = delete;

private:
    CoroutineStream& stream_;
};

#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)

using LocalSocket = boost::asio::local::stream_protocol::socket;
using LocalEndpoint = boost::asio::local::stream_protocol::endpoint;

/**
 * @brief Native asynchronous Unix domain socket.
 */
class AsioLocalStream : public CoroutineStream {
public:
    explicit AsioLocalStream(LocalSocket socket);
    ~AsioLocalStream() override;

    Result<size_t> readSome(uint8_t* buffer, size_t size) override;
    Result<size_t> writeSome(const uint8_t* data, size_t size) override;
    Result<void> flush() override;
    void close() override;
    bool isOpen() const override;

    LocalSocket& socket() { return socket_; }

private:
    LocalSocket socket_;
};

#endif // BOOST_ASIO_HAS_LOCAL_SOCKETS

} // namespace async
} // namespace presencelink
