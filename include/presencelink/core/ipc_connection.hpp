#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "presencelink/core/byte_stream.hpp"
#include "presencelink/core/pipe_config.hpp"
#include "presencelink/core/socket_paths.hpp"

namespace presencelink {
namespace core {

/// Connected Unix domain stream socket.
struct UnixStreamChannel {
    int fd = -1;
};

/// Connected Windows named pipe client handle, opened for overlapped I/O.
struct NamedPipeChannel {
    void* handle = nullptr;
    void* cancelEvent = nullptr;    ///< Manual-reset event signalled by cancel()
};

/**
 * @brief Platform channel, selected once when the connection is opened.
 */
using Channel = std::variant<std::monostate, UnixStreamChannel, NamedPipeChannel>;

/**
 * @brief A reachable pipe reported by IpcConnection::discoverPipes().
 */
struct DiscoveredPipe {
    uint32_t pipeNumber = 0;
    std::string path;
};

/**
 * @brief Blocking transport to the peer over a Unix socket or named pipe.
 *
 * Owns exactly one channel handle and releases it on close() or destruction.
 */
class IpcConnection : public ByteStream {
public:
    /**
     * @brief Open a channel according to the selector.
     *
     * Auto and PipeNumber probe every candidate path in order and return
     * the first that accepts. Failed probes are closed immediately. When
     * every probe fails the error lists the attempted paths and is
     * PermissionDenied if any probe was refused for access reasons.
     */
    static Result<std::unique_ptr<IpcConnection>> open(const PipeConfig& pipe,
                                                        const IpcConfig& config = IpcConfig());

    /**
     * @brief open() retried every config.retryIntervalMs until the deadline.
     *
     * Returns ConnectionTimeout carrying the last underlying error on expiry.
     * Errors that cannot clear up by waiting (configuration, permissions)
     * are returned immediately.
     */
    static Result<std::unique_ptr<IpcConnection>> openWithTimeout(
        const PipeConfig& pipe, std::chrono::milliseconds timeout,
        const IpcConfig& config = IpcConfig());

    /**
     * @brief Connect to one socket or pipe path without enumeration.
     */
    static Result<std::unique_ptr<IpcConnection>> connectPath(const std::string& path);

    /**
     * @brief List every candidate that currently accepts a connection.
     */
    static std::vector<DiscoveredPipe> discoverPipes(const IpcConfig& config = IpcConfig());

#ifndef _WIN32
    /**
     * @brief Take ownership of an already connected stream socket.
     */
    static std::unique_ptr<IpcConnection> adoptSocket(int fd, std::string path = "<adopted>");
#endif

    ~IpcConnection() override;

    IpcConnection(const IpcConnection&) = delete;
    IpcConnection& operator=(const IpcConnection&) = delete;

    Result<size_t> readSome(uint8_t* buffer, size_t size) override;
    Result<size_t> writeSome(const uint8_t* data, size_t size) override;
    Result<void> flush() override;
    void close() override;
    bool isOpen() const override;

    /**
     * @brief Wake any read or write blocked on this connection.
     *
     * Safe to call from another thread while readSome() or writeSome() is
     * blocked. The handle stays owned until close(), which must not run
     * concurrently with I/O. Once cancelled, every transfer fails with
     * SocketClosed or reads end-of-stream.
     */
    void cancel();

    const std::string& path() const { return path_; }

private:
    IpcConnection(Channel channel, std::string path);

    static Result<Channel> openChannel(const std::string& path);
    static void closeChannel(Channel& channel);

    Channel channel_;
    std::string path_;
    std::atomic<bool> cancelled_{false};
};

} // namespace core
} // namespace presencelink
