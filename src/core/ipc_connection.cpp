#include "presencelink/core/ipc_connection.hpp"
#include "presencelink/utils/logging.hpp"

#include <algorithm>
#include <cstring>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#endif

namespace presencelink {
namespace core {

namespace {

#ifdef _WIN32
std::string getSystemError(DWORD code) {
    char* buffer = nullptr;
    FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                   FORMAT_MESSAGE_IGNORE_INSERTS,
                   nullptr, code, 0, reinterpret_cast<LPSTR>(&buffer), 0, nullptr);
    std::string message = buffer ? buffer : "error " + std::to_string(code);
    LocalFree(buffer);
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    return message;
}

/**
 * @brief One overlapped ReadFile or WriteFile that gives up when cancelEvent is set.
 *
 * The OVERLAPPED block lives on this frame, so the call always waits for the
 * kernel to finish with it, including after a cancellation.
 */
Result<size_t> transferOverlapped(const NamedPipeChannel& pipe, bool reading, void* buffer, DWORD size) {
    HANDLE handle = static_cast<HANDLE>(pipe.handle);
    HANDLE cancelEvent = static_cast<HANDLE>(pipe.cancelEvent);
    if (WaitForSingleObject(cancelEvent, 0) == WAIT_OBJECT_0) {
        return IpcError::socketClosed("connection cancelled");
    }

    OVERLAPPED overlapped{};
    overlapped.hEvent = CreateEventA(nullptr, TRUE, FALSE, nullptr);
    if (overlapped.hEvent == nullptr) {
        return IpcError::socketClosed("CreateEvent(): " + getSystemError(GetLastError()));
    }

    BOOL issued = reading ? ReadFile(handle, buffer, size, nullptr, &overlapped)
                          : WriteFile(handle, buffer, size, nullptr, &overlapped);
    DWORD code = issued ? ERROR_SUCCESS : GetLastError();
    DWORD transferred = 0;
    if (issued || code == ERROR_IO_PENDING) {
        if (!issued) {
            HANDLE events[2] = {overlapped.hEvent, cancelEvent};
            if (WaitForMultipleObjects(2, events, FALSE, INFINITE) != WAIT_OBJECT_0) {
                CancelIoEx(handle, &overlapped);
            }
        }
        code = GetOverlappedResult(handle, &overlapped, &transferred, TRUE) ? ERROR_SUCCESS : GetLastError();
    }
    CloseHandle(overlapped.hEvent);

    if (code == ERROR_SUCCESS) {
        return static_cast<size_t>(transferred);
    }
    if (code == ERROR_OPERATION_ABORTED) {
        return IpcError::socketClosed("connection cancelled");
    }
    if (reading && (code == ERROR_BROKEN_PIPE || code == ERROR_PIPE_NOT_CONNECTED)) {
        return size_t{0};
    }
    return IpcError::socketClosed(getSystemError(code));
}
#else
std::string getSystemError(int code) {
    return std::string(std::strerror(code));
}

#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif
#endif

// Waiting cannot fix a bad selector or a permission problem.
bool retryableWhileWaiting(const IpcError& error) {
    return error.isConnectionError() && error.code() != ErrorCode::PermissionDenied;
}

} // namespace

IpcConnection::IpcConnection(Channel channel, std::string path)
    : channel_(std::move(channel)), path_(std::move(path)) {}

IpcConnection::~IpcConnection() {
    close();
}

Result<Channel> IpcConnection::openChannel(const std::string& path) {
#ifdef _WIN32
    HANDLE handle = CreateFileA(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr,
                                OPEN_EXISTING, FILE_FLAG_OVERLAPPED, nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        DWORD code = GetLastError();
        if (code == ERROR_ACCESS_DENIED) {
            return IpcError::permissionDenied(path);
        }
        return IpcError::connectionFailed(path, getSystemError(code));
    }
    HANDLE cancelEvent = CreateEventA(nullptr, TRUE, FALSE, nullptr);
    if (cancelEvent == nullptr) {
        DWORD code = GetLastError();
        CloseHandle(handle);
        return IpcError::connectionFailed(path, "CreateEvent(): " + getSystemError(code));
    }
    return Channel(NamedPipeChannel{handle, cancelEvent});
#else
    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) {
        return IpcError::connectionFailed(path, "socket path too long");
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        return IpcError::connectionFailed(path, "socket(): " + getSystemError(errno));
    }
#ifdef SO_NOSIGPIPE
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int code = errno;
        ::close(fd);
        if (code == EACCES || code == EPERM) {
            return IpcError::permissionDenied(path);
        }
        return IpcError::connectionFailed(path, getSystemError(code));
    }
    return Channel(UnixStreamChannel{fd});
#endif
}

void IpcConnection::closeChannel(Channel& channel) {
#ifdef _WIN32
    if (auto* pipe = std::get_if<NamedPipeChannel>(&channel)) {
        if (pipe->handle != nullptr) {
            CloseHandle(static_cast<HANDLE>(pipe->handle));
        }
        if (pipe->cancelEvent != nullptr) {
            CloseHandle(static_cast<HANDLE>(pipe->cancelEvent));
        }
    }
#else
    if (auto* stream = std::get_if<UnixStreamChannel>(&channel)) {
        if (stream->fd >= 0) {
            ::shutdown(stream->fd, SHUT_RDWR);
            ::close(stream->fd);
        }
    }
#endif
    channel = std::monostate{};
}

Result<std::unique_ptr<IpcConnection>> IpcConnection::connectPath(const std::string& path) {
    auto channel = openChannel(path);
    if (channel.has_error()) {
        return channel.error();
    }
    PLINK_LOG_DEBUG("connected to " << path);
    return std::unique_ptr<IpcConnection>(new IpcConnection(std::move(channel).value(), path));
}

Result<std::unique_ptr<IpcConnection>> IpcConnection::open(const PipeConfig& pipe,
                                                            const IpcConfig& config) {
    auto valid = config.validate();
    if (valid.has_error()) {
        return valid.error();
    }
    valid = pipe.validate(config);
    if (valid.has_error()) {
        return valid.error();
    }

    if (pipe.mode() == PipeConfig::Mode::CustomPath) {
        return connectPath(pipe.path());
    }

    std::vector<std::string> attempted;
    bool sawPermissionDenied = false;
    for (const auto& candidate : candidatePaths(pipe, config)) {
        attempted.push_back(candidate.path);
        auto connection = connectPath(candidate.path);
        if (connection.has_value()) {
            return connection;
        }
        if (connection.error().code() == ErrorCode::PermissionDenied) {
            sawPermissionDenied = true;
        }
        PLINK_LOG_DEBUG("probe failed: " << connection.error().message());
    }

    if (sawPermissionDenied) {
        IpcError error(ErrorCode::PermissionDenied,
                       "permission denied while probing IPC sockets");
        error.withAttemptedPaths(std::move(attempted));
        return error;
    }
#ifdef _WIN32
    return IpcError::noValidSocket(std::move(attempted));
#else
    return IpcError::discoveryFailed(std::move(attempted), "no socket accepted a connection");
#endif
}

Result<std::unique_ptr<IpcConnection>> IpcConnection::openWithTimeout(
    const PipeConfig& pipe, std::chrono::milliseconds timeout, const IpcConfig& config) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::optional<std::string> lastError;

    while (true) {
        auto connection = open(pipe, config);
        if (connection.has_value()) {
            return connection;
        }
        if (!retryableWhileWaiting(connection.error())) {
            return connection.error();
        }
        lastError = connection.error().toString();

        auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero()) {
            break;
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(config.retryInterval(), remaining));
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
    }

    PLINK_LOG_WARN("connection timed out after " << timeout.count() << " ms");
    return IpcError::connectionTimeout(static_cast<uint64_t>(timeout.count()), lastError);
}

std::vector<DiscoveredPipe> IpcConnection::discoverPipes(const IpcConfig& config) {
    std::vector<DiscoveredPipe> found;
    for (const auto& candidate : candidatePaths(PipeConfig::autoDiscover(), config)) {
        auto channel = openChannel(candidate.path);
        if (channel.has_value()) {
            closeChannel(channel.value());
            found.push_back(DiscoveredPipe{candidate.pipeNumber, candidate.path});
        }
    }
    return found;
}

#ifndef _WIN32
std::unique_ptr<IpcConnection> IpcConnection::adoptSocket(int fd, std::string path) {
    return std::unique_ptr<IpcConnection>(new IpcConnection(UnixStreamChannel{fd}, std::move(path)));
}
#endif

Result<size_t> IpcConnection::readSome(uint8_t* buffer, size_t size) {
#ifdef _WIN32
    auto* pipe = std::get_if<NamedPipeChannel>(&channel_);
    if (pipe == nullptr) {
        return IpcError::notConnected();
    }
    return transferOverlapped(*pipe, true, buffer, static_cast<DWORD>(size));
#else
    auto* stream = std::get_if<UnixStreamChannel>(&channel_);
    if (stream == nullptr) {
        return IpcError::notConnected();
    }
    if (cancelled_) {
        return size_t{0};
    }
    while (true) {
        ssize_t received = ::recv(stream->fd, buffer, size, 0);
        if (received >= 0) {
            return static_cast<size_t>(received);
        }
        if (errno == EINTR) {
            continue;
        }
        return IpcError::socketClosed("recv(): " + getSystemError(errno));
    }
#endif
}

Result<size_t> IpcConnection::writeSome(const uint8_t* data, size_t size) {
#ifdef _WIN32
    auto* pipe = std::get_if<NamedPipeChannel>(&channel_);
    if (pipe == nullptr) {
        return IpcError::notConnected();
    }
    return transferOverlapped(*pipe, false, const_cast<uint8_t*>(data), static_cast<DWORD>(size));
#else
    auto* stream = std::get_if<UnixStreamChannel>(&channel_);
    if (stream == nullptr) {
        return IpcError::notConnected();
    }
    if (cancelled_) {
        return IpcError::socketClosed("connection cancelled");
    }
    while (true) {
        ssize_t sent = ::send(stream->fd, data, size, kSendFlags);
        if (sent >= 0) {
            return static_cast<size_t>(sent);
        }
        if (errno == EINTR) {
            continue;
        }
        return IpcError::socketClosed("send(): " + getSystemError(errno));
    }
#endif
}

Result<void> IpcConnection::flush() {
    if (!isOpen()) {
        return IpcError::notConnected();
    }
    // Sockets and message-less pipes carry no user-space buffer.
    return Result<void>();
}

// Only reads the channel; the handle is released by close() once I/O has returned.
void IpcConnection::cancel() {
    cancelled_ = true;
#ifdef _WIN32
    if (auto* pipe = std::get_if<NamedPipeChannel>(&channel_)) {
        SetEvent(static_cast<HANDLE>(pipe->cancelEvent));
    }
#else
    if (auto* stream = std::get_if<UnixStreamChannel>(&channel_)) {
        ::shutdown(stream->fd, SHUT_RDWR);
    }
#endif
}

void IpcConnection::close() {
    if (isOpen()) {
        PLINK_LOG_DEBUG("closing " << path_);
    }
    closeChannel(channel_);
}

bool IpcConnection::isOpen() const {
    return !std::holds_alternative<std::monostate>(channel_);
}

} // namespace core
} // namespace presencelink
