#pragma once

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "presencelink/core/frame_codec.hpp"
#include "presencelink/core/ipc_connection.hpp"
#include "support/scripted_stream.hpp"

namespace presencelink {
namespace test_support {

/**
 * @brief Scratch directory removed with everything in it on destruction.
 */
class TempDir {
public:
    TempDir() {
        char pattern[] = "/tmp/presencelink-XXXXXX";
        if (::mkdtemp(pattern) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }
    ~TempDir() {
        std::string command = "rm -rf '" + path_ + "'";
        int ignored = std::system(command.c_str());
        (void)ignored;
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

/**
 * @brief Peer side of the local socket, served from a background thread.
 *
 * Each session callback handles one accepted connection, in order. The
 * listener gives up if no client arrives within acceptTimeoutMs so a failing
 * test cannot hang in the destructor.
 */
class FakePeer {
public:
    using Session = std::function<void(core::IpcConnection& connection, core::FrameCodec& codec)>;

    explicit FakePeer(std::string socketPath, int acceptTimeoutMs = 5000)
        : path_(std::move(socketPath)), acceptTimeoutMs_(acceptTimeoutMs) {
        listenFd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
        if (listenFd_ < 0) {
            throw std::runtime_error("socket() failed");
        }
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
        ::unlink(path_.c_str());
        if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listenFd_, 4) != 0) {
            ::close(listenFd_);
            throw std::runtime_error("cannot listen on " + path_);
        }
    }

    ~FakePeer() {
        join();
        ::close(listenFd_);
        ::unlink(path_.c_str());
    }

    FakePeer(const FakePeer&) = delete;
    FakePeer& operator=(const FakePeer&) = delete;

    void serve(std::vector<Session> sessions) {
        thread_ = std::thread([this, sessions = std::move(sessions)] {
            for (const auto& session : sessions) {
                pollfd pfd{listenFd_, POLLIN, 0};
                if (::poll(&pfd, 1, acceptTimeoutMs_) <= 0) {
                    return;
                }
                int fd = ::accept(listenFd_, nullptr, nullptr);
                if (fd < 0) {
                    return;
                }
                auto connection = core::IpcConnection::adoptSocket(fd, path_);
                core::FrameCodec codec;
                session(*connection, codec);
                ++served_;
            }
        });
    }

    void serve(Session session) { serve(std::vector<Session>{std::move(session)}); }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    const std::string& path() const { return path_; }
    int served() const { return served_; }

private:
    std::string path_;
    int acceptTimeoutMs_;
    int listenFd_ = -1;
    std::thread thread_;
    std::atomic<int> served_{0};
};

/// Reads the handshake, answers with the ready event and returns the handshake body.
inline nlohmann::json acceptHandshake(core::IpcConnection& connection, core::FrameCodec& codec) {
    auto handshake = codec.recv(connection);
    if (handshake.has_error()) {
        return nlohmann::json();
    }
    auto sent = codec.send(connection, core::Opcode::Frame, readyEvent());
    if (sent.has_error()) {
        return nlohmann::json();
    }
    return handshake.value().payload;
}

/// Answers every command with an acknowledgement until the client hangs up.
inline int acknowledgeCommands(core::IpcConnection& connection, core::FrameCodec& codec) {
    int handled = 0;
    while (true) {
        auto request = codec.recv(connection);
        if (request.has_error()) {
            return handled;
        }
        if (codec.send(connection, core::Opcode::Frame, commandAck(request.value().payload)).has_error()) {
            return handled;
        }
        ++handled;
    }
}

} // namespace test_support
} // namespace presencelink
