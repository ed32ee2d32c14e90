#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "presencelink/core/ipc_config.hpp"

namespace presencelink {
namespace core {

/**
 * @brief Selects how the transport finds the peer.
 */
class PipeConfig {
public:
    enum class Mode {
        Auto,        ///< Probe every candidate directory and pipe number
        PipeNumber,  ///< Probe one pipe number in every candidate directory
        CustomPath   ///< Connect to a caller-supplied path only
    };

    PipeConfig() = default;

    static PipeConfig autoDiscover() { return PipeConfig(); }
    static PipeConfig pipeNumber(uint32_t number);
    static PipeConfig customPath(std::string path);

    Mode mode() const { return mode_; }
    uint32_t number() const { return number_; }
    const std::string& path() const { return path_; }

    /**
     * @brief Fails with InvalidPipeNumber when the number is not below
     * config.maxSockets.
     */
    Result<void> validate(const IpcConfig& config) const;

    std::string describe() const;

private:
    Mode mode_ = Mode::Auto;
    uint32_t number_ = 0;
    std::string path_;
};

/**
 * @brief Construction parameters retained by the reconnecting clients.
 */
struct ClientOptions {
    PipeConfig pipe;
    std::optional<std::chrono::milliseconds> connectTimeout;
    IpcConfig ipc;
};

} // namespace core
} // namespace presencelink
