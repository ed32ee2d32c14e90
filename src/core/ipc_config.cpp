#include "presencelink/core/ipc_config.hpp"
#include "presencelink/core/pipe_config.hpp"

namespace presencelink {
namespace core {

namespace {

constexpr uint32_t kMaxSocketsLimit = 100;
constexpr uint32_t kMaxRetryIntervalMs = 10000;
constexpr uint32_t kMinPayloadSize = 1024;
constexpr uint32_t kMaxPayloadSizeLimit = 100 * 1024 * 1024;

} // namespace

IpcConfig IpcConfig::fastConnect() {
    IpcConfig config;
    config.maxSockets = 3;
    config.retryIntervalMs = 50;
    return config;
}

IpcConfig IpcConfig::extended() {
    IpcConfig config;
    config.maxSockets = MAX_IPC_SOCKETS;
    config.retryIntervalMs = 200;
    return config;
}

Result<void> IpcConfig::validate() const {
    if (maxSockets == 0 || maxSockets > kMaxSocketsLimit) {
        return IpcError(ErrorCode::InvalidConfig,
                        "maxSockets must be between 1 and 100 (got " +
                        std::to_string(maxSockets) + ")");
    }
    if (retryIntervalMs == 0 || retryIntervalMs > kMaxRetryIntervalMs) {
        return IpcError(ErrorCode::InvalidConfig,
                        "retryIntervalMs must be between 1 and 10000 (got " +
                        std::to_string(retryIntervalMs) + ")");
    }
    if (maxPayloadSize < kMinPayloadSize || maxPayloadSize > kMaxPayloadSizeLimit) {
        return IpcError(ErrorCode::InvalidConfig,
                        "maxPayloadSize must be between 1 KiB and 100 MiB (got " +
                        std::to_string(maxPayloadSize) + ")");
    }
    return Result<void>();
}

PipeConfig PipeConfig::pipeNumber(uint32_t number) {
    PipeConfig config;
    config.mode_ = Mode::PipeNumber;
    config.number_ = number;
    return config;
}

PipeConfig PipeConfig::customPath(std::string path) {
    PipeConfig config;
    config.mode_ = Mode::CustomPath;
    config.path_ = std::move(path);
    return config;
}

Result<void> PipeConfig::validate(const IpcConfig& config) const {
    if (mode_ == Mode::PipeNumber && number_ >= config.maxSockets) {
        return IpcError(ErrorCode::InvalidPipeNumber,
                        "pipe number " + std::to_string(number_) +
                        " is out of range (0-" + std::to_string(config.maxSockets - 1) + ")");
    }
    if (mode_ == Mode::CustomPath && path_.empty()) {
        return IpcError(ErrorCode::InvalidConfig, "custom pipe path is empty");
    }
    return Result<void>();
}

std::string PipeConfig::describe() const {
    switch (mode_) {
        case Mode::Auto: return "auto";
        case Mode::PipeNumber: return "pipe " + std::to_string(number_);
        case Mode::CustomPath: return "path " + path_;
    }
    return "auto";
}

} // namespace core
} // namespace presencelink
