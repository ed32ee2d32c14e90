#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "presencelink/utils/result.hpp"

namespace presencelink {
namespace core {

/// Handshake protocol version sent as "v".
constexpr uint32_t PROTOCOL_VERSION = 1;
/// Number of numbered sockets/pipes probed per directory.
constexpr uint32_t MAX_IPC_SOCKETS = 10;
/// Hard upper bound on a frame body.
constexpr uint32_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;
/// Interval between connection probes while a deadline is running.
constexpr uint32_t DEFAULT_RETRY_INTERVAL_MS = 100;
/// Opcode + length.
constexpr size_t FRAME_HEADER_SIZE = 8;
/// Socket/pipe file name prefix, followed by the pipe number.
constexpr const char* IPC_SOCKET_PREFIX = "discord-ipc-";

/**
 * @brief Frame opcodes. Any other value on the wire is a protocol violation.
 */
enum class Opcode : uint32_t {
    Handshake = 0,
    Frame = 1,
    Close = 2,
    Ping = 3,
    Pong = 4
};

inline uint32_t toU32(Opcode opcode) { return static_cast<uint32_t>(opcode); }

/**
 * @brief Decodes a wire value, failing with InvalidOpcode for values >= 5.
 */
Result<Opcode> opcodeFromU32(uint32_t value);

const char* toString(Opcode opcode);

/**
 * @brief Remote commands known to the client. Only SetActivity is issued.
 */
enum class Command {
    SetActivity,
    Subscribe,
    Unsubscribe
};

const char* toString(Command command);
Result<Command> commandFromString(const std::string& name);

} // namespace core
} // namespace presencelink
