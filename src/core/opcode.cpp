#include "presencelink/core/opcode.hpp"

namespace presencelink {
namespace core {

Result<Opcode> opcodeFromU32(uint32_t value) {
    switch (value) {
        case 0: return Opcode::Handshake;
        case 1: return Opcode::Frame;
        case 2: return Opcode::Close;
        case 3: return Opcode::Ping;
        case 4: return Opcode::Pong;
        default: return IpcError::invalidOpcode(value);
    }
}

const char* toString(Opcode opcode) {
    switch (opcode) {
        case Opcode::Handshake: return "Handshake";
        case Opcode::Frame: return "Frame";
        case Opcode::Close: return "Close";
        case Opcode::Ping: return "Ping";
        case Opcode::Pong: return "Pong";
    }
    return "Unknown";
}

const char* toString(Command command) {
    switch (command) {
        case Command::SetActivity: return "SET_ACTIVITY";
        case Command::Subscribe: return "SUBSCRIBE";
        case Command::Unsubscribe: return "UNSUBSCRIBE";
    }
    return "UNKNOWN";
}

Result<Command> commandFromString(const std::string& name) {
    if (name == "SET_ACTIVITY") return Command::SetActivity;
    if (name == "SUBSCRIBE") return Command::Subscribe;
    if (name == "UNSUBSCRIBE") return Command::Unsubscribe;
    return IpcError::invalidResponse("unknown command '" + name + "'");
}

} // namespace core
} // namespace presencelink
