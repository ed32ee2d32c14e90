#include "presencelink/core/frame_codec.hpp"
#include "presencelink/utils/logging.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

namespace presencelink {
namespace core {

namespace {

void writeU32LE(uint8_t* out, uint32_t value) {
    out[0] = static_cast<uint8_t>(value & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    out[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    out[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

uint32_t readU32LE(const uint8_t* in) {
    return static_cast<uint32_t>(in[0]) |
           (static_cast<uint32_t>(in[1]) << 8) |
           (static_cast<uint32_t>(in[2]) << 16) |
           (static_cast<uint32_t>(in[3]) << 24);
}

} // namespace

FrameCodec::FrameCodec(uint32_t maxPayloadSize)
    : maxPayloadSize_(maxPayloadSize) {}

std::array<uint8_t, FRAME_HEADER_SIZE> FrameCodec::encodeHeader(uint32_t opcode, uint32_t length) {
    std::array<uint8_t, FRAME_HEADER_SIZE> header{};
    writeU32LE(header.data(), opcode);
    writeU32LE(header.data() + 4, length);
    return header;
}

void FrameCodec::decodeHeader(const uint8_t* header, uint32_t& opcode, uint32_t& length) {
    opcode = readU32LE(header);
    length = readU32LE(header + 4);
}

Result<void> FrameCodec::send(ByteWriter& writer, Opcode opcode, const nlohmann::json& payload) {
    std::string body;
    try {
        body = payload.dump();
    } catch (const nlohmann::json::exception& e) {
        return IpcError(ErrorCode::SerializationFailed,
                        std::string("failed to serialize payload: ") + e.what());
    }

    if (body.size() > maxPayloadSize_) {
        return IpcError::payloadTooLarge(static_cast<uint32_t>(
            std::min<size_t>(body.size(), UINT32_MAX)), maxPayloadSize_);
    }

    const auto length = static_cast<uint32_t>(body.size());
    const auto header = encodeHeader(toU32(opcode), length);

    writeBuffer_.clear();
    writeBuffer_.reserve(FRAME_HEADER_SIZE + body.size());
    writeBuffer_.insert(writeBuffer_.end(), header.begin(), header.end());
    writeBuffer_.insert(writeBuffer_.end(), body.begin(), body.end());

    PLINK_LOG_DEBUG("send " << toString(opcode) << " (" << length << " bytes)");
    return writeAll(writer, writeBuffer_.data(), writeBuffer_.size());
}

Result<Frame> FrameCodec::recv(ByteReader& reader) {
    std::array<uint8_t, FRAME_HEADER_SIZE> header{};
    auto headerRead = readExact(reader, header.data(), header.size());
    if (headerRead.has_error()) {
        return headerRead.error();
    }

    uint32_t rawOpcode = 0;
    uint32_t length = 0;
    decodeHeader(header.data(), rawOpcode, length);

    if (length > maxPayloadSize_) {
        PLINK_LOG_WARN("rejecting frame of " << length << " bytes");
        return IpcError::payloadTooLarge(length, maxPayloadSize_);
    }

    auto opcode = opcodeFromU32(rawOpcode);
    if (opcode.has_error()) {
        return IpcError::invalidOpcode(rawOpcode, length);
    }

    readBuffer_.resize(length);
    auto bodyRead = readExact(reader, readBuffer_.data(), length);
    if (bodyRead.has_error()) {
        return bodyRead.error();
    }

    Frame frame;
    frame.opcode = opcode.value();
    frame.length = length;
    try {
        frame.payload = nlohmann::json::parse(readBuffer_.begin(), readBuffer_.end());
    } catch (const nlohmann::json::exception& e) {
        return IpcError(ErrorCode::DeserializationFailed,
                        std::string("failed to parse payload: ") + e.what());
    }

    PLINK_LOG_DEBUG("recv " << toString(frame.opcode) << " (" << length << " bytes)");
    return frame;
}

} // namespace core
} // namespace presencelink
