#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include "presencelink/core/byte_stream.hpp"
#include "presencelink/core/opcode.hpp"

namespace presencelink {
namespace core {

/**
 * @brief One decoded frame.
 */
struct Frame {
    Opcode opcode = Opcode::Frame;
    uint32_t length = 0;        ///< Byte length of the serialized payload
    nlohmann::json payload;
};

/**
 * @brief Encodes and decodes the 8-byte header + JSON body wire format.
 *
 * Header layout: little-endian u32 opcode, little-endian u32 body length.
 * Keeps its scratch buffers between calls, so one codec serves one stream.
 */
class FrameCodec {
public:
    explicit FrameCodec(uint32_t maxPayloadSize = MAX_PAYLOAD_SIZE);

    /**
     * @brief Serialize payload and write header and body, then flush.
     *
     * @return SerializationFailed if the payload cannot be encoded,
     *         PayloadTooLarge if the body exceeds the configured maximum.
     */
    Result<void> send(ByteWriter& writer, Opcode opcode, const nlohmann::json& payload);

    /**
     * @brief Read one frame.
     *
     * The declared length is checked before the body buffer is sized.
     * Unknown opcodes yield InvalidOpcode, a short read SocketClosed and a
     * malformed body DeserializationFailed.
     */
    Result<Frame> recv(ByteReader& reader);

    uint32_t maxPayloadSize() const { return maxPayloadSize_; }

    static std::array<uint8_t, FRAME_HEADER_SIZE> encodeHeader(uint32_t opcode, uint32_t length);
    static void decodeHeader(const uint8_t* header, uint32_t& opcode, uint32_t& length);

private:
    uint32_t maxPayloadSize_;
    std::vector<uint8_t> writeBuffer_;
    std::vector<uint8_t> readBuffer_;
};

} // namespace core
} // namespace presencelink
