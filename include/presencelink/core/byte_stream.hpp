#pragma once

#include <cstddef>
#include <cstdint>

#include "presencelink/utils/result.hpp"

namespace presencelink {
namespace core {

/**
 * @brief Capability to read bytes from a channel.
 *
 * Implementations may block the calling thread or suspend the calling
 * coroutine. The protocol engine does not depend on which.
 */
class ByteReader {
public:
    virtual ~ByteReader() = default;

    /**
     * @brief Read up to size bytes into buffer.
     *
     * @return Number of bytes read; 0 means the peer closed the channel.
     */
    virtual Result<size_t> readSome(uint8_t* buffer, size_t size) = 0;
};

/**
 * @brief Capability to write bytes to a channel.
 */
class ByteWriter {
public:
    virtual ~ByteWriter() = default;

    /**
     * @brief Write up to size bytes from data.
     *
     * @return Number of bytes accepted by the channel.
     */
    virtual Result<size_t> writeSome(const uint8_t* data, size_t size) = 0;

    /**
     * @brief Push buffered bytes to the peer. A no-op for unbuffered channels.
     */
    virtual Result<void> flush() = 0;
};

/**
 * @brief Bidirectional channel owned by exactly one protocol engine.
 */
class ByteStream : public ByteReader, public ByteWriter {
public:
    ~ByteStream() override = default;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

/**
 * @brief Fill buffer completely. A short read is reported as SocketClosed.
 */
Result<void> readExact(ByteReader& reader, uint8_t* buffer, size_t size);

/**
 * @brief Write every byte then flush.
 */
Result<void> writeAll(ByteWriter& writer, const uint8_t* data, size_t size);

} // namespace core
} // namespace presencelink
