#include "presencelink/core/byte_stream.hpp"

#include <string>

namespace presencelink {
namespace core {

Result<void> readExact(ByteReader& reader, uint8_t* buffer, size_t size) {
    size_t total = 0;
    while (total < size) {
        auto result = reader.readSome(buffer + total, size - total);
        if (result.has_error()) {
            return result.error();
        }
        if (result.value() == 0) {
            return IpcError::socketClosed("expected " + std::to_string(size) +
                                          " bytes, received " + std::to_string(total));
        }
        total += result.value();
    }
    return Result<void>();
}

Result<void> writeAll(ByteWriter& writer, const uint8_t* data, size_t size) {
    size_t total = 0;
    while (total < size) {
        auto result = writer.writeSome(data + total, size - total);
        if (result.has_error()) {
            return result.error();
        }
        if (result.value() == 0) {
            return IpcError::socketClosed("channel accepted no bytes after " +
                                          std::to_string(total) + " of " + std::to_string(size));
        }
        total += result.value();
    }
    return writer.flush();
}

} // namespace core
} // namespace presencelink
