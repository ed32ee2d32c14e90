#include "presencelink/core/nonce.hpp"

#include <array>
#include <cstdint>
#include <sstream>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace presencelink {
namespace core {

namespace {

std::string getOpenSSLError() {
    std::stringstream ss;
    unsigned long err;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        ss << buf << "; ";
    }
    return ss.str();
}

} // namespace

Result<std::string> generateUuid() {
    std::array<uint8_t, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return IpcError(ErrorCode::InternalError,
                        "failed to generate random nonce: " + getOpenSSLError());
    }

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    static const char* hex = "0123456789abcdef";
    std::string uuid;
    uuid.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            uuid.push_back('-');
        }
        uuid.push_back(hex[bytes[i] >> 4]);
        uuid.push_back(hex[bytes[i] & 0x0F]);
    }
    return uuid;
}

Result<std::string> generateNonce(const std::string& prefix) {
    auto uuid = generateUuid();
    if (uuid.has_error()) {
        return uuid.error();
    }
    return prefix + "-" + uuid.value();
}

} // namespace core
} // namespace presencelink
