#pragma once

#include <string>

#include "presencelink/utils/result.hpp"

namespace presencelink {
namespace core {

constexpr const char* SET_ACTIVITY_NONCE_PREFIX = "set-activity";
constexpr const char* CLEAR_ACTIVITY_NONCE_PREFIX = "clear-activity";

/**
 * @brief Random (version 4) UUID in canonical 8-4-4-4-12 hex form.
 *
 * Drawn from OpenSSL's CSPRNG; fails with InternalError if it cannot be seeded.
 */
Result<std::string> generateUuid();

/**
 * @brief "{prefix}-{uuid}", unique per request.
 */
Result<std::string> generateNonce(const std::string& prefix);

} // namespace core
} // namespace presencelink
