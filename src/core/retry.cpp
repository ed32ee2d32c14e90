#include "presencelink/core/retry.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace presencelink {
namespace core {

RetryConfig RetryConfig::withMaxAttempts(uint32_t attempts) {
    RetryConfig config;
    config.maxAttempts = attempts;
    return config;
}

std::chrono::milliseconds RetryConfig::delayForAttempt(uint32_t attempt) const {
    const double scaled = static_cast<double>(initialDelayMs) *
                          std::pow(backoffMultiplier, static_cast<double>(attempt));
    const double capped = std::min(scaled, static_cast<double>(maxDelayMs));
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
}

void threadSleep(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

} // namespace core
} // namespace presencelink
