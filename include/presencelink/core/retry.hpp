#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "presencelink/utils/logging.hpp"
#include "presencelink/utils/result.hpp"

namespace presencelink {
namespace core {

/**
 * @brief Exponential backoff policy.
 */
struct RetryConfig {
    uint32_t maxAttempts = 3;          ///< Total invocations, including the first
    uint64_t initialDelayMs = 1000;    ///< Delay after the first failure
    uint64_t maxDelayMs = 10000;       ///< Upper bound for any single delay
    double backoffMultiplier = 2.0;    ///< Growth factor per attempt

    /// Default delays with a different attempt count.
    static RetryConfig withMaxAttempts(uint32_t attempts);

    /**
     * @brief min(initialDelayMs * backoffMultiplier^attempt, maxDelayMs).
     */
    std::chrono::milliseconds delayForAttempt(uint32_t attempt) const;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// std::this_thread::sleep_for.
void threadSleep(std::chrono::milliseconds delay);

/**
 * @brief Invoke operation until it succeeds or fails for good.
 *
 * A failure is retried only if it is recoverable and attempts remain;
 * otherwise it is returned as is. Between tries the sleeper waits
 * delayForAttempt(attempt). operation must return a Result.
 */
template <typename Operation>
auto withRetry(const RetryConfig& config, Operation&& operation,
               const Sleeper& sleeper = threadSleep) -> decltype(operation()) {
    using ResultType = decltype(operation());

    for (uint32_t attempt = 0; attempt < config.maxAttempts; ++attempt) {
        ResultType result = operation();
        if (result.has_value()) {
            if (attempt > 0) {
                PLINK_LOG_INFO("operation succeeded after " << attempt << " retries");
            }
            return result;
        }

        const IpcError& error = result.error();
        if (!error.isRecoverable() || attempt + 1 >= config.maxAttempts) {
            if (error.isRecoverable()) {
                PLINK_LOG_WARN("giving up after " << config.maxAttempts
                               << " attempts: " << error.toString());
            }
            return result;
        }

        const auto delay = config.delayForAttempt(attempt);
        PLINK_LOG_WARN("attempt " << (attempt + 1) << " of " << config.maxAttempts
                       << " failed (" << error.toString() << "), retrying in "
                       << delay.count() << " ms");
        sleeper(delay);
    }

    return ResultType(IpcError(ErrorCode::InvalidConfig, "retry requires at least one attempt"));
}

} // namespace core
} // namespace presencelink
