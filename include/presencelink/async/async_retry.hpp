#pragma once

#include <chrono>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>

#include "presencelink/core/retry.hpp"

namespace presencelink {
namespace async {

/**
 * @brief core::withRetry with the backoff delay spent on a steady_timer.
 *
 * The calling coroutine is suspended between attempts; the thread keeps
 * running other handlers.
 */
template <typename Operation>
auto withRetryAsync(const core::RetryConfig& config, boost::asio::io_context& io,
                    Operation&& operation, const boost::asio::yield_context& yield)
    -> decltype(operation()) {
    return core::withRetry(config, std::forward<Operation>(operation),
        [&io, &yield](std::chrono::milliseconds delay) {
            boost::asio::steady_timer timer(io, delay);
            boost::system::error_code ec;
            timer.async_wait(yield[ec]);
        });
}

} // namespace async
} // namespace presencelink
