#pragma once

#include <memory>
#include <optional>
#include <utility>

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/thread_pool.hpp>

#include "presencelink/async/asio_stream.hpp"
#include "presencelink/core/ipc_connection.hpp"

namespace presencelink {
namespace async {

/**
 * @brief Run a blocking job on the pool and suspend the coroutine until it ends.
 *
 * The io_context is kept busy while the job runs, and the coroutine is
 * resumed on its own executor.
 *
 * @return Whatever the job returns.
 */
template <typename Job>
auto runOnWorker(boost::asio::io_context& io, boost::asio::thread_pool& pool, Job job,
                 const boost::asio::yield_context& yield) -> decltype(job()) {
    using ResultType = decltype(job());
    auto slot = std::make_shared<std::optional<ResultType>>();

    boost::system::error_code ec;
    auto token = yield[ec];
    boost::asio::async_initiate<boost::asio::yield_context, void(boost::system::error_code)>(
        [&io, &pool, slot, job = std::move(job)](auto handler) mutable {
            auto work = boost::asio::make_work_guard(io);
            boost::asio::post(pool,
                [handler = std::move(handler), work = std::move(work), slot,
                 job = std::move(job)]() mutable {
                    slot->emplace(job());
                    auto executor = boost::asio::get_associated_executor(handler, work.get_executor());
                    boost::asio::post(executor,
                        [handler = std::move(handler), work = std::move(work)]() mutable {
                            handler(boost::system::error_code());
                        });
                });
        },
        token);

    return std::move(**slot);
}

/**
 * @brief Drives a blocking IpcConnection from a worker thread.
 *
 * Used where no native asynchronous channel exists (Windows named pipes)
 * or when explicitly selected. Each read or write occupies one pool thread
 * while the calling coroutine is suspended.
 *
 * close() from the io thread while a job is in flight only cancels the
 * connection. The handle is released when the job has returned.
 */
class WorkerStream : public CoroutineStream {
public:
    WorkerStream(boost::asio::io_context& io, boost::asio::thread_pool& pool,
                 std::unique_ptr<core::IpcConnection> connection);
    ~WorkerStream() override;

    Result<size_t> readSome(uint8_t* buffer, size_t size) override;
    Result<size_t> writeSome(const uint8_t* data, size_t size) override;
    Result<void> flush() override;
    void close() override;
    bool isOpen() const override;

private:
    template <typename Job>
    Result<size_t> runJob(Job job);

    boost::asio::io_context& io_;
    boost::asio::thread_pool& pool_;
    std::shared_ptr<core::IpcConnection> connection_;
    bool busy_ = false;
    bool closing_ = false;
};

} // namespace async
} // namespace presencelink
