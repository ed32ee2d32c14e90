#include "presencelink/activity/activity_builder.hpp"
#include "presencelink/async/async_ipc_client.hpp"
#include "presencelink/async/async_retry.hpp"

#include <iostream>

#include <boost/asio/steady_timer.hpp>

using namespace presencelink;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <client-id>\n";
        return 2;
    }
    const std::string clientId = argv[1];
    int status = 0;

    boost::asio::io_context io;
    boost::asio::spawn(io, [&](boost::asio::yield_context yield) {
        async::AsyncIpcClient client(io, clientId);
        std::cout << "backend: " << async::toString(client.backend()) << "\n";

        auto ready = async::withRetryAsync(core::RetryConfig(), io, [&] {
            return client.connectWithTimeout(std::chrono::seconds(5), yield);
        }, yield);
        if (!ready) {
            std::cerr << "connect failed: " << ready.error().toString() << "\n";
            status = 1;
            return;
        }

        boost::asio::steady_timer timer(io);
        for (int level = 1; level <= 3; ++level) {
            auto activity = activity::ActivityBuilder()
                .state("Level " + std::to_string(level))
                .details("async example")
                .party("example-party", static_cast<uint32_t>(level), 4)
                .build();
            auto set = client.setActivity(activity, yield);
            if (!set) {
                std::cerr << "set activity failed: " << set.error().toString() << "\n";
                status = 1;
                return;
            }
            timer.expires_after(std::chrono::seconds(5));
            boost::system::error_code ec;
            timer.async_wait(yield[ec]);
        }

        auto cleared = client.clearActivity(yield);
        if (!cleared) {
            std::cerr << "clear activity failed: " << cleared.error().toString() << "\n";
            status = 1;
        }
    });
    io.run();
    return status;
}
