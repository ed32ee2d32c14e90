#include "presencelink/activity/activity_builder.hpp"
#include "presencelink/core/ipc_client.hpp"
#include "presencelink/core/ipc_connection.hpp"
#include "presencelink/core/retry.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace presencelink;
using namespace presencelink::core;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <client-id> [pipe-number | socket-path]\n";
        return 2;
    }

    ClientOptions options;
    if (argc > 2) {
        std::string selector = argv[2];
        if (!selector.empty() && selector.find_first_not_of("0123456789") == std::string::npos) {
            options.pipe = PipeConfig::pipeNumber(static_cast<uint32_t>(std::stoul(selector)));
        } else {
            options.pipe = PipeConfig::customPath(selector);
        }
    }
    options.connectTimeout = std::chrono::milliseconds(2000);

    // List what is listening before picking one
    for (const auto& pipe : IpcConnection::discoverPipes(options.ipc)) {
        std::cout << "found pipe " << pipe.pipeNumber << " at " << pipe.path << "\n";
    }

    IpcClient client(argv[1], options);
    auto ready = withRetry(RetryConfig(), [&client] { return client.connect(); });
    if (!ready) {
        std::cerr << "connect failed: " << ready.error().toString() << "\n";
        return 1;
    }
    std::cout << "connected as "
              << ready.value()["data"]["user"].value("username", std::string("<unknown>")) << "\n";

    auto activity = activity::ActivityBuilder()
        .state("Writing C++")
        .details("presencelink example")
        .startTimestampNow()
        .largeImage("logo")
        .largeText("presencelink")
        .button("Source", "https://example.com/presencelink")
        .build();

    auto set = client.setActivity(activity);
    if (!set) {
        std::cerr << "set activity failed: " << set.error().toString() << "\n";
        if (!set.error().isRecoverable() || !client.reconnect() || !client.setActivity(activity)) {
            return 1;
        }
    }

    std::this_thread::sleep_for(std::chrono::seconds(10));

    auto cleared = client.clearActivity();
    if (!cleared) {
        std::cerr << "clear activity failed: " << cleared.error().toString() << "\n";
        return 1;
    }
    return 0;
}
