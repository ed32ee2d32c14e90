#include <gtest/gtest.h>
#include "presencelink/activity/activity_builder.hpp"
#include "presencelink/core/ipc_client.hpp"
#include "support/fake_peer.hpp"
#include "support/scoped_env.hpp"

namespace presencelink {
namespace core {
namespace testing {

using std::chrono::milliseconds;
using test_support::ScopedEnv;
using test_support::TempDir;

class IpcClientTest : public ::testing::Test {
protected:
    void SetUp() override { env.useRuntimeDir(dir.path()); }

    ClientOptions optionsFor(PipeConfig pipe) {
        ClientOptions options;
        options.pipe = std::move(pipe);
        options.ipc = IpcConfig::fastConnect();
        return options;
    }

    TempDir dir;
    ScopedEnv env;
};

TEST_F(IpcClientTest, OperationsBeforeConnectFail) {
    IpcClient client("123456789012345678");
    EXPECT_FALSE(client.isConnected());
    EXPECT_EQ(client.clientId(), "123456789012345678");

    auto set = client.setActivity(activity::ActivityBuilder().state("x").build());
    ASSERT_TRUE(set.has_error());
    EXPECT_EQ(set.error().code(), ErrorCode::NotConnected);
    EXPECT_EQ(client.clearActivity().error().code(), ErrorCode::NotConnected);
    EXPECT_EQ(client.sendMessage(Opcode::Ping, nlohmann::json::object()).error().code(),
              ErrorCode::NotConnected);
    EXPECT_EQ(client.recvMessage().error().code(), ErrorCode::NotConnected);
    EXPECT_EQ(client.cleanupPending(milliseconds(0)), 0u);
}

TEST_F(IpcClientTest, InvalidActivityReportedBeforeConnectionState) {
    IpcClient client("123456789012345678");
    auto set = client.setActivity(activity::ActivityBuilder().state(std::string(129, 'a')).build());
    ASSERT_TRUE(set.has_error());
    EXPECT_EQ(set.error().code(), ErrorCode::InvalidActivity);
}

TEST_F(IpcClientTest, MissingCustomPathIsConnectionFailed) {
    IpcClient client("1", optionsFor(PipeConfig::customPath(dir.file("absent.sock"))));

    auto ready = client.connect();
    ASSERT_TRUE(ready.has_error());
    EXPECT_EQ(ready.error().code(), ErrorCode::ConnectionFailed);
    EXPECT_FALSE(client.isConnected());
}

TEST_F(IpcClientTest, AutoDiscoveryReportsEveryAttempt) {
    IpcClient client("1", optionsFor(PipeConfig::autoDiscover()));

    auto ready = client.connect();
    ASSERT_TRUE(ready.has_error());
    EXPECT_EQ(ready.error().code(), ErrorCode::DiscoveryFailed);
    EXPECT_TRUE(ready.error().isRecoverable());
    ASSERT_EQ(ready.error().attemptedPaths().size(), 6u);
    EXPECT_EQ(ready.error().attemptedPaths()[0], dir.path() + "/discord-ipc-0");
    EXPECT_EQ(ready.error().attemptedPaths()[3],
              dir.path() + "/app/com.discordapp.Discord/discord-ipc-0");
}

TEST_F(IpcClientTest, InvalidPipeNumberFailsFast) {
    auto options = optionsFor(PipeConfig::pipeNumber(3));
    options.connectTimeout = milliseconds(5000);
    IpcClient client("1", options);

    const auto start = std::chrono::steady_clock::now();
    auto ready = client.connect();
    ASSERT_TRUE(ready.has_error());
    EXPECT_EQ(ready.error().code(), ErrorCode::InvalidPipeNumber);
    EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds(1000));
}

TEST_F(IpcClientTest, TimeoutCarriesLastError) {
    auto options = optionsFor(PipeConfig::autoDiscover());
    options.connectTimeout = milliseconds(200);
    IpcClient client("1", options);

    const auto start = std::chrono::steady_clock::now();
    auto ready = client.connect();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(ready.has_error());
    EXPECT_EQ(ready.error().code(), ErrorCode::ConnectionTimeout);
    ASSERT_TRUE(ready.error().lastError().has_value());
    EXPECT_NE(ready.error().lastError()->find("DiscoveryFailed"), std::string::npos);
    EXPECT_GE(elapsed, milliseconds(200));
    EXPECT_LT(elapsed, milliseconds(2000));
}

TEST_F(IpcClientTest, TimeoutSucceedsOncePeerAppears) {
    const std::string path = dir.file("discord-ipc-0");
    auto options = optionsFor(PipeConfig::pipeNumber(0));
    options.connectTimeout = milliseconds(3000);
    IpcClient client("1", options);

    std::unique_ptr<test_support::FakePeer> peer;
    std::thread starter([&] {
        std::this_thread::sleep_for(milliseconds(150));
        peer.reset(new test_support::FakePeer(path));
        peer->serve([](IpcConnection& connection, FrameCodec& codec) {
            test_support::acceptHandshake(connection, codec);
        });
    });

    auto ready = client.connect();
    starter.join();
    ASSERT_TRUE(ready.has_value()) << ready.error().toString();
    EXPECT_EQ(ready.value()["evt"], "READY");
    client.close();
    peer.reset();
}

} // namespace testing
} // namespace core
} // namespace presencelink
