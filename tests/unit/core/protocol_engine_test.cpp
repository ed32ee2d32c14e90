#include <gtest/gtest.h>
#include "presencelink/activity/activity_builder.hpp"
#include "presencelink/core/protocol_engine.hpp"
#include "support/scripted_stream.hpp"

namespace presencelink {
namespace core {
namespace testing {

using nlohmann::json;
using test_support::ScriptedStream;
using test_support::commandAck;
using test_support::readyEvent;

class ProtocolEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto owned = std::make_unique<ScriptedStream>();
        stream = owned.get();
        engine = std::make_unique<ProtocolEngine>("123456789012345678", std::move(owned));
    }

    void handshake() {
        stream->queueFrame(Opcode::Frame, readyEvent());
        auto ready = engine->connect();
        ASSERT_TRUE(ready.has_value()) << ready.error().toString();
    }

    // Acknowledges every command frame, optionally surrounded by extra frames.
    void respondWith(std::function<void(ScriptedStream&, const json&)> reply) {
        stream->setResponder([reply](ScriptedStream& s, const Frame& frame) {
            if (frame.opcode == Opcode::Frame) {
                reply(s, frame.payload);
            }
        });
    }

    void acknowledgeCommands() {
        respondWith([](ScriptedStream& s, const json& request) {
            s.queueFrame(Opcode::Frame, commandAck(request));
        });
    }

    ScriptedStream* stream = nullptr;
    std::unique_ptr<ProtocolEngine> engine;
};

TEST_F(ProtocolEngineTest, ConstructionPerformsNoIo) {
    EXPECT_TRUE(stream->written().empty());
    EXPECT_EQ(engine->state(), EngineState::Unconnected);
    EXPECT_FALSE(engine->isConnected());
    EXPECT_EQ(engine->clientId(), "123456789012345678");
}

TEST_F(ProtocolEngineTest, HandshakeSendsVersionAndClientId) {
    handshake();

    auto frames = stream->writtenFrames();
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].opcode, Opcode::Handshake);
    EXPECT_EQ(frames[0].payload, (json{{"v", 1}, {"client_id", "123456789012345678"}}));
    EXPECT_TRUE(engine->isConnected());
    EXPECT_EQ(engine->state(), EngineState::Connected);
}

TEST_F(ProtocolEngineTest, HandshakeReturnsReadyEvent) {
    stream->queueFrame(Opcode::Frame, readyEvent());
    auto ready = engine->connect();
    ASSERT_TRUE(ready.has_value());
    EXPECT_EQ(ready.value()["evt"], "READY");
    EXPECT_EQ(ready.value()["data"]["user"]["username"], "tester");
}

TEST_F(ProtocolEngineTest, HandshakeAnsweredWithHandshakeOpcodeFails) {
    stream->queueFrame(Opcode::Handshake, readyEvent());

    auto ready = engine->connect();
    ASSERT_TRUE(ready.has_error());
    EXPECT_EQ(ready.error().code(), ErrorCode::HandshakeFailed);
    ASSERT_TRUE(ready.error().protocolContext().has_value());
    EXPECT_EQ(ready.error().protocolContext()->expectedOpcode, 1u);
    EXPECT_EQ(ready.error().protocolContext()->receivedOpcode, 0u);
    EXPECT_FALSE(engine->isConnected());
}

TEST_F(ProtocolEngineTest, HandshakeErrorObjectBecomesPeerError) {
    stream->queueFrame(Opcode::Frame, {{"error", {{"code", 4000}, {"message", "Invalid Client ID"}}}});

    auto ready = engine->connect();
    ASSERT_TRUE(ready.has_error());
    EXPECT_EQ(ready.error().code(), ErrorCode::PeerError);
    EXPECT_EQ(ready.error().peerCode(), 4000);
    EXPECT_EQ(ready.error().message(), "Invalid Client ID");
}

TEST_F(ProtocolEngineTest, MalformedHandshakeErrorIsHandshakeFailure) {
    stream->queueFrame(Opcode::Close, {{"error", "nope"}});

    auto ready = engine->connect();
    ASSERT_TRUE(ready.has_error());
    EXPECT_EQ(ready.error().code(), ErrorCode::HandshakeFailed);
}

TEST_F(ProtocolEngineTest, PeerHangupDuringHandshake) {
    auto ready = engine->connect();
    ASSERT_TRUE(ready.has_error());
    EXPECT_EQ(ready.error().code(), ErrorCode::SocketClosed);
}

TEST_F(ProtocolEngineTest, ConnectOnClosedStreamIsNotConnected) {
    engine->close();
    auto ready = engine->connect();
    ASSERT_TRUE(ready.has_error());
    EXPECT_EQ(ready.error().code(), ErrorCode::NotConnected);
}

TEST_F(ProtocolEngineTest, CommandsRequireHandshake) {
    auto set = engine->setActivity(activity::ActivityBuilder().state("idle").build());
    ASSERT_TRUE(set.has_error());
    EXPECT_EQ(set.error().code(), ErrorCode::NotConnected);

    auto clear = engine->clearActivity();
    ASSERT_TRUE(clear.has_error());
    EXPECT_EQ(clear.error().code(), ErrorCode::NotConnected);
    EXPECT_TRUE(stream->written().empty());
}

TEST_F(ProtocolEngineTest, InvalidActivityRejectedBeforeAnyIo) {
    auto result = engine->setActivity(activity::ActivityBuilder().state(std::string(129, 's')).build());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidActivity);
    EXPECT_TRUE(stream->written().empty());
}

TEST_F(ProtocolEngineTest, OverlongStateFailsWithoutWriting) {
    handshake();
    acknowledgeCommands();
    const size_t before = stream->written().size();

    auto tooLong = engine->setActivity(activity::ActivityBuilder().state(std::string(129, 's')).build());
    ASSERT_TRUE(tooLong.has_error());
    EXPECT_EQ(tooLong.error().code(), ErrorCode::InvalidActivity);
    EXPECT_FALSE(tooLong.error().isRecoverable());
    EXPECT_NE(tooLong.error().message().find("state"), std::string::npos);
    EXPECT_EQ(stream->written().size(), before);

    auto atLimit = engine->setActivity(activity::ActivityBuilder().state(std::string(128, 's')).build());
    EXPECT_TRUE(atLimit.has_value()) << atLimit.error().toString();
    EXPECT_GT(stream->written().size(), before);
}

TEST_F(ProtocolEngineTest, SetActivitySendsCommand) {
    handshake();
    acknowledgeCommands();

    auto activity = activity::ActivityBuilder().state("In a match").details("Ranked").build();
    auto result = engine->setActivity(activity);
    ASSERT_TRUE(result.has_value()) << result.error().toString();

    auto frames = stream->writtenFrames();
    ASSERT_EQ(frames.size(), 2u);
    const json& command = frames[1].payload;
    EXPECT_EQ(frames[1].opcode, Opcode::Frame);
    EXPECT_EQ(command["cmd"], "SET_ACTIVITY");
    EXPECT_EQ(command["args"]["pid"], currentProcessId());
    EXPECT_EQ(command["args"]["activity"], json(activity));
    EXPECT_EQ(command["nonce"].get<std::string>().rfind("set-activity-", 0), 0u);
}

TEST_F(ProtocolEngineTest, EveryCommandGetsFreshNonce) {
    handshake();
    acknowledgeCommands();

    ASSERT_TRUE(engine->setActivity(activity::ActivityBuilder().state("a").build()).has_value());
    ASSERT_TRUE(engine->setActivity(activity::ActivityBuilder().state("b").build()).has_value());

    auto frames = stream->writtenFrames();
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_NE(frames[1].payload["nonce"], frames[2].payload["nonce"]);
}

TEST_F(ProtocolEngineTest, ClearActivitySendsNullAndReturnsBody) {
    handshake();
    acknowledgeCommands();

    auto response = engine->clearActivity();
    ASSERT_TRUE(response.has_value()) << response.error().toString();

    auto frames = stream->writtenFrames();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_TRUE(frames[1].payload["args"]["activity"].is_null());
    EXPECT_EQ(frames[1].payload["nonce"].get<std::string>().rfind("clear-activity-", 0), 0u);
    EXPECT_EQ(response.value()["cmd"], "SET_ACTIVITY");
    EXPECT_EQ(response.value()["nonce"], frames[1].payload["nonce"]);
}

TEST_F(ProtocolEngineTest, UnrelatedFramesAreBufferedInArrivalOrder) {
    handshake();
    respondWith([](ScriptedStream& s, const json& request) {
        s.queueFrame(Opcode::Frame, {{"evt", "ACTIVITY_JOIN"}, {"seq", 1}});
        s.queueFrame(Opcode::Frame, commandAck(request));
        s.queueFrame(Opcode::Frame, {{"evt", "ACTIVITY_SPECTATE"}, {"nonce", "someone-else"}, {"seq", 3}});
    });

    ASSERT_TRUE(engine->setActivity(activity::ActivityBuilder().state("x").build()).has_value());
    EXPECT_EQ(engine->pendingCount(), 1u);

    auto first = engine->recvMessage();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value().payload["seq"], 1);

    auto third = engine->recvMessage();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third.value().payload["seq"], 3);
    EXPECT_EQ(engine->pendingCount(), 0u);
}

TEST_F(ProtocolEngineTest, CommandErrorObjectBecomesPeerError) {
    handshake();
    respondWith([](ScriptedStream& s, const json& request) {
        s.queueFrame(Opcode::Frame, {
            {"error", {{"code", 4002}, {"message", "child \"activity\" fails"}}},
            {"nonce", request["nonce"]}
        });
    });

    auto result = engine->setActivity(activity::ActivityBuilder().state("x").build());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code(), ErrorCode::PeerError);
    EXPECT_EQ(result.error().peerCode(), 4002);
}

TEST_F(ProtocolEngineTest, MalformedCommandErrorIsInvalidResponse) {
    handshake();
    respondWith([](ScriptedStream& s, const json& request) {
        s.queueFrame(Opcode::Frame, {{"error", {{"code", "bad"}}}, {"nonce", request["nonce"]}});
    });

    auto result = engine->clearActivity();
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidResponse);
}

TEST_F(ProtocolEngineTest, ResponseWithWrongOpcodeIsInvalidResponse) {
    handshake();
    respondWith([](ScriptedStream& s, const json& request) {
        s.queueFrame(Opcode::Pong, commandAck(request));
    });

    auto result = engine->clearActivity();
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidResponse);
    ASSERT_TRUE(result.error().protocolContext().has_value());
    EXPECT_EQ(result.error().protocolContext()->receivedOpcode, 4u);
}

TEST_F(ProtocolEngineTest, HandshakeFrameAfterHandshakeIsProtocolViolation) {
    handshake();
    respondWith([](ScriptedStream& s, const json& request) {
        s.queueFrame(Opcode::Handshake, commandAck(request));
    });

    auto result = engine->setActivity(activity::ActivityBuilder().state("x").build());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code(), ErrorCode::ProtocolViolation);
    EXPECT_EQ(result.error().category(), ErrorCategory::Protocol);
    EXPECT_FALSE(result.error().isRecoverable());
    ASSERT_TRUE(result.error().protocolContext().has_value());
    EXPECT_EQ(result.error().protocolContext()->expectedOpcode, 1u);
    EXPECT_EQ(result.error().protocolContext()->receivedOpcode, 0u);
    EXPECT_EQ(engine->pendingCount(), 0u);
}

TEST_F(ProtocolEngineTest, RawSendAndReceive) {
    handshake();
    ASSERT_TRUE(engine->sendMessage(Opcode::Ping, {{"ts", 1}}).has_value());
    auto frames = stream->writtenFrames();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[1].opcode, Opcode::Ping);

    stream->queueFrame(Opcode::Pong, {{"ts", 1}});
    auto pong = engine->recvMessage();
    ASSERT_TRUE(pong.has_value());
    EXPECT_EQ(pong.value().opcode, Opcode::Pong);
}

TEST_F(ProtocolEngineTest, CleanupPendingByAge) {
    handshake();
    respondWith([](ScriptedStream& s, const json& request) {
        s.queueFrame(Opcode::Frame, {{"evt", "GUILD_STATUS"}});
        s.queueFrame(Opcode::Frame, {{"evt", "GUILD_STATUS"}});
        s.queueFrame(Opcode::Frame, commandAck(request));
    });
    ASSERT_TRUE(engine->clearActivity().has_value());
    ASSERT_EQ(engine->pendingCount(), 2u);

    EXPECT_EQ(engine->cleanupPending(std::chrono::hours(1)), 0u);
    EXPECT_EQ(engine->pendingCount(), 2u);
    EXPECT_EQ(engine->cleanupPending(std::chrono::milliseconds(0)), 2u);
    EXPECT_EQ(engine->pendingCount(), 0u);
}

TEST_F(ProtocolEngineTest, CloseReleasesStreamAndBuffer) {
    handshake();
    engine->close();
    EXPECT_FALSE(stream->isOpen());
    EXPECT_FALSE(engine->isConnected());
    EXPECT_EQ(engine->pendingCount(), 0u);

    auto sent = engine->sendMessage(Opcode::Ping, json::object());
    ASSERT_TRUE(sent.has_error());
    EXPECT_EQ(sent.error().code(), ErrorCode::NotConnected);
}

TEST(HasNonceTest, MatchesOnlyStringNonce) {
    EXPECT_TRUE(hasNonce({{"nonce", "abc"}}, "abc"));
    EXPECT_FALSE(hasNonce({{"nonce", "abd"}}, "abc"));
    EXPECT_FALSE(hasNonce({{"nonce", nullptr}}, "abc"));
    EXPECT_FALSE(hasNonce(json::array({"abc"}), "abc"));
    EXPECT_FALSE(hasNonce(json::object(), "abc"));
}

} // namespace testing
} // namespace core
} // namespace presencelink
