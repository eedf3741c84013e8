/**
 * @file test_realtime_client.cpp
 * @brief RealtimeClient against a refused port and a loopback TLS server
 */

#include <gtest/gtest.h>

#include "loopback_model_server.h"
#include "model_events.h"
#include "realtime_client.h"
#include "test_common.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace rtbridge;
using namespace rtbridge::test;
using namespace std::chrono_literals;

namespace {

RealtimeEndpoint unreachableEndpoint()
{
    RealtimeEndpoint ep;
    ep.host = "127.0.0.1";
    ep.port = "1";
    ep.path = "/v1/realtime?model=test-model";
    ep.apiKey = "sk-test";
    ep.connectTimeout = 2000ms;
    return ep;
}

ModelEvent nextEvent(RealtimeClient& client)
{
    InboundMessage msg;
    if (!client.receive(msg))
        return ModelEvent{};
    return msg.binary ? decodeModelBinary(msg.data) : decodeModelEvent(msg.data);
}

} // namespace

TEST(RealtimeClientTest, CloseBeforeStartIsIdempotent) {
    RealtimeClient client(unreachableEndpoint());
    client.close();
    client.close();
    EXPECT_EQ(client.state(), ConnectionState::Closed);

    InboundMessage msg;
    EXPECT_FALSE(client.receive(msg));

    // A closed client never connects.
    client.start();
    EXPECT_EQ(client.state(), ConnectionState::Closed);
    EXPECT_FALSE(client.waitOpen(100ms));
    EXPECT_FALSE(client.send(R"({"type":"session.update"})"));
}

TEST(RealtimeClientTest, RefusedConnectionReportsErrorThenClosed) {
    RealtimeClient client(unreachableEndpoint());
    client.start();
    EXPECT_FALSE(client.waitOpen(5000ms));
    EXPECT_EQ(client.state(), ConnectionState::Failed);

    ModelEvent error = nextEvent(client);
    EXPECT_EQ(error.type, ModelEventType::Error);
    EXPECT_NE(error.message.find("connect"), std::string::npos) << error.message;

    ModelEvent closed = nextEvent(client);
    EXPECT_EQ(closed.type, ModelEventType::Closed);
    EXPECT_EQ(closed.closeCode, 1006);

    InboundMessage msg;
    EXPECT_FALSE(client.receive(msg));
    EXPECT_FALSE(client.send(R"({"type":"session.update"})"));
    client.close();
    EXPECT_EQ(client.state(), ConnectionState::Failed);
}

TEST(RealtimeClientTest, HandshakeCarriesCredentialsAndMessagesFlow) {
    LoopbackModelServer server([](LoopbackModelServer&, ServerSocket& ws) {
        beast::flat_buffer buffer;
        ws.read(buffer);
        json got = json::parse(beast::buffers_to_string(buffer.data()));
        writeText(ws, json{{"type", "session.created"}, {"seen", got["type"]}}.dump());
        readUntilClosed(ws);
    });

    RealtimeClient client(server.endpoint());
    client.start();
    ASSERT_TRUE(client.waitOpen(5000ms));
    EXPECT_EQ(client.state(), ConnectionState::Open);
    EXPECT_TRUE(client.send(R"({"type":"session.update"})"));

    InboundMessage msg;
    ASSERT_TRUE(client.receive(msg));
    EXPECT_FALSE(msg.binary);
    json reply = json::parse(msg.data);
    EXPECT_EQ(reply["type"], "session.created");
    EXPECT_EQ(reply["seen"], "session.update");

    client.close();
    ModelEvent closed = nextEvent(client);
    EXPECT_EQ(closed.type, ModelEventType::Closed);
    EXPECT_EQ(closed.closeCode, 1000);
    EXPECT_FALSE(client.receive(msg));
    EXPECT_EQ(client.state(), ConnectionState::Closed);

    server.join();
    EXPECT_EQ(server.authorization(), "Bearer sk-test");
    EXPECT_EQ(server.betaHeader(), "realtime=v1");
    EXPECT_EQ(server.target(), "/v1/realtime?model=test-model");
    EXPECT_EQ(server.failure(), "");
}

TEST(RealtimeClientTest, SlowConsumerLosesNoEvents) {
    const int count = 64;
    LoopbackModelServer server([count](LoopbackModelServer&, ServerSocket& ws) {
        for (int i = 0; i < count; i++)
            writeText(ws, json{{"type", "response.text.delta"}, {"seq", i}}.dump());
        ws.close(websocket::close_code::normal);
    });

    RealtimeEndpoint ep = server.endpoint();
    ep.inboundQueueLimit = 4;
    RealtimeClient client(ep);
    client.start();
    ASSERT_TRUE(client.waitOpen(5000ms));

    // Let the queue fill and reading stop.
    std::this_thread::sleep_for(200ms);

    std::vector<int> seqs;
    std::vector<std::string> tail;
    InboundMessage msg;
    while (client.receive(msg)) {
        json j = json::parse(msg.data);
        if (j.contains("seq"))
            seqs.push_back(j["seq"].get<int>());
        else
            tail.push_back(j["type"].get<std::string>());
    }

    ASSERT_EQ(seqs.size(), static_cast<size_t>(count));
    for (int i = 0; i < count; i++)
        EXPECT_EQ(seqs[i], i);
    EXPECT_EQ(tail, (std::vector<std::string>{"closed"}));
    EXPECT_EQ(client.state(), ConnectionState::Closed);
}

TEST(RealtimeClientTest, PausedReadingDoesNotTripKeepAlive) {
    LoopbackModelServer server([](LoopbackModelServer&, ServerSocket& ws) {
        for (int i = 0; i < 3; i++)
            writeText(ws, json{{"type", "response.text.delta"}, {"seq", i}}.dump());
        readUntilClosed(ws);
    });

    RealtimeEndpoint ep = server.endpoint();
    ep.inboundQueueLimit = 1;
    ep.pingInterval = std::chrono::seconds(1);
    ep.pingTimeout = std::chrono::seconds(1);
    RealtimeClient client(ep);
    client.start();
    ASSERT_TRUE(client.waitOpen(5000ms));

    // Past one ping interval plus its pong deadline without receiving.
    std::this_thread::sleep_for(2500ms);
    EXPECT_EQ(client.state(), ConnectionState::Open);

    InboundMessage msg;
    for (int i = 0; i < 3; i++) {
        ASSERT_TRUE(client.receive(msg));
        EXPECT_EQ(json::parse(msg.data)["seq"], i);
    }
    EXPECT_EQ(client.state(), ConnectionState::Open);
}

TEST(RealtimeClientTest, MissingPongFailsConnection) {
    LoopbackModelServer server([](LoopbackModelServer& self, ServerSocket&) {
        // Never reads, so pings go unanswered.
        self.hold(10000ms);
    });

    RealtimeEndpoint ep = server.endpoint();
    ep.pingInterval = std::chrono::seconds(1);
    ep.pingTimeout = std::chrono::seconds(1);
    RealtimeClient client(ep);
    client.start();
    ASSERT_TRUE(client.waitOpen(5000ms));

    ModelEvent error = nextEvent(client);
    EXPECT_EQ(error.type, ModelEventType::Error);
    EXPECT_NE(error.message.find("keep-alive"), std::string::npos) << error.message;
    ModelEvent closed = nextEvent(client);
    EXPECT_EQ(closed.type, ModelEventType::Closed);
    EXPECT_EQ(closed.closeCode, 1006);
    EXPECT_EQ(client.state(), ConnectionState::Failed);
    server.release();
}

TEST(RealtimeClientTest, RemoteCloseDuringWritesEndsCleanly) {
    LoopbackModelServer server([](LoopbackModelServer&, ServerSocket& ws) {
        beast::flat_buffer buffer;
        ws.read(buffer);
        ws.close(websocket::close_code::normal);
    });

    RealtimeEndpoint ep = server.endpoint();
    ep.sendQueueLimit = 1024;
    RealtimeClient client(ep);
    client.start();
    ASSERT_TRUE(client.waitOpen(5000ms));

    // Keep the write side busy while the server's close arrives.
    const std::string chunk = json{{"type", "input_audio_buffer.append"},
                                   {"audio", std::string(4096, 'A')}}.dump();
    std::thread writer([&]() {
        for (int i = 0; i < 500; i++)
            if (!client.send(chunk))
                break;
    });

    std::vector<ModelEvent> events;
    InboundMessage msg;
    while (client.receive(msg))
        events.push_back(decodeModelEvent(msg.data));
    writer.join();

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, ModelEventType::Closed);
    EXPECT_EQ(events.back().closeCode, 1000);
    EXPECT_EQ(client.state(), ConnectionState::Closed);
    EXPECT_FALSE(client.send(chunk));
}

TEST(RealtimeClientTest, UntrustedCertificateFailsHandshake) {
    LoopbackModelServer server([](LoopbackModelServer&, ServerSocket& ws) {
        readUntilClosed(ws);
    });

    RealtimeEndpoint ep = server.endpoint();
    ep.caFile.clear();
    RealtimeClient client(ep);
    client.start();
    EXPECT_FALSE(client.waitOpen(5000ms));
    EXPECT_EQ(client.state(), ConnectionState::Failed);

    ModelEvent error = nextEvent(client);
    EXPECT_EQ(error.type, ModelEventType::Error);
    EXPECT_NE(error.message.find("ssl handshake"), std::string::npos) << error.message;
}
