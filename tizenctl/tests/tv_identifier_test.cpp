#include <gtest/gtest.h>

#include "core/session_manager.hpp"
#include "core/tv_identifier.hpp"
#include "fake_channel.hpp"
#include "loopback_peer.hpp"
#include "util/encoding.hpp"

#include <chrono>
#include <string>

TEST(TvIdentifierTest, WebsocketPortIdentifiesWhenChannelOpens) {
    auto fake = std::make_shared<FakeTv>();
    TvIdentifier identifier(fakeFactory(fake), nullptr);

    auto candidate = identifier.identify("192.168.1.50", tv::PLAIN_CONTROL_PORT);
    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(candidate->endpoint.method, tv::TransportMethod::Websocket);
    EXPECT_EQ(candidate->model, "Unknown (WebSocket)");
    EXPECT_EQ(candidate->discoverySource, tv::DiscoverySource::PortScan);
    ASSERT_EQ(fake->openedUrls.size(), 1u);
    EXPECT_EQ(fake->openedUrls[0],
              "ws://192.168.1.50:8001/api/v2/channels/samsung.remote.control?name=" +
              util::base64Encode("tizenctl"));
    EXPECT_FALSE(fake->openedSecure[0]);
}

TEST(TvIdentifierTest, WebsocketHandshakeUsesSessionUrlAndClientName) {
    auto fake = std::make_shared<FakeTv>();
    TvIdentifier identifier(fakeFactory(fake), nullptr);
    identifier.setClientName("Living Room Remote");

    ASSERT_TRUE(identifier.identify("10.0.0.7", tv::PLAIN_CONTROL_PORT).has_value());
    ASSERT_EQ(fake->openedUrls.size(), 1u);
    EXPECT_EQ(fake->openedUrls[0],
              SessionManager::buildUrl("10.0.0.7", tv::PLAIN_CONTROL_PORT, false, "Living Room Remote", std::nullopt));
}

TEST(TvIdentifierTest, FailedOpenAndOtherPortsYieldNothing) {
    auto fake = std::make_shared<FakeTv>();
    fake->openResults.push_back(TransportStatus::failure(TransportFault::Protocol, "HTTP 404"));
    TvIdentifier identifier(fakeFactory(fake), nullptr);

    EXPECT_FALSE(identifier.identify("192.168.1.50", tv::PLAIN_CONTROL_PORT).has_value());
    EXPECT_FALSE(identifier.identify("192.168.1.50", 80).has_value());
    EXPECT_EQ(fake->openedUrls.size(), 1u);
}

TEST(TvIdentifierTest, LegacyListenerThatAnswersIsIdentified) {
    loopback::TcpListener listener(std::string("\x64\x00\x01\x00", 4));
    ASSERT_GT(listener.port(), 0);

    auto fake = std::make_shared<FakeTv>();
    TvIdentifier identifier(fakeFactory(fake), nullptr);
    identifier.setTimeoutMs(1000);
    identifier.setControlPorts(tv::PLAIN_CONTROL_PORT, listener.port());

    auto candidate = identifier.identify("127.0.0.1", listener.port());
    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(candidate->endpoint.host, "127.0.0.1");
    EXPECT_EQ(candidate->endpoint.port, listener.port());
    EXPECT_EQ(candidate->endpoint.method, tv::TransportMethod::Legacy);
    EXPECT_EQ(candidate->model, "Unknown (Legacy)");
    EXPECT_EQ(candidate->discoverySource, tv::DiscoverySource::PortScan);
    EXPECT_TRUE(fake->openedUrls.empty());
}

TEST(TvIdentifierTest, SilentLegacyListenerIsNotIdentified) {
    loopback::TcpListener listener("");
    ASSERT_GT(listener.port(), 0);

    TvIdentifier identifier(nullptr, nullptr);
    identifier.setTimeoutMs(200);
    identifier.setControlPorts(tv::PLAIN_CONTROL_PORT, listener.port());

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(identifier.identify("127.0.0.1", listener.port()).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST(TvIdentifierTest, LegacyListenerReceivesTenByteHello) {
    loopback::TcpListener listener("ok");
    ASSERT_GT(listener.port(), 0);

    TvIdentifier identifier(nullptr, nullptr);
    identifier.setTimeoutMs(1000);
    identifier.setControlPorts(tv::PLAIN_CONTROL_PORT, listener.port());

    ASSERT_TRUE(identifier.identify("127.0.0.1", listener.port()).has_value());
    EXPECT_EQ(listener.bytesReceived(), 10u);
}

