#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "core/session_manager.hpp"
#include "fake_channel.hpp"
#include "util/encoding.hpp"

namespace {

constexpr const char* CONNECT_EVENT = R"({"event":"ms.channel.connect","data":{"clients":[]}})";
constexpr const char* UNAUTHORIZED_EVENT = R"({"event":"ms.channel.unauthorized"})";

SessionOptions fastOptions() {
    SessionOptions options;
    options.clientName = "tizenctl";
    options.timeoutMs = 100;
    options.keyIntervalMs = 0;
    return options;
}

tv::Endpoint endpointFor(const std::string& host, int port = tv::PLAIN_CONTROL_PORT) {
    tv::Endpoint endpoint;
    endpoint.host = host;
    endpoint.port = port;
    return endpoint;
}

class SessionManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTv> fake = std::make_shared<FakeTv>();
    SessionManager session{fastOptions(), fakeFactory(fake), nullptr};
};

}

TEST_F(SessionManagerTest, PlainConnectAuthorizesAndSendsExactPayload) {
    fake->replyWith(CONNECT_EVENT);

    tv::PairingCredential credential;
    tv::TvError error;
    ASSERT_TRUE(session.connect(endpointFor("192.168.1.20", 8001), credential, error));
    EXPECT_EQ(session.getState(), tv::SessionState::Authorized);
    EXPECT_TRUE(credential.paired);
    EXPECT_FALSE(credential.hasToken());

    ASSERT_EQ(fake->openedUrls.size(), 1u);
    EXPECT_FALSE(fake->openedSecure[0]);
    EXPECT_EQ(fake->openedUrls[0].rfind("ws://192.168.1.20:8001/", 0), 0u);

    tv::CommandResult result = session.send("KEY_VOLUP");
    EXPECT_EQ(result.outcome, tv::CommandOutcome::Ok);

    ASSERT_EQ(fake->sent.size(), 1u);
    auto payload = nlohmann::json::parse(fake->sent[0]);
    auto expected = nlohmann::json::parse(R"({
        "method": "ms.remote.control",
        "params": {
            "Cmd": "Click",
            "DataOfCmd": "KEY_VOLUP",
            "Option": "false",
            "TypeOfRemote": "SendRemoteKey"
        }
    })");
    EXPECT_EQ(payload, expected);
    EXPECT_EQ(fake->openedUrls.size(), 1u);
}

TEST_F(SessionManagerTest, UrlCarriesEncodedNameAndToken) {
    std::string url = SessionManager::buildUrl("10.0.0.5", 8002, true, "tizenctl", std::string("12345"));
    EXPECT_EQ(url, "wss://10.0.0.5:8002/api/v2/channels/samsung.remote.control?name=" +
                   util::base64Encode("tizenctl") + "&token=12345");

    std::string plain = SessionManager::buildUrl("10.0.0.5", 8001, false, "tizenctl", std::nullopt);
    EXPECT_EQ(plain.find("token="), std::string::npos);
    EXPECT_EQ(plain.rfind("ws://", 0), 0u);
}

TEST_F(SessionManagerTest, UnauthorizedPlainFallsBackToSecureAndStoresToken) {
    fake->replyWith(UNAUTHORIZED_EVENT);
    fake->replyWith(R"({"event":"ms.channel.connect","data":{"token":"98765"}})");

    tv::PairingCredential credential;
    tv::TvError error;
    ASSERT_TRUE(session.connect(endpointFor("192.168.1.20"), credential, error));

    EXPECT_EQ(session.getState(), tv::SessionState::Authorized);
    EXPECT_TRUE(credential.paired);
    ASSERT_TRUE(credential.token.has_value());
    EXPECT_EQ(*credential.token, "98765");

    ASSERT_EQ(fake->openedUrls.size(), 2u);
    EXPECT_FALSE(fake->openedSecure[0]);
    EXPECT_TRUE(fake->openedSecure[1]);
    EXPECT_EQ(fake->openedUrls[1].rfind("wss://192.168.1.20:8002/", 0), 0u);
}

TEST_F(SessionManagerTest, NumericTokenIsStoredAsString) {
    fake->replyWith(UNAUTHORIZED_EVENT);
    fake->replyWith(R"({"event":"ms.channel.connect","data":{"token":42}})");

    tv::PairingCredential credential;
    tv::TvError error;
    ASSERT_TRUE(session.connect(endpointFor("192.168.1.20"), credential, error));
    ASSERT_TRUE(credential.token.has_value());
    EXPECT_EQ(*credential.token, "42");
}

TEST_F(SessionManagerTest, UnauthorizedTwiceIsAccessDenied) {
    fake->replyWith(UNAUTHORIZED_EVENT);
    fake->replyWith(UNAUTHORIZED_EVENT);

    tv::PairingCredential credential;
    tv::TvError error;
    EXPECT_FALSE(session.connect(endpointFor("192.168.1.20"), credential, error));
    EXPECT_EQ(error.kind, tv::ErrorKind::AccessDenied);
    EXPECT_FALSE(credential.token.has_value());
    EXPECT_FALSE(credential.paired);
    EXPECT_EQ(session.getState(), tv::SessionState::Failed);
}

TEST_F(SessionManagerTest, SecureRetryThatCannotOpenIsTransportError) {
    fake->openResults.push_back(TransportStatus::success());
    fake->openResults.push_back(TransportStatus::failure(TransportFault::Tls, "handshake failed"));
    fake->replyWith(UNAUTHORIZED_EVENT);

    tv::PairingCredential credential;
    tv::TvError error;
    EXPECT_FALSE(session.connect(endpointFor("192.168.1.20"), credential, error));
    EXPECT_EQ(error.kind, tv::ErrorKind::TransportError);
}

TEST_F(SessionManagerTest, PairedCredentialOpensOnlySecureUrl) {
    fake->replyWith(CONNECT_EVENT);

    tv::PairingCredential credential;
    credential.token = "555";
    credential.paired = true;
    tv::TvError error;
    ASSERT_TRUE(session.connect(endpointFor("192.168.1.20"), credential, error));

    ASSERT_EQ(fake->openedUrls.size(), 1u);
    EXPECT_TRUE(fake->openedSecure[0]);
    EXPECT_NE(fake->openedUrls[0].find(":8002/"), std::string::npos);
    EXPECT_NE(fake->openedUrls[0].find("&token=555"), std::string::npos);
    EXPECT_EQ(*credential.token, "555");
}

TEST_F(SessionManagerTest, UnauthorizedOnSecureAttemptIsAccessDenied) {
    fake->replyWith(UNAUTHORIZED_EVENT);

    tv::PairingCredential credential;
    credential.token = "555";
    credential.paired = true;
    tv::TvError error;
    EXPECT_FALSE(session.connect(endpointFor("192.168.1.20"), credential, error));
    EXPECT_EQ(error.kind, tv::ErrorKind::AccessDenied);
    EXPECT_EQ(fake->openedUrls.size(), 1u);
    EXPECT_EQ(*credential.token, "555");
}

TEST_F(SessionManagerTest, UnexpectedEventIsUnhandledResponse) {
    fake->replyWith(R"({"event":"ms.channel.timeOut"})");

    tv::PairingCredential credential;
    tv::TvError error;
    EXPECT_FALSE(session.connect(endpointFor("192.168.1.20"), credential, error));
    EXPECT_EQ(error.kind, tv::ErrorKind::UnhandledResponse);
}

TEST_F(SessionManagerTest, MalformedPayloadIsUnhandledResponse) {
    fake->replyWith("not json at all");

    tv::PairingCredential credential;
    tv::TvError error;
    EXPECT_FALSE(session.connect(endpointFor("192.168.1.20"), credential, error));
    EXPECT_EQ(error.kind, tv::ErrorKind::UnhandledResponse);

    fake->replyWith(R"({"data":{}})");
    EXPECT_FALSE(session.connect(endpointFor("192.168.1.20"), credential, error));
    EXPECT_EQ(error.kind, tv::ErrorKind::UnhandledResponse);
}

TEST_F(SessionManagerTest, OpenFailureIsTransportError) {
    fake->openResults.push_back(TransportStatus::failure(TransportFault::Connect, "refused"));

    tv::PairingCredential credential;
    tv::TvError error;
    EXPECT_FALSE(session.connect(endpointFor("192.168.1.20"), credential, error));
    EXPECT_EQ(error.kind, tv::ErrorKind::TransportError);
    EXPECT_EQ(session.getState(), tv::SessionState::Failed);
}

TEST_F(SessionManagerTest, LegacyEndpointIsUnsupported) {
    tv::Endpoint endpoint = endpointFor("192.168.1.20", tv::LEGACY_CONTROL_PORT);
    endpoint.method = tv::TransportMethod::Legacy;

    tv::PairingCredential credential;
    tv::TvError error;
    EXPECT_FALSE(session.connect(endpoint, credential, error));
    EXPECT_EQ(error.kind, tv::ErrorKind::UnsupportedMethod);
    EXPECT_EQ(fake->ioCount(), 0);
}

TEST_F(SessionManagerTest, SendWithoutConnectIsConnectionClosed) {
    tv::CommandResult result = session.send("KEY_POWER");
    EXPECT_EQ(result.outcome, tv::CommandOutcome::Failed);
    EXPECT_EQ(result.errorKind, tv::ErrorKind::ConnectionClosed);
    EXPECT_EQ(fake->ioCount(), 0);
    EXPECT_EQ(fake->channelsCreated, 0);
}

TEST_F(SessionManagerTest, SendAfterCloseIsConnectionClosed) {
    fake->replyWith(CONNECT_EVENT);
    tv::PairingCredential credential;
    tv::TvError error;
    ASSERT_TRUE(session.connect(endpointFor("192.168.1.20"), credential, error));

    session.close();
    session.close();
    EXPECT_EQ(session.getState(), tv::SessionState::Closed);

    int before = fake->ioCount();
    tv::CommandResult result = session.send("KEY_POWER");
    EXPECT_EQ(result.errorKind, tv::ErrorKind::ConnectionClosed);
    EXPECT_EQ(fake->ioCount(), before);
}

TEST_F(SessionManagerTest, WriteFailureReconnectsAndRetriesOnce) {
    fake->replyWith(CONNECT_EVENT);
    tv::PairingCredential credential;
    tv::TvError error;
    ASSERT_TRUE(session.connect(endpointFor("192.168.1.20"), credential, error));

    fake->sendResults.push_back(TransportStatus::failure(TransportFault::Send, "Broken pipe"));
    fake->replyWith(CONNECT_EVENT);

    tv::CommandResult result = session.send("KEY_MUTE");
    EXPECT_EQ(result.outcome, tv::CommandOutcome::Retried);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(fake->sendAttempts, 2);
    EXPECT_EQ(fake->sent.size(), 1u);
    EXPECT_EQ(fake->openedUrls.size(), 2u);
    EXPECT_EQ(session.getState(), tv::SessionState::Authorized);
}

TEST_F(SessionManagerTest, FailedReconnectSurfacesTransportError) {
    fake->replyWith(CONNECT_EVENT);
    tv::PairingCredential credential;
    tv::TvError error;
    ASSERT_TRUE(session.connect(endpointFor("192.168.1.20"), credential, error));

    fake->sendResults.push_back(TransportStatus::failure(TransportFault::PeerClosed, "closed by peer"));
    fake->openResults.push_back(TransportStatus::failure(TransportFault::Connect, "refused"));

    tv::CommandResult result = session.send("KEY_MUTE");
    EXPECT_EQ(result.outcome, tv::CommandOutcome::Failed);
    EXPECT_EQ(result.errorKind, tv::ErrorKind::TransportError);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("closed by peer"), std::string::npos);
    EXPECT_EQ(fake->sendAttempts, 1);
}

TEST_F(SessionManagerTest, RetriedWriteFailureIsNotRetriedAgain) {
    fake->replyWith(CONNECT_EVENT);
    tv::PairingCredential credential;
    tv::TvError error;
    ASSERT_TRUE(session.connect(endpointFor("192.168.1.20"), credential, error));

    fake->sendResults.push_back(TransportStatus::failure(TransportFault::Send, "first"));
    fake->sendResults.push_back(TransportStatus::failure(TransportFault::Send, "second"));
    fake->replyWith(CONNECT_EVENT);

    tv::CommandResult result = session.send("KEY_MUTE");
    EXPECT_EQ(result.outcome, tv::CommandOutcome::Failed);
    EXPECT_EQ(result.errorKind, tv::ErrorKind::TransportError);
    EXPECT_EQ(fake->sendAttempts, 2);
    EXPECT_EQ(fake->openedUrls.size(), 2u);
}

TEST_F(SessionManagerTest, CredentialCallbackAndHistory) {
    std::string notifiedHost;
    tv::PairingCredential notified;
    session.setOnCredentialUpdated([&](const std::string& host, const tv::PairingCredential& credential) {
        notifiedHost = host;
        notified = credential;
    });

    fake->replyWith(UNAUTHORIZED_EVENT);
    fake->replyWith(R"({"event":"ms.channel.connect","data":{"token":"abc"}})");

    tv::PairingCredential credential;
    tv::TvError error;
    ASSERT_TRUE(session.connect(endpointFor("192.168.1.30"), credential, error));
    EXPECT_EQ(notifiedHost, "192.168.1.30");
    EXPECT_TRUE(notified.paired);
    EXPECT_EQ(notified.token.value_or(""), "abc");

    session.send("KEY_1");
    session.send("KEY_2");
    auto entries = session.getHistory().entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].key, "KEY_2");
    EXPECT_EQ(entries[1].key, "KEY_1");
}
