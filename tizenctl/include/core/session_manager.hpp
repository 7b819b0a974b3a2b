#ifndef TIZENCTL_SESSION_MANAGER_HPP
#define TIZENCTL_SESSION_MANAGER_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "core/command_history.hpp"
#include "core/connection_channel.hpp"
#include "models/tv_types.hpp"

class Logger;

struct SessionOptions {
    std::string clientName = "tizenctl";
    int timeoutMs = 5000;      // <= 0 waits without limit
    int keyIntervalMs = 500;   // minimum gap enforced after each command
};

// Drives the remote-control handshake over one ConnectionChannel.
//
// connect() and send() block the calling thread. One instance must not be
// used from several threads at once; callers serialize their own calls.
class SessionManager {
public:
    using OnCredentialUpdated = std::function<void(const std::string& host, const tv::PairingCredential& credential)>;

    SessionManager(SessionOptions options, ChannelFactory channelFactory, Logger* logger);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

private:
    enum class EventKind {
        Connect,
        Unauthorized,
        Other
    };

    struct HandshakeReply {
        EventKind kind = EventKind::Other;
        std::optional<std::string> token;
        std::string raw;
    };

    SessionOptions m_options;
    ChannelFactory m_channelFactory;
    Logger* m_log = nullptr;

    std::unique_ptr<ConnectionChannel> m_channel;
    tv::SessionState m_state = tv::SessionState::Idle;
    tv::Endpoint m_endpoint;
    tv::PairingCredential m_credential;

    CommandHistory m_history;
    OnCredentialUpdated m_onCredentialUpdated;

    static constexpr const char* HANDSHAKE_PATH = "/api/v2/channels/samsung.remote.control";
    static constexpr const char* EVENT_CONNECT = "ms.channel.connect";
    static constexpr const char* EVENT_UNAUTHORIZED = "ms.channel.unauthorized";

    bool establish(const tv::Endpoint& endpoint, tv::PairingCredential& credential, tv::TvError& outError);
    bool openAndReadEvent(const std::string& host, int port, bool secure,
                          const tv::PairingCredential& credential,
                          HandshakeReply& outReply, tv::TvError& outError);
    static HandshakeReply parseEvent(const std::string& message);

    void fail(tv::TvError& outError, tv::ErrorKind kind, const std::string& message);
    void releaseChannel();
    void adoptCredential(const tv::PairingCredential& credential);
    void waitKeyInterval() const;
    tv::CommandResult finish(tv::CommandResult result);

public:
    // Opens the control channel and authorizes. On success the credential
    // carries paired == true and any token the TV issued.
    bool connect(const tv::Endpoint& endpoint, tv::PairingCredential& credential, tv::TvError& outError);

    // Sends one key. A write failure triggers exactly one reconnect and retry.
    tv::CommandResult send(const std::string& key);

    void close();

    tv::SessionState getState() const { return m_state; }
    bool isAuthorized() const;
    tv::PairingCredential getCredential() const { return m_credential; }
    tv::Endpoint getEndpoint() const { return m_endpoint; }
    const CommandHistory& getHistory() const { return m_history; }
    CommandHistory& getHistory() { return m_history; }

    void setOnCredentialUpdated(OnCredentialUpdated callback) {
        m_onCredentialUpdated = std::move(callback);
    }

    static std::string buildUrl(const std::string& host, int port, bool secure,
                                const std::string& clientName,
                                const std::optional<std::string>& token);
    static std::string buildCommandPayload(const std::string& key);
};

#endif
