#ifndef TIZENCTL_TV_IDENTIFIER_HPP
#define TIZENCTL_TV_IDENTIFIER_HPP

#include <optional>
#include <string>

#include "core/connection_channel.hpp"
#include "models/tv_types.hpp"

class Logger;

// Classifies a reachable (ip, port) as a Samsung TV and infers its transport
class TvIdentifier {
public:
    TvIdentifier(ChannelFactory channelFactory, Logger* logger);
    virtual ~TvIdentifier() = default;

    virtual std::optional<tv::Candidate> identify(const std::string& ip, int port);

    void setTimeoutMs(int timeoutMs) { m_timeoutMs = timeoutMs; }
    int getTimeoutMs() const { return m_timeoutMs; }

    // Name announced in the control channel handshake
    void setClientName(const std::string& clientName) { m_clientName = clientName; }
    const std::string& getClientName() const { return m_clientName; }

    // Ports that select the websocket and legacy checks in identify()
    void setControlPorts(int websocketPort, int legacyPort) {
        m_websocketPort = websocketPort;
        m_legacyPort = legacyPort;
    }

private:
    ChannelFactory m_channelFactory;
    Logger* m_log = nullptr;
    int m_timeoutMs = DEFAULT_TIMEOUT_MS;
    std::string m_clientName = DEFAULT_CLIENT_NAME;
    int m_websocketPort = tv::PLAIN_CONTROL_PORT;
    int m_legacyPort = tv::LEGACY_CONTROL_PORT;

    static constexpr int DEFAULT_TIMEOUT_MS = 2000;
    static constexpr const char* DEFAULT_CLIENT_NAME = "tizenctl";
    static constexpr size_t LEGACY_PROBE_SIZE = 10;

    bool probeWebsocket(const std::string& ip, int port);
    bool probeLegacy(const std::string& ip, int port);
};

#endif
