#include "core/tv_identifier.hpp"
#include "core/logger.hpp"
#include "core/session_manager.hpp"
#include "util/net_util.hpp"

#include <sys/socket.h>
#include <errno.h>
#include <cstring>

TvIdentifier::TvIdentifier(ChannelFactory channelFactory, Logger* logger)
    : m_channelFactory(std::move(channelFactory)),
      m_log(Logger::orSilent(logger)) {
}

std::optional<tv::Candidate> TvIdentifier::identify(const std::string& ip, int port) {
    tv::Candidate candidate;
    candidate.endpoint.host = ip;
    candidate.endpoint.port = port;
    candidate.endpoint.displayName = "Samsung TV (" + ip + ")";
    candidate.discoverySource = tv::DiscoverySource::PortScan;

    if (port == m_websocketPort) {
        if (!probeWebsocket(ip, port)) return std::nullopt;
        candidate.endpoint.method = tv::TransportMethod::Websocket;
        candidate.model = "Unknown (WebSocket)";
        return candidate;
    }

    if (port == m_legacyPort) {
        if (!probeLegacy(ip, port)) return std::nullopt;
        candidate.endpoint.method = tv::TransportMethod::Legacy;
        candidate.model = "Unknown (Legacy)";
        return candidate;
    }

    return std::nullopt;
}

bool TvIdentifier::probeWebsocket(const std::string& ip, int port) {
    if (!m_channelFactory) return false;

    std::unique_ptr<ConnectionChannel> channel = m_channelFactory(false);
    if (!channel) return false;

    std::string url = SessionManager::buildUrl(ip, port, false, m_clientName, std::nullopt);
    TransportStatus status = channel->open(url, m_timeoutMs);
    channel->close();

    if (!status.ok()) {
        m_log->debug("TvIdentifier: {}:{} is not a websocket endpoint [{}] {}", ip, port, toString(status.fault), status.message);
        return false;
    }

    m_log->info("TvIdentifier: found websocket TV at {}", ip);
    return true;
}

bool TvIdentifier::probeLegacy(const std::string& ip, int port) {
    util::SocketHandle sock;
    std::string error;
    if (!util::connectTcp(ip, port, m_timeoutMs, sock, error)) {
        m_log->debug("TvIdentifier: legacy connect to {}:{} failed: {}", ip, port, error);
        return false;
    }

    char probe[LEGACY_PROBE_SIZE];
    memset(probe, 0, sizeof(probe));
    ssize_t sent = ::send(sock.get(), probe, sizeof(probe), MSG_NOSIGNAL);
    if (sent != static_cast<ssize_t>(sizeof(probe))) {
        m_log->debug("TvIdentifier: legacy probe to {} failed: {}", ip, strerror(errno));
        return false;
    }

    if (!util::waitReadable(sock.get(), m_timeoutMs)) {
        return false;
    }

    char buffer[64];
    ssize_t received = ::recv(sock.get(), buffer, sizeof(buffer), 0);
    if (received <= 0) {
        return false;
    }

    m_log->info("TvIdentifier: found legacy TV at {}", ip);
    return true;
}
