#include "core/multicast_probe.hpp"
#include "core/logger.hpp"
#include "util/encoding.hpp"
#include "util/net_util.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>
#include <sys/time.h>
#include <errno.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <map>
#include <set>
#include <sstream>

MulticastProbe::MulticastProbe(MulticastProbeOptions options, Logger* logger)
    : m_options(options),
      m_log(Logger::orSilent(logger)) {
}

std::string MulticastProbe::buildSearchRequest() {
    return std::string("M-SEARCH * HTTP/1.1\r\n") +
           "HOST: " + SSDP_ADDR + ":" + std::to_string(SSDP_PORT) + "\r\n" +
           "MAN: \"ssdp:discover\"\r\n" +
           "MX: 3\r\n" +
           "ST: upnp:rootdevice\r\n" +
           "USER-AGENT: SamsungRemote/1.0\r\n" +
           "\r\n";
}

std::optional<tv::Candidate> MulticastProbe::parseResponse(const std::string& data, const std::string& fromIp) {
    std::map<std::string, std::string> headers;

    std::istringstream stream(data);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        size_t colonPos = line.find(':');
        if (colonPos == std::string::npos) continue;

        std::string key = util::toUpper(util::trim(line.substr(0, colonPos)));
        std::string value = util::trim(line.substr(colonPos + 1));
        if (key.empty()) continue;

        headers[key] = value;
    }

    const std::string server = headers.count("SERVER") ? headers["SERVER"] : "";
    const std::string location = headers.count("LOCATION") ? headers["LOCATION"] : "";
    const std::string serverUpper = util::toUpper(server);
    const std::string locationUpper = util::toUpper(location);

    bool samsung = serverUpper.find("SAMSUNG") != std::string::npos ||
                   serverUpper.find("SEC_HHP") != std::string::npos ||
                   locationUpper.find("SAMSUNG") != std::string::npos ||
                   locationUpper.find("SEC_HHP") != std::string::npos;
    if (!samsung) {
        return std::nullopt;
    }

    tv::Candidate candidate;
    candidate.endpoint.host = fromIp;
    candidate.endpoint.port = tv::PLAIN_CONTROL_PORT;
    candidate.endpoint.method = tv::TransportMethod::Websocket;
    candidate.endpoint.displayName = "Samsung TV (" + fromIp + ")";
    candidate.discoverySource = tv::DiscoverySource::Multicast;
    candidate.model = "Samsung TV (UPnP)";

    if (location.find(std::to_string(tv::LEGACY_CONTROL_PORT)) != std::string::npos &&
        location.find(std::to_string(tv::PLAIN_CONTROL_PORT)) == std::string::npos) {
        candidate.endpoint.port = tv::LEGACY_CONTROL_PORT;
        candidate.endpoint.method = tv::TransportMethod::Legacy;
    }

    return candidate;
}

std::vector<tv::Candidate> MulticastProbe::run(const std::atomic<bool>& keepRunning) {
    std::vector<tv::Candidate> results;

    util::SocketHandle sock(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (!sock.valid()) {
        m_log->error("MulticastProbe: failed to create socket: {}", strerror(errno));
        return results;
    }

    int reuseaddr = 1;
    setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &reuseaddr, sizeof(reuseaddr));

    unsigned char ttl = static_cast<unsigned char>(m_options.ttl);
    if (setsockopt(sock.get(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
        m_log->warning("MulticastProbe: failed to set multicast TTL: {}", strerror(errno));
    }

    struct timeval recvTimeout;
    recvTimeout.tv_sec = m_options.receiveTimeoutMs / 1000;
    recvTimeout.tv_usec = (m_options.receiveTimeoutMs % 1000) * 1000;
    setsockopt(sock.get(), SOL_SOCKET, SO_RCVTIMEO, &recvTimeout, sizeof(recvTimeout));

    struct sockaddr_in bindAddr;
    memset(&bindAddr, 0, sizeof(bindAddr));
    bindAddr.sin_family = AF_INET;
    bindAddr.sin_addr.s_addr = INADDR_ANY;
    bindAddr.sin_port = htons(0);

    if (bind(sock.get(), (struct sockaddr*)&bindAddr, sizeof(bindAddr)) < 0) {
        m_log->error("MulticastProbe: failed to bind: {}", strerror(errno));
        return results;
    }

    struct sockaddr_in groupAddr;
    memset(&groupAddr, 0, sizeof(groupAddr));
    groupAddr.sin_family = AF_INET;
    groupAddr.sin_port = htons(static_cast<uint16_t>(m_options.groupPort));
    if (inet_pton(AF_INET, m_options.groupAddress.c_str(), &groupAddr.sin_addr) != 1) {
        m_log->error("MulticastProbe: invalid group address {}", m_options.groupAddress);
        return results;
    }

    std::string request = buildSearchRequest();
    ssize_t sent = sendto(sock.get(), request.data(), request.size(), 0,
                          (struct sockaddr*)&groupAddr, sizeof(groupAddr));
    if (sent < 0) {
        m_log->error("MulticastProbe: failed to send M-SEARCH: {}", strerror(errno));
        return results;
    }

    m_log->debug("MulticastProbe: M-SEARCH sent to {}:{}, listening for {} ms",
                 m_options.groupAddress, m_options.groupPort, m_options.listenMs);

    std::set<std::string> seen;
    char buffer[4096];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_options.listenMs);

    while (keepRunning) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()
        ).count();
        if (remaining <= 0) {
            break;
        }

        int slice = static_cast<int>(std::min<int64_t>(remaining, POLL_SLICE_MS));
        if (!util::waitReadable(sock.get(), slice)) {
            continue;
        }

        struct sockaddr_in fromAddr;
        socklen_t fromLen = sizeof(fromAddr);
        ssize_t received = recvfrom(sock.get(), buffer, sizeof(buffer) - 1, 0,
                                    (struct sockaddr*)&fromAddr, &fromLen);
        if (received <= 0) {
            continue;
        }

        char fromStr[INET_ADDRSTRLEN];
        if (!inet_ntop(AF_INET, &fromAddr.sin_addr, fromStr, sizeof(fromStr))) {
            continue;
        }
        std::string fromIp = fromStr;

        auto candidate = parseResponse(std::string(buffer, static_cast<size_t>(received)), fromIp);
        if (!candidate) {
            m_log->debug("MulticastProbe: ignoring response from {}", fromIp);
            continue;
        }
        if (!seen.insert(fromIp).second) {
            continue;
        }

        m_log->info("MulticastProbe: found Samsung TV at {}", fromIp);
        results.push_back(*candidate);
    }

    return results;
}
