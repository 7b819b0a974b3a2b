#include "core/conflict_checker.hpp"
#include "core/logger.hpp"
#include "models/subnet.hpp"
#include "util/net_util.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <errno.h>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>

static uint16_t icmpChecksum(const void* data, size_t len) {
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    uint32_t sum = 0;
    for (size_t i = 0; i + 1 < len; i += 2) {
        sum += static_cast<uint32_t>(bytes[i] << 8 | bytes[i + 1]);
    }
    if (len & 1) {
        sum += static_cast<uint32_t>(bytes[len - 1] << 8);
    }
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return htons(static_cast<uint16_t>(~sum));
}

ConflictChecker::ConflictChecker(Logger* logger, ArpReader arpReader, Pinger pinger)
    : m_log(Logger::orSilent(logger)),
      m_arpReader(std::move(arpReader)),
      m_pinger(std::move(pinger)) {
    if (!m_arpReader) {
        m_arpReader = readProcArp;
    }
    if (!m_pinger) {
        m_pinger = icmpEcho;
    }
}

bool ConflictChecker::readProcArp(std::string& outTable) {
    std::ifstream file("/proc/net/arp");
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    outTable = buffer.str();
    return true;
}

std::set<std::string> ConflictChecker::parseArpTable(const std::string& table) {
    std::set<std::string> addresses;

    std::istringstream stream(table);
    std::string line;
    bool header = true;
    while (std::getline(stream, line)) {
        if (header) {
            header = false;
            if (line.find("IP address") != std::string::npos) continue;
        }

        std::istringstream fields(line);
        std::string ip, hwType, flags, mac;
        if (!(fields >> ip >> hwType >> flags >> mac)) continue;

        unsigned long flagBits = 0;
        try {
            flagBits = std::stoul(flags, nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }

        // ATF_COM
        if ((flagBits & 0x2) == 0) continue;
        if (mac == "00:00:00:00:00:00") continue;

        uint32_t addr = 0;
        if (!tv::Subnet::parseAddress(ip, addr)) continue;

        addresses.insert(ip);
    }

    return addresses;
}

bool ConflictChecker::icmpEcho(const std::string& ip, int timeoutMs) {
    struct sockaddr_in target;
    memset(&target, 0, sizeof(target));
    target.sin_family = AF_INET;
    if (inet_pton(AF_INET, ip.c_str(), &target.sin_addr) != 1) {
        return false;
    }

    bool raw = false;
    util::SocketHandle sock(::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP));
    if (!sock.valid()) {
        sock.reset(::socket(AF_INET, SOCK_RAW, IPPROTO_ICMP));
        raw = true;
    }
    if (!sock.valid()) {
        return false;
    }

    struct icmphdr request;
    memset(&request, 0, sizeof(request));
    request.type = ICMP_ECHO;
    request.code = 0;
    request.un.echo.id = htons(static_cast<uint16_t>(getpid() & 0xFFFF));
    request.un.echo.sequence = htons(1);
    request.checksum = icmpChecksum(&request, sizeof(request));

    if (sendto(sock.get(), &request, sizeof(request), 0,
               (struct sockaddr*)&target, sizeof(target)) < 0) {
        return false;
    }

    char buffer[512];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()
        ).count();
        if (remaining <= 0) {
            return false;
        }
        if (!util::waitReadable(sock.get(), static_cast<int>(remaining))) {
            return false;
        }

        struct sockaddr_in from;
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(sock.get(), buffer, sizeof(buffer), 0, (struct sockaddr*)&from, &fromLen);
        if (received <= 0) {
            continue;
        }
        if (from.sin_addr.s_addr != target.sin_addr.s_addr) {
            continue;
        }

        size_t offset = 0;
        if (raw) {
            const struct iphdr* ipHeader = reinterpret_cast<const struct iphdr*>(buffer);
            offset = static_cast<size_t>(ipHeader->ihl) * 4;
        }
        if (static_cast<size_t>(received) < offset + sizeof(struct icmphdr)) {
            continue;
        }

        const struct icmphdr* reply = reinterpret_cast<const struct icmphdr*>(buffer + offset);
        if (reply->type == ICMP_ECHOREPLY) {
            return true;
        }
    }
}

std::set<std::string> ConflictChecker::knownAddresses() {
    std::string table;
    if (!m_arpReader(table)) {
        m_log->debug("ConflictChecker: ARP table unavailable");
        return {};
    }
    return parseArpTable(table);
}

bool ConflictChecker::check(const std::string& ip) {
    std::set<std::string> known = knownAddresses();
    if (known.count(ip)) {
        m_log->warning("ConflictChecker: {} is already in the ARP table", ip);
        return true;
    }

    if (m_pinger(ip, PING_TIMEOUT_MS)) {
        m_log->warning("ConflictChecker: {} answered a ping", ip);
        return true;
    }

    m_log->debug("ConflictChecker: no conflict detected for {}", ip);
    return false;
}

std::optional<std::string> ConflictChecker::suggestAlternative(const std::string& localIp, const std::string& subnetCidr) {
    tv::Subnet subnet;
    std::string error;
    if (!tv::Subnet::parse(subnetCidr, subnet, error)) {
        m_log->error("ConflictChecker: {}", error);
        return std::nullopt;
    }

    uint32_t local = 0;
    if (!tv::Subnet::parseAddress(localIp, local)) {
        m_log->error("ConflictChecker: invalid local address '{}'", localIp);
        return std::nullopt;
    }

    uint32_t mask = subnet.getPrefix() == 0 ? 0 : 0xFFFFFFFFu << (32 - subnet.getPrefix());
    uint32_t broadcast = subnet.getNetwork() | ~mask;

    std::set<std::string> known = knownAddresses();

    for (int i = 1; i <= SUGGEST_WINDOW; i++) {
        uint32_t next = local + static_cast<uint32_t>(i);
        if (next < local) break;

        std::string candidate = tv::Subnet::formatAddress(next);
        if (!subnet.contains(candidate)) break;
        if (subnet.getPrefix() <= 30 && next == broadcast) break;
        if (known.count(candidate)) continue;
        if (m_pinger(candidate, PING_TIMEOUT_MS)) continue;

        m_log->info("ConflictChecker: suggesting free address {}", candidate);
        return candidate;
    }

    m_log->warning("ConflictChecker: no free address found after {}", localIp);
    return std::nullopt;
}
