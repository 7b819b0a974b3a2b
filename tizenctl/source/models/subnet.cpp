#include "models/subnet.hpp"

#include <arpa/inet.h>

namespace tv {

bool Subnet::parseAddress(const std::string& ip, uint32_t& outAddr) {
    struct in_addr addr;
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
        return false;
    }
    outAddr = ntohl(addr.s_addr);
    return true;
}

std::string Subnet::formatAddress(uint32_t addr) {
    struct in_addr in;
    in.s_addr = htonl(addr);
    char buffer[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &in, buffer, sizeof(buffer))) {
        return "";
    }
    return buffer;
}

bool Subnet::parse(const std::string& cidr, Subnet& outSubnet, std::string& outError) {
    std::string address = cidr;
    int prefix = 32;

    size_t slash = cidr.find('/');
    if (slash != std::string::npos) {
        address = cidr.substr(0, slash);
        std::string prefixStr = cidr.substr(slash + 1);
        if (prefixStr.empty() || prefixStr.size() > 2 ||
            prefixStr.find_first_not_of("0123456789") != std::string::npos) {
            outError = "Invalid prefix length in '" + cidr + "'";
            return false;
        }
        prefix = std::stoi(prefixStr);
        if (prefix > 32) {
            outError = "Prefix length out of range in '" + cidr + "'";
            return false;
        }
    }

    uint32_t addr = 0;
    if (!parseAddress(address, addr)) {
        outError = "Invalid IPv4 address in '" + cidr + "'";
        return false;
    }

    outSubnet.m_prefix = prefix;
    outSubnet.m_network = addr & outSubnet.mask();
    return true;
}

uint32_t Subnet::mask() const {
    if (m_prefix == 0) return 0;
    return 0xFFFFFFFFu << (32 - m_prefix);
}

std::vector<std::string> Subnet::hosts(size_t limit) const {
    std::vector<std::string> result;
    if (limit == 0) return result;

    uint64_t first = m_network;
    uint64_t last = static_cast<uint64_t>(m_network) | (~mask() & 0xFFFFFFFFu);

    if (m_prefix <= 30) {
        first += 1;
        last -= 1;
    }

    for (uint64_t addr = first; addr <= last && result.size() < limit; addr++) {
        result.push_back(formatAddress(static_cast<uint32_t>(addr)));
    }
    return result;
}

bool Subnet::contains(const std::string& ip) const {
    uint32_t addr = 0;
    if (!parseAddress(ip, addr)) return false;
    return (addr & mask()) == m_network;
}

std::string Subnet::toString() const {
    return formatAddress(m_network) + "/" + std::to_string(m_prefix);
}

std::string Subnet::defaultFor(const std::string& ip) {
    uint32_t addr = 0;
    if (!parseAddress(ip, addr)) {
        return "192.168.1.0/24";
    }
    return formatAddress(addr & 0xFFFFFF00u) + "/24";
}

}
