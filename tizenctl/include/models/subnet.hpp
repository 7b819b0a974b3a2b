#ifndef TIZENCTL_SUBNET_HPP
#define TIZENCTL_SUBNET_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace tv {

// IPv4 network/mask pair parsed from CIDR notation. Host bits in the input
// are masked off, so "192.168.1.17/24" describes 192.168.1.0/24.
class Subnet {
public:
    Subnet() = default;

    static bool parse(const std::string& cidr, Subnet& outSubnet, std::string& outError);

    // Usable host addresses in ascending order, at most `limit` of them.
    // Network and broadcast addresses are skipped unless the prefix is /31 or /32.
    std::vector<std::string> hosts(size_t limit) const;

    bool contains(const std::string& ip) const;

    uint32_t getNetwork() const { return m_network; }
    int getPrefix() const { return m_prefix; }
    std::string toString() const;

    // The /24 that contains `ip`, e.g. "10.1.2.3" -> "10.1.2.0/24"
    static std::string defaultFor(const std::string& ip);

    static bool parseAddress(const std::string& ip, uint32_t& outAddr);
    static std::string formatAddress(uint32_t addr);

private:
    uint32_t m_network = 0;  // host byte order
    int m_prefix = 32;

    uint32_t mask() const;
};

}

#endif
