#ifndef TIZENCTL_CONFLICT_CHECKER_HPP
#define TIZENCTL_CONFLICT_CHECKER_HPP

#include <functional>
#include <optional>
#include <set>
#include <string>

class Logger;

// Advisory check that an address is not already claimed on the local network
class ConflictChecker {
public:
    // Returns false when the table could not be read
    using ArpReader = std::function<bool(std::string& outTable)>;
    // Returns true when the host answered an echo request within timeoutMs
    using Pinger = std::function<bool(const std::string& ip, int timeoutMs)>;

    explicit ConflictChecker(Logger* logger, ArpReader arpReader = nullptr, Pinger pinger = nullptr);

    // true when the address appears in the ARP table or answers a ping
    bool check(const std::string& ip);

    // First address after localIp inside subnetCidr that is neither in the
    // ARP table nor answering pings. Looks at most SUGGEST_WINDOW addresses.
    std::optional<std::string> suggestAlternative(const std::string& localIp, const std::string& subnetCidr);

    // Addresses of complete entries with a hardware address in /proc/net/arp format
    static std::set<std::string> parseArpTable(const std::string& table);

    static bool readProcArp(std::string& outTable);
    static bool icmpEcho(const std::string& ip, int timeoutMs);

    static constexpr int PING_TIMEOUT_MS = 1000;
    static constexpr int SUGGEST_WINDOW = 20;

private:
    Logger* m_log = nullptr;
    ArpReader m_arpReader;
    Pinger m_pinger;

    std::set<std::string> knownAddresses();
};

#endif
