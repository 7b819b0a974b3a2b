#ifndef TIZENCTL_MULTICAST_PROBE_HPP
#define TIZENCTL_MULTICAST_PROBE_HPP

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "models/tv_types.hpp"

class Logger;

struct MulticastProbeOptions {
    int listenMs = 4000;
    int receiveTimeoutMs = 5000;
    int ttl = 2;
    // Where the M-SEARCH is sent; replies are read from any sender
    std::string groupAddress = "239.255.255.250";
    int groupPort = 1900;
};

// One SSDP M-SEARCH round on the local segment
class MulticastProbe {
public:
    MulticastProbe(MulticastProbeOptions options, Logger* logger);
    virtual ~MulticastProbe() = default;

    // Returns Samsung candidates, at most one per responding IP.
    // Stops early once keepRunning turns false.
    virtual std::vector<tv::Candidate> run(const std::atomic<bool>& keepRunning);

    // Parses one SSDP response. Returns nothing when the sender is not a Samsung TV.
    static std::optional<tv::Candidate> parseResponse(const std::string& data, const std::string& fromIp);

    static std::string buildSearchRequest();

private:
    MulticastProbeOptions m_options;
    Logger* m_log = nullptr;

    static constexpr const char* SSDP_ADDR = "239.255.255.250";
    static constexpr int SSDP_PORT = 1900;
    static constexpr int POLL_SLICE_MS = 250;
};

#endif
