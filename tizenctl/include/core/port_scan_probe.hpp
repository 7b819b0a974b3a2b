#ifndef TIZENCTL_PORT_SCAN_PROBE_HPP
#define TIZENCTL_PORT_SCAN_PROBE_HPP

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "models/subnet.hpp"
#include "models/tv_types.hpp"

class Logger;
class TvIdentifier;

struct PortScanOptions {
    size_t hostCap = 50;
    int connectTimeoutMs = 500;
    int interProbeDelayMs = 10;
    int workers = 8;
    std::vector<int> ports = {tv::PLAIN_CONTROL_PORT, tv::LEGACY_CONTROL_PORT};
};

// Sweeps the first hosts of a subnet for open control ports. Hosts are
// checked as borealis tasks, at most `workers` of them at a time.
class PortScanProbe {
public:
    using PortChecker = std::function<bool(const std::string& ip, int port, int timeoutMs)>;
    using ProgressCallback = std::function<void(size_t done, size_t total)>;
    using CompleteCallback = std::function<void(std::vector<tv::Candidate> candidates)>;

    PortScanProbe(PortScanOptions options, TvIdentifier& identifier, Logger* logger,
                  PortChecker portChecker = nullptr);
    virtual ~PortScanProbe() = default;

    // Returns at once. onComplete runs on the task that finishes last, or on the
    // calling thread when the subnet has no hosts. Results are in subnet address
    // order. keepRunning and this probe must outlive the scan.
    virtual void scanAsync(const tv::Subnet& subnet,
                           const std::atomic<bool>& keepRunning,
                           ProgressCallback progress,
                           CompleteCallback onComplete);

    // Blocks until every host was checked or keepRunning turned false.
    // Must not be called from a borealis task.
    std::vector<tv::Candidate> scan(const tv::Subnet& subnet,
                                    const std::atomic<bool>& keepRunning,
                                    ProgressCallback progress = nullptr);

    const PortScanOptions& getOptions() const { return m_options; }

private:
    PortScanOptions m_options;
    TvIdentifier& m_identifier;
    Logger* m_log = nullptr;
    PortChecker m_portChecker;

    std::optional<tv::Candidate> probeHost(const std::string& ip);
};

#endif
