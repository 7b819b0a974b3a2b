#ifndef TIZENCTL_DISCOVERY_ENGINE_HPP
#define TIZENCTL_DISCOVERY_ENGINE_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "models/tv_types.hpp"

class Logger;
class MulticastProbe;
class PortScanProbe;

// Runs the multicast probe and one port scan per subnet concurrently and merges
// their candidates by IP, multicast results first. All work runs as borealis
// tasks, so brls::Threading must be started before a run.
class DiscoveryEngine {
public:
    using ProgressCallback = std::function<void(const std::string& message, double fraction)>;
    using CompleteCallback = std::function<void(const std::vector<tv::Candidate>& candidates, const tv::TvError& error)>;

    DiscoveryEngine(MulticastProbe& multicastProbe, PortScanProbe& portScanProbe, Logger* logger);
    // Stops a run in progress and waits until its onComplete has returned
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

private:
    struct Run;

    MulticastProbe& m_multicastProbe;
    PortScanProbe& m_portScanProbe;
    Logger* m_log = nullptr;

    std::atomic<bool> m_busy{false};
    std::atomic<bool> m_keepRunning{false};
    std::mutex m_progressMutex;
    std::mutex m_runMutex;
    std::condition_variable m_runFinished;
    int m_runsInFlight = 0;

    void finishPart(const std::shared_ptr<Run>& run);

public:
    // Blocks until the run completes. Must not be called from a borealis task.
    // Fails with DiscoveryBusy when a run is already in progress on this engine.
    bool discover(const std::vector<std::string>& subnets,
                  std::vector<tv::Candidate>& outCandidates,
                  tv::TvError& outError,
                  ProgressCallback progress = nullptr);

    // Returns at once. onComplete is called from the borealis task that finishes
    // the run, or from the calling thread with DiscoveryBusy.
    void discoverAsync(const std::vector<std::string>& subnets,
                       ProgressCallback progress,
                       CompleteCallback onComplete);

    // Asks the running probes to wind down at their next check
    void stop();

    bool isRunning() const { return m_busy; }

    // Multicast candidates win over port-scan candidates for the same IP
    static std::vector<tv::Candidate> merge(const std::vector<tv::Candidate>& multicast,
                                            const std::vector<std::vector<tv::Candidate>>& scans);
};

#endif
