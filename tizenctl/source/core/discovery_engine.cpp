#include "core/discovery_engine.hpp"
#include "core/logger.hpp"
#include "core/multicast_probe.hpp"
#include "core/port_scan_probe.hpp"
#include "models/subnet.hpp"
#include "util/task_queue.hpp"

#include <borealis.hpp>

#include <set>

DiscoveryEngine::DiscoveryEngine(MulticastProbe& multicastProbe, PortScanProbe& portScanProbe, Logger* logger)
    : m_multicastProbe(multicastProbe),
      m_portScanProbe(portScanProbe),
      m_log(Logger::orSilent(logger)) {
}

struct DiscoveryEngine::Run {
    std::mutex mutex;
    size_t pending = 0;
    std::vector<tv::Candidate> multicast;
    std::vector<std::vector<tv::Candidate>> scans;
    CompleteCallback onComplete;
};

DiscoveryEngine::~DiscoveryEngine() {
    stop();
    std::unique_lock<std::mutex> lock(m_runMutex);
    m_runFinished.wait(lock, [this]() { return m_runsInFlight == 0; });
}

void DiscoveryEngine::stop() {
    m_keepRunning = false;
}

std::vector<tv::Candidate> DiscoveryEngine::merge(const std::vector<tv::Candidate>& multicast,
                                                  const std::vector<std::vector<tv::Candidate>>& scans) {
    std::vector<tv::Candidate> merged;
    std::set<std::string> seen;

    for (const auto& candidate : multicast) {
        if (seen.insert(candidate.endpoint.host).second) {
            merged.push_back(candidate);
        }
    }

    for (const auto& scan : scans) {
        for (const auto& candidate : scan) {
            if (seen.insert(candidate.endpoint.host).second) {
                merged.push_back(candidate);
            }
        }
    }

    return merged;
}

void DiscoveryEngine::finishPart(const std::shared_ptr<Run>& run) {
    {
        std::lock_guard<std::mutex> lock(run->mutex);
        if (--run->pending > 0) return;
    }

    std::vector<tv::Candidate> candidates = merge(run->multicast, run->scans);
    m_log->info("DiscoveryEngine: discovery finished, {} TV(s) found", candidates.size());

    CompleteCallback onComplete = std::move(run->onComplete);
    m_keepRunning = false;
    m_busy = false;

    if (onComplete) {
        onComplete(candidates, tv::TvError{});
    }

    // Last touch of the engine; the destructor may proceed once this unlocks
    std::lock_guard<std::mutex> lock(m_runMutex);
    m_runsInFlight--;
    m_runFinished.notify_all();
}

void DiscoveryEngine::discoverAsync(const std::vector<std::string>& subnets,
                                    ProgressCallback progress,
                                    CompleteCallback onComplete) {
    bool expected = false;
    if (!m_busy.compare_exchange_strong(expected, true)) {
        tv::TvError error;
        error.kind = tv::ErrorKind::DiscoveryBusy;
        error.message = "Discovery already in progress";
        m_log->warning("DiscoveryEngine: {}", error.message);
        if (onComplete) onComplete({}, error);
        return;
    }

    std::vector<tv::Subnet> parsed;
    for (const auto& cidr : subnets) {
        tv::Subnet subnet;
        std::string error;
        if (!tv::Subnet::parse(cidr, subnet, error)) {
            m_log->warning("DiscoveryEngine: skipping subnet '{}': {}", cidr, error);
            continue;
        }
        parsed.push_back(subnet);
    }

    {
        std::lock_guard<std::mutex> lock(m_runMutex);
        m_runsInFlight++;
    }
    m_keepRunning = true;
    m_log->info("DiscoveryEngine: starting discovery over {} subnet(s)", parsed.size());

    auto run = std::make_shared<Run>();
    run->pending = parsed.size() + 1;
    run->scans.resize(parsed.size());
    run->onComplete = std::move(onComplete);

    brls::async([this, run]() {
        std::vector<tv::Candidate> found = m_multicastProbe.run(m_keepRunning);
        {
            std::lock_guard<std::mutex> lock(run->mutex);
            run->multicast = std::move(found);
        }
        finishPart(run);
    });

    for (size_t i = 0; i < parsed.size(); i++) {
        const std::string message = "scanning subnet " + parsed[i].toString();
        auto scanProgress = [this, message, progress](size_t done, size_t total) {
            if (!progress || total == 0) return;
            std::lock_guard<std::mutex> lock(m_progressMutex);
            progress(message, static_cast<double>(done) / static_cast<double>(total));
        };

        m_portScanProbe.scanAsync(parsed[i], m_keepRunning, scanProgress,
                                  [this, run, i](std::vector<tv::Candidate> found) {
            {
                std::lock_guard<std::mutex> lock(run->mutex);
                run->scans[i] = std::move(found);
            }
            finishPart(run);
        });
    }
}

bool DiscoveryEngine::discover(const std::vector<std::string>& subnets,
                               std::vector<tv::Candidate>& outCandidates,
                               tv::TvError& outError,
                               ProgressCallback progress) {
    auto latch = std::make_shared<util::CompletionLatch>(1);
    discoverAsync(subnets, std::move(progress),
                  [&outCandidates, &outError, latch](const std::vector<tv::Candidate>& candidates,
                                                     const tv::TvError& error) {
        outCandidates = candidates;
        outError = error;
        latch->countDown();
    });

    latch->wait();
    return !outError.isError();
}
