#include "core/port_scan_probe.hpp"
#include "core/logger.hpp"
#include "core/tv_identifier.hpp"
#include "util/net_util.hpp"
#include "util/task_queue.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

PortScanProbe::PortScanProbe(PortScanOptions options, TvIdentifier& identifier, Logger* logger,
                             PortChecker portChecker)
    : m_options(std::move(options)),
      m_identifier(identifier),
      m_log(Logger::orSilent(logger)),
      m_portChecker(std::move(portChecker)) {
    if (!m_portChecker) {
        m_portChecker = util::isTcpPortOpen;
    }
}

std::optional<tv::Candidate> PortScanProbe::probeHost(const std::string& ip) {
    for (int port : m_options.ports) {
        if (!m_portChecker(ip, port, m_options.connectTimeoutMs)) {
            continue;
        }

        m_log->debug("PortScanProbe: {}:{} is open", ip, port);
        auto candidate = m_identifier.identify(ip, port);
        if (candidate) {
            return candidate;
        }
    }
    return std::nullopt;
}

namespace {

struct ScanRun {
    std::vector<std::string> hosts;
    std::vector<std::optional<tv::Candidate>> slots;
    std::string subnet;
    std::mutex mutex;
    size_t remaining = 0;
    size_t checked = 0;
    PortScanProbe::ProgressCallback progress;
    PortScanProbe::CompleteCallback onComplete;
};

}

void PortScanProbe::scanAsync(const tv::Subnet& subnet,
                              const std::atomic<bool>& keepRunning,
                              ProgressCallback progress,
                              CompleteCallback onComplete) {
    auto run = std::make_shared<ScanRun>();
    run->hosts = subnet.hosts(m_options.hostCap);
    run->slots.resize(run->hosts.size());
    run->subnet = subnet.toString();
    run->remaining = run->hosts.size();
    run->progress = std::move(progress);
    run->onComplete = std::move(onComplete);

    if (run->hosts.empty()) {
        if (run->onComplete) run->onComplete({});
        return;
    }

    m_log->info("PortScanProbe: scanning {} hosts in {}", run->hosts.size(), run->subnet);

    auto queue = util::TaskQueue::create(m_options.workers);
    for (size_t index = 0; index < run->hosts.size(); index++) {
        queue->enqueue([this, run, index, &keepRunning]() {
            bool checked = false;
            if (keepRunning) {
                run->slots[index] = probeHost(run->hosts[index]);
                checked = true;
                if (m_options.interProbeDelayMs > 0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(m_options.interProbeDelayMs));
                }
            }

            bool last = false;
            {
                std::lock_guard<std::mutex> lock(run->mutex);
                if (checked) {
                    run->checked++;
                    if (run->progress) run->progress(run->checked, run->hosts.size());
                }
                last = --run->remaining == 0;
            }
            if (!last) return;

            std::vector<tv::Candidate> results;
            for (auto& slot : run->slots) {
                if (slot) results.push_back(std::move(*slot));
            }
            m_log->info("PortScanProbe: {} found {} TV(s)", run->subnet, results.size());
            if (run->onComplete) run->onComplete(std::move(results));
        });
    }
}

std::vector<tv::Candidate> PortScanProbe::scan(const tv::Subnet& subnet,
                                               const std::atomic<bool>& keepRunning,
                                               ProgressCallback progress) {
    std::vector<tv::Candidate> results;
    auto latch = std::make_shared<util::CompletionLatch>(1);

    scanAsync(subnet, keepRunning, std::move(progress), [&results, latch](std::vector<tv::Candidate> candidates) {
        results = std::move(candidates);
        latch->countDown();
    });

    latch->wait();
    return results;
}
