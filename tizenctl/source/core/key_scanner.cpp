#include "core/key_scanner.hpp"
#include "core/logger.hpp"
#include "core/session_manager.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <thread>

KeyScanner::KeyScanner(SessionManager& session, Logger* logger, int pauseMs)
    : m_session(session),
      m_log(Logger::orSilent(logger)),
      m_pauseMs(pauseMs) {
}

KeyScanReport KeyScanner::scan(const std::vector<std::string>& keys, ProgressCallback progress) {
    KeyScanReport report;
    report.timestamp = tv::nowMillis();

    for (size_t i = 0; i < keys.size(); i++) {
        const std::string& key = keys[i];
        if (progress) {
            progress(key, i, keys.size());
        }

        tv::CommandResult result = m_session.send(key);
        if (result.succeeded()) {
            report.working.push_back(key);
        } else {
            report.failed.push_back(key);
        }

        // Session is gone, nothing further can succeed
        if (result.errorKind == tv::ErrorKind::ConnectionClosed) {
            m_log->warning("KeyScanner: session closed, marking {} remaining key(s) as failed", keys.size() - i - 1);
            for (size_t j = i + 1; j < keys.size(); j++) {
                report.failed.push_back(keys[j]);
            }
            break;
        }

        if (m_pauseMs > 0 && i + 1 < keys.size()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(m_pauseMs));
        }
    }

    m_log->info("KeyScanner: {} working, {} failed", report.working.size(), report.failed.size());
    return report;
}

bool KeyScanner::writeReport(const KeyScanReport& report, const std::string& path, std::string& outError) {
    nlohmann::json json;
    json["working"] = report.working;
    json["failed"] = report.failed;
    json["timestamp"] = report.timestamp;

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        outError = "Failed to open " + path + " for writing";
        return false;
    }

    file << json.dump(2) << std::endl;
    if (!file.good()) {
        outError = "Failed to write " + path;
        return false;
    }
    return true;
}
