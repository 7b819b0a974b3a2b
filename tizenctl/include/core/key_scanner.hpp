#ifndef TIZENCTL_KEY_SCANNER_HPP
#define TIZENCTL_KEY_SCANNER_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

class Logger;
class SessionManager;

struct KeyScanReport {
    std::vector<std::string> working;
    std::vector<std::string> failed;
    int64_t timestamp = 0;
};

// Sends each key of a list through an authorized session and records which
// ones the TV accepted.
class KeyScanner {
public:
    using ProgressCallback = std::function<void(const std::string& key, size_t index, size_t total)>;

    KeyScanner(SessionManager& session, Logger* logger, int pauseMs = DEFAULT_PAUSE_MS);

    KeyScanReport scan(const std::vector<std::string>& keys, ProgressCallback progress = nullptr);

    static bool writeReport(const KeyScanReport& report, const std::string& path, std::string& outError);

    static constexpr int DEFAULT_PAUSE_MS = 100;

private:
    SessionManager& m_session;
    Logger* m_log = nullptr;
    int m_pauseMs;
};

#endif
