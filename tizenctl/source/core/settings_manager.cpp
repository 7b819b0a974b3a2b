#include "core/settings_manager.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sys/stat.h>

SettingsManager* SettingsManager::instance = nullptr;

SettingsManager::SettingsManager(std::string configPath, Logger* logger)
    : m_configPath(std::move(configPath)),
      m_log(Logger::orSilent(logger)) {
}

SettingsManager* SettingsManager::getInstance(Logger* logger) {
    if (instance == nullptr) {
        instance = new SettingsManager(defaultConfigPath(), logger);
        instance->ensureConfigDir();
        instance->parseFile();
    }
    return instance;
}

std::string SettingsManager::defaultConfigPath() {
    const char* home = std::getenv("HOME");
    std::string base = home ? home : ".";
    return base + CONFIG_DIR_SUFFIX + "/" + CONFIG_FILE_NAME;
}

bool SettingsManager::ensureConfigDir() {
    size_t slash = m_configPath.find_last_of('/');
    if (slash == std::string::npos || slash == 0) {
        return true;
    }

    std::string dir = m_configPath.substr(0, slash);
    for (size_t pos = 1; pos <= dir.size(); pos++) {
        if (pos != dir.size() && dir[pos] != '/') continue;

        std::string partial = dir.substr(0, pos);
        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            m_log->error("SettingsManager: failed to create {}: {}", partial, strerror(errno));
            return false;
        }
    }
    return true;
}

bool SettingsManager::fileExists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0);
}

void SettingsManager::parseFile() {
    if (fileExists(m_configPath)) {
        parseTomlFile();
    } else {
        m_log->debug("SettingsManager: no config at {}, using defaults", m_configPath);
    }
}

static tv::PairingCredential readCredential(const toml::table& table) {
    tv::PairingCredential credential;
    if (auto val = table["token"].value<std::string>()) {
        if (!val->empty()) credential.token = *val;
    }
    if (auto val = table["paired"].value<bool>())
        credential.paired = *val;
    return credential;
}

void SettingsManager::parseTomlFile() {
    try {
        auto config = toml::parse_file(m_configPath);

        if (auto val = config["host"].value<std::string>())
            m_host = *val;
        if (auto val = config["port"].value<int64_t>())
            m_port = static_cast<int>(*val);
        if (auto val = config["method"].value<std::string>())
            m_method = tv::methodFromString(*val);
        if (auto val = config["name"].value<std::string>())
            m_name = *val;
        if (auto val = config["timeout"].value<int64_t>())
            m_timeout = static_cast<int>(*val);

        if (auto* subnets = config["discovery_subnets"].as_array()) {
            m_discoverySubnets.clear();
            for (auto& node : *subnets) {
                if (auto val = node.value<std::string>())
                    m_discoverySubnets.push_back(*val);
            }
        }

        m_tokens.clear();
        if (!m_host.empty()) {
            tv::PairingCredential current = readCredential(config);
            if (current.paired || current.hasToken()) {
                m_tokens.put(m_host, current);
            }
        }

        for (auto& [key, value] : config) {
            if (!value.is_table()) continue;

            std::string keyStr(key.str());
            if (keyStr.rfind(TV_TABLE_PREFIX, 0) != 0) continue;

            std::string host = keyStr.substr(std::strlen(TV_TABLE_PREFIX));
            if (host.empty() || host == m_host) continue;

            m_tokens.put(host, readCredential(*value.as_table()));
        }

        m_log->debug("SettingsManager: loaded {} ({} paired TV(s))", m_configPath, m_tokens.all().size());
    } catch (const toml::parse_error& err) {
        m_log->error("SettingsManager: failed to parse {}: {}", m_configPath, std::string(err.description()));
    }
}

int SettingsManager::writeFile() {
    if (!ensureConfigDir()) {
        return -1;
    }

    toml::table config;

    if (!m_host.empty())
        config.insert("host", m_host);
    config.insert("port", m_port);
    config.insert("method", tv::toString(m_method));
    config.insert("name", m_name);
    config.insert("timeout", m_timeout);

    toml::array subnets;
    for (const auto& subnet : m_discoverySubnets) {
        subnets.push_back(subnet);
    }
    config.insert("discovery_subnets", subnets);

    for (const auto& [host, credential] : m_tokens.all()) {
        if (host == m_host) {
            if (credential.hasToken())
                config.insert("token", *credential.token);
            config.insert("paired", credential.paired);
            continue;
        }

        toml::table tvTable;
        if (credential.hasToken())
            tvTable.insert("token", *credential.token);
        tvTable.insert("paired", credential.paired);

        config.insert(TV_TABLE_PREFIX + host, tvTable);
    }

    std::ofstream configFile(m_configPath, std::ios::out | std::ios::trunc);
    if (!configFile.is_open()) {
        m_log->error("SettingsManager: failed to open {} for writing", m_configPath);
        return -1;
    }

    configFile << config;
    configFile.close();
    return 0;
}

std::string SettingsManager::getHost() const {
    return m_host;
}

void SettingsManager::setHost(const std::string& host) {
    m_host = host;
}

int SettingsManager::getPort() const {
    return m_port;
}

void SettingsManager::setPort(int port) {
    m_port = port;
}

tv::TransportMethod SettingsManager::getMethod() const {
    return m_method;
}

void SettingsManager::setMethod(tv::TransportMethod method) {
    m_method = method;
}

std::string SettingsManager::getName() const {
    return m_name;
}

void SettingsManager::setName(const std::string& name) {
    m_name = name;
}

int SettingsManager::getTimeout() const {
    return m_timeout;
}

void SettingsManager::setTimeout(int seconds) {
    if (seconds >= 0) {
        m_timeout = seconds;
    }
}

std::vector<std::string> SettingsManager::getDiscoverySubnets() const {
    return m_discoverySubnets;
}

void SettingsManager::setDiscoverySubnets(const std::vector<std::string>& subnets) {
    m_discoverySubnets = subnets;
}

tv::Endpoint SettingsManager::getEndpoint() const {
    tv::Endpoint endpoint;
    endpoint.host = m_host;
    endpoint.port = m_port;
    endpoint.method = m_method;
    endpoint.displayName = m_host.empty() ? "" : "Samsung TV (" + m_host + ")";
    return endpoint;
}
