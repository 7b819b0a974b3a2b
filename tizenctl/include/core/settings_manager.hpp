#ifndef TIZENCTL_SETTINGS_MANAGER_HPP
#define TIZENCTL_SETTINGS_MANAGER_HPP

#include <string>
#include <vector>

#include "core/token_store.hpp"
#include "models/tv_types.hpp"

class Logger;

// TOML configuration: the current TV, session options, discovery subnets and
// one pairing credential per TV.
class SettingsManager {
protected:
    static SettingsManager* instance;

private:
    std::string m_configPath;
    Logger* m_log = nullptr;

    std::string m_host;
    int m_port = tv::PLAIN_CONTROL_PORT;
    tv::TransportMethod m_method = tv::TransportMethod::Websocket;
    std::string m_name = "tizenctl";
    int m_timeout = 5;
    std::vector<std::string> m_discoverySubnets;

    TokenStore m_tokens;

    static constexpr const char* CONFIG_DIR_SUFFIX = "/.config/tizenctl";
    static constexpr const char* CONFIG_FILE_NAME = "config.toml";
    static constexpr const char* TV_TABLE_PREFIX = "tv_";

    void parseTomlFile();
    static bool fileExists(const std::string& path);

public:
    explicit SettingsManager(std::string configPath, Logger* logger = nullptr);

    SettingsManager(const SettingsManager&) = delete;
    void operator=(const SettingsManager&) = delete;

    // Process-wide settings at defaultConfigPath(), loaded on first use
    static SettingsManager* getInstance(Logger* logger = nullptr);
    static std::string defaultConfigPath();

    void parseFile();
    int writeFile();
    bool ensureConfigDir();

    const std::string& getConfigPath() const { return m_configPath; }

    std::string getHost() const;
    void setHost(const std::string& host);

    int getPort() const;
    void setPort(int port);

    tv::TransportMethod getMethod() const;
    void setMethod(tv::TransportMethod method);

    std::string getName() const;
    void setName(const std::string& name);

    // Seconds; 0 disables the limit
    int getTimeout() const;
    void setTimeout(int seconds);

    std::vector<std::string> getDiscoverySubnets() const;
    void setDiscoverySubnets(const std::vector<std::string>& subnets);

    // Endpoint for the configured host, empty host when none is set
    tv::Endpoint getEndpoint() const;

    TokenStore& getTokenStore() { return m_tokens; }
    const TokenStore& getTokenStore() const { return m_tokens; }
};

#endif
