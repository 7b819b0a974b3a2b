#ifndef TIZENCTL_TOKEN_STORE_HPP
#define TIZENCTL_TOKEN_STORE_HPP

#include <map>
#include <string>
#include <vector>

#include "models/tv_types.hpp"

// Pairing credentials keyed by TV host. Loaded and written by SettingsManager.
class TokenStore {
public:
    tv::PairingCredential get(const std::string& host) const;
    void put(const std::string& host, const tv::PairingCredential& credential);
    void remove(const std::string& host);
    void clear();

    bool contains(const std::string& host) const;
    std::vector<std::string> hosts() const;

    const std::map<std::string, tv::PairingCredential>& all() const { return m_credentials; }

private:
    std::map<std::string, tv::PairingCredential> m_credentials;
};

#endif
