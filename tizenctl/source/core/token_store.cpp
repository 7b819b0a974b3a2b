#include "core/token_store.hpp"

tv::PairingCredential TokenStore::get(const std::string& host) const {
    auto it = m_credentials.find(host);
    if (it == m_credentials.end()) {
        return tv::PairingCredential{};
    }
    return it->second;
}

void TokenStore::put(const std::string& host, const tv::PairingCredential& credential) {
    if (host.empty()) return;
    m_credentials[host] = credential;
}

void TokenStore::remove(const std::string& host) {
    m_credentials.erase(host);
}

void TokenStore::clear() {
    m_credentials.clear();
}

bool TokenStore::contains(const std::string& host) const {
    return m_credentials.find(host) != m_credentials.end();
}

std::vector<std::string> TokenStore::hosts() const {
    std::vector<std::string> result;
    result.reserve(m_credentials.size());
    for (const auto& [host, credential] : m_credentials) {
        result.push_back(host);
    }
    return result;
}
