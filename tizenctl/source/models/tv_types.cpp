#include "models/tv_types.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace tv {

static std::string safeGetString(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key)) return "";
    const auto& val = j[key];
    if (val.is_string()) return val.get<std::string>();
    if (val.is_number_integer()) return std::to_string(val.get<int64_t>());
    return "";
}

static int safeGetInt(const nlohmann::json& j, const std::string& key, int fallback) {
    if (!j.contains(key)) return fallback;
    const auto& val = j[key];
    if (val.is_number_integer()) return val.get<int>();
    if (val.is_string()) {
        try { return std::stoi(val.get<std::string>()); }
        catch (const std::exception&) { return fallback; }
    }
    return fallback;
}

std::string toString(TransportMethod method) {
    switch (method) {
        case TransportMethod::Websocket: return "websocket";
        case TransportMethod::Legacy: return "legacy";
    }
    return "websocket";
}

std::string toString(DiscoverySource source) {
    switch (source) {
        case DiscoverySource::Multicast: return "UPnP";
        case DiscoverySource::PortScan: return "PortScan";
    }
    return "PortScan";
}

std::string toString(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Connecting: return "Connecting";
        case SessionState::AwaitingAuth: return "AwaitingAuth";
        case SessionState::Authorized: return "Authorized";
        case SessionState::Closed: return "Closed";
        case SessionState::Failed: return "Failed";
    }
    return "Idle";
}

std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::AccessDenied: return "AccessDenied";
        case ErrorKind::UnhandledResponse: return "UnhandledResponse";
        case ErrorKind::ConnectionClosed: return "ConnectionClosed";
        case ErrorKind::TransportError: return "TransportError";
        case ErrorKind::DiscoveryBusy: return "DiscoveryBusy";
        case ErrorKind::UnsupportedMethod: return "UnsupportedMethod";
        case ErrorKind::InvalidSubnet: return "InvalidSubnet";
    }
    return "None";
}

std::string toString(CommandOutcome outcome) {
    switch (outcome) {
        case CommandOutcome::Ok: return "ok";
        case CommandOutcome::Failed: return "failed";
        case CommandOutcome::Retried: return "retried";
    }
    return "ok";
}

TransportMethod methodFromString(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "legacy") {
        return TransportMethod::Legacy;
    }
    return TransportMethod::Websocket;
}

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

void to_json(nlohmann::json& j, const Endpoint& e) {
    j = nlohmann::json{
        {"ip", e.host},
        {"port", e.port},
        {"method", toString(e.method)},
        {"name", e.displayName}
    };
}

void to_json(nlohmann::json& j, const Candidate& c) {
    to_json(j, c.endpoint);
    j["model"] = c.model;
    j["discovery_method"] = toString(c.discoverySource);
}

void to_json(nlohmann::json& j, const CommandResult& r) {
    j = nlohmann::json{
        {"command", r.key},
        {"timestamp", r.timestamp},
        {"success", r.succeeded()},
        {"retried", r.outcome == CommandOutcome::Retried}
    };
    if (r.error) {
        j["error"] = *r.error;
    }
}

void from_json(const nlohmann::json& j, Endpoint& e) {
    e.host = safeGetString(j, "ip");
    e.port = safeGetInt(j, "port", PLAIN_CONTROL_PORT);
    e.method = methodFromString(safeGetString(j, "method"));
    e.displayName = safeGetString(j, "name");
}

}
