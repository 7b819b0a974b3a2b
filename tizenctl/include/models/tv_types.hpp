#ifndef TIZENCTL_TV_TYPES_HPP
#define TIZENCTL_TV_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace tv {

constexpr int PLAIN_CONTROL_PORT = 8001;
constexpr int SECURE_CONTROL_PORT = 8002;
constexpr int LEGACY_CONTROL_PORT = 55000;

enum class TransportMethod {
    Websocket = 0,
    Legacy = 1
};

enum class DiscoverySource {
    Multicast = 0,
    PortScan = 1
};

enum class SessionState {
    Idle,
    Connecting,
    AwaitingAuth,
    Authorized,
    Closed,
    Failed
};

enum class ErrorKind {
    None,
    AccessDenied,       // Handshake rejected on plain and secure attempts
    UnhandledResponse,  // Handshake returned an unexpected event
    ConnectionClosed,   // Operation attempted with no open channel
    TransportError,     // Network failure opening, reading or writing
    DiscoveryBusy,      // Discovery already running on this engine
    UnsupportedMethod,  // Endpoint method the session cannot drive
    InvalidSubnet
};

enum class CommandOutcome {
    Ok,
    Failed,
    Retried
};

struct TvError {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool isError() const { return kind != ErrorKind::None; }
};

struct Endpoint {
    std::string host;
    int port = PLAIN_CONTROL_PORT;
    TransportMethod method = TransportMethod::Websocket;
    std::string displayName;
};

struct PairingCredential {
    std::optional<std::string> token;
    bool paired = false;

    bool hasToken() const { return token.has_value() && !token->empty(); }
};

struct Candidate {
    Endpoint endpoint;
    DiscoverySource discoverySource = DiscoverySource::PortScan;
    std::string model;
};

struct CommandResult {
    std::string key;
    int64_t timestamp = 0;  // unix epoch, milliseconds
    CommandOutcome outcome = CommandOutcome::Ok;
    std::optional<std::string> error;
    ErrorKind errorKind = ErrorKind::None;

    bool succeeded() const { return outcome != CommandOutcome::Failed; }
};

std::string toString(TransportMethod method);
std::string toString(DiscoverySource source);
std::string toString(SessionState state);
std::string toString(ErrorKind kind);
std::string toString(CommandOutcome outcome);

// Accepts "websocket" / "legacy" in any case; anything else is Websocket
TransportMethod methodFromString(const std::string& value);

int64_t nowMillis();

void to_json(nlohmann::json& j, const Endpoint& e);
void to_json(nlohmann::json& j, const Candidate& c);
void to_json(nlohmann::json& j, const CommandResult& r);
void from_json(const nlohmann::json& j, Endpoint& e);

}

#endif
