#include "core/session_manager.hpp"
#include "core/logger.hpp"
#include "util/encoding.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <thread>

SessionManager::SessionManager(SessionOptions options, ChannelFactory channelFactory, Logger* logger)
    : m_options(std::move(options)),
      m_channelFactory(std::move(channelFactory)),
      m_log(Logger::orSilent(logger)) {
}

SessionManager::~SessionManager() {
    close();
}

std::string SessionManager::buildUrl(const std::string& host, int port, bool secure,
                                     const std::string& clientName,
                                     const std::optional<std::string>& token) {
    std::string url = secure ? "wss://" : "ws://";
    url += host + ":" + std::to_string(port) + HANDSHAKE_PATH;
    url += "?name=" + util::base64Encode(clientName);
    if (token && !token->empty()) {
        url += "&token=" + *token;
    }
    return url;
}

std::string SessionManager::buildCommandPayload(const std::string& key) {
    nlohmann::json payload = {
        {"method", "ms.remote.control"},
        {"params", {
            {"Cmd", "Click"},
            {"DataOfCmd", key},
            {"Option", "false"},
            {"TypeOfRemote", "SendRemoteKey"}
        }}
    };
    return payload.dump();
}

SessionManager::HandshakeReply SessionManager::parseEvent(const std::string& message) {
    HandshakeReply reply;
    reply.raw = message;

    try {
        auto json = nlohmann::json::parse(message);
        if (!json.is_object() || !json.contains("event") || !json["event"].is_string()) {
            return reply;
        }

        std::string event = json["event"].get<std::string>();
        if (event == EVENT_UNAUTHORIZED) {
            reply.kind = EventKind::Unauthorized;
        } else if (event == EVENT_CONNECT) {
            reply.kind = EventKind::Connect;
            if (json.contains("data") && json["data"].is_object() && json["data"].contains("token")) {
                const auto& token = json["data"]["token"];
                if (token.is_string()) {
                    reply.token = token.get<std::string>();
                } else if (token.is_number_integer()) {
                    reply.token = std::to_string(token.get<int64_t>());
                }
            }
        }
    } catch (const std::exception&) {
        reply.kind = EventKind::Other;
    }

    return reply;
}

void SessionManager::releaseChannel() {
    if (m_channel) {
        m_channel->close();
        m_channel.reset();
    }
}

void SessionManager::fail(tv::TvError& outError, tv::ErrorKind kind, const std::string& message) {
    releaseChannel();
    m_state = tv::SessionState::Failed;
    outError.kind = kind;
    outError.message = message;
    m_log->error("SessionManager: {} ({})", message, tv::toString(kind));
}

bool SessionManager::openAndReadEvent(const std::string& host, int port, bool secure,
                                      const tv::PairingCredential& credential,
                                      HandshakeReply& outReply, tv::TvError& outError) {
    releaseChannel();
    m_state = tv::SessionState::Connecting;

    m_channel = m_channelFactory ? m_channelFactory(secure) : nullptr;
    if (!m_channel) {
        fail(outError, tv::ErrorKind::TransportError, "No channel available");
        return false;
    }

    std::string url = buildUrl(host, port, secure, m_options.clientName, credential.token);
    m_log->info("SessionManager: connecting to {}://{}:{}", secure ? "wss" : "ws", host, port);

    TransportStatus status = m_channel->open(url, m_options.timeoutMs);
    if (!status.ok()) {
        fail(outError, tv::ErrorKind::TransportError,
             "Failed to open channel to " + host + ":" + std::to_string(port) +
             " [" + toString(status.fault) + "] " + status.message);
        return false;
    }

    m_state = tv::SessionState::AwaitingAuth;

    std::string message;
    status = m_channel->receiveText(message, m_options.timeoutMs);
    if (!status.ok()) {
        fail(outError, tv::ErrorKind::TransportError,
             "Failed to read handshake from " + host +
             " [" + toString(status.fault) + "] " + status.message);
        return false;
    }

    outReply = parseEvent(message);
    return true;
}

bool SessionManager::establish(const tv::Endpoint& endpoint, tv::PairingCredential& credential, tv::TvError& outError) {
    bool secure = credential.paired && credential.hasToken();
    int port = secure ? tv::SECURE_CONTROL_PORT
                      : (endpoint.port > 0 ? endpoint.port : tv::PLAIN_CONTROL_PORT);

    HandshakeReply reply;
    if (!openAndReadEvent(endpoint.host, port, secure, credential, reply, outError)) {
        return false;
    }

    if (reply.kind == EventKind::Unauthorized) {
        if (secure) {
            fail(outError, tv::ErrorKind::AccessDenied, "Access denied by " + endpoint.host);
            return false;
        }

        m_log->debug("SessionManager: plain handshake unauthorized, trying secure port {}", tv::SECURE_CONTROL_PORT);
        if (!openAndReadEvent(endpoint.host, tv::SECURE_CONTROL_PORT, true, credential, reply, outError)) {
            return false;
        }
        if (reply.kind != EventKind::Connect) {
            fail(outError, tv::ErrorKind::AccessDenied, "Access denied by " + endpoint.host);
            return false;
        }
    } else if (reply.kind != EventKind::Connect) {
        fail(outError, tv::ErrorKind::UnhandledResponse, "Unhandled handshake response: " + reply.raw);
        return false;
    }

    if (reply.token) {
        credential.token = reply.token;
        m_log->debug("SessionManager: token received from {}", endpoint.host);
    }
    credential.paired = true;

    m_state = tv::SessionState::Authorized;
    m_log->info("SessionManager: authorized by {} over {}", endpoint.host, m_channel->isSecure() ? "wss" : "ws");
    return true;
}

void SessionManager::adoptCredential(const tv::PairingCredential& credential) {
    m_credential = credential;
    if (m_onCredentialUpdated) {
        m_onCredentialUpdated(m_endpoint.host, m_credential);
    }
}

bool SessionManager::connect(const tv::Endpoint& endpoint, tv::PairingCredential& credential, tv::TvError& outError) {
    m_endpoint = endpoint;
    m_credential = credential;

    if (endpoint.method != tv::TransportMethod::Websocket) {
        fail(outError, tv::ErrorKind::UnsupportedMethod,
             "Transport method '" + tv::toString(endpoint.method) + "' is not supported");
        return false;
    }

    tv::PairingCredential working = credential;
    if (!establish(endpoint, working, outError)) {
        return false;
    }

    credential = working;
    adoptCredential(working);
    return true;
}

bool SessionManager::isAuthorized() const {
    return m_state == tv::SessionState::Authorized && m_channel && m_channel->isOpen();
}

void SessionManager::waitKeyInterval() const {
    if (m_options.keyIntervalMs > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(m_options.keyIntervalMs));
    }
}

tv::CommandResult SessionManager::finish(tv::CommandResult result) {
    m_history.record(result);
    return result;
}

tv::CommandResult SessionManager::send(const std::string& key) {
    tv::CommandResult result;
    result.key = key;
    result.timestamp = tv::nowMillis();

    if (!isAuthorized()) {
        m_log->warning("SessionManager: attempted to send {} without a connection", key);
        result.outcome = tv::CommandOutcome::Failed;
        result.errorKind = tv::ErrorKind::ConnectionClosed;
        result.error = "Connection closed";
        return finish(result);
    }

    std::string payload = buildCommandPayload(key);
    m_log->info("SessionManager: sending control command: {}", key);

    TransportStatus status = m_channel->sendText(payload);
    if (status.ok()) {
        waitKeyInterval();
        result.outcome = tv::CommandOutcome::Ok;
        return finish(result);
    }

    std::string originalError = "[" + toString(status.fault) + "] " + status.message;
    m_log->warning("SessionManager: failed to send {} {}, reconnecting", key, originalError);

    tv::PairingCredential credential = m_credential;
    tv::TvError reconnectError;
    if (!establish(m_endpoint, credential, reconnectError)) {
        m_log->error("SessionManager: reconnect failed: {}", reconnectError.message);
        result.outcome = tv::CommandOutcome::Failed;
        result.errorKind = tv::ErrorKind::TransportError;
        result.error = originalError;
        return finish(result);
    }
    adoptCredential(credential);

    m_log->info("SessionManager: retrying command after reconnection: {}", key);
    status = m_channel->sendText(payload);
    if (!status.ok()) {
        std::string retryError = "[" + toString(status.fault) + "] " + status.message;
        m_log->error("SessionManager: failed to send {} even after reconnection {}", key, retryError);
        result.outcome = tv::CommandOutcome::Failed;
        result.errorKind = tv::ErrorKind::TransportError;
        result.error = retryError;
        return finish(result);
    }

    waitKeyInterval();
    result.outcome = tv::CommandOutcome::Retried;
    return finish(result);
}

void SessionManager::close() {
    if (m_channel) {
        m_log->debug("SessionManager: closing connection to {}", m_endpoint.host);
    }
    releaseChannel();
    m_state = tv::SessionState::Closed;
}
