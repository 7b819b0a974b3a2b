#include "core/websocket_channel.hpp"
#include "core/logger.hpp"

#include <curl/websockets.h>
#include <poll.h>

#include <algorithm>
#include <chrono>

// curl 8.0 made the frame metadata pointer const
#if LIBCURL_VERSION_NUM >= 0x080000
using WsFramePtr = const struct curl_ws_frame*;
#else
using WsFramePtr = struct curl_ws_frame*;
#endif

using Clock = std::chrono::steady_clock;

static int remainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

CurlWebSocketChannel::CurlWebSocketChannel(bool secure, Logger* logger)
    : m_secure(secure), m_log(Logger::orSilent(logger)) {
}

CurlWebSocketChannel::~CurlWebSocketChannel() {
    close();
}

ChannelFactory CurlWebSocketChannel::factory(Logger* logger) {
    return [logger](bool secure) -> std::unique_ptr<ConnectionChannel> {
        return std::make_unique<CurlWebSocketChannel>(secure, logger);
    };
}

TransportFault CurlWebSocketChannel::classify(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return TransportFault::None;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return TransportFault::Resolve;
        case CURLE_COULDNT_CONNECT:
            return TransportFault::Connect;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportFault::Timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
            return TransportFault::Tls;
        case CURLE_SEND_ERROR:
            return TransportFault::Send;
        case CURLE_RECV_ERROR:
            return TransportFault::Receive;
        case CURLE_GOT_NOTHING:
            return TransportFault::PeerClosed;
        default:
            return TransportFault::Protocol;
    }
}

TransportStatus CurlWebSocketChannel::open(const std::string& url, int timeoutMs) {
    close();

    m_curl = curl_easy_init();
    if (!m_curl) {
        return TransportStatus::failure(TransportFault::Connect, "Failed to init curl");
    }

    curl_easy_setopt(m_curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(m_curl, CURLOPT_CONNECT_ONLY, 2L);
    if (timeoutMs > 0) {
        curl_easy_setopt(m_curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeoutMs));
    }
    if (m_secure) {
        curl_easy_setopt(m_curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(m_curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    curl_easy_setopt(m_curl, CURLOPT_FORBID_REUSE, 1L);
    curl_easy_setopt(m_curl, CURLOPT_FRESH_CONNECT, 1L);

    CURLcode res = curl_easy_perform(m_curl);
    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(m_curl);
        m_curl = nullptr;
        return TransportStatus::failure(classify(res), error);
    }

    long httpCode = 0;
    curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &httpCode);
    if (httpCode != 0 && httpCode != 101) {
        curl_easy_cleanup(m_curl);
        m_curl = nullptr;
        return TransportStatus::failure(TransportFault::Protocol,
                                        "WebSocket upgrade refused (HTTP " + std::to_string(httpCode) + ")");
    }

    m_log->debug("CurlWebSocketChannel: opened {}", url);
    return TransportStatus::success();
}

bool CurlWebSocketChannel::waitSocket(bool forWrite, int timeoutMs) {
    curl_socket_t sockfd = CURL_SOCKET_BAD;
    if (curl_easy_getinfo(m_curl, CURLINFO_ACTIVESOCKET, &sockfd) != CURLE_OK || sockfd == CURL_SOCKET_BAD) {
        return false;
    }

    struct pollfd pfd;
    pfd.fd = sockfd;
    pfd.events = forWrite ? POLLOUT : POLLIN;
    pfd.revents = 0;

    return ::poll(&pfd, 1, timeoutMs) > 0;
}

TransportStatus CurlWebSocketChannel::receiveText(std::string& outMessage, int timeoutMs) {
    if (!m_curl) {
        return TransportStatus::failure(TransportFault::PeerClosed, "Channel is not open");
    }

    outMessage.clear();
    Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
    char buffer[RECV_CHUNK];

    while (true) {
        size_t received = 0;
        WsFramePtr meta = nullptr;
        CURLcode res = curl_ws_recv(m_curl, buffer, sizeof(buffer), &received, &meta);

        if (res == CURLE_AGAIN) {
            int wait = timeoutMs > 0 ? remainingMs(deadline) : -1;
            if (wait == 0 || !waitSocket(false, wait)) {
                return TransportStatus::failure(TransportFault::Timeout, "Timed out waiting for a message");
            }
            continue;
        }

        if (res != CURLE_OK) {
            TransportFault fault = classify(res);
            if (fault == TransportFault::Protocol) {
                fault = TransportFault::Receive;
            }
            return TransportStatus::failure(fault, curl_easy_strerror(res));
        }

        if (!meta) {
            continue;
        }

        if (meta->flags & CURLWS_CLOSE) {
            close();
            return TransportStatus::failure(TransportFault::PeerClosed, "Peer closed the channel");
        }

        if (meta->flags & CURLWS_PING) {
            continue;
        }

        outMessage.append(buffer, received);

        if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
            return TransportStatus::success();
        }
    }
}

TransportStatus CurlWebSocketChannel::writeFrame(const std::string& message, int timeoutMs,
                                                 const SendChunk& sendChunk, const WaitWritable& waitWritable) {
    Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
    size_t offset = 0;

    while (true) {
        size_t sent = 0;
        CURLcode res = sendChunk(message.data() + offset, message.size() - offset, sent);

        if (res != CURLE_OK && res != CURLE_AGAIN) {
            TransportFault fault = classify(res);
            if (fault == TransportFault::Protocol) {
                fault = TransportFault::Send;
            }
            return TransportStatus::failure(fault, curl_easy_strerror(res));
        }

        offset += std::min(sent, message.size() - offset);
        if (res == CURLE_OK && offset == message.size()) {
            return TransportStatus::success();
        }

        int wait = remainingMs(deadline);
        if (wait == 0 || !waitWritable(wait)) {
            return TransportStatus::failure(TransportFault::Timeout,
                                            "Timed out writing to channel (" + std::to_string(offset) + "/" +
                                            std::to_string(message.size()) + " bytes)");
        }
    }
}

TransportStatus CurlWebSocketChannel::sendText(const std::string& message) {
    if (!m_curl) {
        return TransportStatus::failure(TransportFault::PeerClosed, "Channel is not open");
    }

    return writeFrame(message, SEND_TIMEOUT_MS,
        [this](const char* data, size_t size, size_t& sent) {
            return curl_ws_send(m_curl, data, size, &sent, 0, CURLWS_TEXT);
        },
        [this](int timeoutMs) {
            return waitSocket(true, timeoutMs);
        });
}

void CurlWebSocketChannel::close() {
    if (m_curl) {
        size_t sent = 0;
        CURLcode res = curl_ws_send(m_curl, "", 0, &sent, 0, CURLWS_CLOSE);
        if (res != CURLE_OK) {
            m_log->debug("CurlWebSocketChannel: close frame not sent: {}", curl_easy_strerror(res));
        }
        curl_easy_cleanup(m_curl);
        m_curl = nullptr;
        m_log->debug("CurlWebSocketChannel: closed");
    }
}
