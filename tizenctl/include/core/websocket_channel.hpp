#ifndef TIZENCTL_WEBSOCKET_CHANNEL_HPP
#define TIZENCTL_WEBSOCKET_CHANNEL_HPP

#include "core/connection_channel.hpp"

#include <curl/curl.h>

#include <functional>

class Logger;

// WebSocket control channel on top of libcurl's connect-only WebSocket mode.
// The secure variant skips certificate verification: TVs present self-signed
// certificates.
class CurlWebSocketChannel : public ConnectionChannel {
public:
    CurlWebSocketChannel(bool secure, Logger* logger);
    ~CurlWebSocketChannel() override;

    CurlWebSocketChannel(const CurlWebSocketChannel&) = delete;
    CurlWebSocketChannel& operator=(const CurlWebSocketChannel&) = delete;

    TransportStatus open(const std::string& url, int timeoutMs) override;
    TransportStatus receiveText(std::string& outMessage, int timeoutMs) override;
    TransportStatus sendText(const std::string& message) override;
    void close() override;

    bool isOpen() const override { return m_curl != nullptr; }
    bool isSecure() const override { return m_secure; }

    static ChannelFactory factory(Logger* logger);

    static TransportFault classify(CURLcode code);

    using SendChunk = std::function<CURLcode(const char* data, size_t size, size_t& sent)>;
    using WaitWritable = std::function<bool(int timeoutMs)>;

    // Pushes one text frame through sendChunk, continuing with the unsent
    // remainder after partial writes until timeoutMs runs out
    static TransportStatus writeFrame(const std::string& message, int timeoutMs,
                                      const SendChunk& sendChunk, const WaitWritable& waitWritable);

private:
    CURL* m_curl = nullptr;
    bool m_secure = false;
    Logger* m_log = nullptr;

    static constexpr size_t RECV_CHUNK = 4096;
    static constexpr int SEND_TIMEOUT_MS = 5000;

    bool waitSocket(bool forWrite, int timeoutMs);
};

#endif
