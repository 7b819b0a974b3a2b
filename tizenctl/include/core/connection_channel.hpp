#ifndef TIZENCTL_CONNECTION_CHANNEL_HPP
#define TIZENCTL_CONNECTION_CHANNEL_HPP

#include <functional>
#include <memory>
#include <string>

// Where a transport operation failed. Assigned at the failure site so that
// callers dispatch on the tag instead of the error text.
enum class TransportFault {
    None,
    Resolve,     // Host name could not be resolved
    Connect,     // TCP connect refused or unreachable
    Timeout,     // Connect, read or write exceeded its timeout
    Tls,         // TLS handshake failed on the secure channel
    Send,        // Write on an established channel failed
    Receive,     // Read on an established channel failed
    PeerClosed,  // Peer closed the channel
    Protocol     // Upgrade refused or malformed framing
};

std::string toString(TransportFault fault);

struct TransportStatus {
    TransportFault fault = TransportFault::None;
    std::string message;

    bool ok() const { return fault == TransportFault::None; }

    static TransportStatus success() { return {}; }
    static TransportStatus failure(TransportFault fault, const std::string& message) {
        return {fault, message};
    }
};

// One physical control connection to a TV. Implementations own their socket
// and are never shared between threads.
class ConnectionChannel {
public:
    virtual ~ConnectionChannel() = default;

    virtual TransportStatus open(const std::string& url, int timeoutMs) = 0;

    // Reads one complete text message
    virtual TransportStatus receiveText(std::string& outMessage, int timeoutMs) = 0;

    virtual TransportStatus sendText(const std::string& message) = 0;

    // Safe to call repeatedly
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
    virtual bool isSecure() const = 0;
};

// Creates a plain (secure == false) or secure channel
using ChannelFactory = std::function<std::unique_ptr<ConnectionChannel>(bool secure)>;

#endif
