#include "core/connection_channel.hpp"

std::string toString(TransportFault fault) {
    switch (fault) {
        case TransportFault::None: return "none";
        case TransportFault::Resolve: return "resolve";
        case TransportFault::Connect: return "connect";
        case TransportFault::Timeout: return "timeout";
        case TransportFault::Tls: return "tls";
        case TransportFault::Send: return "send";
        case TransportFault::Receive: return "receive";
        case TransportFault::PeerClosed: return "peer-closed";
        case TransportFault::Protocol: return "protocol";
    }
    return "none";
}
