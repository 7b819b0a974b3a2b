#include "util/net_util.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdint>
#include <cstring>
#include <utility>

namespace util {

void SocketHandle::reset(int fd) {
    if (m_fd >= 0) {
        ::close(m_fd);
    }
    m_fd = fd;
}

static bool setBlocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

bool connectTcp(const std::string& ip, int port, int timeoutMs, SocketHandle& outSocket, std::string& outError) {
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        outError = "Invalid IPv4 address: " + ip;
        return false;
    }

    SocketHandle sock(::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
    if (!sock.valid()) {
        outError = std::string("socket: ") + strerror(errno);
        return false;
    }

    if (!setBlocking(sock.get(), false)) {
        outError = std::string("fcntl: ") + strerror(errno);
        return false;
    }

    int rc = ::connect(sock.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno != EINPROGRESS) {
        outError = std::string("connect: ") + strerror(errno);
        return false;
    }

    if (rc < 0) {
        struct pollfd pfd;
        pfd.fd = sock.get();
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, timeoutMs);
        if (ready == 0) {
            outError = "connect: timed out";
            return false;
        }
        if (ready < 0) {
            outError = std::string("poll: ") + strerror(errno);
            return false;
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
            outError = std::string("getsockopt: ") + strerror(errno);
            return false;
        }
        if (soError != 0) {
            outError = std::string("connect: ") + strerror(soError);
            return false;
        }
    }

    if (!setBlocking(sock.get(), true)) {
        outError = std::string("fcntl: ") + strerror(errno);
        return false;
    }

    outSocket = std::move(sock);
    return true;
}

bool isTcpPortOpen(const std::string& ip, int port, int timeoutMs) {
    SocketHandle sock;
    std::string error;
    return connectTcp(ip, port, timeoutMs, sock, error);
}

bool waitReadable(int fd, int timeoutMs) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready = ::poll(&pfd, 1, timeoutMs);
    return ready > 0 && (pfd.revents & (POLLIN | POLLHUP)) != 0;
}

std::string localIPv4Address() {
    SocketHandle sock(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (!sock.valid()) {
        return "";
    }

    // No datagram is sent; connect() on UDP only selects the outgoing route
    struct sockaddr_in remote;
    memset(&remote, 0, sizeof(remote));
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

    if (::connect(sock.get(), reinterpret_cast<struct sockaddr*>(&remote), sizeof(remote)) < 0) {
        return "";
    }

    struct sockaddr_in local;
    socklen_t len = sizeof(local);
    if (getsockname(sock.get(), reinterpret_cast<struct sockaddr*>(&local), &len) < 0) {
        return "";
    }

    char buffer[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &local.sin_addr, buffer, sizeof(buffer))) {
        return "";
    }
    return buffer;
}

}
