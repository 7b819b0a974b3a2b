#ifndef TIZENCTL_NET_UTIL_HPP
#define TIZENCTL_NET_UTIL_HPP

#include <string>

namespace util {

// Owns a socket descriptor and closes it on destruction
class SocketHandle {
public:
    SocketHandle() = default;
    explicit SocketHandle(int fd) : m_fd(fd) {}
    ~SocketHandle() { reset(); }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    SocketHandle(SocketHandle&& other) noexcept : m_fd(other.release()) {}
    SocketHandle& operator=(SocketHandle&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return m_fd; }
    bool valid() const { return m_fd >= 0; }
    int release() {
        int fd = m_fd;
        m_fd = -1;
        return fd;
    }
    void reset(int fd = -1);

private:
    int m_fd = -1;
};

// Non-blocking connect bounded by timeoutMs. The returned socket is blocking again.
bool connectTcp(const std::string& ip, int port, int timeoutMs, SocketHandle& outSocket, std::string& outError);

bool isTcpPortOpen(const std::string& ip, int port, int timeoutMs);

// Waits until fd is readable. Returns false on timeout or poll error.
bool waitReadable(int fd, int timeoutMs);

// Address of the interface that routes towards the internet, or empty when offline
std::string localIPv4Address();

}

#endif
