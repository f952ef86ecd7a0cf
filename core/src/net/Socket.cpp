#include "net/Socket.hpp"
#include "sshdeck/Log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace sshdeck {
namespace net {

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* p) const {
        if (p) freeaddrinfo(p);
    }
};

bool setNonBlocking(int fd, bool on) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, flags) == 0;
}

// Outcome of one address attempt: 0 connected, otherwise errno-like.
int connectOne(int fd, const addrinfo* rp,
               std::chrono::steady_clock::time_point deadline,
               const std::atomic<bool>& aborted) {
    if (!setNonBlocking(fd, true)) return errno;
    if (::connect(fd, rp->ai_addr, rp->ai_addrlen) == 0) {
        setNonBlocking(fd, false);
        return 0;
    }
    if (errno != EINPROGRESS) return errno;

    // Poll in short slices so abort() is noticed quickly.
    for (;;) {
        if (aborted.load()) return ECANCELED;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return ETIMEDOUT;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int slice = (int)std::min<long long>(left, 100);
        int rc = waitFd(fd, false, true, slice);
        if (rc < 0) return errno ? errno : EIO;
        if (rc == 0) continue;
        int soerr = 0;
        socklen_t len = sizeof(soerr);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soerr, &len) != 0) return errno;
        if (soerr != 0) return soerr;
        setNonBlocking(fd, false);
        return 0;
    }
}

} // namespace

int tcpConnect(const std::string& host, std::uint16_t port,
               std::chrono::milliseconds timeout,
               const std::atomic<bool>& aborted,
               Error& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    addrinfo* raw = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &raw);
    std::unique_ptr<addrinfo, AddrInfoDeleter> res(raw);
    if (gai != 0) {
        err.set(ErrorKind::DnsFailure, std::string("getaddrinfo: ") + gai_strerror(gai));
        return -1;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int lastErr = 0;
    for (auto rp = res.get(); rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            lastErr = errno;
            continue;
        }
        int rc = connectOne(s, rp, deadline, aborted);
        if (rc == 0) {
            enableKeepalive(s);
            LOGD("tcp connected to %s:%u", host.c_str(), (unsigned)port);
            return s;
        }
        ::close(s);
        lastErr = rc;
        if (rc == ETIMEDOUT || rc == ECANCELED) break;
    }

    switch (lastErr) {
        case ECONNREFUSED:
            err.set(ErrorKind::ConnectionRefused, "connect: " + std::string(std::strerror(lastErr)));
            break;
        case ETIMEDOUT:
            err.set(ErrorKind::Timeout, "connect timed out after " +
                                            std::to_string(timeout.count()) + " ms");
            break;
        case ECANCELED:
            err.set(ErrorKind::Cancelled, "connect aborted");
            break;
        case EHOSTUNREACH:
        case ENETUNREACH:
            err.set(ErrorKind::Timeout, "connect: " + std::string(std::strerror(lastErr)));
            break;
        default:
            err.set(ErrorKind::ConnectionRefused,
                    "connect: " + std::string(lastErr ? std::strerror(lastErr) : "no usable address"));
            break;
    }
    return -1;
}

void enableKeepalive(int fd) {
    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
    int idle = 60;
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
    int idle = 60, intvl = 10, cnt = 3;
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
    int nodelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
}

int waitFd(int fd, bool forRead, bool forWrite, int timeoutMs) {
    struct pollfd pfd{};
    pfd.fd = fd;
    pfd.events = (short)((forRead ? POLLIN : 0) | (forWrite ? POLLOUT : 0));
    for (;;) {
        int rc = ::poll(&pfd, 1, timeoutMs);
        if (rc < 0 && errno == EINTR) continue;
        if (rc > 0 && (pfd.revents & (POLLERR | POLLNVAL)) && !(pfd.revents & (POLLIN | POLLOUT)))
            return -1;
        return rc;
    }
}

void shutdownFd(int fd) {
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace net
} // namespace sshdeck
