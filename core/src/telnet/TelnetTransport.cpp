// Telnet transport: TCP socket plus the option codec.
#include "sshdeck/TelnetTransport.hpp"
#include "net/Socket.hpp"
#include "sshdeck/Log.hpp"
#include "telnet/TelnetCodec.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/types.h>

namespace sshdeck {

TelnetTransport::TelnetTransport() = default;

TelnetTransport::~TelnetTransport() {
    close();
}

bool TelnetTransport::connect(const HostDescriptor& host,
                              const TransportOptions& opt,
                              Error& err) {
    hostId_ = host.id;
    if (connected_.load()) {
        err = Error(ErrorKind::ProtocolError, "already connected", host.id);
        return false;
    }
    int fd = net::tcpConnect(host.address, host.effectivePort(), opt.connectTimeout, aborted_, err);
    if (fd < 0) {
        err.host = host.id;
        return false;
    }
    sock_ = fd;
    if (aborted_.load()) {
        // abort() may have run before the descriptor was published
        net::shutdownFd(fd);
        err = Error(ErrorKind::Cancelled, "connect aborted", host.id);
        return false;
    }

    telnet::TelnetCodec::Options copt;
    copt.binary = host.telnetBinary;
    copt.localEcho = host.telnetLocalEcho;
    copt.terminalType = opt.terminalType;
    copt.size = opt.terminalSize;

    std::lock_guard<std::mutex> lk(mtx_);
    codec_ = std::make_unique<telnet::TelnetCodec>(copt);
    if (!sendAll(codec_->initialNegotiation(), err)) {
        err.host = host.id;
        return false;
    }
    connected_ = true;
    LOGI("telnet connected to %s:%u", host.address.c_str(), (unsigned)host.effectivePort());
    return true;
}

bool TelnetTransport::authenticate(const HostDescriptor&, const Secret&,
                                   const TransportOptions&, Error&) {
    return true;
}

bool TelnetTransport::openShell(const TransportOptions&, Error& err) {
    if (!connected_.load()) {
        err = Error(ErrorKind::NotConnected, "telnet transport not connected", hostId_);
        return false;
    }
    return true;
}

bool TelnetTransport::sendAll(const std::string& bytes, Error& err) {
    const int fd = sock_.load();
    std::size_t off = 0;
    while (off < bytes.size()) {
        if (aborted_.load()) {
            err = Error(ErrorKind::Cancelled, "transport closed", hostId_);
            return false;
        }
        ssize_t n = ::send(fd, bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                net::waitFd(fd, false, true, 100);
                continue;
            }
            err = Error(ErrorKind::ConnectionLost, std::string("send: ") + std::strerror(errno), hostId_);
            return false;
        }
        off += (std::size_t)n;
    }
    return true;
}

long TelnetTransport::read(char* buf, std::size_t cap,
                           std::chrono::milliseconds timeout,
                           Error& err) {
    if (aborted_.load()) {
        err = Error(ErrorKind::Cancelled, "transport closed", hostId_);
        return -1;
    }
    if (pending_.empty()) {
        const int fd = sock_.load();
        int rc = net::waitFd(fd, true, false, (int)timeout.count());
        if (rc == 0) return 0;
        if (aborted_.load()) {
            err = Error(ErrorKind::Cancelled, "transport closed", hostId_);
            return -1;
        }
        if (rc < 0) {
            err = Error(ErrorKind::ConnectionLost, std::string("poll: ") + std::strerror(errno), hostId_);
            connected_ = false;
            return -1;
        }
        char raw[8192];
        ssize_t n = ::recv(fd, raw, sizeof(raw), 0);
        if (n == 0) {
            if (aborted_.load()) {
                err = Error(ErrorKind::Cancelled, "transport closed", hostId_);
            } else {
                LOGI("telnet: remote host %s closed the connection", hostId_.c_str());
            }
            connected_ = false;
            return -1;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return 0;
            err = Error(aborted_.load() ? ErrorKind::Cancelled : ErrorKind::ConnectionLost,
                        std::string("recv: ") + std::strerror(errno), hostId_);
            connected_ = false;
            return -1;
        }
        std::string reply;
        std::lock_guard<std::mutex> lk(mtx_);
        codec_->feed(raw, (std::size_t)n, pending_, reply);
        if (!reply.empty() && !sendAll(reply, err)) {
            connected_ = false;
            return -1;
        }
        if (pending_.empty()) return 0;  // negotiation only
    }
    const std::size_t take = std::min(cap, pending_.size());
    std::memcpy(buf, pending_.data(), take);
    pending_.erase(0, take);
    return (long)take;
}

bool TelnetTransport::write(const char* data, std::size_t len, Error& err) {
    if (!connected_.load()) {
        err = Error(ErrorKind::NotConnected, "telnet transport not connected", hostId_);
        return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    return sendAll(codec_->encode(data, len), err);
}

bool TelnetTransport::resize(int rows, int cols, Error& err) {
    if (!connected_.load()) {
        err = Error(ErrorKind::NotConnected, "telnet transport not connected", hostId_);
        return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string msg = codec_->windowSize(rows, cols);
    if (msg.empty()) return true;  // sent once the server enables NAWS
    return sendAll(msg, err);
}

std::unique_ptr<SftpChannel> TelnetTransport::openSftp(Error& err) {
    err = Error(ErrorKind::ProtocolError, "SFTP is not available over Telnet", hostId_);
    return nullptr;
}

void TelnetTransport::abort() {
    aborted_ = true;
    net::shutdownFd(sock_.load());
}

void TelnetTransport::close() {
    int fd = sock_.exchange(-1);
    net::closeFd(fd);
    connected_ = false;
}

} // namespace sshdeck
