// Abstract transport: one raw network connection to one host (SSH or Telnet).
// A transport is used by a single session I/O thread; abort() is the only call
// allowed from any thread and unblocks whatever call is in flight.
#pragma once
#include "Errors.hpp"
#include "SessionTypes.hpp"
#include "SftpChannel.hpp"
#include <cstddef>
#include <chrono>
#include <memory>
#include <string>

namespace sshdeck {

class Transport {
public:
    virtual ~Transport() = default;

    // TCP connect, protocol handshake and host verification, bounded by opt.connectTimeout.
    virtual bool connect(const HostDescriptor& host,
                         const TransportOptions& opt,
                         Error& err) = 0;

    // Whether authenticate() has any work to do (false for Telnet).
    virtual bool requiresAuthentication() const = 0;

    virtual bool authenticate(const HostDescriptor& host,
                              const Secret& secret,
                              const TransportOptions& opt,
                              Error& err) = 0;

    // Interactive channel (PTY shell for SSH, option negotiation for Telnet).
    virtual bool openShell(const TransportOptions& opt, Error& err) = 0;

    virtual bool isConnected() const = 0;

    // Returns bytes read (>0), 0 on timeout, or -1 once the connection is closed.
    // On -1, err is ConnectionLost when the link dropped, Cancelled after abort(), and
    // stays clear when the remote side ended the session in an orderly way.
    virtual long read(char* buf, std::size_t cap,
                      std::chrono::milliseconds timeout,
                      Error& err) = 0;

    // Writes all bytes or fails.
    virtual bool write(const char* data, std::size_t len, Error& err) = 0;

    virtual bool supportsResize() const = 0;
    virtual bool resize(int rows, int cols, Error& err) = 0;

    virtual bool supportsSftp() const = 0;
    // The channel shares the connection and must not outlive this transport.
    virtual std::unique_ptr<SftpChannel> openSftp(Error& err) = 0;

    // Unblocks in-flight calls; afterwards every call fails fast. Thread-safe.
    virtual void abort() = 0;
    // Releases the connection. Idempotent.
    virtual void close() = 0;
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;
    virtual std::unique_ptr<Transport> create(const HostDescriptor& host) = 0;
};

// libssh2 for SSH hosts, the built-in Telnet client for Telnet hosts.
class DefaultTransportFactory : public TransportFactory {
public:
    std::unique_ptr<Transport> create(const HostDescriptor& host) override;
};

} // namespace sshdeck
