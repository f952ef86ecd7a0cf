// Transport implementation using libssh2 for SSH shells and SFTP.
// Encapsulates the TCP socket, the SSH session and the shell channel.
#pragma once
#include "Transport.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_CHANNEL;

namespace sshdeck {

// Presented host key against known_hosts.
enum class KnownHostMatch { Match, Mismatch, Unknown };

enum class HostKeyVerdict { Accept, AcceptAndSave, RejectMismatch, RejectUnknown };

// A match is accepted and a mismatch always rejected. An unknown key is rejected
// under Strict; under AcceptNew it goes to `verifier`, and without one it is rejected.
// The verifier is only called for unknown keys.
HostKeyVerdict decideHostKey(KnownHostMatch match,
                             KnownHostsPolicy policy,
                             const HostKeyVerifier& verifier,
                             const HostKeyInfo& info);

class Libssh2Transport : public Transport {
public:
    using Deadline = std::chrono::steady_clock::time_point;

    Libssh2Transport();
    ~Libssh2Transport() override;

    bool connect(const HostDescriptor& host,
                 const TransportOptions& opt,
                 Error& err) override;
    bool requiresAuthentication() const override { return true; }
    bool authenticate(const HostDescriptor& host,
                      const Secret& secret,
                      const TransportOptions& opt,
                      Error& err) override;
    bool openShell(const TransportOptions& opt, Error& err) override;
    bool isConnected() const override { return connected_.load() && !aborted_.load(); }

    long read(char* buf, std::size_t cap,
              std::chrono::milliseconds timeout,
              Error& err) override;
    bool write(const char* data, std::size_t len, Error& err) override;

    bool supportsResize() const override { return true; }
    bool resize(int rows, int cols, Error& err) override;

    bool supportsSftp() const override { return true; }
    std::unique_ptr<SftpChannel> openSftp(Error& err) override;

    void abort() override;
    void close() override;

    // Used by the SFTP channel and the retry helpers. All libssh2 calls made after
    // openShell() must hold mutex().
    std::mutex& mutex() { return mtx_; }
    _LIBSSH2_SESSION* session() const { return session_; }
    bool aborted() const { return aborted_.load(); }
    Deadline operationDeadline() const { return std::chrono::steady_clock::now() + opTimeout_; }
    const std::string& hostId() const { return hostId_; }

    // Waits until the socket is ready in the directions libssh2 is blocked on.
    // Fails with Cancelled after abort(), Timeout past the deadline, ConnectionLost
    // on socket errors.
    bool waitSocket(Deadline deadline, Error& err);

    // Fills err from the session's last error (ConnectionLost for socket errors).
    void setSessionError(Error& err, ErrorKind fallback, const char* what);

private:
    bool verifyHostKey(const HostDescriptor& host, const TransportOptions& opt, Error& err);
    bool authPassword(const HostDescriptor& host, const Secret& secret,
                      const TransportOptions& opt, Error& err);
    bool authPublicKey(const HostDescriptor& host, const Secret& secret, Error& err);
    bool authAgent(const HostDescriptor& host, Error& err);
    void applyLegacyAlgorithms();
    std::string lastSessionError() const;

    std::mutex mtx_;  // serializes libssh2 calls once the session is non-blocking
    std::atomic<int>  sock_{-1};
    std::atomic<bool> aborted_{false};
    std::atomic<bool> connected_{false};
    _LIBSSH2_SESSION* session_ = nullptr; // <- uses internal libssh2 types
    _LIBSSH2_CHANNEL* channel_ = nullptr; // <- same
    std::chrono::milliseconds opTimeout_{30000};
    std::string hostId_;
};

} // namespace sshdeck
