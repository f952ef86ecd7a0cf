// Error taxonomy for transports, sessions and transfers.
// Operations report failures through an Error out-parameter and a bool result.
#pragma once
#include <string>

namespace sshdeck {

enum class ErrorKind {
    None,
    // Transport
    DnsFailure,
    ConnectionRefused,
    Timeout,
    HostKeyMismatch,
    HostKeyRejected,
    ProtocolError,
    ConnectionLost,
    // Auth
    AuthRejected,
    // State
    NotConnected,
    AlreadyConnecting,
    // Transfer
    Cancelled,
    RemoteIOError,
    PermissionDenied,
    LocalIOError
};

enum class ErrorCategory { None, Transport, Auth, State, Transfer };

ErrorCategory categoryOf(ErrorKind k);
const char* toString(ErrorKind k);
const char* toString(ErrorCategory c);

// Network-level failures that automatic reconnection may retry.
// Auth and host key failures need user action and are never retried.
bool isRetryable(ErrorKind k);

struct Error {
    ErrorKind   kind = ErrorKind::None;
    std::string message;   // diagnostic or remote-provided text
    std::string host;      // HostDescriptor::id when known

    Error() = default;
    Error(ErrorKind k, std::string msg, std::string hostId = {})
        : kind(k), message(std::move(msg)), host(std::move(hostId)) {}

    bool ok() const { return kind == ErrorKind::None; }
    explicit operator bool() const { return !ok(); }

    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
        host.clear();
    }

    // "ConnectionRefused [h1]: connect: Connection refused"
    std::string describe() const;
};

} // namespace sshdeck
