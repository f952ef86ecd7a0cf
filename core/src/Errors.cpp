#include "sshdeck/Errors.hpp"

namespace sshdeck {

ErrorCategory categoryOf(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:
            return ErrorCategory::None;
        case ErrorKind::DnsFailure:
        case ErrorKind::ConnectionRefused:
        case ErrorKind::Timeout:
        case ErrorKind::HostKeyMismatch:
        case ErrorKind::HostKeyRejected:
        case ErrorKind::ProtocolError:
        case ErrorKind::ConnectionLost:
            return ErrorCategory::Transport;
        case ErrorKind::AuthRejected:
            return ErrorCategory::Auth;
        case ErrorKind::NotConnected:
        case ErrorKind::AlreadyConnecting:
            return ErrorCategory::State;
        case ErrorKind::Cancelled:
        case ErrorKind::RemoteIOError:
        case ErrorKind::PermissionDenied:
        case ErrorKind::LocalIOError:
            return ErrorCategory::Transfer;
    }
    return ErrorCategory::None;
}

const char* toString(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "None";
        case ErrorKind::DnsFailure: return "DnsFailure";
        case ErrorKind::ConnectionRefused: return "ConnectionRefused";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::HostKeyMismatch: return "HostKeyMismatch";
        case ErrorKind::HostKeyRejected: return "HostKeyRejected";
        case ErrorKind::ProtocolError: return "ProtocolError";
        case ErrorKind::ConnectionLost: return "ConnectionLost";
        case ErrorKind::AuthRejected: return "AuthRejected";
        case ErrorKind::NotConnected: return "NotConnected";
        case ErrorKind::AlreadyConnecting: return "AlreadyConnecting";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::RemoteIOError: return "RemoteIOError";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::LocalIOError: return "LocalIOError";
    }
    return "?";
}

const char* toString(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Transport: return "Transport";
        case ErrorCategory::Auth: return "Auth";
        case ErrorCategory::State: return "State";
        case ErrorCategory::Transfer: return "Transfer";
    }
    return "?";
}

bool isRetryable(ErrorKind k) {
    switch (k) {
        case ErrorKind::DnsFailure:
        case ErrorKind::ConnectionRefused:
        case ErrorKind::Timeout:
        case ErrorKind::ConnectionLost:
            return true;
        default:
            return false;
    }
}

std::string Error::describe() const {
    std::string out = toString(kind);
    if (!host.empty()) out += " [" + host + "]";
    if (!message.empty()) out += ": " + message;
    return out;
}

} // namespace sshdeck
