// Basic types shared by transports, sessions and the presentation layer:
// host descriptors, credentials, session states and connection policies.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>
#include <functional>

namespace sshdeck {

enum class Protocol { SSH, Telnet };

enum class AuthMethod { Password, PrivateKey, Agent };

// Session lifecycle. Disconnected and Failed are terminal until reopen().
enum class SessionState {
    Idle,
    Connecting,
    Authenticating,
    Connected,
    Reconnecting,
    Disconnected,
    Failed
};

const char* toString(SessionState s);
const char* toString(Protocol p);
const char* toString(AuthMethod m);

// A host as known to the inventory. Immutable once bound to a session; identity is `id`.
struct HostDescriptor {
    std::string   id;
    std::string   address;
    std::uint16_t port = 0;            // 0 = protocol default (22 / 23)
    Protocol      protocol = Protocol::SSH;
    AuthMethod    authMethod = AuthMethod::Password;
    std::string   username;

    // Key file used for PrivateKey auth when the stored secret has no key blob.
    std::optional<std::string> privateKeyPath;
    // Allow old kex/host key/cipher algorithms (diffie-hellman-group1-sha1, ssh-rsa, cbc).
    bool legacyAlgorithms = false;
    // Telnet only
    bool telnetBinary = false;
    bool telnetLocalEcho = false;

    std::uint16_t effectivePort() const {
        if (port != 0) return port;
        return protocol == Protocol::Telnet ? 23 : 22;
    }
};

// Credential material. Copies are wiped on destruction; never log these fields.
struct Secret {
    std::optional<std::string> password;
    std::optional<std::string> privateKey;    // OpenSSH/PEM blob
    std::optional<std::string> passphrase;

    Secret() = default;
    Secret(const Secret&) = default;
    Secret(Secret&&) = default;
    Secret& operator=(const Secret&) = default;
    Secret& operator=(Secret&&) = default;
    ~Secret() { wipe(); }

    bool empty() const { return !password && !privateKey; }
    void wipe();
};

// Overwrites the buffer before releasing it.
void wipeString(std::string& s);

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,     // Unknown hosts are rejected.
    AcceptNew   // Unknown hosts are offered to the HostKeyVerifier; changed keys are rejected.
};

struct HostKeyInfo {
    std::string   host;
    std::uint16_t port = 0;
    std::string   algorithm;    // RSA, ECDSA-256, ED25519...
    std::string   fingerprint;  // SHA256:AA:BB:...
};

enum class HostKeyDecision { Reject, AcceptOnce, AcceptAndSave };

// Asked when a host presents a key that is not in known_hosts.
using HostKeyVerifier = std::function<HostKeyDecision(const HostKeyInfo&)>;

// Callback to answer keyboard-interactive prompts.
// Must return true and fill "responses" with one entry per prompt if it could answer.
// If it returns false, the backend uses a heuristic (username/password) as a fallback.
using KbdIntPromptsCB = std::function<bool(const std::string& name,
                                           const std::string& instruction,
                                           const std::vector<std::string>& prompts,
                                           std::vector<std::string>& responses)>;

struct TerminalSize {
    int rows = 24;
    int cols = 80;
};

struct TransportOptions {
    std::chrono::milliseconds connectTimeout{10000};
    // Per-call bound for SFTP and channel operations once connected.
    std::chrono::milliseconds operationTimeout{30000};
    int keepaliveIntervalSec = 30;

    std::optional<std::string> knownHostsPath; // default: ~/.ssh/known_hosts
    KnownHostsPolicy knownHostsPolicy = KnownHostsPolicy::AcceptNew;
    HostKeyVerifier hostKeyVerifier;
    KbdIntPromptsCB keyboardInteractive;

    std::string  terminalType = "xterm-256color";
    TerminalSize terminalSize;
};

// Exponential backoff for automatic reconnection after a network-level drop.
struct ReconnectPolicy {
    bool enabled = true;
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{30000};
    int maxAttempts = 5;

    // Delay before the given 1-based attempt: base * 2^(attempt-1), capped at maxDelay.
    std::chrono::milliseconds delayFor(int attempt) const;
};

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
    std::uint32_t uid   = 0;
    std::uint32_t gid   = 0;
};

} // namespace sshdeck
