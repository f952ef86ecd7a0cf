// libssh2 backend: TCP socket, SSH session, shell channel and SFTP sub-channel.
// Connect, authentication and shell setup run in blocking mode; afterwards the
// session is non-blocking and every libssh2 call is serialized by mtx_.
#include "sshdeck/Libssh2Transport.hpp"
#include "libssh2/Libssh2SftpChannel.hpp"
#include "libssh2/Libssh2Util.hpp"
#include "net/Socket.hpp"
#include "sshdeck/Log.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

namespace sshdeck {

namespace {

// libssh2_init/libssh2_exit once per process
struct Libssh2Runtime {
    Libssh2Runtime() {
        int rc = libssh2_init(0);
        if (rc != 0) LOGE("libssh2_init failed (%d)", rc);
    }
    ~Libssh2Runtime() { libssh2_exit(); }
};

void ensureLibssh2() {
    static Libssh2Runtime runtime;
    (void)runtime;
}

// Context for keyboard-interactive: respond with username/password based on the prompt
struct KbdIntCtx {
    const char* user;
    const char* pass;
    const KbdIntPromptsCB* cb; // optional: UI callback for prompts
};

char* dupResponse(const std::string& s, unsigned int& len) {
    len = 0;
    if (s.empty()) return nullptr;
    char* buf = static_cast<char*>(std::malloc(s.size() + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s.data(), s.size());
    buf[s.size()] = '\0';
    len = (unsigned int)s.size();
    return buf;
}

// Keyboard-interactive callback: respond to prompts with username/password based on the text
void kbintCallback(const char* name, int name_len,
                   const char* instruction, int instruction_len,
                   int num_prompts,
                   const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                   LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                   void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    // If a callback is provided, give it a chance to answer the prompts.
    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> ptxts;
        ptxts.reserve((size_t)num_prompts);
        for (int i = 0; i < num_prompts; ++i) {
            const char* pt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
            ptxts.emplace_back(pt);
        }
        std::vector<std::string> answers;
        std::string nm = (name && name_len > 0) ? std::string(name, (size_t)name_len) : std::string();
        std::string ins = (instruction && instruction_len > 0) ? std::string(instruction, (size_t)instruction_len) : std::string();
        bool ok = (*(ctx->cb))(nm, ins, ptxts, answers);
        if (ok && (int)answers.size() >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i) {
                responses[i].text = dupResponse(answers[(size_t)i], responses[i].length);
                wipeString(answers[(size_t)i]);
            }
            return;
        }
        for (auto& a : answers) wipeString(a);
        // If the callback could not answer, fall back to the simple heuristic
    }
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt = (prompts && prompts[i].text)
                                 ? std::string(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length)
                                 : std::string();
        std::transform(prompt.begin(), prompt.end(), prompt.begin(),
                       [](unsigned char c) { return (char)std::tolower(c); });
        // Simple heuristic: if the prompt mentions "user" or "name", send username; otherwise send password
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        responses[i].text = dupResponse(ans ? std::string(ans) : std::string(), responses[i].length);
    }
}

const char* hostKeyTypeName(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
        case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
#endif
        default: return "UNKNOWN";
    }
}

int knownHostKeyBits(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS: return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default: return 0;
    }
}

std::string fingerprint(LIBSSH2_SESSION* session) {
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA256;
    const int hashLen = 32;
    const char* prefix = "SHA256:";
#else
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA1;
    const int hashLen = 20;
    const char* prefix = "SHA1:";
#endif
    const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(session, hashType);
    if (!h) return {};
    std::ostringstream oss;
    oss << prefix;
    for (int i = 0; i < hashLen; ++i) {
        if (i) oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
        oss << b;
    }
    return oss.str();
}

std::string defaultKnownHostsPath() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.ssh/known_hosts" : std::string();
}

bool isSocketError(int e) {
    return e == LIBSSH2_ERROR_SOCKET_DISCONNECT || e == LIBSSH2_ERROR_SOCKET_SEND ||
           e == LIBSSH2_ERROR_SOCKET_RECV || e == LIBSSH2_ERROR_SOCKET_TIMEOUT ||
           e == LIBSSH2_ERROR_CHANNEL_CLOSED || e == LIBSSH2_ERROR_CHANNEL_EOF_SENT;
}

} // namespace

Libssh2Transport::Libssh2Transport() {
    ensureLibssh2();
}

Libssh2Transport::~Libssh2Transport() {
    close();
}

std::string Libssh2Transport::lastSessionError() const {
    if (!session_) return {};
    char* emsgPtr = nullptr;
    int emlen = 0;
    (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
    return (emsgPtr && emlen > 0) ? std::string(emsgPtr, (size_t)emlen) : std::string();
}

void Libssh2Transport::setSessionError(Error& err, ErrorKind fallback, const char* what) {
    int e = 0;
    std::string msg;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (session_) {
            e = libssh2_session_last_errno(session_);
            msg = lastSessionError();
        }
    }
    ErrorKind kind = fallback;
    if (aborted_.load()) kind = ErrorKind::Cancelled;
    else if (isSocketError(e)) kind = ErrorKind::ConnectionLost;
    else if (e == LIBSSH2_ERROR_TIMEOUT) kind = ErrorKind::Timeout;
    std::string text = what;
    if (!msg.empty()) text += ": " + msg;
    err = Error(kind, text, hostId_);
}

bool Libssh2Transport::waitSocket(Deadline deadline, Error& err) {
    if (aborted_.load()) {
        err = Error(ErrorKind::Cancelled, "transport closed", hostId_);
        return false;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
        err = Error(ErrorKind::Timeout, "operation timed out", hostId_);
        return false;
    }
    int dir = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (session_) dir = libssh2_session_block_directions(session_);
    }
    if (dir == 0) dir = LIBSSH2_SESSION_BLOCK_INBOUND;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    int rc = net::waitFd(sock_.load(),
                         (dir & LIBSSH2_SESSION_BLOCK_INBOUND) != 0,
                         (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) != 0,
                         (int)std::min<long long>(left, 100));
    if (rc < 0) {
        err = Error(aborted_.load() ? ErrorKind::Cancelled : ErrorKind::ConnectionLost,
                    "socket error while waiting", hostId_);
        return false;
    }
    return true;
}

void Libssh2Transport::applyLegacyAlgorithms() {
    // Modern algorithms first; the old ones are only used when the server offers nothing else.
    // libssh2 drops entries it was not built with.
    struct Pref {
        int method;
        const char* list;
    };
    const Pref prefs[] = {
        {LIBSSH2_METHOD_KEX,
         "curve25519-sha256,curve25519-sha256@libssh.org,ecdh-sha2-nistp256,ecdh-sha2-nistp384,"
         "ecdh-sha2-nistp521,diffie-hellman-group14-sha256,diffie-hellman-group16-sha512,"
         "diffie-hellman-group-exchange-sha256,diffie-hellman-group14-sha1,"
         "diffie-hellman-group-exchange-sha1,diffie-hellman-group1-sha1"},
        {LIBSSH2_METHOD_HOSTKEY,
         "ssh-ed25519,ecdsa-sha2-nistp256,ecdsa-sha2-nistp384,ecdsa-sha2-nistp521,"
         "rsa-sha2-512,rsa-sha2-256,ssh-rsa,ssh-dss"},
        {LIBSSH2_METHOD_CRYPT_CS,
         "aes256-gcm@openssh.com,aes128-gcm@openssh.com,aes256-ctr,aes192-ctr,aes128-ctr,"
         "aes256-cbc,aes192-cbc,aes128-cbc,3des-cbc"},
        {LIBSSH2_METHOD_CRYPT_SC,
         "aes256-gcm@openssh.com,aes128-gcm@openssh.com,aes256-ctr,aes192-ctr,aes128-ctr,"
         "aes256-cbc,aes192-cbc,aes128-cbc,3des-cbc"},
    };
    for (const auto& p : prefs) {
        if (libssh2_session_method_pref(session_, p.method, p.list) != 0)
            LOGW("legacy algorithms: method %d preference rejected: %s", p.method, lastSessionError().c_str());
    }
}

bool Libssh2Transport::connect(const HostDescriptor& host,
                               const TransportOptions& opt,
                               Error& err) {
    hostId_ = host.id;
    opTimeout_ = opt.operationTimeout;
    if (session_) {
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
        net::shutdownFd(fd);
        err = Error(ErrorKind::Cancelled, "connect aborted", host.id);
        return false;
    }

    session_ = libssh2_session_init();
    if (!session_) {
        err = Error(ErrorKind::ProtocolError, "libssh2_session_init failed", host.id);
        return false;
    }
    if (host.legacyAlgorithms) applyLegacyAlgorithms();

    // Blocking mode with a bounded timeout until the shell is up
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, (long)opt.connectTimeout.count());

    if (libssh2_session_handshake(session_, fd) != 0) {
        setSessionError(err, ErrorKind::ProtocolError, "SSH handshake failed");
        if (err.kind == ErrorKind::ConnectionLost) err.kind = ErrorKind::ProtocolError;
        return false;
    }

    // SSH keepalive: request libssh2 to send messages every N seconds if the peer allows it
    if (opt.keepaliveIntervalSec > 0)
        libssh2_keepalive_config(session_, 1, (unsigned)opt.keepaliveIntervalSec);

    if (!verifyHostKey(host, opt, err)) return false;

    connected_ = true;
    LOGI("ssh connected to %s:%u", host.address.c_str(), (unsigned)host.effectivePort());
    return true;
}

HostKeyVerdict decideHostKey(KnownHostMatch match,
                             KnownHostsPolicy policy,
                             const HostKeyVerifier& verifier,
                             const HostKeyInfo& info) {
    if (match == KnownHostMatch::Match) return HostKeyVerdict::Accept;
    if (match == KnownHostMatch::Mismatch) return HostKeyVerdict::RejectMismatch;
    if (policy == KnownHostsPolicy::Strict || !verifier) return HostKeyVerdict::RejectUnknown;
    // TOFU: the embedder decides
    switch (verifier(info)) {
        case HostKeyDecision::AcceptOnce: return HostKeyVerdict::Accept;
        case HostKeyDecision::AcceptAndSave: return HostKeyVerdict::AcceptAndSave;
        case HostKeyDecision::Reject: break;
    }
    return HostKeyVerdict::RejectUnknown;
}

bool Libssh2Transport::verifyHostKey(const HostDescriptor& host,
                                     const TransportOptions& opt,
                                     Error& err) {
    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = Error(ErrorKind::ProtocolError, "could not initialize known_hosts", host.id);
        return false;
    }
    struct KnownHostsGuard {
        LIBSSH2_KNOWNHOSTS* p;
        ~KnownHostsGuard() { libssh2_knownhost_free(p); }
    } guard{nh};

    // Effective path
    const std::string khPath = opt.knownHostsPath ? *opt.knownHostsPath : defaultKnownHostsPath();
    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        err = Error(ErrorKind::ProtocolError, "could not obtain host key", host.id);
        return false;
    }

    const int alg = knownHostKeyBits(keytype);
    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int port = host.effectivePort();

    KnownHostMatch match = KnownHostMatch::Unknown;
    if (khLoaded) {
        struct libssh2_knownhost* known = nullptr;
        int check = libssh2_knownhost_checkp(nh, host.address.c_str(), port,
                                             hostkey, keylen, typemask_plain, &known);
        if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH && check != LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
            check = libssh2_knownhost_checkp(nh, host.address.c_str(), port,
                                             hostkey, keylen, typemask_hash, &known);
        }
        if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) match = KnownHostMatch::Match;
        else if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) match = KnownHostMatch::Mismatch;
    }
    if (match == KnownHostMatch::Match) return true;

    HostKeyInfo info;
    info.host = host.address;
    info.port = (std::uint16_t)port;
    info.algorithm = hostKeyTypeName(keytype);
    info.fingerprint = fingerprint(session_);

    switch (decideHostKey(match, opt.knownHostsPolicy, opt.hostKeyVerifier, info)) {
        case HostKeyVerdict::Accept:
            return true;
        case HostKeyVerdict::RejectMismatch:
            LOGE("host key for %s changed (%s %s)", host.address.c_str(), info.algorithm.c_str(),
                 info.fingerprint.c_str());
            err = Error(ErrorKind::HostKeyMismatch,
                        "host key does not match known_hosts (" + info.algorithm + " " + info.fingerprint + ")",
                        host.id);
            return false;
        case HostKeyVerdict::RejectUnknown:
            if (opt.knownHostsPolicy == KnownHostsPolicy::Strict)
                err = Error(ErrorKind::HostKeyRejected,
                            khLoaded ? "host not present in known_hosts (strict policy)"
                                     : "known_hosts unavailable or unreadable (strict policy)",
                            host.id);
            else
                err = Error(ErrorKind::HostKeyRejected,
                            "unknown host key not accepted (" + info.fingerprint + ")", host.id);
            return false;
        case HostKeyVerdict::AcceptAndSave:
            break;
    }

    const std::string entry = port == 22 ? host.address
                                         : "[" + host.address + "]:" + std::to_string(port);
    int addrc = libssh2_knownhost_addc(nh, entry.c_str(), nullptr,
                                       hostkey, keylen,
                                       nullptr, 0, typemask_plain, nullptr);
    if (khPath.empty() || addrc != 0 ||
        libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        LOGW("could not record host key for %s in known_hosts", host.address.c_str());
    }
    return true;
}

bool Libssh2Transport::authPassword(const HostDescriptor& host, const Secret& secret,
                                    const TransportOptions& opt, Error& err) {
    if (!secret.password) {
        err = Error(ErrorKind::AuthRejected, "no password available", host.id);
        return false;
    }
    const std::string& user = host.username;

    // Attempt password directly (without prior userauth_list).
    int rc_pw = libssh2_userauth_password_ex(session_, user.c_str(), (unsigned)user.size(),
                                             secret.password->c_str(), (unsigned)secret.password->size(),
                                             nullptr);
    if (rc_pw == 0) return true;

    // If the server closed after the password attempt, stop: the rest would cascade-fail.
    if (isSocketError(rc_pw)) {
        setSessionError(err, ErrorKind::ConnectionLost, "server closed the connection after password attempt");
        return false;
    }
    const std::string pwErr = lastSessionError();

    // Password failed but the session is alive: query methods and try keyboard-interactive.
    char* methods = libssh2_userauth_list(session_, user.c_str(), (unsigned)user.size());
    const std::string authlist = methods ? std::string(methods) : std::string();
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{user.c_str(), secret.password->c_str(), &opt.keyboardInteractive};
        void** abs = libssh2_session_abstract(session_);
        if (abs) *abs = &ctx;
        int rc_kbd = libssh2_userauth_keyboard_interactive_ex(session_, user.c_str(), (unsigned)user.size(),
                                                              kbintCallback);
        if (abs) *abs = nullptr;
        if (rc_kbd == 0) return true;
    }

    // As a last resort, try ssh-agent if the server allows publickey.
    if (authlist.find("publickey") != std::string::npos) {
        Error agentErr;
        if (authAgent(host, agentErr)) return true;
    }

    err = Error(ErrorKind::AuthRejected,
                "password authentication failed" +
                    (authlist.empty() ? std::string() : " (methods: " + authlist + ")") +
                    (pwErr.empty() ? std::string() : ": " + pwErr),
                host.id);
    return false;
}

bool Libssh2Transport::authPublicKey(const HostDescriptor& host, const Secret& secret, Error& err) {
    const std::string& user = host.username;
    const char* passphrase = secret.passphrase ? secret.passphrase->c_str() : nullptr;
    int rc = -1;
    if (secret.privateKey && !secret.privateKey->empty()) {
        rc = libssh2_userauth_publickey_frommemory(session_, user.c_str(), user.size(),
                                                   nullptr, 0,
                                                   secret.privateKey->data(), secret.privateKey->size(),
                                                   passphrase);
    } else if (host.privateKeyPath) {
        rc = libssh2_userauth_publickey_fromfile_ex(session_, user.c_str(), (unsigned)user.size(),
                                                    nullptr,  // public key path (NULL: derived from the private key)
                                                    host.privateKeyPath->c_str(),
                                                    passphrase);
    } else {
        err = Error(ErrorKind::AuthRejected, "no private key available", host.id);
        return false;
    }
    if (rc != 0) {
        if (isSocketError(rc)) {
            setSessionError(err, ErrorKind::ConnectionLost, "connection lost during key authentication");
            return false;
        }
        err = Error(ErrorKind::AuthRejected, "key authentication failed: " + lastSessionError(), host.id);
        return false;
    }
    return true;
}

bool Libssh2Transport::authAgent(const HostDescriptor& host, Error& err) {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) {
        err = Error(ErrorKind::AuthRejected, "could not initialize ssh-agent support", host.id);
        return false;
    }
    bool authed = false;
    if (libssh2_agent_connect(agent) == 0) {
        if (libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            int tries = 0;
            const int kMaxAgentTries = 3; // conservative limit
            while (tries < kMaxAgentTries && libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                prev = identity;
                ++tries;
                if (libssh2_agent_userauth(agent, host.username.c_str(), identity) == 0) {
                    authed = true;
                    break;
                }
            }
        }
        libssh2_agent_disconnect(agent);
    }
    libssh2_agent_free(agent);
    if (!authed) err = Error(ErrorKind::AuthRejected, "ssh-agent authentication failed", host.id);
    return authed;
}

bool Libssh2Transport::authenticate(const HostDescriptor& host,
                                    const Secret& secret,
                                    const TransportOptions& opt,
                                    Error& err) {
    if (!connected_.load() || !session_) {
        err = Error(ErrorKind::NotConnected, "SSH transport not connected", host.id);
        return false;
    }
    libssh2_session_set_timeout(session_, (long)opTimeout_.count());

    bool ok = false;
    switch (host.authMethod) {
        case AuthMethod::Password: ok = authPassword(host, secret, opt, err); break;
        case AuthMethod::PrivateKey: ok = authPublicKey(host, secret, err); break;
        case AuthMethod::Agent: ok = authAgent(host, err); break;
    }
    if (!ok) {
        if (aborted_.load()) err = Error(ErrorKind::Cancelled, "authentication aborted", host.id);
        LOGW("authentication for %s failed: %s", host.id.c_str(), err.describe().c_str());
        return false;
    }
    if (!libssh2_userauth_authenticated(session_)) {
        err = Error(ErrorKind::AuthRejected, "server did not confirm authentication", host.id);
        return false;
    }
    LOGI("authenticated to %s as %s (%s)", host.id.c_str(), host.username.c_str(), toString(host.authMethod));
    return true;
}

bool Libssh2Transport::openShell(const TransportOptions& opt, Error& err) {
    if (!connected_.load() || !session_) {
        err = Error(ErrorKind::NotConnected, "SSH transport not connected", hostId_);
        return false;
    }
    channel_ = libssh2_channel_open_session(session_);
    if (!channel_) {
        setSessionError(err, ErrorKind::ProtocolError, "could not open session channel");
        return false;
    }
    const std::string& term = opt.terminalType;
    if (libssh2_channel_request_pty_ex(channel_, term.c_str(), (unsigned)term.size(), nullptr, 0,
                                       opt.terminalSize.cols, opt.terminalSize.rows, 0, 0) != 0) {
        setSessionError(err, ErrorKind::ProtocolError, "pty request failed");
        return false;
    }
    if (libssh2_channel_shell(channel_) != 0) {
        setSessionError(err, ErrorKind::ProtocolError, "shell request failed");
        return false;
    }
    libssh2_session_set_blocking(session_, 0);
    return true;
}

long Libssh2Transport::read(char* buf, std::size_t cap,
                            std::chrono::milliseconds timeout,
                            Error& err) {
    if (aborted_.load()) {
        err = Error(ErrorKind::Cancelled, "transport closed", hostId_);
        return -1;
    }
    if (!channel_) {
        err = Error(ErrorKind::NotConnected, "no shell channel", hostId_);
        return -1;
    }
    const Deadline deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        long n = 0;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            n = (long)libssh2_channel_read(channel_, buf, cap);
            if (n <= 0 && (n == 0 || n == LIBSSH2_ERROR_EAGAIN)) eof = libssh2_channel_eof(channel_) != 0;
        }
        if (n > 0) return n;
        if (eof) {
            LOGI("ssh: remote shell on %s ended", hostId_.c_str());
            connected_ = false;
            return -1;
        }
        if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
            Error werr;
            if (waitSocket(deadline, werr)) continue;
            if (werr.kind != ErrorKind::Timeout) {
                err = werr;
                connected_ = false;
                return -1;
            }
            // Idle: let libssh2 send a keepalive when one is due.
            int nextSec = 0;
            int krc = 0;
            {
                std::lock_guard<std::mutex> lk(mtx_);
                krc = libssh2_keepalive_send(session_, &nextSec);
            }
            if (krc != 0 && krc != LIBSSH2_ERROR_EAGAIN) {
                setSessionError(err, ErrorKind::ConnectionLost, "keepalive failed");
                connected_ = false;
                return -1;
            }
            return 0;
        }
        setSessionError(err, ErrorKind::ConnectionLost, "channel read failed");
        connected_ = false;
        return -1;
    }
}

bool Libssh2Transport::write(const char* data, std::size_t len, Error& err) {
    if (aborted_.load() || !channel_) {
        err = Error(ErrorKind::NotConnected, "SSH transport not connected", hostId_);
        return false;
    }
    const Deadline deadline = operationDeadline();
    std::size_t off = 0;
    while (off < len) {
        long rc = 0;
        if (!ssh2::callRetry(*this, deadline, rc, err,
                             [&] { return libssh2_channel_write(channel_, data + off, len - off); }))
            return false;
        if (rc < 0) {
            setSessionError(err, ErrorKind::ConnectionLost, "channel write failed");
            return false;
        }
        off += (std::size_t)rc;
    }
    return true;
}

bool Libssh2Transport::resize(int rows, int cols, Error& err) {
    if (aborted_.load() || !channel_) {
        err = Error(ErrorKind::NotConnected, "SSH transport not connected", hostId_);
        return false;
    }
    long rc = 0;
    if (!ssh2::callRetry(*this, operationDeadline(), rc, err,
                         [&] { return libssh2_channel_request_pty_size(channel_, cols, rows); }))
        return false;
    if (rc != 0) {
        setSessionError(err, ErrorKind::ProtocolError, "pty resize failed");
        return false;
    }
    return true;
}

std::unique_ptr<SftpChannel> Libssh2Transport::openSftp(Error& err) {
    if (!isConnected() || !session_) {
        err = Error(ErrorKind::NotConnected, "SSH transport not connected", hostId_);
        return nullptr;
    }
    LIBSSH2_SFTP* sftp = ssh2::callRetryPtr<LIBSSH2_SFTP>(*this, operationDeadline(), err,
                                                          [&] { return libssh2_sftp_init(session_); });
    if (!sftp) {
        if (err.ok()) setSessionError(err, ErrorKind::ProtocolError, "SFTP subsystem unavailable");
        return nullptr;
    }
    return std::make_unique<Libssh2SftpChannel>(*this, sftp);
}

void Libssh2Transport::abort() {
    aborted_ = true;
    net::shutdownFd(sock_.load());
}

void Libssh2Transport::close() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (session_) {
            // Teardown in blocking mode with a short bound; after abort() the socket fails fast.
            libssh2_session_set_blocking(session_, 1);
            libssh2_session_set_timeout(session_, aborted_.load() ? 1000 : 5000);
            if (channel_) {
                libssh2_channel_close(channel_);
                libssh2_channel_free(channel_);
                channel_ = nullptr;
            }
            if (!aborted_.load()) libssh2_session_disconnect(session_, "bye");
            libssh2_session_free(session_);
            session_ = nullptr;
        }
    }
    int fd = sock_.exchange(-1);
    net::closeFd(fd);
    connected_ = false;
}

} // namespace sshdeck
