// Session state machine and I/O thread.
#include "sshdeck/Session.hpp"
#include "sshdeck/Log.hpp"
#include "telnet/TelnetLogin.hpp"

#include <vector>

namespace sshdeck {

namespace {

constexpr std::size_t kReadChunk = 16 * 1024;

bool isActive(SessionState s) {
    return s == SessionState::Connecting || s == SessionState::Authenticating ||
           s == SessionState::Connected || s == SessionState::Reconnecting;
}

} // namespace

Session::Session(std::string id,
                 HostDescriptor host,
                 SessionOptions opt,
                 std::shared_ptr<TransportFactory> factory,
                 std::shared_ptr<CredentialProvider> credentials,
                 EventSink emit)
    : id_(std::move(id)),
      host_(std::move(host)),
      opt_(std::move(opt)),
      factory_(std::move(factory)),
      credentials_(std::move(credentials)),
      emit_(std::move(emit)),
      createdAt_(std::chrono::system_clock::now()),
      lastActivityAt_(createdAt_) {}

Session::~Session() {
    close();
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

SessionInfo Session::info() const {
    std::lock_guard<std::mutex> lk(mtx_);
    SessionInfo si;
    si.id = id_;
    si.host = host_;
    si.state = state_;
    si.createdAt = createdAt_;
    si.lastActivityAt = lastActivityAt_;
    si.reconnectAttempts = reconnectAttempts_;
    si.hasTransport = transport_ != nullptr;
    return si;
}

void Session::setListener(TransportListener* listener) {
    std::lock_guard<std::mutex> lk(mtx_);
    listener_ = listener;
}

void Session::setReconnectGate(ReconnectGate gate) {
    std::lock_guard<std::mutex> lk(mtx_);
    reconnectGate_ = std::move(gate);
}

void Session::setState(SessionState s) {
    if (state_ == s) return;
    const SessionState prev = state_;
    state_ = s;
    LOGI("session %s [%s]: %s -> %s", id_.c_str(), host_.id.c_str(), toString(prev), toString(s));
    if (emit_) emit_(Event::stateChanged(id_, prev, s));
}

bool Session::advance(SessionState s) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (stopRequested_.load()) return false;
    setState(s);
    return true;
}

void Session::touch() {
    std::lock_guard<std::mutex> lk(mtx_);
    lastActivityAt_ = std::chrono::system_clock::now();
}

void Session::emitError(const Error& err) {
    Error e = err;
    if (e.host.empty()) e.host = host_.id;
    if (emit_) emit_(Event::failure(id_, e));
}

bool Session::open(Error& err) {
    std::lock_guard<std::mutex> life(lifecycleMtx_);
    std::lock_guard<std::mutex> lk(mtx_);
    if (isActive(state_)) return true;
    if (state_ != SessionState::Idle) {
        err = Error(ErrorKind::NotConnected,
                    std::string("session is ") + toString(state_) + "; reopen it first", host_.id);
        return false;
    }
    stopRequested_ = false;
    reconnectAttempts_ = 0;
    transport_ = factory_->create(host_);
    if (!transport_) {
        err = Error(ErrorKind::ProtocolError, "no transport for this host", host_.id);
        return false;
    }
    setState(SessionState::Connecting);
    io_ = std::thread(&Session::run, this);
    return true;
}

bool Session::reopen(Error& err) {
    {
        std::lock_guard<std::mutex> life(lifecycleMtx_);
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (isActive(state_)) return true;
        }
        // The I/O thread has already left run() in a terminal state.
        if (io_.joinable()) io_.join();
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_ == SessionState::Disconnected || state_ == SessionState::Failed) setState(SessionState::Idle);
    }
    return open(err);
}

void Session::close() {
    std::lock_guard<std::mutex> life(lifecycleMtx_);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopRequested_ = true;
        if (transport_) transport_->abort();
    }
    cv_.notify_all();
    if (io_.joinable()) io_.join();
    release(SessionState::Disconnected, false);
}

bool Session::beginCall(Transport*& t, Error& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (state_ != SessionState::Connected || releasing_ || !transport_) {
        err = Error(ErrorKind::NotConnected,
                    std::string("session is ") + toString(state_), host_.id);
        return false;
    }
    ++activeCalls_;
    t = transport_.get();
    return true;
}

void Session::endCall() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        --activeCalls_;
    }
    cv_.notify_all();
}

bool Session::write(const std::string& bytes, Error& err) {
    Transport* t = nullptr;
    if (!beginCall(t, err)) return false;
    const bool ok = t->write(bytes.data(), bytes.size(), err);
    endCall();
    if (!ok) {
        if (err.host.empty()) err.host = host_.id;
        return false;
    }
    touch();
    if (host_.protocol == Protocol::Telnet && host_.telnetLocalEcho && emit_)
        emit_(Event::shellData(id_, bytes));
    return true;
}

bool Session::resize(int rows, int cols, Error& err) {
    Transport* t = nullptr;
    if (!beginCall(t, err)) return false;
    bool ok = true;
    if (t->supportsResize()) ok = t->resize(rows, cols, err);
    endCall();
    if (!ok && err.host.empty()) err.host = host_.id;
    return ok;
}

bool Session::withSftp(const SftpWork& work, Error& err) {
    Transport* t = nullptr;
    if (!beginCall(t, err)) return false;
    struct CallGuard {
        Session& s;
        ~CallGuard() { s.endCall(); }
    } guard{*this};

    SftpChannel* ch = nullptr;
    {
        std::lock_guard<std::mutex> lk(sftpMtx_);
        if (!sftp_) {
            sftp_ = t->openSftp(err);
            if (!sftp_) {
                if (err.ok()) err = Error(ErrorKind::ProtocolError, "cannot open SFTP channel", host_.id);
                return false;
            }
            LOGD("session %s: SFTP channel opened", id_.c_str());
        }
        ch = sftp_.get();
    }
    const bool ok = work(*ch, err);
    if (ok) touch();
    else if (err.host.empty()) err.host = host_.id;
    return ok;
}

void Session::run() {
    for (;;) {
        Error err;
        if (!connectOnce(err)) {
            if (stopRequested_.load()) return;
            if (err.kind == ErrorKind::AlreadyConnecting) {
                LOGI("session %s: %s; waiting", id_.c_str(), err.message.c_str());
                if (!waitHostBusy()) return;
                continue;
            }
            LOGW("session %s: connect failed: %s", id_.c_str(), err.describe().c_str());
            emitError(err);
            const bool retry = reconnectAttempts_ > 0 && isRetryable(err.kind) &&
                               reconnectAttempts_ < opt_.reconnect.maxAttempts;
            if (!retry) {
                release(SessionState::Failed, false);
                return;
            }
            release(SessionState::Reconnecting, false);
            if (!backoff()) return;
            continue;
        }

        Error lost;
        const ReadEnd end = readLoop(lost);
        if (end == ReadEnd::Stopped) return;
        if (end == ReadEnd::Closed) {
            LOGI("session %s: remote side closed the shell", id_.c_str());
            release(SessionState::Disconnected, false);
            return;
        }
        LOGW("session %s: connection lost: %s", id_.c_str(), lost.describe().c_str());
        emitError(lost);
        if (!opt_.reconnect.enabled || opt_.reconnect.maxAttempts <= 0) {
            release(SessionState::Disconnected, true);
            return;
        }
        release(SessionState::Reconnecting, true);
        if (!backoff()) return;
    }
}

bool Session::backoff() {
    std::unique_lock<std::mutex> lk(mtx_);
    ++reconnectAttempts_;
    const auto delay = opt_.reconnect.delayFor(reconnectAttempts_);
    LOGI("session %s: reconnect attempt %d in %lld ms", id_.c_str(), reconnectAttempts_,
         (long long)delay.count());
    cv_.wait_for(lk, delay, [this] { return stopRequested_.load(); });
    return !stopRequested_.load();
}

bool Session::waitHostBusy() {
    std::unique_lock<std::mutex> lk(mtx_);
    const auto delay = opt_.reconnect.delayFor(reconnectAttempts_ > 0 ? reconnectAttempts_ : 1);
    cv_.wait_for(lk, delay, [this] { return stopRequested_.load(); });
    return !stopRequested_.load();
}

bool Session::connectOnce(Error& err) {
    Transport* t = nullptr;
    ReconnectGate gate;
    bool reconnecting = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        gate = reconnectGate_;
        reconnecting = state_ == SessionState::Reconnecting;
    }
    auto enter = [this, &t] {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopRequested_.load() || !transport_) return;
        t = transport_.get();
        setState(SessionState::Connecting);
    };
    if (reconnecting && gate) {
        if (!gate(enter)) {
            err = Error(ErrorKind::AlreadyConnecting, "another session of this host is connecting", host_.id);
            return false;
        }
    } else {
        enter();
    }
    if (!t) {
        err = Error(ErrorKind::Cancelled, "session closing", host_.id);
        return false;
    }

    if (!t->connect(host_, opt_.transport, err)) return false;

    std::optional<Secret> secret;
    if (credentials_) secret = credentials_->get(host_.id);

    if (t->requiresAuthentication()) {
        if (!advance(SessionState::Authenticating)) {
            err = Error(ErrorKind::Cancelled, "session closing", host_.id);
            return false;
        }
        const bool ok = t->authenticate(host_, secret ? *secret : Secret{}, opt_.transport, err);
        if (secret) secret->wipe();
        if (!ok) return false;
    } else {
        std::optional<std::string> password;
        if (secret) password = secret->password;
        if (!host_.username.empty() || password)
            login_ = std::make_unique<telnet::TelnetLogin>(host_.username, std::move(password));
        if (secret) secret->wipe();
    }

    if (!t->openShell(opt_.transport, err)) return false;

    std::lock_guard<std::mutex> lk(mtx_);
    if (stopRequested_.load()) {
        err = Error(ErrorKind::Cancelled, "session closing", host_.id);
        return false;
    }
    reconnectAttempts_ = 0;
    lastActivityAt_ = std::chrono::system_clock::now();
    setState(SessionState::Connected);
    return true;
}

Session::ReadEnd Session::readLoop(Error& lost) {
    Transport* t = nullptr;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        t = transport_.get();
    }
    std::vector<char> buf(kReadChunk);
    while (!stopRequested_.load()) {
        Error err;
        long n = t->read(buf.data(), buf.size(), opt_.readTimeout, err);
        if (n == 0) continue;
        if (n < 0) {
            if (stopRequested_.load() || err.kind == ErrorKind::Cancelled) return ReadEnd::Stopped;
            if (err.ok()) return ReadEnd::Closed;
            lost = err;
            if (lost.host.empty()) lost.host = host_.id;
            return ReadEnd::Lost;
        }
        std::string data(buf.data(), (std::size_t)n);
        touch();
        if (emit_) emit_(Event::shellData(id_, data));
        if (login_) {
            std::string reply = login_->onOutput(data);
            if (!reply.empty()) {
                Error werr;
                if (!t->write(reply.data(), reply.size(), werr))
                    LOGW("session %s: telnet login reply failed: %s", id_.c_str(), werr.describe().c_str());
                wipeString(reply);
            }
            if (login_->finished()) login_.reset();
        }
    }
    return ReadEnd::Stopped;
}

void Session::release(SessionState target, bool lost) {
    TransportListener* listener = nullptr;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        releasing_ = true;
        listener = listener_;
    }
    if (listener) listener->transportReleasing(id_, lost);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (transport_) transport_->abort();
    }
    if (listener) listener->transportReleased(id_);

    std::unique_ptr<Transport> old;
    {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return activeCalls_ == 0; });
        old = std::move(transport_);
    }
    {
        std::lock_guard<std::mutex> lk(sftpMtx_);
        sftp_.reset();
    }
    if (old) {
        old->close();
        old.reset();
    }
    login_.reset();

    std::lock_guard<std::mutex> lk(mtx_);
    if (target == SessionState::Reconnecting) transport_ = factory_->create(host_);
    setState(target);
    releasing_ = false;
}

} // namespace sshdeck
