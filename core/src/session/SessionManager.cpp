// Session table, command routing and event fan-out.
#include "sshdeck/SessionManager.hpp"
#include "sshdeck/Log.hpp"

#include <stdexcept>

namespace sshdeck {

SessionManager::SessionManager(std::shared_ptr<CredentialProvider> credentials,
                               std::shared_ptr<TransportFactory> factory,
                               SessionManagerOptions options)
    : options_(std::move(options)),
      credentials_(std::move(credentials)),
      factory_(std::move(factory)),
      engine_([this](const Event& ev) { dispatch(ev); }) {
    if (!factory_) factory_ = std::make_shared<DefaultTransportFactory>();
}

SessionManager::~SessionManager() {
    closeAll();
    std::lock_guard<std::mutex> lk(dispatchMtx_);
    for (auto& w : streams_) {
        if (auto s = w.lock()) s->close();
    }
    streams_.clear();
}

std::shared_ptr<SessionManager::Slot> SessionManager::lookup(const std::string& sessionId,
                                                             Error& err) const {
    std::lock_guard<std::mutex> lk(tableMtx_);
    auto it = table_.find(sessionId);
    if (it == table_.end()) throw std::out_of_range("unknown session id: " + sessionId);
    if (closed_.count(sessionId)) {
        err = Error(ErrorKind::NotConnected, "session " + sessionId + " is closed");
        return nullptr;
    }
    return it->second;
}

bool SessionManager::isClosed(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lk(tableMtx_);
    return closed_.count(sessionId) > 0;
}

std::string SessionManager::inflightFor(const std::string& hostId, const std::string& except) const {
    std::lock_guard<std::mutex> lk(tableMtx_);
    for (const auto& kv : table_) {
        if (kv.first == except) continue;
        const Session& s = *kv.second->session;
        if (s.host().id != hostId) continue;
        const SessionState st = s.state();
        if (st == SessionState::Connecting || st == SessionState::Authenticating) return kv.first;
    }
    return {};
}

bool SessionManager::gateReconnect(const std::string& sessionId, const std::string& hostId,
                                   const std::function<void()>& enter) {
    std::lock_guard<std::mutex> guard(hostGuardMtx_);
    if (!inflightFor(hostId, sessionId).empty()) return false;
    enter();
    return true;
}

bool SessionManager::createSession(const HostDescriptor& host, std::string& sessionId, Error& err) {
    if (host.id.empty()) throw std::invalid_argument("host descriptor without id");

    std::lock_guard<std::mutex> guard(hostGuardMtx_);
    const std::string existing = inflightFor(host.id, {});
    if (!existing.empty()) {
        if (options_.duplicateHostPolicy == DuplicateHostPolicy::ReturnExisting) {
            LOGI("host %s already connecting in %s; reusing it", host.id.c_str(), existing.c_str());
            sessionId = existing;
            return true;
        }
        err = Error(ErrorKind::AlreadyConnecting, "already connecting in session " + existing, host.id);
        return false;
    }

    std::string id;
    {
        std::lock_guard<std::mutex> lk(tableMtx_);
        id = "s" + std::to_string(++nextId_);
    }
    auto slot = std::make_shared<Slot>();
    slot->session = std::make_unique<Session>(id, host, options_.session, factory_, credentials_,
                                              [this](const Event& ev) { dispatch(ev); });
    slot->session->setListener(&engine_);
    slot->session->setReconnectGate([this, id, hostId = host.id](const std::function<void()>& enter) {
        return gateReconnect(id, hostId, enter);
    });
    {
        std::lock_guard<std::mutex> lk(tableMtx_);
        table_[id] = slot;
    }
    LOGI("session %s created for host %s (%s)", id.c_str(), host.id.c_str(), toString(host.protocol));
    sessionId = id;
    return true;
}

bool SessionManager::openSession(const std::string& sessionId, Error& err) {
    auto slot = lookup(sessionId, err);
    if (!slot) return false;
    std::lock_guard<std::mutex> cmd(slot->command);
    if (isClosed(sessionId)) {
        err = Error(ErrorKind::NotConnected, "session " + sessionId + " is closed");
        return false;
    }
    std::lock_guard<std::mutex> guard(hostGuardMtx_);
    const std::string& hostId = slot->session->host().id;
    const std::string other = inflightFor(hostId, sessionId);
    if (!other.empty()) {
        err = Error(ErrorKind::AlreadyConnecting, "already connecting in session " + other, hostId);
        return false;
    }
    return slot->session->open(err);
}

bool SessionManager::reopenSession(const std::string& sessionId, Error& err) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lk(tableMtx_);
        auto it = table_.find(sessionId);
        if (it == table_.end()) throw std::out_of_range("unknown session id: " + sessionId);
        slot = it->second;
    }
    std::lock_guard<std::mutex> cmd(slot->command);
    std::lock_guard<std::mutex> guard(hostGuardMtx_);
    const std::string& hostId = slot->session->host().id;
    const std::string other = inflightFor(hostId, sessionId);
    if (!other.empty()) {
        err = Error(ErrorKind::AlreadyConnecting, "already connecting in session " + other, hostId);
        return false;
    }
    if (isClosed(sessionId)) {
        {
            std::lock_guard<std::mutex> lk(dispatchMtx_);
            silenced_.erase(sessionId);
        }
        std::lock_guard<std::mutex> lk(tableMtx_);
        closed_.erase(sessionId);
        LOGI("session %s reopened after close", sessionId.c_str());
    }
    return slot->session->reopen(err);
}

bool SessionManager::closeSession(const std::string& sessionId, Error& err) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lk(tableMtx_);
        auto it = table_.find(sessionId);
        if (it == table_.end()) throw std::out_of_range("unknown session id: " + sessionId);
        if (closed_.count(sessionId)) return true;
        slot = it->second;
    }
    std::lock_guard<std::mutex> cmd(slot->command);
    if (isClosed(sessionId)) return true;
    slot->session->close();
    {
        std::lock_guard<std::mutex> lk(dispatchMtx_);
        silenced_.insert(sessionId);
        // Per-session readers see the end of their stream
        for (auto it = streams_.begin(); it != streams_.end();) {
            auto s = it->lock();
            if (s && s->filter() == sessionId) s->close();
            if (!s || s->closed()) it = streams_.erase(it);
            else ++it;
        }
    }
    {
        std::lock_guard<std::mutex> lk(tableMtx_);
        closed_.insert(sessionId);
    }
    const std::size_t dropped = engine_.forgetSession(sessionId);
    err.clear();
    LOGI("session %s closed (%zu finished tasks dropped)", sessionId.c_str(), dropped);
    return true;
}

bool SessionManager::sendInput(const std::string& sessionId, const std::string& bytes, Error& err) {
    auto slot = lookup(sessionId, err);
    if (!slot) return false;
    std::lock_guard<std::mutex> cmd(slot->command);
    return slot->session->write(bytes, err);
}

bool SessionManager::resizeTerminal(const std::string& sessionId, int rows, int cols, Error& err) {
    if (rows <= 0 || cols <= 0) {
        err = Error(ErrorKind::ProtocolError, "invalid terminal size");
        return false;
    }
    auto slot = lookup(sessionId, err);
    if (!slot) return false;
    std::lock_guard<std::mutex> cmd(slot->command);
    return slot->session->resize(rows, cols, err);
}

std::shared_ptr<EventStream> SessionManager::subscribe(const std::string& sessionId) {
    bool closed = false;
    if (!sessionId.empty()) {
        std::lock_guard<std::mutex> lk(tableMtx_);
        if (!table_.count(sessionId)) throw std::out_of_range("unknown session id: " + sessionId);
        closed = closed_.count(sessionId) > 0;
    }
    auto stream = std::make_shared<EventStream>(sessionId);
    // A closed id produces no events until it is reopened
    if (closed) {
        stream->close();
        return stream;
    }
    std::lock_guard<std::mutex> lk(dispatchMtx_);
    streams_.push_back(stream);
    return stream;
}

void SessionManager::unsubscribe(const std::shared_ptr<EventStream>& stream) {
    if (!stream) return;
    stream->close();
    std::lock_guard<std::mutex> lk(dispatchMtx_);
    for (auto it = streams_.begin(); it != streams_.end();) {
        auto s = it->lock();
        if (!s || s == stream) it = streams_.erase(it);
        else ++it;
    }
}

void SessionManager::dispatch(const Event& ev) {
    std::lock_guard<std::mutex> lk(dispatchMtx_);
    if (silenced_.count(ev.sessionId)) return;
    Event out = ev;
    out.sequence = ++sequence_;
    for (auto it = streams_.begin(); it != streams_.end();) {
        auto s = it->lock();
        if (!s || s->closed()) {
            it = streams_.erase(it);
            continue;
        }
        if (s->accepts(out)) s->push(out);
        ++it;
    }
}

bool SessionManager::submitTransfer(const std::string& sessionId, const TransferRequest& req,
                                    std::uint64_t& taskId, Error& err) {
    auto slot = lookup(sessionId, err);
    if (!slot) return false;
    // Keeps close() from releasing the session between the state check and the worker start
    std::lock_guard<std::mutex> cmd(slot->command);
    return engine_.submit(*slot->session, req, taskId, err);
}

bool SessionManager::cancelTransfer(std::uint64_t taskId) {
    return engine_.cancel(taskId);
}

std::optional<TransferTask> SessionManager::transferTask(std::uint64_t taskId) const {
    return engine_.task(taskId);
}

bool SessionManager::waitTransfer(std::uint64_t taskId, std::chrono::milliseconds timeout) const {
    return engine_.wait(taskId, timeout);
}

std::size_t SessionManager::clearCompleted() {
    return engine_.clearCompleted();
}

std::optional<SessionInfo> SessionManager::sessionInfo(const std::string& sessionId) const {
    Error err;
    auto slot = lookup(sessionId, err);
    if (!slot) return std::nullopt;
    return slot->session->info();
}

std::vector<SessionInfo> SessionManager::sessions() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lk(tableMtx_);
        for (const auto& kv : table_)
            if (!closed_.count(kv.first)) slots.push_back(kv.second);
    }
    std::vector<SessionInfo> out;
    out.reserve(slots.size());
    for (const auto& s : slots) out.push_back(s->session->info());
    return out;
}

void SessionManager::closeAll() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(tableMtx_);
        for (const auto& kv : table_)
            if (!closed_.count(kv.first)) ids.push_back(kv.first);
    }
    for (const auto& id : ids) {
        Error err;
        if (!closeSession(id, err)) LOGW("close %s failed: %s", id.c_str(), err.describe().c_str());
    }
}

} // namespace sshdeck
