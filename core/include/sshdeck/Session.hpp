// One logical connection to one host: owns the Transport, runs the I/O thread
// (connect, shell read loop, reconnect backoff) and drives the state machine.
#pragma once
#include "CredentialProvider.hpp"
#include "Event.hpp"
#include "SessionTypes.hpp"
#include "Transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sshdeck {

namespace telnet {
class TelnetLogin;
}

struct SessionOptions {
    TransportOptions transport;
    ReconnectPolicy  reconnect;
    // Slice of each shell read; also bounds how long close() waits for the read loop.
    std::chrono::milliseconds readTimeout{200};
};

// Snapshot of a session for listings.
struct SessionInfo {
    std::string    id;
    HostDescriptor host;
    SessionState   state = SessionState::Idle;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point lastActivityAt;
    int  reconnectAttempts = 0;
    bool hasTransport = false;
};

// Notified around transport teardown so work bound to the transport can wind down.
class TransportListener {
public:
    virtual ~TransportListener() = default;
    // Called before the transport is aborted. Must not block. `lost` is true when
    // the connection dropped underneath the session.
    virtual void transportReleasing(const std::string& sessionId, bool lost) = 0;
    // Called after abort(); returns once nothing uses the transport any more.
    virtual void transportReleased(const std::string& sessionId) = 0;
};

class Session {
public:
    using EventSink = std::function<void(const Event&)>;
    using SftpWork = std::function<bool(SftpChannel&, Error&)>;
    // Runs `enter` (the Reconnecting -> Connecting step) unless another session of
    // the same host is connecting; returns false in that case without calling it.
    using ReconnectGate = std::function<bool(const std::function<void()>& enter)>;

    Session(std::string id,
            HostDescriptor host,
            SessionOptions opt,
            std::shared_ptr<TransportFactory> factory,
            std::shared_ptr<CredentialProvider> credentials,
            EventSink emit);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }
    const HostDescriptor& host() const { return host_; }
    SessionState state() const;
    SessionInfo info() const;

    // Not owned; must outlive the session.
    void setListener(TransportListener* listener);
    // Optional; without a gate a reconnect enters Connecting directly.
    void setReconnectGate(ReconnectGate gate);

    // Idle -> Connecting. Idempotent while active; fails with NotConnected once the
    // session reached Disconnected or Failed.
    bool open(Error& err);
    // Disconnected/Failed -> Idle -> Connecting.
    bool reopen(Error& err);
    // Valid from any state; ends in Disconnected with the transport released.
    void close();

    bool write(const std::string& bytes, Error& err);
    // No-op (true) when the transport has no notion of a window size.
    bool resize(int rows, int cols, Error& err);

    // Runs `work` on the session's SFTP channel, opening it on first use.
    // Only while Connected; the transport is not released before `work` returns.
    bool withSftp(const SftpWork& work, Error& err);

private:
    enum class ReadEnd { Stopped, Closed, Lost };

    void run();
    bool connectOnce(Error& err);
    ReadEnd readLoop(Error& lost);
    bool backoff();
    // Waits one backoff slice without spending a reconnect attempt.
    bool waitHostBusy();
    void release(SessionState target, bool lost);
    // Requires mtx_. Emits SessionStateChanged when the state actually changes.
    void setState(SessionState s);
    // I/O thread transitions; false once close() started.
    bool advance(SessionState s);
    void touch();
    void emitError(const Error& err);
    bool beginCall(Transport*& t, Error& err);
    void endCall();

    const std::string id_;
    const HostDescriptor host_;
    const SessionOptions opt_;
    std::shared_ptr<TransportFactory> factory_;
    std::shared_ptr<CredentialProvider> credentials_;
    EventSink emit_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    SessionState state_ = SessionState::Idle;
    std::unique_ptr<Transport> transport_;
    std::unique_ptr<SftpChannel> sftp_;
    std::mutex sftpMtx_;          // lazy SFTP open
    std::unique_ptr<telnet::TelnetLogin> login_;   // I/O thread only
    TransportListener* listener_ = nullptr;
    ReconnectGate reconnectGate_;
    int  activeCalls_ = 0;
    bool releasing_ = false;
    std::atomic<bool> stopRequested_{false};
    int  reconnectAttempts_ = 0;
    std::chrono::system_clock::time_point createdAt_;
    std::chrono::system_clock::time_point lastActivityAt_;

    std::mutex lifecycleMtx_;     // open/reopen/close
    std::thread io_;
};

} // namespace sshdeck
