// Owns the live sessions, routes commands by session id and fans events out to
// subscribers. Entry point of the core for a presentation layer.
#pragma once
#include "CredentialProvider.hpp"
#include "Event.hpp"
#include "Session.hpp"
#include "TransferEngine.hpp"
#include "Transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sshdeck {

// What createSession does while another session of the same host is still
// Connecting or Authenticating.
enum class DuplicateHostPolicy {
    ReturnExisting,  // hand back the in-flight session id
    Reject           // fail with AlreadyConnecting
};

struct SessionManagerOptions {
    SessionOptions session;
    DuplicateHostPolicy duplicateHostPolicy = DuplicateHostPolicy::ReturnExisting;
};

// Commands on ids this manager never issued throw std::out_of_range. A closed id
// stays reserved: every command on it fails with NotConnected except
// reopenSession, which brings the session back.
class SessionManager {
public:
    explicit SessionManager(std::shared_ptr<CredentialProvider> credentials,
                            std::shared_ptr<TransportFactory> factory = std::make_shared<DefaultTransportFactory>(),
                            SessionManagerOptions options = {});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // New Idle session bound to the host. Ids are s1, s2, ... and never reused.
    bool createSession(const HostDescriptor& host, std::string& sessionId, Error& err);
    bool openSession(const std::string& sessionId, Error& err);
    // Disconnected/Failed -> Idle -> Connecting; also the only way back for a closed id.
    bool reopenSession(const std::string& sessionId, Error& err);
    // Releases the transport, drops the session's finished tasks and closes the
    // streams subscribed to it. Closing a closed id is a no-op.
    bool closeSession(const std::string& sessionId, Error& err);

    bool sendInput(const std::string& sessionId, const std::string& bytes, Error& err);
    bool resizeTerminal(const std::string& sessionId, int rows, int cols, Error& err);

    // Empty id subscribes to every session. A closed id gets an already closed stream.
    std::shared_ptr<EventStream> subscribe(const std::string& sessionId = {});
    void unsubscribe(const std::shared_ptr<EventStream>& stream);

    bool submitTransfer(const std::string& sessionId, const TransferRequest& req,
                        std::uint64_t& taskId, Error& err);
    bool cancelTransfer(std::uint64_t taskId);
    std::optional<TransferTask> transferTask(std::uint64_t taskId) const;
    bool waitTransfer(std::uint64_t taskId, std::chrono::milliseconds timeout) const;
    // Forgets every finished task; returns how many were dropped.
    std::size_t clearCompleted();

    std::optional<SessionInfo> sessionInfo(const std::string& sessionId) const;
    std::vector<SessionInfo> sessions() const;

    void closeAll();

    const SessionManagerOptions& options() const { return options_; }

private:
    struct Slot {
        std::unique_ptr<Session> session;
        std::mutex command;  // serializes write/close/reopen/resize
    };

    // Throws std::out_of_range for never-issued ids; nullptr + NotConnected for closed ones.
    std::shared_ptr<Slot> lookup(const std::string& sessionId, Error& err) const;
    bool isClosed(const std::string& sessionId) const;
    // Reconnect step of a session: enters Connecting under hostGuardMtx_.
    bool gateReconnect(const std::string& sessionId, const std::string& hostId,
                       const std::function<void()>& enter);
    // Session of `hostId` in Connecting/Authenticating, other than `except`. Requires hostGuardMtx_.
    std::string inflightFor(const std::string& hostId, const std::string& except) const;
    void dispatch(const Event& ev);

    const SessionManagerOptions options_;
    std::shared_ptr<CredentialProvider> credentials_;
    std::shared_ptr<TransportFactory> factory_;

    std::mutex dispatchMtx_;
    std::vector<std::weak_ptr<EventStream>> streams_;
    std::set<std::string> silenced_;   // closed ids; their events are dropped
    std::uint64_t sequence_ = 0;

    TransferEngine engine_;

    std::mutex hostGuardMtx_;          // per-host Connecting/Authenticating check
    mutable std::mutex tableMtx_;
    std::map<std::string, std::shared_ptr<Slot>> table_;
    std::set<std::string> closed_;     // closed and not reopened
    std::uint64_t nextId_ = 0;
};

} // namespace sshdeck
