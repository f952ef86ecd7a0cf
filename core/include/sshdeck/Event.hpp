// Events emitted by sessions and transfers, and the pull queue subscribers read them from.
#pragma once
#include "Errors.hpp"
#include "SessionTypes.hpp"
#include "TransferTypes.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace sshdeck {

struct Event {
    enum class Type { SessionStateChanged, ShellData, TransferProgress, TransferDone, Error } type =
        Type::SessionStateChanged;
    std::string   sessionId;
    std::uint64_t sequence = 0;      // manager-wide emission order

    // SessionStateChanged
    SessionState state = SessionState::Idle;
    SessionState previous = SessionState::Idle;
    // ShellData: raw bytes from the remote side
    std::string data;
    // TransferProgress / TransferDone: snapshot of the task
    TransferTask task;
    // Error: kind + host + optional remote message
    sshdeck::Error error;

    static Event stateChanged(const std::string& sessionId, SessionState from, SessionState to);
    static Event shellData(const std::string& sessionId, std::string bytes);
    static Event transferProgress(const TransferTask& t);
    static Event transferDone(const TransferTask& t);
    static Event failure(const std::string& sessionId, const sshdeck::Error& e);
};

const char* toString(Event::Type t);

// Thread-safe FIFO handed to subscribers. An empty filter receives every session.
class EventStream {
public:
    explicit EventStream(std::string sessionFilter = {});

    const std::string& filter() const { return filter_; }
    bool accepts(const Event& ev) const;

    void push(Event ev);

    // Waits up to `timeout` for the next event. Returns false on timeout, or once the
    // stream is closed and drained.
    bool next(Event& out, std::chrono::milliseconds timeout);
    bool tryNext(Event& out);

    void close();
    bool closed() const;
    std::size_t pending() const;

private:
    std::string filter_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    bool closed_ = false;
};

} // namespace sshdeck
