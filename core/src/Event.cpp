// Event factories and the subscriber queue.
#include "sshdeck/Event.hpp"

namespace sshdeck {

Event Event::stateChanged(const std::string& sessionId, SessionState from, SessionState to) {
    Event ev;
    ev.type = Type::SessionStateChanged;
    ev.sessionId = sessionId;
    ev.previous = from;
    ev.state = to;
    return ev;
}

Event Event::shellData(const std::string& sessionId, std::string bytes) {
    Event ev;
    ev.type = Type::ShellData;
    ev.sessionId = sessionId;
    ev.data = std::move(bytes);
    return ev;
}

Event Event::transferProgress(const TransferTask& t) {
    Event ev;
    ev.type = Type::TransferProgress;
    ev.sessionId = t.sessionId;
    ev.task = t;
    ev.task.listing.clear();
    return ev;
}

Event Event::transferDone(const TransferTask& t) {
    Event ev;
    ev.type = Type::TransferDone;
    ev.sessionId = t.sessionId;
    ev.task = t;
    return ev;
}

Event Event::failure(const std::string& sessionId, const sshdeck::Error& e) {
    Event ev;
    ev.type = Type::Error;
    ev.sessionId = sessionId;
    ev.error = e;
    return ev;
}

const char* toString(Event::Type t) {
    switch (t) {
        case Event::Type::SessionStateChanged: return "SessionStateChanged";
        case Event::Type::ShellData: return "ShellData";
        case Event::Type::TransferProgress: return "TransferProgress";
        case Event::Type::TransferDone: return "TransferDone";
        case Event::Type::Error: return "Error";
    }
    return "?";
}

EventStream::EventStream(std::string sessionFilter) : filter_(std::move(sessionFilter)) {}

bool EventStream::accepts(const Event& ev) const {
    return filter_.empty() || filter_ == ev.sessionId;
}

void EventStream::push(Event ev) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_) return;
        queue_.push_back(std::move(ev));
    }
    cv_.notify_one();
}

bool EventStream::next(Event& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_for(lk, timeout, [&] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return false;
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

bool EventStream::tryNext(Event& out) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (queue_.empty()) return false;
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void EventStream::close() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventStream::closed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
}

std::size_t EventStream::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.size();
}

} // namespace sshdeck
