// Helpers shared by the core test suites.
#pragma once
#include "sshdeck/Event.hpp"
#include "sshdeck/MockTransport.hpp"
#include "sshdeck/SessionTypes.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sshdeck::test {

using namespace std::chrono_literals;

// Polls `pred` until it holds or the timeout expires.
inline bool waitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

inline HostDescriptor sshHost(const std::string& id) {
    HostDescriptor h;
    h.id = id;
    h.address = id + ".example";
    h.protocol = Protocol::SSH;
    h.authMethod = AuthMethod::Password;
    h.username = "alice";
    return h;
}

inline HostDescriptor telnetHost(const std::string& id) {
    HostDescriptor h = sshHost(id);
    h.protocol = Protocol::Telnet;
    return h;
}

// Fast policy so reconnect tests do not sleep for seconds.
inline ReconnectPolicy quickReconnect(int maxAttempts) {
    ReconnectPolicy p;
    p.enabled = true;
    p.baseDelay = std::chrono::milliseconds(1);
    p.maxDelay = std::chrono::milliseconds(4);
    p.maxAttempts = maxAttempts;
    return p;
}

// Accumulates events from a stream for later inspection.
class EventLog {
public:
    explicit EventLog(std::shared_ptr<EventStream> stream) : stream_(std::move(stream)) {}

    // Drains the stream until `pred` matches an event or the timeout expires.
    bool waitFor(const std::function<bool(const Event&)>& pred,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        for (const auto& ev : events_)
            if (pred(ev)) return true;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            Event ev;
            if (!stream_->next(ev, std::chrono::milliseconds(20))) continue;
            events_.push_back(ev);
            if (pred(ev)) return true;
        }
        return false;
    }

    bool waitForState(const std::string& sessionId, SessionState s,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        return waitFor([&](const Event& ev) {
            return ev.type == Event::Type::SessionStateChanged && ev.sessionId == sessionId &&
                   ev.state == s;
        }, timeout);
    }

    void drain() {
        Event ev;
        while (stream_->tryNext(ev)) events_.push_back(ev);
    }

    std::vector<SessionState> states(const std::string& sessionId) {
        drain();
        std::vector<SessionState> out;
        for (const auto& ev : events_)
            if (ev.type == Event::Type::SessionStateChanged && ev.sessionId == sessionId)
                out.push_back(ev.state);
        return out;
    }

    std::string shellText(const std::string& sessionId) {
        drain();
        std::string out;
        for (const auto& ev : events_)
            if (ev.type == Event::Type::ShellData && ev.sessionId == sessionId) out += ev.data;
        return out;
    }

    std::vector<Event> ofType(Event::Type t) {
        drain();
        std::vector<Event> out;
        for (const auto& ev : events_)
            if (ev.type == t) out.push_back(ev);
        return out;
    }

    const std::vector<Event>& all() {
        drain();
        return events_;
    }

private:
    std::shared_ptr<EventStream> stream_;
    std::vector<Event> events_;
};

// Temporary local file removed on scope exit.
class TempFile {
public:
    explicit TempFile(const std::string& content = {}) {
        char tmpl[] = "/tmp/sshdeck_test_XXXXXX";
        int fd = ::mkstemp(tmpl);
        if (fd >= 0) ::close(fd);
        path_ = tmpl;
        write(content);
    }
    ~TempFile() { std::remove(path_.c_str()); }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

    void write(const std::string& content) const {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read() const {
        std::ifstream in(path_, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

private:
    std::string path_;
};

inline bool isLocalDir(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

inline bool isLocalFile(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

inline bool makeLocalDir(const std::string& path) {
    return ::mkdir(path.c_str(), 0755) == 0;
}

inline void writeLocal(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readLocal(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline void removeLocalTree(const std::string& path) {
    if (DIR* d = ::opendir(path.c_str())) {
        while (dirent* e = ::readdir(d)) {
            const std::string name = e->d_name;
            if (name == "." || name == "..") continue;
            removeLocalTree(path + "/" + name);
        }
        ::closedir(d);
        ::rmdir(path.c_str());
    } else {
        std::remove(path.c_str());
    }
}

// Temporary local directory removed with its contents on scope exit.
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/sshdeck_dir_XXXXXX";
        if (::mkdtemp(tmpl)) path_ = tmpl;
    }
    ~TempDir() {
        if (!path_.empty()) removeLocalTree(path_);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

inline std::string patternBytes(std::size_t n) {
    std::string s(n, '\0');
    for (std::size_t i = 0; i < n; ++i) s[i] = (char)('a' + (i * 7) % 26);
    return s;
}

} // namespace sshdeck::test
