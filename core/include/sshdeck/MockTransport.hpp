// Simulated transports and SFTP filesystem for tests and UI work without network.
// Each host id gets a script describing how its connection attempts behave.
#pragma once
#include "Transport.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sshdeck {

// Holds a mock transport at a chosen phase until the test releases it.
class MockGate {
public:
    explicit MockGate(bool closed = true) : closed_(closed) {}

    void close();
    void open();
    // Blocks while the gate is closed. Returns false if `stop` became true or
    // the wait exceeded maxWait.
    bool wait(const std::function<bool()>& stop = {},
              std::chrono::milliseconds maxWait = std::chrono::milliseconds(10000));
    int waiting() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool closed_;
    int waiting_ = 0;
};

// Mini simulated "remote FS": path -> node. Shared by every SFTP channel of a host.
class MockFileSystem {
public:
    // Called after every transferred chunk with the bytes done so far.
    using ChunkHook = std::function<void(const std::string& path, std::uint64_t done)>;

    MockFileSystem();

    void addDir(const std::string& path, std::uint32_t mode = 0755);
    void addFile(const std::string& path, std::string content, std::uint32_t mode = 0644);
    // Writes and deletions under the prefix fail with PermissionDenied.
    void setReadOnly(const std::string& prefix);
    void setChunkHook(ChunkHook hook);

    bool exists(const std::string& path) const;
    bool isDir(const std::string& path) const;
    std::optional<std::string> content(const std::string& path) const;
    std::optional<std::uint32_t> mode(const std::string& path) const;

    bool list(const std::string& path, std::vector<FileInfo>& out, Error& err) const;
    bool stat(const std::string& path, FileInfo& info, Error& err) const;
    bool mkdir(const std::string& path, std::uint32_t mode, Error& err);
    bool removeFile(const std::string& path, Error& err);
    bool removeDir(const std::string& path, Error& err);
    bool rename(const std::string& from, const std::string& to, bool overwrite, Error& err);
    bool chmod(const std::string& path, std::uint32_t mode, Error& err);

    // Byte-level access used by the mock SFTP channel.
    bool read(const std::string& path, std::uint64_t offset, std::size_t len,
              std::string& out, Error& err) const;
    bool open(const std::string& path, bool truncate, Error& err);
    bool write(const std::string& path, std::uint64_t offset,
               const char* data, std::size_t len, Error& err);
    void chunkDone(const std::string& path, std::uint64_t done);

    static std::string normalize(const std::string& path);

private:
    struct Node {
        bool dir = false;
        std::string data;
        std::uint32_t mode = 0644;
        std::uint64_t mtime = 0;
    };

    static std::string parentOf(const std::string& path);
    bool writable(const std::string& path) const;     // requires mtx_
    bool hasChildren(const std::string& dir) const;   // requires mtx_

    mutable std::mutex mtx_;
    std::map<std::string, Node> nodes_;
    std::vector<std::string> readOnly_;
    ChunkHook chunkHook_;
};

// Behavior of one scripted host.
struct MockHostScript {
    // Outcome of successive connect() calls; once empty every attempt succeeds.
    std::deque<ErrorKind> connectResults;
    ErrorKind authResult = ErrorKind::None;
    std::string banner = "Last login: never\r\n$ ";
    bool echo = true;                // remote echoes written bytes
    bool sftp = true;
    std::chrono::milliseconds connectDelay{0};
    std::shared_ptr<MockGate> authGate;  // authenticate() waits on it when set
};

class MockTransportFactory : public TransportFactory {
public:
    MockTransportFactory();
    ~MockTransportFactory() override;

    std::unique_ptr<Transport> create(const HostDescriptor& host) override;

    void setScript(const std::string& hostId, MockHostScript script);
    std::shared_ptr<MockFileSystem> fileSystem(const std::string& hostId);

    int connectAttempts(const std::string& hostId) const;
    int authAttempts(const std::string& hostId) const;
    // Transports created and not yet closed
    int liveTransports(const std::string& hostId) const;
    int maxLiveTransports(const std::string& hostId) const;
    // Bytes the client wrote to the host (after the shell was opened)
    std::string written(const std::string& hostId) const;
    // PTY sizes requested, starting with the one sent by openShell()
    std::vector<TerminalSize> resizes(const std::string& hostId) const;
    // Password seen by the last authenticate() call
    std::optional<std::string> lastPassword(const std::string& hostId) const;

    // Network-level drop of every live connection to the host.
    void dropConnection(const std::string& hostId);
    // Orderly end of the remote shell.
    void remoteClose(const std::string& hostId);
    // Bytes as if sent by the host.
    void inject(const std::string& hostId, const std::string& bytes);

    struct Network;

private:
    std::shared_ptr<Network> net_;
};

} // namespace sshdeck
