// Scripted transports: connection outcomes, a loopback shell and SFTP over MockFileSystem.
#include "sshdeck/MockTransport.hpp"
#include "sshdeck/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>

namespace sshdeck {

// ---- MockGate ----

void MockGate::close() {
    std::lock_guard<std::mutex> lk(mtx_);
    closed_ = true;
}

void MockGate::open() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = false;
    }
    cv_.notify_all();
}

bool MockGate::wait(const std::function<bool()>& stop, std::chrono::milliseconds maxWait) {
    const auto deadline = std::chrono::steady_clock::now() + maxWait;
    std::unique_lock<std::mutex> lk(mtx_);
    ++waiting_;
    bool passed = true;
    while (closed_) {
        if (stop && stop()) {
            passed = false;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            passed = false;
            break;
        }
        // Short slices so `stop` is polled
        cv_.wait_for(lk, std::chrono::milliseconds(10));
    }
    --waiting_;
    return passed;
}

int MockGate::waiting() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return waiting_;
}

// ---- Shared network state ----

namespace {

// One simulated connection. Shared between the transport and its SFTP channels.
struct MockLink {
    std::mutex mtx;
    std::condition_variable cv;
    std::string inbox;               // bytes waiting for read()
    std::atomic<bool> aborted{false};
    std::atomic<bool> dropped{false};
    std::atomic<bool> remoteClosed{false};

    bool alive() const { return !aborted.load() && !dropped.load() && !remoteClosed.load(); }

    void deliver(const std::string& bytes) {
        {
            std::lock_guard<std::mutex> lk(mtx);
            inbox += bytes;
        }
        cv.notify_all();
    }

    void mark(std::atomic<bool>& flag) {
        {
            std::lock_guard<std::mutex> lk(mtx);
            flag = true;
        }
        cv.notify_all();
    }
};

} // namespace

struct MockTransportFactory::Network {
    struct Host {
        MockHostScript script;
        std::shared_ptr<MockFileSystem> fs = std::make_shared<MockFileSystem>();
        int connectAttempts = 0;
        int authAttempts = 0;
        int live = 0;
        int maxLive = 0;
        std::string written;
        std::vector<TerminalSize> resizes;
        std::optional<std::string> lastPassword;
        std::vector<std::weak_ptr<MockLink>> links;
    };

    mutable std::mutex mtx;
    std::map<std::string, Host> hosts;

    std::vector<std::shared_ptr<MockLink>> liveLinks(const std::string& hostId) {
        std::vector<std::shared_ptr<MockLink>> out;
        std::lock_guard<std::mutex> lk(mtx);
        auto it = hosts.find(hostId);
        if (it == hosts.end()) return out;
        auto& links = it->second.links;
        links.erase(std::remove_if(links.begin(), links.end(),
                                   [](const std::weak_ptr<MockLink>& w) { return w.expired(); }),
                    links.end());
        for (auto& w : links)
            if (auto l = w.lock()) out.push_back(std::move(l));
        return out;
    }
};

namespace {

constexpr std::size_t CHUNK = 64 * 1024;

struct FileCloser {
    FILE* f;
    ~FileCloser() {
        if (f) std::fclose(f);
    }
    bool close() {
        FILE* tmp = f;
        f = nullptr;
        return tmp && std::fclose(tmp) == 0;
    }
};

class MockSftpChannel : public SftpChannel {
public:
    MockSftpChannel(std::shared_ptr<MockFileSystem> fs, std::shared_ptr<MockLink> link, std::string hostId)
        : fs_(std::move(fs)), link_(std::move(link)), hostId_(std::move(hostId)) {}

    bool list(const std::string& remote_path, std::vector<FileInfo>& out, Error& err) override {
        if (!check(err)) return false;
        if (!fs_->list(remote_path, out, err)) return tag(err);
        // directories first, like a file manager
        std::stable_sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
            return a.is_dir > b.is_dir;
        });
        return true;
    }

    bool stat(const std::string& remote_path, FileInfo& info, Error& err) override {
        if (!check(err)) return false;
        return fs_->stat(remote_path, info, err);
    }

    bool exists(const std::string& remote_path, bool& isDir, Error& err) override {
        FileInfo info;
        if (!stat(remote_path, info, err)) return false;
        isDir = info.is_dir;
        return true;
    }

    bool get(const std::string& remote, const std::string& local, Error& err,
             ProgressCB progress, CancelCB shouldCancel, bool resume) override {
        FileInfo st;
        if (!stat(remote, st, err)) {
            if (err.ok()) err = Error(ErrorKind::RemoteIOError, "no such remote file: " + remote, hostId_);
            return false;
        }
        if (st.is_dir) {
            err = Error(ErrorKind::RemoteIOError, "cannot download a directory: " + remote, hostId_);
            return false;
        }
        const std::uint64_t total = st.size;

        FileCloser lf{nullptr};
        std::uint64_t done = 0;
        if (resume) {
            lf.f = std::fopen(local.c_str(), "ab");
            if (lf.f) {
                std::fseek(lf.f, 0, SEEK_END);
                long cur = std::ftell(lf.f);
                if (cur > 0) done = (std::uint64_t)cur;
                if (done > total) {
                    lf.close();
                    done = 0;
                }
            }
        }
        if (!lf.f) lf.f = std::fopen(local.c_str(), "wb");
        if (!lf.f) {
            err = Error(ErrorKind::LocalIOError, "cannot open local file for writing: " + local, hostId_);
            return false;
        }
        if (progress) progress(done, total);

        std::string chunk;
        while (done < total) {
            if (shouldCancel && shouldCancel()) {
                err = Error(ErrorKind::Cancelled, "cancelled by user", hostId_);
                return false;
            }
            if (!check(err)) return false;
            if (!fs_->read(remote, done, CHUNK, chunk, err)) return tag(err);
            if (chunk.empty()) break;  // shrank underneath us
            if (std::fwrite(chunk.data(), 1, chunk.size(), lf.f) != chunk.size()) {
                err = Error(ErrorKind::LocalIOError, "local write failed: " + local, hostId_);
                return false;
            }
            done += chunk.size();
            if (progress) progress(done, total);
            fs_->chunkDone(remote, done);
        }
        if (!lf.close()) {
            err = Error(ErrorKind::LocalIOError, "local close failed: " + local, hostId_);
            return false;
        }
        return true;
    }

    bool put(const std::string& local, const std::string& remote, Error& err,
             ProgressCB progress, CancelCB shouldCancel, bool resume) override {
        FileCloser lf{std::fopen(local.c_str(), "rb")};
        if (!lf.f) {
            err = Error(ErrorKind::LocalIOError, "cannot open local file for reading: " + local, hostId_);
            return false;
        }
        std::fseek(lf.f, 0, SEEK_END);
        long fsz = std::ftell(lf.f);
        std::fseek(lf.f, 0, SEEK_SET);
        const std::uint64_t total = fsz > 0 ? (std::uint64_t)fsz : 0;

        std::uint64_t done = 0;
        if (resume) {
            FileInfo st;
            if (stat(remote, st, err)) done = st.size;
            else if (!err.ok()) return false;
            if (done > total) done = 0;
        }
        if (!check(err)) return false;
        if (!fs_->open(remote, done == 0, err)) return tag(err);
        if (done > 0 && std::fseek(lf.f, (long)done, SEEK_SET) != 0) {
            err = Error(ErrorKind::LocalIOError, "cannot seek local file: " + local, hostId_);
            return false;
        }
        if (progress) progress(done, total);

        std::vector<char> buf(CHUNK);
        while (true) {
            if (shouldCancel && shouldCancel()) {
                err = Error(ErrorKind::Cancelled, "cancelled by user", hostId_);
                return false;
            }
            size_t n = std::fread(buf.data(), 1, buf.size(), lf.f);
            if (n == 0) {
                if (std::ferror(lf.f)) {
                    err = Error(ErrorKind::LocalIOError, "local read failed: " + local, hostId_);
                    return false;
                }
                break;
            }
            if (!check(err)) return false;
            if (!fs_->write(remote, done, buf.data(), n, err)) return tag(err);
            done += n;
            if (progress) progress(done, total);
            fs_->chunkDone(remote, done);
        }
        return true;
    }

    bool mkdir(const std::string& remote_dir, Error& err, std::uint32_t mode) override {
        if (!check(err)) return false;
        return fs_->mkdir(remote_dir, mode, err) || tag(err);
    }

    bool removeFile(const std::string& remote_path, Error& err) override {
        if (!check(err)) return false;
        return fs_->removeFile(remote_path, err) || tag(err);
    }

    bool removeDir(const std::string& remote_dir, Error& err) override {
        if (!check(err)) return false;
        return fs_->removeDir(remote_dir, err) || tag(err);
    }

    bool rename(const std::string& from, const std::string& to, Error& err, bool overwrite) override {
        if (!check(err)) return false;
        return fs_->rename(from, to, overwrite, err) || tag(err);
    }

    bool chmod(const std::string& remote_path, std::uint32_t mode, Error& err) override {
        if (!check(err)) return false;
        return fs_->chmod(remote_path, mode, err) || tag(err);
    }

    bool isAlive() const override { return link_->alive(); }

private:
    bool check(Error& err) const {
        if (link_->aborted.load()) {
            err = Error(ErrorKind::Cancelled, "transport closed", hostId_);
            return false;
        }
        if (!link_->alive()) {
            err = Error(ErrorKind::ConnectionLost, "connection lost", hostId_);
            return false;
        }
        return true;
    }

    // Always false; stamps the host on a filesystem error.
    bool tag(Error& err) const {
        err.host = hostId_;
        return false;
    }

    std::shared_ptr<MockFileSystem> fs_;
    std::shared_ptr<MockLink> link_;
    std::string hostId_;
};

class MockTransport : public Transport {
public:
    MockTransport(std::shared_ptr<MockTransportFactory::Network> net,
                  const HostDescriptor& host,
                  std::shared_ptr<MockLink> link)
        : net_(std::move(net)), host_(host), link_(std::move(link)) {}

    ~MockTransport() override { close(); }

    bool connect(const HostDescriptor& host, const TransportOptions&, Error& err) override {
        ErrorKind result = ErrorKind::None;
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lk(net_->mtx);
            auto& h = net_->hosts[host.id];
            ++h.connectAttempts;
            if (!h.script.connectResults.empty()) {
                result = h.script.connectResults.front();
                h.script.connectResults.pop_front();
            }
            delay = h.script.connectDelay;
            echo_ = h.script.echo;
            sftp_ = h.script.sftp;
        }
        if (delay.count() > 0) {
            std::unique_lock<std::mutex> lk(link_->mtx);
            link_->cv.wait_for(lk, delay, [&] { return link_->aborted.load(); });
        }
        if (link_->aborted.load()) {
            err = Error(ErrorKind::Cancelled, "connect aborted", host.id);
            return false;
        }
        if (result != ErrorKind::None) {
            err = Error(result, std::string("simulated ") + toString(result), host.id);
            return false;
        }
        connected_ = true;
        LOGD("mock connected to %s", host.id.c_str());
        return true;
    }

    bool requiresAuthentication() const override { return host_.protocol == Protocol::SSH; }

    bool authenticate(const HostDescriptor& host, const Secret& secret,
                      const TransportOptions&, Error& err) override {
        ErrorKind result = ErrorKind::None;
        std::shared_ptr<MockGate> gate;
        {
            std::lock_guard<std::mutex> lk(net_->mtx);
            auto& h = net_->hosts[host.id];
            ++h.authAttempts;
            h.lastPassword = secret.password;
            result = h.script.authResult;
            gate = h.script.authGate;
        }
        if (gate && !gate->wait([this] { return link_->aborted.load(); })) {
            if (link_->aborted.load()) err = Error(ErrorKind::Cancelled, "authentication aborted", host.id);
            else err = Error(ErrorKind::Timeout, "authentication timed out", host.id);
            return false;
        }
        if (link_->aborted.load()) {
            err = Error(ErrorKind::Cancelled, "authentication aborted", host.id);
            return false;
        }
        if (result != ErrorKind::None) {
            err = Error(result, std::string("simulated ") + toString(result), host.id);
            return false;
        }
        return true;
    }

    bool openShell(const TransportOptions& opt, Error& err) override {
        if (!connected_) {
            err = Error(ErrorKind::NotConnected, "mock transport not connected", host_.id);
            return false;
        }
        std::string banner;
        {
            std::lock_guard<std::mutex> lk(net_->mtx);
            auto& h = net_->hosts[host_.id];
            banner = h.script.banner;
            h.resizes.push_back(opt.terminalSize);
        }
        shellOpen_ = true;
        if (!banner.empty()) link_->deliver(banner);
        return true;
    }

    bool isConnected() const override { return connected_ && link_->alive(); }

    long read(char* buf, std::size_t cap, std::chrono::milliseconds timeout, Error& err) override {
        std::unique_lock<std::mutex> lk(link_->mtx);
        link_->cv.wait_for(lk, timeout, [&] {
            return !link_->inbox.empty() || !link_->alive();
        });
        if (link_->aborted.load()) {
            err = Error(ErrorKind::Cancelled, "transport closed", host_.id);
            return -1;
        }
        if (!link_->inbox.empty()) {
            const std::size_t n = std::min(cap, link_->inbox.size());
            std::copy(link_->inbox.begin(), link_->inbox.begin() + (long)n, buf);
            link_->inbox.erase(0, n);
            return (long)n;
        }
        if (link_->dropped.load()) {
            err = Error(ErrorKind::ConnectionLost, "connection reset by peer", host_.id);
            return -1;
        }
        if (link_->remoteClosed.load()) {
            err.clear();
            return -1;
        }
        return 0;
    }

    bool write(const char* data, std::size_t len, Error& err) override {
        if (!live(err)) return false;
        {
            std::lock_guard<std::mutex> lk(net_->mtx);
            net_->hosts[host_.id].written.append(data, len);
        }
        if (echo_) link_->deliver(std::string(data, len));
        return true;
    }

    bool supportsResize() const override { return true; }

    bool resize(int rows, int cols, Error& err) override {
        if (!live(err)) return false;
        std::lock_guard<std::mutex> lk(net_->mtx);
        net_->hosts[host_.id].resizes.push_back(TerminalSize{rows, cols});
        return true;
    }

    bool supportsSftp() const override { return host_.protocol == Protocol::SSH && sftp_; }

    std::unique_ptr<SftpChannel> openSftp(Error& err) override {
        if (!supportsSftp()) {
            err = Error(ErrorKind::ProtocolError, "SFTP subsystem not available", host_.id);
            return nullptr;
        }
        if (!live(err)) return nullptr;
        std::shared_ptr<MockFileSystem> fs;
        {
            std::lock_guard<std::mutex> lk(net_->mtx);
            fs = net_->hosts[host_.id].fs;
        }
        return std::make_unique<MockSftpChannel>(fs, link_, host_.id);
    }

    void abort() override { link_->mark(link_->aborted); }

    void close() override {
        if (closed_) return;
        closed_ = true;
        abort();
        connected_ = false;
        std::lock_guard<std::mutex> lk(net_->mtx);
        --net_->hosts[host_.id].live;
    }

private:
    bool live(Error& err) const {
        if (link_->aborted.load()) {
            err = Error(ErrorKind::Cancelled, "transport closed", host_.id);
            return false;
        }
        if (!connected_ || !shellOpen_) {
            err = Error(ErrorKind::NotConnected, "mock transport not connected", host_.id);
            return false;
        }
        if (!link_->alive()) {
            err = Error(ErrorKind::ConnectionLost, "connection lost", host_.id);
            return false;
        }
        return true;
    }

    std::shared_ptr<MockTransportFactory::Network> net_;
    HostDescriptor host_;
    std::shared_ptr<MockLink> link_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> shellOpen_{false};
    bool closed_ = false;
    bool echo_ = true;
    bool sftp_ = true;
};

} // namespace

// ---- MockTransportFactory ----

MockTransportFactory::MockTransportFactory() : net_(std::make_shared<Network>()) {}

MockTransportFactory::~MockTransportFactory() = default;

std::unique_ptr<Transport> MockTransportFactory::create(const HostDescriptor& host) {
    auto link = std::make_shared<MockLink>();
    {
        std::lock_guard<std::mutex> lk(net_->mtx);
        auto& h = net_->hosts[host.id];
        ++h.live;
        h.maxLive = std::max(h.maxLive, h.live);
        h.links.push_back(link);
    }
    return std::make_unique<MockTransport>(net_, host, link);
}

void MockTransportFactory::setScript(const std::string& hostId, MockHostScript script) {
    std::lock_guard<std::mutex> lk(net_->mtx);
    net_->hosts[hostId].script = std::move(script);
}

std::shared_ptr<MockFileSystem> MockTransportFactory::fileSystem(const std::string& hostId) {
    std::lock_guard<std::mutex> lk(net_->mtx);
    return net_->hosts[hostId].fs;
}

int MockTransportFactory::connectAttempts(const std::string& hostId) const {
    std::lock_guard<std::mutex> lk(net_->mtx);
    auto it = net_->hosts.find(hostId);
    return it == net_->hosts.end() ? 0 : it->second.connectAttempts;
}

int MockTransportFactory::authAttempts(const std::string& hostId) const {
    std::lock_guard<std::mutex> lk(net_->mtx);
    auto it = net_->hosts.find(hostId);
    return it == net_->hosts.end() ? 0 : it->second.authAttempts;
}

int MockTransportFactory::liveTransports(const std::string& hostId) const {
    std::lock_guard<std::mutex> lk(net_->mtx);
    auto it = net_->hosts.find(hostId);
    return it == net_->hosts.end() ? 0 : it->second.live;
}

int MockTransportFactory::maxLiveTransports(const std::string& hostId) const {
    std::lock_guard<std::mutex> lk(net_->mtx);
    auto it = net_->hosts.find(hostId);
    return it == net_->hosts.end() ? 0 : it->second.maxLive;
}

std::string MockTransportFactory::written(const std::string& hostId) const {
    std::lock_guard<std::mutex> lk(net_->mtx);
    auto it = net_->hosts.find(hostId);
    return it == net_->hosts.end() ? std::string() : it->second.written;
}

std::vector<TerminalSize> MockTransportFactory::resizes(const std::string& hostId) const {
    std::lock_guard<std::mutex> lk(net_->mtx);
    auto it = net_->hosts.find(hostId);
    return it == net_->hosts.end() ? std::vector<TerminalSize>() : it->second.resizes;
}

std::optional<std::string> MockTransportFactory::lastPassword(const std::string& hostId) const {
    std::lock_guard<std::mutex> lk(net_->mtx);
    auto it = net_->hosts.find(hostId);
    if (it == net_->hosts.end()) return std::nullopt;
    return it->second.lastPassword;
}

void MockTransportFactory::dropConnection(const std::string& hostId) {
    for (auto& l : net_->liveLinks(hostId)) l->mark(l->dropped);
}

void MockTransportFactory::remoteClose(const std::string& hostId) {
    for (auto& l : net_->liveLinks(hostId)) l->mark(l->remoteClosed);
}

void MockTransportFactory::inject(const std::string& hostId, const std::string& bytes) {
    for (auto& l : net_->liveLinks(hostId)) {
        if (l->alive()) l->deliver(bytes);
    }
}

} // namespace sshdeck
