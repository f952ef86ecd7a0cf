// Transfer workers: one thread per task, running on the session's SFTP channel.
#include "sshdeck/TransferEngine.hpp"
#include "sshdeck/Log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>

namespace sshdeck {

namespace {

std::string joinRemotePath(const std::string& base, const std::string& name) {
    if (base.empty() || base.back() == '/') return base + name;
    return base + "/" + name;
}

bool localIsDir(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool makeLocalDir(const std::string& path, Error& err) {
    if (::mkdir(path.c_str(), 0755) == 0) return true;
    const int e = errno;
    if (e == EEXIST && localIsDir(path)) return true;
    err = Error(ErrorKind::LocalIOError, "cannot create local directory " + path + ": " + std::strerror(e));
    return false;
}

// Local tree below `dir`: subdirectories (parents first) and regular files, as
// paths relative to `dir`, sorted by name within each directory.
bool walkLocal(const std::string& dir, const std::string& rel,
               std::vector<std::string>& dirs,
               std::vector<std::pair<std::string, std::uint64_t>>& files,
               Error& err) {
    const std::string abs = rel.empty() ? dir : joinRemotePath(dir, rel);
    DIR* d = ::opendir(abs.c_str());
    if (!d) {
        err = Error(ErrorKind::LocalIOError, "cannot read local directory " + abs + ": " + std::strerror(errno));
        return false;
    }
    std::vector<std::string> names;
    while (dirent* e = ::readdir(d)) {
        const std::string name = e->d_name;
        if (name == "." || name == "..") continue;
        names.push_back(name);
    }
    ::closedir(d);
    std::sort(names.begin(), names.end());

    for (const auto& name : names) {
        const std::string childRel = rel.empty() ? name : joinRemotePath(rel, name);
        struct stat st{};
        if (::stat(joinRemotePath(dir, childRel).c_str(), &st) != 0) {
            err = Error(ErrorKind::LocalIOError, "cannot stat " + joinRemotePath(dir, childRel) + ": " + std::strerror(errno));
            return false;
        }
        if (S_ISDIR(st.st_mode)) {
            dirs.push_back(childRel);
            if (!walkLocal(dir, childRel, dirs, files, err)) return false;
        } else if (S_ISREG(st.st_mode)) {
            files.emplace_back(childRel, (std::uint64_t)st.st_size);
        }
    }
    return true;
}

bool cancelledError(const SftpChannel::CancelCB& shouldCancel, Error& err) {
    if (!shouldCancel || !shouldCancel()) return false;
    err = Error(ErrorKind::Cancelled, "cancelled by user");
    return true;
}

} // namespace

TransferEngine::TransferEngine(EventSink sink) : sink_(std::move(sink)) {}

TransferEngine::~TransferEngine() {
    std::unordered_map<std::uint64_t, std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto& kv : tasks_)
            if (!kv.second.finished()) canceledTasks_.insert(kv.first);
        workers.swap(workers_);
    }
    for (auto& kv : workers) {
        if (kv.second.joinable()) kv.second.join();
    }
}

bool TransferEngine::submit(Session& session, const TransferRequest& req,
                            std::uint64_t& taskId, Error& err) {
    if (session.state() != SessionState::Connected) {
        err = Error(ErrorKind::NotConnected,
                    std::string("session is ") + toString(session.state()), session.host().id);
        return false;
    }
    if (session.host().protocol == Protocol::Telnet) {
        err = Error(ErrorKind::ProtocolError, "SFTP is not available over Telnet", session.host().id);
        return false;
    }

    TransferTask snapshot;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        reapFinished();
        TransferTask t;
        t.id = nextId_++;
        t.sessionId = session.id();
        t.request = req;
        tasks_[t.id] = t;
        snapshot = t;
        taskId = t.id;
        workers_[taskId] = std::thread(&TransferEngine::run, this, &session, taskId);
    }
    LOGD("transfer %llu queued: %s %s", (unsigned long long)taskId, toString(req.kind), req.path.c_str());
    if (sink_) sink_(Event::transferProgress(snapshot));
    return true;
}

bool TransferEngine::cancel(std::uint64_t taskId) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tasks_.find(taskId);
    if (it == tasks_.end() || it->second.finished()) return false;
    canceledTasks_.insert(taskId);
    return true;
}

std::optional<TransferTask> TransferEngine::task(std::uint64_t taskId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tasks_.find(taskId);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::vector<TransferTask> TransferEngine::tasksFor(const std::string& sessionId) const {
    std::vector<TransferTask> out;
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& kv : tasks_)
        if (kv.second.sessionId == sessionId) out.push_back(kv.second);
    return out;
}

std::size_t TransferEngine::eraseFinished(const std::string& sessionId) {
    reapFinished();
    std::size_t n = 0;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        const bool match = sessionId.empty() || it->second.sessionId == sessionId;
        if (match && it->second.finished()) {
            it = tasks_.erase(it);
            ++n;
        } else {
            ++it;
        }
    }
    return n;
}

std::size_t TransferEngine::clearCompleted() {
    std::lock_guard<std::mutex> lk(mtx_);
    return eraseFinished({});
}

std::size_t TransferEngine::forgetSession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lk(mtx_);
    return eraseFinished(sessionId);
}

bool TransferEngine::wait(std::uint64_t taskId, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [&] {
        auto it = tasks_.find(taskId);
        return it != tasks_.end() && it->second.finished();
    });
}

void TransferEngine::transportReleasing(const std::string& sessionId, bool lost) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& kv : tasks_) {
        if (kv.second.sessionId != sessionId || kv.second.finished()) continue;
        if (lost) lostTasks_.insert(kv.first);
        else canceledTasks_.insert(kv.first);
    }
}

void TransferEngine::transportReleased(const std::string& sessionId) {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto& kv : tasks_) {
            if (kv.second.sessionId != sessionId) continue;
            auto w = workers_.find(kv.first);
            if (w == workers_.end()) continue;
            threads.push_back(std::move(w->second));
            workers_.erase(w);
            exitedWorkers_.erase(kv.first);
        }
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
}

void TransferEngine::reapFinished() {
    for (auto id : exitedWorkers_) {
        auto w = workers_.find(id);
        if (w == workers_.end()) continue;
        if (w->second.joinable()) w->second.join();
        workers_.erase(w);
    }
    exitedWorkers_.clear();
}

bool TransferEngine::isCanceled(std::uint64_t taskId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return canceledTasks_.count(taskId) > 0 || lostTasks_.count(taskId) > 0;
}

void TransferEngine::report(std::uint64_t taskId, std::uint64_t done, std::uint64_t total) {
    TransferTask snapshot;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = tasks_.find(taskId);
        if (it == tasks_.end()) return;
        it->second.bytesTransferred = done;
        it->second.totalBytes = total;
        snapshot = it->second;
    }
    if (sink_) sink_(Event::transferProgress(snapshot));
}

void TransferEngine::run(Session* session, std::uint64_t taskId) {
    TransferRequest req;
    TransferTask snapshot;
    bool canceledEarly = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto& t = tasks_[taskId];
        req = t.request;
        canceledEarly = canceledTasks_.count(taskId) > 0 || lostTasks_.count(taskId) > 0;
        if (!canceledEarly) {
            t.state = TransferState::Running;
            snapshot = t;
        }
    }

    Error err;
    bool ok = false;
    if (canceledEarly) {
        err = Error(ErrorKind::Cancelled, "cancelled before start", session->host().id);
    } else {
        if (sink_) sink_(Event::transferProgress(snapshot));
        ok = session->withSftp([&](SftpChannel& ch, Error& e) { return execute(taskId, req, ch, e); }, err);
    }
    finish(taskId, ok, std::move(err));

    {
        std::lock_guard<std::mutex> lk(mtx_);
        exitedWorkers_.insert(taskId);
    }
}

bool TransferEngine::execute(std::uint64_t taskId, const TransferRequest& req,
                             SftpChannel& ch, Error& err) {
    auto shouldCancel = [this, taskId]() -> bool { return isCanceled(taskId); };
    auto progress = [this, taskId](std::uint64_t done, std::uint64_t total) {
        report(taskId, done, total);
    };

    switch (req.kind) {
        case TransferKind::List: {
            std::vector<FileInfo> out;
            if (!ch.list(req.path, out, err)) return false;
            std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
                if (a.is_dir != b.is_dir) return a.is_dir > b.is_dir; // directories first
                return a.name < b.name;
            });
            if (out.size() > kMaxListing) out.resize(kMaxListing);
            std::lock_guard<std::mutex> lk(mtx_);
            tasks_[taskId].listing = std::move(out);
            return true;
        }
        case TransferKind::Get: {
            if (req.recursive) {
                bool isDir = false;
                if (!ch.exists(req.path, isDir, err)) {
                    if (err.ok()) err = Error(ErrorKind::RemoteIOError, "no such remote path: " + req.path);
                    return false;
                }
                if (isDir) return getTree(taskId, req, ch, err);
            }
            return ch.get(req.path, req.localPath, err, progress, shouldCancel, req.resume);
        }
        case TransferKind::Put:
            if (req.recursive && localIsDir(req.localPath)) return putTree(taskId, req, ch, err);
            return ch.put(req.localPath, req.path, err, progress, shouldCancel, req.resume);
        case TransferKind::Mkdir:
            return ch.mkdir(req.path, err, req.mode);
        case TransferKind::Remove: {
            bool isDir = false;
            if (!ch.exists(req.path, isDir, err)) {
                if (err.ok()) err = Error(ErrorKind::RemoteIOError, "no such remote path: " + req.path);
                return false;
            }
            if (!isDir) return ch.removeFile(req.path, err);
            if (!req.recursive) return ch.removeDir(req.path, err);
            return removeTree(ch, req.path, shouldCancel, err);
        }
        case TransferKind::Rename:
            return ch.rename(req.path, req.newPath, err, req.overwrite);
        case TransferKind::Chmod:
            return ch.chmod(req.path, req.mode, err);
    }
    err = Error(ErrorKind::ProtocolError, "unknown transfer kind");
    return false;
}

// Depth-first: children first, then the directory itself.
bool TransferEngine::removeTree(SftpChannel& ch, const std::string& path,
                                const SftpChannel::CancelCB& shouldCancel, Error& err) {
    if (shouldCancel && shouldCancel()) {
        err = Error(ErrorKind::Cancelled, "cancelled by user");
        return false;
    }
    std::vector<FileInfo> out;
    if (!ch.list(path, out, err)) return false;
    for (const auto& e : out) {
        const std::string child = joinRemotePath(path, e.name);
        if (e.is_dir) {
            if (!removeTree(ch, child, shouldCancel, err)) return false;
        } else if (!ch.removeFile(child, err)) {
            return false;
        }
    }
    return ch.removeDir(path, err);
}

bool TransferEngine::walkRemote(SftpChannel& ch, const std::string& remote, const std::string& local,
                                std::vector<std::string>& dirs, std::vector<TreeFile>& files,
                                const SftpChannel::CancelCB& shouldCancel, Error& err) {
    if (cancelledError(shouldCancel, err)) return false;
    std::vector<FileInfo> out;
    if (!ch.list(remote, out, err)) return false;
    std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) { return a.name < b.name; });
    for (const auto& e : out) {
        const std::string from = joinRemotePath(remote, e.name);
        const std::string to = joinRemotePath(local, e.name);
        if (e.is_dir) {
            dirs.push_back(to);
            if (!walkRemote(ch, from, to, dirs, files, shouldCancel, err)) return false;
        } else {
            files.push_back(TreeFile{from, to, e.size});
        }
    }
    return true;
}

// Remote directory -> local directory, created as needed.
bool TransferEngine::getTree(std::uint64_t taskId, const TransferRequest& req,
                             SftpChannel& ch, Error& err) {
    auto shouldCancel = [this, taskId]() -> bool { return isCanceled(taskId); };
    std::vector<std::string> dirs{req.localPath};
    std::vector<TreeFile> files;
    if (!walkRemote(ch, req.path, req.localPath, dirs, files, shouldCancel, err)) return false;
    for (const auto& d : dirs) {
        if (!makeLocalDir(d, err)) return false;
    }
    LOGD("transfer %llu: %zu files in %zu directories", (unsigned long long)taskId, files.size(), dirs.size());
    return copyFiles(taskId, files, true, req.resume, ch, err);
}

// Local directory -> remote directory. Existing remote directories are reused.
bool TransferEngine::putTree(std::uint64_t taskId, const TransferRequest& req,
                             SftpChannel& ch, Error& err) {
    std::vector<std::string> rel;
    std::vector<std::pair<std::string, std::uint64_t>> local;
    if (!walkLocal(req.localPath, {}, rel, local, err)) return false;

    std::vector<std::string> dirs{req.path};
    for (const auto& r : rel) dirs.push_back(joinRemotePath(req.path, r));
    for (const auto& d : dirs) {
        if (isCanceled(taskId)) {
            err = Error(ErrorKind::Cancelled, "cancelled by user");
            return false;
        }
        bool isDir = false;
        if (ch.exists(d, isDir, err)) {
            if (isDir) continue;
            err = Error(ErrorKind::RemoteIOError, "remote path is not a directory: " + d);
            return false;
        }
        if (!err.ok() || !ch.mkdir(d, err, 0755)) return false;
    }

    std::vector<TreeFile> files;
    files.reserve(local.size());
    for (const auto& f : local)
        files.push_back(TreeFile{joinRemotePath(req.localPath, f.first), joinRemotePath(req.path, f.first), f.second});
    LOGD("transfer %llu: %zu files in %zu directories", (unsigned long long)taskId, files.size(), dirs.size());
    return copyFiles(taskId, files, false, req.resume, ch, err);
}

bool TransferEngine::copyFiles(std::uint64_t taskId, const std::vector<TreeFile>& files, bool download,
                               bool resume, SftpChannel& ch, Error& err) {
    auto shouldCancel = [this, taskId]() -> bool { return isCanceled(taskId); };
    std::uint64_t total = 0;
    for (const auto& f : files) total += f.size;
    std::uint64_t base = 0;
    report(taskId, 0, total);

    for (const auto& f : files) {
        if (cancelledError(shouldCancel, err)) return false;
        // Per-file progress folded into the running total
        auto progress = [&](std::uint64_t done, std::uint64_t) {
            report(taskId, std::min(base + done, total), total);
        };
        const bool ok = download ? ch.get(f.from, f.to, err, progress, shouldCancel, resume)
                                 : ch.put(f.from, f.to, err, progress, shouldCancel, resume);
        if (!ok) return false;
        base += f.size;
        report(taskId, std::min(base, total), total);
    }
    return true;
}

void TransferEngine::finish(std::uint64_t taskId, bool ok, Error err) {
    TransferTask snapshot;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto& t = tasks_[taskId];
        const bool lost = lostTasks_.count(taskId) > 0;
        const bool canceled = canceledTasks_.count(taskId) > 0;
        if (ok) {
            t.state = TransferState::Done;
            t.error.clear();
        } else if (lost || err.kind == ErrorKind::ConnectionLost) {
            t.state = TransferState::Failed;
            t.error = Error(ErrorKind::ConnectionLost,
                            err.kind == ErrorKind::ConnectionLost ? err.message : "connection lost",
                            err.host);
        } else if (canceled || err.kind == ErrorKind::Cancelled) {
            t.state = TransferState::Cancelled;
            t.error = Error(ErrorKind::Cancelled,
                            err.kind == ErrorKind::Cancelled ? err.message : "cancelled", err.host);
        } else {
            t.state = TransferState::Failed;
            t.error = std::move(err);
        }
        canceledTasks_.erase(taskId);
        lostTasks_.erase(taskId);
        snapshot = t;
    }
    cv_.notify_all();

    if (snapshot.state == TransferState::Done)
        LOGI("transfer %llu done", (unsigned long long)taskId);
    else
        LOGW("transfer %llu %s: %s", (unsigned long long)taskId, toString(snapshot.state),
             snapshot.error.describe().c_str());

    if (sink_) {
        sink_(Event::transferDone(snapshot));
        if (snapshot.state == TransferState::Failed)
            sink_(Event::failure(snapshot.sessionId, snapshot.error));
    }
}

} // namespace sshdeck
