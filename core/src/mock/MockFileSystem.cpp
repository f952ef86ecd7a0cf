// In-memory remote filesystem behind the mock SFTP channel.
#include "sshdeck/MockTransport.hpp"
#include <algorithm>
#include <ctime>

namespace sshdeck {

namespace {

constexpr std::uint32_t kTypeDir = 0040000;
constexpr std::uint32_t kTypeFile = 0100000;

bool isUnder(const std::string& path, const std::string& prefix) {
    if (prefix == "/") return true;
    if (path == prefix) return true;
    return path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0 &&
           path[prefix.size()] == '/';
}

std::string childPrefix(const std::string& dir) {
    return dir == "/" ? dir : dir + "/";
}

std::string baseName(const std::string& path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

MockFileSystem::MockFileSystem() {
    Node root;
    root.dir = true;
    root.mode = 0755;
    root.mtime = (std::uint64_t)std::time(nullptr);
    nodes_["/"] = root;
}

std::string MockFileSystem::normalize(const std::string& path) {
    std::string out = "/";
    std::size_t i = 0;
    while (i < path.size()) {
        while (i < path.size() && path[i] == '/') ++i;
        std::size_t j = path.find('/', i);
        if (j == std::string::npos) j = path.size();
        std::string seg = path.substr(i, j - i);
        i = j;
        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            out = parentOf(out);
            continue;
        }
        if (out.size() > 1) out += '/';
        out += seg;
    }
    return out;
}

std::string MockFileSystem::parentOf(const std::string& path) {
    if (path == "/") return "/";
    auto pos = path.find_last_of('/');
    if (pos == 0 || pos == std::string::npos) return "/";
    return path.substr(0, pos);
}

bool MockFileSystem::hasChildren(const std::string& dir) const {
    const std::string prefix = childPrefix(dir);
    auto it = nodes_.lower_bound(prefix);
    if (it != nodes_.end() && it->first == dir) ++it;
    return it != nodes_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

bool MockFileSystem::writable(const std::string& path) const {
    for (const auto& p : readOnly_)
        if (isUnder(path, p)) return false;
    return true;
}

void MockFileSystem::addDir(const std::string& path, std::uint32_t mode) {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx_);
    // mkdir -p
    std::string cur = p;
    std::vector<std::string> chain;
    while (cur != "/" && nodes_.find(cur) == nodes_.end()) {
        chain.push_back(cur);
        cur = parentOf(cur);
    }
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        Node n;
        n.dir = true;
        n.mode = mode;
        n.mtime = (std::uint64_t)std::time(nullptr);
        nodes_[*it] = n;
    }
}

void MockFileSystem::addFile(const std::string& path, std::string content, std::uint32_t mode) {
    const std::string p = normalize(path);
    addDir(parentOf(p));
    std::lock_guard<std::mutex> lk(mtx_);
    Node n;
    n.data = std::move(content);
    n.mode = mode;
    n.mtime = (std::uint64_t)std::time(nullptr);
    nodes_[p] = std::move(n);
}

void MockFileSystem::setReadOnly(const std::string& prefix) {
    std::lock_guard<std::mutex> lk(mtx_);
    readOnly_.push_back(normalize(prefix));
}

void MockFileSystem::setChunkHook(ChunkHook hook) {
    std::lock_guard<std::mutex> lk(mtx_);
    chunkHook_ = std::move(hook);
}

bool MockFileSystem::exists(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return nodes_.count(normalize(path)) > 0;
}

bool MockFileSystem::isDir(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    return it != nodes_.end() && it->second.dir;
}

std::optional<std::string> MockFileSystem::content(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    if (it == nodes_.end() || it->second.dir) return std::nullopt;
    return it->second.data;
}

std::optional<std::uint32_t> MockFileSystem::mode(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    if (it == nodes_.end()) return std::nullopt;
    return it->second.mode;
}

bool MockFileSystem::list(const std::string& path, std::vector<FileInfo>& out, Error& err) const {
    const std::string p = normalize(path.empty() ? "/" : path);
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(p);
    if (it == nodes_.end()) {
        err = Error(ErrorKind::RemoteIOError, "opendir " + p + ": no such file");
        return false;
    }
    if (!it->second.dir) {
        err = Error(ErrorKind::RemoteIOError, "opendir " + p + ": not a directory");
        return false;
    }
    out.clear();
    const std::string prefix = childPrefix(p);
    for (it = nodes_.lower_bound(prefix);
         it != nodes_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
        if (it->first == p || parentOf(it->first) != p) continue;
        FileInfo fi;
        fi.name = baseName(it->first);
        fi.is_dir = it->second.dir;
        fi.size = it->second.dir ? 0 : it->second.data.size();
        fi.mtime = it->second.mtime;
        fi.mode = (it->second.dir ? kTypeDir : kTypeFile) | it->second.mode;
        out.push_back(std::move(fi));
    }
    std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
        return a.name < b.name;
    });
    return true;
}

bool MockFileSystem::stat(const std::string& path, FileInfo& info, Error& err) const {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(p);
    if (it == nodes_.end()) {
        err.clear();
        return false;
    }
    info = FileInfo{};
    info.name = baseName(p);
    info.is_dir = it->second.dir;
    info.size = it->second.dir ? 0 : it->second.data.size();
    info.mtime = it->second.mtime;
    info.mode = (it->second.dir ? kTypeDir : kTypeFile) | it->second.mode;
    return true;
}

bool MockFileSystem::mkdir(const std::string& path, std::uint32_t mode, Error& err) {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx_);
    if (!writable(p)) {
        err = Error(ErrorKind::PermissionDenied, "mkdir " + p + ": permission denied");
        return false;
    }
    if (nodes_.count(p)) {
        err = Error(ErrorKind::RemoteIOError, "mkdir " + p + ": file already exists");
        return false;
    }
    auto parent = nodes_.find(parentOf(p));
    if (parent == nodes_.end() || !parent->second.dir) {
        err = Error(ErrorKind::RemoteIOError, "mkdir " + p + ": no such path");
        return false;
    }
    Node n;
    n.dir = true;
    n.mode = mode;
    n.mtime = (std::uint64_t)std::time(nullptr);
    nodes_[p] = n;
    return true;
}

bool MockFileSystem::removeFile(const std::string& path, Error& err) {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(p);
    if (it == nodes_.end()) {
        err = Error(ErrorKind::RemoteIOError, "unlink " + p + ": no such file");
        return false;
    }
    if (it->second.dir) {
        err = Error(ErrorKind::RemoteIOError, "unlink " + p + ": is a directory");
        return false;
    }
    if (!writable(p)) {
        err = Error(ErrorKind::PermissionDenied, "unlink " + p + ": permission denied");
        return false;
    }
    nodes_.erase(it);
    return true;
}

bool MockFileSystem::removeDir(const std::string& path, Error& err) {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(p);
    if (it == nodes_.end()) {
        err = Error(ErrorKind::RemoteIOError, "rmdir " + p + ": no such file");
        return false;
    }
    if (!it->second.dir) {
        err = Error(ErrorKind::RemoteIOError, "rmdir " + p + ": not a directory");
        return false;
    }
    if (p == "/" || !writable(p)) {
        err = Error(ErrorKind::PermissionDenied, "rmdir " + p + ": permission denied");
        return false;
    }
    if (hasChildren(p)) {
        err = Error(ErrorKind::RemoteIOError, "rmdir " + p + ": directory not empty");
        return false;
    }
    nodes_.erase(it);
    return true;
}

bool MockFileSystem::rename(const std::string& from, const std::string& to,
                            bool overwrite, Error& err) {
    const std::string src = normalize(from);
    const std::string dst = normalize(to);
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(src);
    if (it == nodes_.end()) {
        err = Error(ErrorKind::RemoteIOError, "rename " + src + ": no such file");
        return false;
    }
    if (!writable(src) || !writable(dst)) {
        err = Error(ErrorKind::PermissionDenied, "rename " + src + ": permission denied");
        return false;
    }
    if (src == dst) return true;
    if (isUnder(dst, src)) {
        err = Error(ErrorKind::RemoteIOError, "rename " + src + ": target inside source");
        return false;
    }
    auto parent = nodes_.find(parentOf(dst));
    if (parent == nodes_.end() || !parent->second.dir) {
        err = Error(ErrorKind::RemoteIOError, "rename " + src + ": no such path " + parentOf(dst));
        return false;
    }
    auto target = nodes_.find(dst);
    if (target != nodes_.end()) {
        if (!overwrite) {
            err = Error(ErrorKind::RemoteIOError, "rename " + src + ": file already exists");
            return false;
        }
        if (target->second.dir) {
            if (hasChildren(dst)) {
                err = Error(ErrorKind::RemoteIOError, "rename " + src + ": directory not empty");
                return false;
            }
        }
        nodes_.erase(target);
    }
    // Move the node and, for directories, its whole subtree.
    std::vector<std::pair<std::string, Node>> moved;
    moved.emplace_back(dst, std::move(it->second));
    nodes_.erase(it);
    const std::string prefix = childPrefix(src);
    for (auto cur = nodes_.lower_bound(prefix);
         cur != nodes_.end() && cur->first.compare(0, prefix.size(), prefix) == 0;) {
        moved.emplace_back(dst + cur->first.substr(src.size()), std::move(cur->second));
        cur = nodes_.erase(cur);
    }
    for (auto& m : moved) nodes_[m.first] = std::move(m.second);
    return true;
}

bool MockFileSystem::chmod(const std::string& path, std::uint32_t mode, Error& err) {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(p);
    if (it == nodes_.end()) {
        err = Error(ErrorKind::RemoteIOError, "setstat " + p + ": no such file");
        return false;
    }
    if (!writable(p)) {
        err = Error(ErrorKind::PermissionDenied, "setstat " + p + ": permission denied");
        return false;
    }
    it->second.mode = mode & 07777;
    return true;
}

bool MockFileSystem::read(const std::string& path, std::uint64_t offset, std::size_t len,
                          std::string& out, Error& err) const {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(p);
    if (it == nodes_.end() || it->second.dir) {
        err = Error(ErrorKind::RemoteIOError, "read " + p + ": no such file");
        return false;
    }
    const std::string& data = it->second.data;
    if (offset >= data.size()) {
        out.clear();
        return true;
    }
    out = data.substr((std::size_t)offset, len);
    return true;
}

bool MockFileSystem::open(const std::string& path, bool truncate, Error& err) {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx_);
    if (!writable(p)) {
        err = Error(ErrorKind::PermissionDenied, "open for writing " + p + ": permission denied");
        return false;
    }
    auto parent = nodes_.find(parentOf(p));
    if (parent == nodes_.end() || !parent->second.dir) {
        err = Error(ErrorKind::RemoteIOError, "open for writing " + p + ": no such path");
        return false;
    }
    auto it = nodes_.find(p);
    if (it != nodes_.end()) {
        if (it->second.dir) {
            err = Error(ErrorKind::RemoteIOError, "open for writing " + p + ": is a directory");
            return false;
        }
        if (truncate) it->second.data.clear();
        it->second.mtime = (std::uint64_t)std::time(nullptr);
        return true;
    }
    Node n;
    n.mode = 0644;
    n.mtime = (std::uint64_t)std::time(nullptr);
    nodes_[p] = n;
    return true;
}

bool MockFileSystem::write(const std::string& path, std::uint64_t offset,
                           const char* data, std::size_t len, Error& err) {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(p);
    if (it == nodes_.end() || it->second.dir) {
        err = Error(ErrorKind::RemoteIOError, "write " + p + ": no such file");
        return false;
    }
    std::string& buf = it->second.data;
    if (buf.size() < offset + len) buf.resize((std::size_t)(offset + len));
    buf.replace((std::size_t)offset, len, data, len);
    return true;
}

void MockFileSystem::chunkDone(const std::string& path, std::uint64_t done) {
    ChunkHook hook;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        hook = chunkHook_;
    }
    if (hook) hook(normalize(path), done);
}

} // namespace sshdeck
