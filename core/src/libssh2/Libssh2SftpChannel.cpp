// SFTP operations over the non-blocking libssh2 session. Includes resume support
// and cooperative cancellation for transfers.
#include "libssh2/Libssh2SftpChannel.hpp"
#include "libssh2/Libssh2Util.hpp"
#include "sshdeck/Log.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cstdio>
#include <cstring>
#include <vector>

namespace sshdeck {

namespace {

constexpr std::size_t CHUNK = 64 * 1024;
constexpr std::size_t kMaxListEntries = 100000;

const char* fxName(unsigned long fx) {
    switch (fx) {
        case LIBSSH2_FX_EOF: return "eof";
        case LIBSSH2_FX_NO_SUCH_FILE: return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED: return "permission denied";
        case LIBSSH2_FX_FAILURE: return "failure";
        case LIBSSH2_FX_BAD_MESSAGE: return "bad message";
        case LIBSSH2_FX_OP_UNSUPPORTED: return "operation unsupported";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
        case LIBSSH2_FX_WRITE_PROTECT: return "write protected";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space on filesystem";
        case LIBSSH2_FX_QUOTA_EXCEEDED: return "quota exceeded";
        case LIBSSH2_FX_DIR_NOT_EMPTY: return "directory not empty";
        case LIBSSH2_FX_NOT_A_DIRECTORY: return "not a directory";
        case LIBSSH2_FX_NO_SUCH_PATH: return "no such path";
        default: return "sftp error";
    }
}

FileInfo fromAttrs(const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    FileInfo fi{};
    fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                    ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                    : false;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = (std::uint32_t)attrs.permissions;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        fi.uid = (std::uint32_t)attrs.uid;
        fi.gid = (std::uint32_t)attrs.gid;
    }
    return fi;
}

// Closes an SFTP file/dir handle on scope exit.
struct HandleCloser {
    Libssh2SftpChannel& ch;
    LIBSSH2_SFTP_HANDLE* h;
    ~HandleCloser() { ch.closeHandle(h); }
};

struct FileCloser {
    FILE* f;
    ~FileCloser() {
        if (f) std::fclose(f);
    }
    // Closes now and reports whether buffered data reached the disk.
    bool close() {
        FILE* tmp = f;
        f = nullptr;
        return tmp && std::fclose(tmp) == 0;
    }
};

} // namespace

Libssh2SftpChannel::Libssh2SftpChannel(Libssh2Transport& transport, LIBSSH2_SFTP* sftp)
    : t_(transport), sftp_(sftp) {}

Libssh2SftpChannel::~Libssh2SftpChannel() {
    if (!sftp_) return;
    Error shutdownErr;
    long rc = 0;
    if (!call(rc, shutdownErr, [&] { return libssh2_sftp_shutdown(sftp_); }))
        LOGD("sftp shutdown interrupted: %s", shutdownErr.describe().c_str());
    sftp_ = nullptr;
}

void Libssh2SftpChannel::closeHandle(LIBSSH2_SFTP_HANDLE* h) {
    if (!h) return;
    Error closeErr;
    long rc = 0;
    if (!call(rc, closeErr, [&] { return libssh2_sftp_close_handle(h); }) || rc != 0)
        LOGD("sftp close handle failed on %s", t_.hostId().c_str());
}

bool Libssh2SftpChannel::isAlive() const {
    return sftp_ != nullptr && t_.isConnected();
}

void Libssh2SftpChannel::fail(Error& err, const std::string& what, const std::string& path) {
    if (!err.ok()) return;
    int e = 0;
    unsigned long fx = 0;
    {
        std::lock_guard<std::mutex> lk(t_.mutex());
        e = libssh2_session_last_errno(t_.session());
        if (e == LIBSSH2_ERROR_SFTP_PROTOCOL) fx = libssh2_sftp_last_error(sftp_);
    }
    if (e == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        ErrorKind kind = ErrorKind::RemoteIOError;
        if (fx == LIBSSH2_FX_PERMISSION_DENIED || fx == LIBSSH2_FX_WRITE_PROTECT)
            kind = ErrorKind::PermissionDenied;
        err = Error(kind, what + " " + path + ": " + fxName(fx), t_.hostId());
        return;
    }
    t_.setSessionError(err, ErrorKind::RemoteIOError, (what + " " + path).c_str());
}

bool Libssh2SftpChannel::lastWasNoSuchFile() {
    std::lock_guard<std::mutex> lk(t_.mutex());
    if (libssh2_session_last_errno(t_.session()) != LIBSSH2_ERROR_SFTP_PROTOCOL) return false;
    unsigned long fx = libssh2_sftp_last_error(sftp_);
    return fx == LIBSSH2_FX_NO_SUCH_FILE || fx == LIBSSH2_FX_NO_SUCH_PATH;
}

bool Libssh2SftpChannel::list(const std::string& remote_path,
                              std::vector<FileInfo>& out,
                              Error& err) {
    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = callPtr(err, [&] {
        return libssh2_sftp_open_ex(sftp_, path.c_str(), (unsigned)path.size(), 0, 0, LIBSSH2_SFTP_OPENDIR);
    });
    if (!dir) {
        fail(err, "opendir", path);
        return false;
    }
    HandleCloser closer{*this, dir};

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        long rc = 0;
        if (!call(rc, err, [&] {
                return libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                               longentry, sizeof(longentry), &attrs);
            }))
            return false;
        if (rc > 0) {
            // rc = name length
            FileInfo fi = fromAttrs(attrs);
            fi.name = std::string(filename, (size_t)rc);
            if (fi.name == "." || fi.name == "..") continue;
            if (out.size() >= kMaxListEntries) {
                err = Error(ErrorKind::RemoteIOError, "directory " + path + " has too many entries", t_.hostId());
                return false;
            }
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break; // end of directory
        } else {
            fail(err, "readdir", path);
            return false;
        }
    }
    return true;
}

// Detailed remote metadata (stat-like). Returns false if the path does not exist.
bool Libssh2SftpChannel::stat(const std::string& remote_path,
                              FileInfo& info,
                              Error& err) {
    LIBSSH2_SFTP_ATTRIBUTES st{};
    long rc = 0;
    if (!call(rc, err, [&] {
            return libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                                        LIBSSH2_SFTP_STAT, &st);
        }))
        return false;
    if (rc != 0) {
        if (lastWasNoSuchFile()) {
            err.clear();
            return false; // does not exist
        }
        fail(err, "stat", remote_path);
        return false;
    }
    const std::string name = info.name;
    info = fromAttrs(st);
    info.name = name;
    return true;
}

// Lightweight existence check using stat.
bool Libssh2SftpChannel::exists(const std::string& remote_path,
                                bool& isDir,
                                Error& err) {
    isDir = false;
    FileInfo fi;
    if (!stat(remote_path, fi, err)) return false;
    isDir = fi.is_dir;
    return true;
}

// Download a remote file to local. Reports progress and supports cooperative cancellation.
bool Libssh2SftpChannel::get(const std::string& remote,
                             const std::string& local,
                             Error& err,
                             ProgressCB progress,
                             CancelCB shouldCancel,
                             bool resume) {
    // Remote size (for progress)
    FileInfo st;
    if (!stat(remote, st, err)) {
        if (err.ok()) err = Error(ErrorKind::RemoteIOError, "no such remote file: " + remote, t_.hostId());
        return false;
    }
    const std::uint64_t total = st.size;

    // Open remote for reading
    LIBSSH2_SFTP_HANDLE* rh = callPtr(err, [&] {
        return libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                                    LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    });
    if (!rh) {
        fail(err, "open for reading", remote);
        return false;
    }
    HandleCloser remoteCloser{*this, rh};

    // Open local for writing, with optional resume
    FileCloser lf{nullptr};
    std::uint64_t offset = 0;
    if (resume) {
        lf.f = std::fopen(local.c_str(), "ab");
        if (lf.f) {
            std::fseek(lf.f, 0, SEEK_END);
            long cur = std::ftell(lf.f);
            if (cur > 0) offset = (std::uint64_t)cur;
            if (offset > total) {
                // Local file is longer than the remote one: start over
                lf.close();
                offset = 0;
            } else if (offset > 0) {
                std::lock_guard<std::mutex> lk(t_.mutex());
                libssh2_sftp_seek64(rh, (libssh2_uint64_t)offset);
            }
        }
    }
    if (!lf.f) lf.f = std::fopen(local.c_str(), "wb");
    if (!lf.f) {
        err = Error(ErrorKind::LocalIOError, "cannot open local file for writing: " + local, t_.hostId());
        return false;
    }

    std::vector<char> buf(CHUNK);
    std::uint64_t done = offset;
    if (progress) progress(done, total);

    while (true) {
        if (shouldCancel && shouldCancel()) {
            err = Error(ErrorKind::Cancelled, "cancelled by user", t_.hostId());
            return false;
        }
        long n = 0;
        if (!call(n, err, [&] { return libssh2_sftp_read(rh, buf.data(), buf.size()); }))
            return false;
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (size_t)n, lf.f) != (size_t)n) {
                err = Error(ErrorKind::LocalIOError, "local write failed: " + local, t_.hostId());
                return false;
            }
            done += (std::uint64_t)n;
            if (progress) progress(done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            fail(err, "read", remote);
            return false;
        }
    }

    if (!lf.close()) {
        err = Error(ErrorKind::LocalIOError, "local close failed: " + local, t_.hostId());
        return false;
    }
    return true;
}

// Upload a local file to remote (create/truncate). Reports progress and supports cancellation.
bool Libssh2SftpChannel::put(const std::string& local,
                             const std::string& remote,
                             Error& err,
                             ProgressCB progress,
                             CancelCB shouldCancel,
                             bool resume) {
    // Open local for reading
    FileCloser lf{std::fopen(local.c_str(), "rb")};
    if (!lf.f) {
        err = Error(ErrorKind::LocalIOError, "cannot open local file for reading: " + local, t_.hostId());
        return false;
    }

    // Local size
    std::fseek(lf.f, 0, SEEK_END);
    long fsz = std::ftell(lf.f);
    std::fseek(lf.f, 0, SEEK_SET);
    const std::uint64_t total = fsz > 0 ? (std::uint64_t)fsz : 0;

    // Remote size when resuming
    std::uint64_t startOffset = 0;
    if (resume) {
        FileInfo st;
        Error statErr;
        if (stat(remote, st, statErr)) startOffset = st.size;
        else if (!statErr.ok()) {
            err = statErr;
            return false;
        }
        if (startOffset > total) startOffset = 0;
    }

    // Open remote for writing (create, optionally resume without truncation)
    const unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT |
                                ((resume && startOffset > 0) ? 0 : LIBSSH2_FXF_TRUNC);
    LIBSSH2_SFTP_HANDLE* wh = callPtr(err, [&] {
        return libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                                    flags, 0644, LIBSSH2_SFTP_OPENFILE);
    });
    if (!wh) {
        fail(err, "open for writing", remote);
        return false;
    }
    HandleCloser remoteCloser{*this, wh};

    std::uint64_t done = 0;
    // If resuming, advance local and remote
    if (startOffset > 0) {
        {
            std::lock_guard<std::mutex> lk(t_.mutex());
            libssh2_sftp_seek64(wh, (libssh2_uint64_t)startOffset);
        }
        if (std::fseek(lf.f, (long)startOffset, SEEK_SET) != 0) {
            err = Error(ErrorKind::LocalIOError, "cannot seek local file: " + local, t_.hostId());
            return false;
        }
        done = startOffset;
    }
    if (progress) progress(done, total);

    std::vector<char> buf(CHUNK);
    while (true) {
        size_t n = std::fread(buf.data(), 1, buf.size(), lf.f);
        if (n == 0) {
            if (std::ferror(lf.f)) {
                err = Error(ErrorKind::LocalIOError, "local read failed: " + local, t_.hostId());
                return false;
            }
            break; // EOF
        }
        const char* p = buf.data();
        size_t remain = n;
        while (remain > 0) {
            if (shouldCancel && shouldCancel()) {
                err = Error(ErrorKind::Cancelled, "cancelled by user", t_.hostId());
                return false;
            }
            long w = 0;
            if (!call(w, err, [&] { return libssh2_sftp_write(wh, p, remain); }))
                return false;
            if (w < 0) {
                fail(err, "write", remote);
                return false;
            }
            remain -= (size_t)w;
            p += w;
            done += (std::uint64_t)w;
            if (progress) progress(done, total);
        }
    }
    return true;
}

bool Libssh2SftpChannel::mkdir(const std::string& remote_dir,
                               Error& err,
                               std::uint32_t mode) {
    long rc = 0;
    if (!call(rc, err, [&] {
            return libssh2_sftp_mkdir_ex(sftp_, remote_dir.c_str(), (unsigned)remote_dir.size(), (long)mode);
        }))
        return false;
    if (rc != 0) {
        fail(err, "mkdir", remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpChannel::removeFile(const std::string& remote_path,
                                    Error& err) {
    long rc = 0;
    if (!call(rc, err, [&] {
            return libssh2_sftp_unlink_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size());
        }))
        return false;
    if (rc != 0) {
        fail(err, "unlink", remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpChannel::removeDir(const std::string& remote_dir,
                                   Error& err) {
    long rc = 0;
    if (!call(rc, err, [&] {
            return libssh2_sftp_rmdir_ex(sftp_, remote_dir.c_str(), (unsigned)remote_dir.size());
        }))
        return false;
    if (rc != 0) {
        fail(err, "rmdir", remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpChannel::rename(const std::string& from,
                                const std::string& to,
                                Error& err,
                                bool overwrite) {
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite) flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    long rc = 0;
    if (!call(rc, err, [&] {
            return libssh2_sftp_rename_ex(sftp_, from.c_str(), (unsigned)from.size(),
                                          to.c_str(), (unsigned)to.size(), flags);
        }))
        return false;
    if (rc != 0) {
        fail(err, "rename", from);
        return false;
    }
    return true;
}

bool Libssh2SftpChannel::chmod(const std::string& remote_path,
                               std::uint32_t mode,
                               Error& err) {
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
    a.permissions = mode;
    long rc = 0;
    if (!call(rc, err, [&] {
            return libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                                        LIBSSH2_SFTP_SETSTAT, &a);
        }))
        return false;
    if (rc != 0) {
        fail(err, "chmod", remote_path);
        return false;
    }
    return true;
}

} // namespace sshdeck
