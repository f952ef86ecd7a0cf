// SftpChannel implementation on top of a Libssh2Transport session.
#pragma once
#include "libssh2/Libssh2Util.hpp"
#include "sshdeck/Libssh2Transport.hpp"
#include "sshdeck/SftpChannel.hpp"
#include <mutex>
#include <utility>

struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace sshdeck {

class Libssh2SftpChannel : public SftpChannel {
public:
    // Takes ownership of the SFTP handle. The transport must outlive the channel.
    Libssh2SftpChannel(Libssh2Transport& transport, _LIBSSH2_SFTP* sftp);
    ~Libssh2SftpChannel() override;

    Libssh2SftpChannel(const Libssh2SftpChannel&) = delete;
    Libssh2SftpChannel& operator=(const Libssh2SftpChannel&) = delete;

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              Error& err) override;
    bool stat(const std::string& remote_path,
              FileInfo& info,
              Error& err) override;
    bool exists(const std::string& remote_path,
                bool& isDir,
                Error& err) override;
    bool get(const std::string& remote,
             const std::string& local,
             Error& err,
             ProgressCB progress,
             CancelCB shouldCancel,
             bool resume) override;
    bool put(const std::string& local,
             const std::string& remote,
             Error& err,
             ProgressCB progress,
             CancelCB shouldCancel,
             bool resume) override;
    bool mkdir(const std::string& remote_dir,
               Error& err,
               std::uint32_t mode) override;
    bool removeFile(const std::string& remote_path,
                    Error& err) override;
    bool removeDir(const std::string& remote_dir,
                   Error& err) override;
    bool rename(const std::string& from,
                const std::string& to,
                Error& err,
                bool overwrite) override;
    bool chmod(const std::string& remote_path,
               std::uint32_t mode,
               Error& err) override;
    bool isAlive() const override;

    void closeHandle(_LIBSSH2_SFTP_HANDLE* h);

private:
    // One SFTP request at a time: libssh2 keeps the state of a pending non-blocking
    // request in the SFTP handle, so calls from different workers must not interleave.
    template <typename Fn>
    bool call(long& rc, Error& err, Fn&& fn) {
        std::lock_guard<std::mutex> lk(callMtx_);
        return ssh2::callRetry(t_, t_.operationDeadline(), rc, err, std::forward<Fn>(fn));
    }
    template <typename Fn>
    _LIBSSH2_SFTP_HANDLE* callPtr(Error& err, Fn&& fn) {
        std::lock_guard<std::mutex> lk(callMtx_);
        return ssh2::callRetryPtr<_LIBSSH2_SFTP_HANDLE>(t_, t_.operationDeadline(), err, std::forward<Fn>(fn));
    }

    // Translates the last libssh2/SFTP failure into err, unless err already holds
    // a wait failure.
    void fail(Error& err, const std::string& what, const std::string& path);
    // True when the last failure was "no such file".
    bool lastWasNoSuchFile();

    Libssh2Transport& t_;
    _LIBSSH2_SFTP* sftp_ = nullptr; // <- uses internal libssh2 types
    std::mutex callMtx_;
};

} // namespace sshdeck
