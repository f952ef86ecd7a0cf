// Abstract interface for SFTP operations on a connected transport. Concrete
// implementations (libssh2, mock) follow this API so the Transfer Engine stays
// decoupled from the backend.
#pragma once
#include "Errors.hpp"
#include "SessionTypes.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sshdeck {

class SftpChannel {
public:
    using ProgressCB = std::function<void(std::uint64_t /*done*/, std::uint64_t /*total*/)>;
    using CancelCB = std::function<bool()>;

    virtual ~SftpChannel() = default;

    // Remote directory listing ("." and ".." are skipped)
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      Error& err) = 0;

    // Detailed metadata (stat). Returns true if it exists; err stays clear when it does not.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      Error& err) = 0;

    // Check existence (leave err clear if "does not exist")
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        Error& err) = 0;

    // Download a remote file to local; if resume=true, continue a partial download.
    // Cancellation leaves the partial local file in place and reports Cancelled.
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     Error& err,
                     ProgressCB progress = {},
                     CancelCB shouldCancel = {},
                     bool resume = false) = 0;

    // Upload a local file to remote; if resume=true, continue a partial upload.
    // Cancellation leaves the partial remote file in place and reports Cancelled.
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     Error& err,
                     ProgressCB progress = {},
                     CancelCB shouldCancel = {},
                     bool resume = false) = 0;

    virtual bool mkdir(const std::string& remote_dir,
                       Error& err,
                       std::uint32_t mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            Error& err) = 0;

    // Removes an empty directory
    virtual bool removeDir(const std::string& remote_dir,
                           Error& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        Error& err,
                        bool overwrite = false) = 0;

    // Change permissions (POSIX mode, e.g. 0644)
    virtual bool chmod(const std::string& remote_path,
                       std::uint32_t mode,
                       Error& err) = 0;

    // False once the underlying connection is gone.
    virtual bool isAlive() const = 0;
};

} // namespace sshdeck
