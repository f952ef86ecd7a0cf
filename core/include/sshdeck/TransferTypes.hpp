// Transfer task model shared by the Transfer Engine and the event surface.
#pragma once
#include "Errors.hpp"
#include "SessionTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sshdeck {

enum class TransferKind { List, Get, Put, Mkdir, Remove, Rename, Chmod };

// Task state:
//  - Pending: submitted, worker not started yet
//  - Running: in progress
//  - Done: completed successfully
//  - Failed: finished with error (ConnectionLost when the channel died)
//  - Cancelled: cancelled by the caller or by closing the session
enum class TransferState { Pending, Running, Done, Failed, Cancelled };

const char* toString(TransferKind k);
const char* toString(TransferState s);

// What to run. Paths are remote unless named local.
struct TransferRequest {
    TransferKind  kind = TransferKind::List;
    std::string   path;        // remote path (source for Get, target for Put, old name for Rename)
    std::string   localPath;   // Get destination / Put source (directories when recursive)
    std::string   newPath;     // Rename target
    std::uint32_t mode = 0755; // Mkdir/Chmod
    bool resume = false;       // Get/Put: continue a partial target
    bool recursive = false;    // Remove: delete a directory tree; Get/Put: copy a directory tree
    bool overwrite = false;    // Rename: replace an existing target

    static TransferRequest list(std::string remote);
    static TransferRequest get(std::string remote, std::string local, bool resume = false);
    static TransferRequest put(std::string local, std::string remote, bool resume = false);
    static TransferRequest getTree(std::string remote, std::string local, bool resume = false);
    static TransferRequest putTree(std::string local, std::string remote, bool resume = false);
    static TransferRequest mkdir(std::string remote, std::uint32_t mode = 0755);
    static TransferRequest remove(std::string remote, bool recursive = false);
    static TransferRequest rename(std::string from, std::string to, bool overwrite = false);
    static TransferRequest chmod(std::string remote, std::uint32_t mode);
};

struct TransferTask {
    std::uint64_t   id = 0;   // stable identifier for cross-thread updates
    std::string     sessionId;
    TransferRequest request;
    TransferState   state = TransferState::Pending;
    std::uint64_t   bytesTransferred = 0;
    std::uint64_t   totalBytes = 0;
    std::vector<FileInfo> listing;  // List result
    Error           error;

    TransferKind kind() const { return request.kind; }
    bool finished() const {
        return state == TransferState::Done || state == TransferState::Failed ||
               state == TransferState::Cancelled;
    }
};

} // namespace sshdeck
