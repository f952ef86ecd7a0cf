#include "sshdeck/TransferTypes.hpp"

namespace sshdeck {

const char* toString(TransferKind k) {
    switch (k) {
        case TransferKind::List: return "List";
        case TransferKind::Get: return "Get";
        case TransferKind::Put: return "Put";
        case TransferKind::Mkdir: return "Mkdir";
        case TransferKind::Remove: return "Remove";
        case TransferKind::Rename: return "Rename";
        case TransferKind::Chmod: return "Chmod";
    }
    return "?";
}

const char* toString(TransferState s) {
    switch (s) {
        case TransferState::Pending: return "Pending";
        case TransferState::Running: return "Running";
        case TransferState::Done: return "Done";
        case TransferState::Failed: return "Failed";
        case TransferState::Cancelled: return "Cancelled";
    }
    return "?";
}

TransferRequest TransferRequest::list(std::string remote) {
    TransferRequest r;
    r.kind = TransferKind::List;
    r.path = std::move(remote);
    return r;
}

TransferRequest TransferRequest::get(std::string remote, std::string local, bool resume) {
    TransferRequest r;
    r.kind = TransferKind::Get;
    r.path = std::move(remote);
    r.localPath = std::move(local);
    r.resume = resume;
    return r;
}

TransferRequest TransferRequest::put(std::string local, std::string remote, bool resume) {
    TransferRequest r;
    r.kind = TransferKind::Put;
    r.path = std::move(remote);
    r.localPath = std::move(local);
    r.resume = resume;
    return r;
}

TransferRequest TransferRequest::getTree(std::string remote, std::string local, bool resume) {
    TransferRequest r = get(std::move(remote), std::move(local), resume);
    r.recursive = true;
    return r;
}

TransferRequest TransferRequest::putTree(std::string local, std::string remote, bool resume) {
    TransferRequest r = put(std::move(local), std::move(remote), resume);
    r.recursive = true;
    return r;
}

TransferRequest TransferRequest::mkdir(std::string remote, std::uint32_t mode) {
    TransferRequest r;
    r.kind = TransferKind::Mkdir;
    r.path = std::move(remote);
    r.mode = mode;
    return r;
}

TransferRequest TransferRequest::remove(std::string remote, bool recursive) {
    TransferRequest r;
    r.kind = TransferKind::Remove;
    r.path = std::move(remote);
    r.recursive = recursive;
    return r;
}

TransferRequest TransferRequest::rename(std::string from, std::string to, bool overwrite) {
    TransferRequest r;
    r.kind = TransferKind::Rename;
    r.path = std::move(from);
    r.newPath = std::move(to);
    r.overwrite = overwrite;
    return r;
}

TransferRequest TransferRequest::chmod(std::string remote, std::uint32_t mode) {
    TransferRequest r;
    r.kind = TransferKind::Chmod;
    r.path = std::move(remote);
    r.mode = mode;
    return r;
}

} // namespace sshdeck
