// Runs SFTP operations as background tasks scoped to a Session: one worker thread
// per in-flight task, progress/done events, cooperative cancellation.
#pragma once
#include "Event.hpp"
#include "Session.hpp"
#include "TransferTypes.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sshdeck {

class TransferEngine : public TransportListener {
public:
    using EventSink = std::function<void(const Event&)>;

    explicit TransferEngine(EventSink sink);
    ~TransferEngine() override;

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Queues the request and returns its task id at once. The session must be
    // Connected; it must stay alive until its transport is released.
    bool submit(Session& session, const TransferRequest& req, std::uint64_t& taskId, Error& err);

    // Safe at any point. Returns false when the task is unknown or already finished.
    bool cancel(std::uint64_t taskId);

    std::optional<TransferTask> task(std::uint64_t taskId) const;
    std::vector<TransferTask> tasksFor(const std::string& sessionId) const;

    // Waits until the task finished. False on timeout or unknown id.
    bool wait(std::uint64_t taskId, std::chrono::milliseconds timeout) const;

    // Drops finished tasks (Done, Failed, Cancelled); running ones stay.
    std::size_t clearCompleted();
    // Drops the finished tasks of one session.
    std::size_t forgetSession(const std::string& sessionId);

    void transportReleasing(const std::string& sessionId, bool lost) override;
    void transportReleased(const std::string& sessionId) override;

    // Upper bound for one directory listing
    static constexpr std::size_t kMaxListing = 100000;

private:
    void run(Session* session, std::uint64_t taskId);
    bool execute(std::uint64_t taskId, const TransferRequest& req, SftpChannel& ch, Error& err);
    bool removeTree(SftpChannel& ch, const std::string& path,
                    const SftpChannel::CancelCB& shouldCancel, Error& err);

    // One file of a directory transfer
    struct TreeFile {
        std::string   from;
        std::string   to;
        std::uint64_t size = 0;
    };
    bool getTree(std::uint64_t taskId, const TransferRequest& req, SftpChannel& ch, Error& err);
    bool putTree(std::uint64_t taskId, const TransferRequest& req, SftpChannel& ch, Error& err);
    bool walkRemote(SftpChannel& ch, const std::string& remote, const std::string& local,
                    std::vector<std::string>& dirs, std::vector<TreeFile>& files,
                    const SftpChannel::CancelCB& shouldCancel, Error& err);
    // Copies the files in order, reporting bytes over the whole set.
    bool copyFiles(std::uint64_t taskId, const std::vector<TreeFile>& files, bool download,
                   bool resume, SftpChannel& ch, Error& err);
    std::size_t eraseFinished(const std::string& sessionId);  // requires mtx_; empty id = all
    void report(std::uint64_t taskId, std::uint64_t done, std::uint64_t total);
    void finish(std::uint64_t taskId, bool ok, Error err);
    bool isCanceled(std::uint64_t taskId) const;
    void reapFinished();  // requires mtx_

    EventSink sink_;

    // Worker threads per task
    std::unordered_map<std::uint64_t, std::thread> workers_;
    // Workers that returned and can be joined without blocking
    std::unordered_set<std::uint64_t> exitedWorkers_;
    // Cooperation flags read by the workers
    std::unordered_set<std::uint64_t> canceledTasks_;
    std::unordered_set<std::uint64_t> lostTasks_;
    std::map<std::uint64_t, TransferTask> tasks_;
    mutable std::mutex mtx_;   // protects tasks_ and the sets above
    mutable std::condition_variable cv_;
    std::uint64_t nextId_ = 1;
};

} // namespace sshdeck
