// Re-emits core events as Qt signals. A pump thread drains an EventStream and
// hands each event to the bridge's thread through a queued call, so slots run on
// the thread that owns the bridge (normally the GUI thread).
#pragma once
#include "sshdeck/SessionManager.hpp"
#include <QByteArray>
#include <QMetaType>
#include <QObject>
#include <QString>
#include <atomic>
#include <memory>
#include <thread>

Q_DECLARE_METATYPE(sshdeck::SessionState)
Q_DECLARE_METATYPE(sshdeck::TransferState)

class SessionBridge : public QObject {
    Q_OBJECT
public:
    // The manager is not owned and must outlive the bridge.
    explicit SessionBridge(sshdeck::SessionManager& manager, QObject* parent = nullptr);
    ~SessionBridge() override;

    void start();
    void stop();
    bool running() const { return running_.load(); }

signals:
    void sessionStateChanged(const QString& sessionId, sshdeck::SessionState state,
                             sshdeck::SessionState previous);
    void shellData(const QString& sessionId, const QByteArray& bytes);
    void transferProgress(const QString& sessionId, quint64 taskId, quint64 done, quint64 total);
    void transferFinished(const QString& sessionId, quint64 taskId, sshdeck::TransferState state,
                          const QString& error);
    void errorOccurred(const QString& sessionId, const QString& kind, const QString& host,
                       const QString& message);

private:
    void pump();
    void deliver(const sshdeck::Event& ev);

    sshdeck::SessionManager& manager_;
    std::shared_ptr<sshdeck::EventStream> stream_;
    std::atomic<bool> running_{false};
    std::thread worker_;
};
