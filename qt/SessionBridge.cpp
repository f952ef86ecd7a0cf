// Event pump from the core to Qt signals.
#include "SessionBridge.hpp"
#include "sshdeck/Log.hpp"
#include <QMetaObject>

SessionBridge::SessionBridge(sshdeck::SessionManager& manager, QObject* parent)
    : QObject(parent), manager_(manager) {
    qRegisterMetaType<sshdeck::SessionState>("sshdeck::SessionState");
    qRegisterMetaType<sshdeck::TransferState>("sshdeck::TransferState");
}

SessionBridge::~SessionBridge() {
    stop();
}

void SessionBridge::start() {
    if (running_.exchange(true)) return;
    stream_ = manager_.subscribe();
    worker_ = std::thread([this] { pump(); });
}

void SessionBridge::stop() {
    if (!running_.exchange(false)) return;
    if (stream_) manager_.unsubscribe(stream_);
    if (worker_.joinable()) worker_.join();
    stream_.reset();
}

void SessionBridge::pump() {
    auto stream = stream_;
    sshdeck::Event ev;
    while (running_.load()) {
        if (!stream->next(ev, std::chrono::milliseconds(200))) {
            if (stream->closed()) break;
            continue;
        }
        // Reschedule on the bridge's thread
        QMetaObject::invokeMethod(this, [this, ev]() { deliver(ev); }, Qt::QueuedConnection);
    }
    LOGD("session bridge pump stopped");
}

void SessionBridge::deliver(const sshdeck::Event& ev) {
    const QString sid = QString::fromStdString(ev.sessionId);
    switch (ev.type) {
        case sshdeck::Event::Type::SessionStateChanged:
            emit sessionStateChanged(sid, ev.state, ev.previous);
            break;
        case sshdeck::Event::Type::ShellData:
            emit shellData(sid, QByteArray(ev.data.data(), (int)ev.data.size()));
            break;
        case sshdeck::Event::Type::TransferProgress:
            emit transferProgress(sid, ev.task.id, ev.task.bytesTransferred, ev.task.totalBytes);
            break;
        case sshdeck::Event::Type::TransferDone:
            emit transferFinished(sid, ev.task.id, ev.task.state,
                                  ev.task.error.ok() ? QString() : QString::fromStdString(ev.task.error.describe()));
            break;
        case sshdeck::Event::Type::Error:
            emit errorOccurred(sid, QString::fromLatin1(sshdeck::toString(ev.error.kind)),
                               QString::fromStdString(ev.error.host),
                               QString::fromStdString(ev.error.message));
            break;
    }
}
