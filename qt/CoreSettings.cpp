// QSettings mapping of SessionManagerOptions.
#include "CoreSettings.hpp"
#include <QSettings>
#include <QVariant>

namespace {

int readInt(const QSettings& s, const QString& key, int def, int minValue, int maxValue) {
    bool ok = false;
    const int v = s.value(key, def).toInt(&ok);
    if (!ok || v < minValue || v > maxValue) return def;
    return v;
}

} // namespace

CoreSettings::CoreSettings(QString settingsFile) : file_(std::move(settingsFile)) {}

std::unique_ptr<QSettings> CoreSettings::open() const {
    if (file_.isEmpty()) return std::make_unique<QSettings>("SshDeck", "SshDeck");
    return std::make_unique<QSettings>(file_, QSettings::IniFormat);
}

sshdeck::SessionManagerOptions CoreSettings::load() const {
    using namespace std::chrono;
    sshdeck::SessionManagerOptions opt;
    auto s = open();
    auto& rc = opt.session.reconnect;
    auto& tr = opt.session.transport;

    rc.enabled = s->value("Session/reconnectEnabled", rc.enabled).toBool();
    rc.baseDelay = milliseconds(readInt(*s, "Session/reconnectBaseMs", (int)rc.baseDelay.count(), 1, 600000));
    rc.maxDelay = milliseconds(readInt(*s, "Session/reconnectMaxMs", (int)rc.maxDelay.count(), 1, 3600000));
    if (rc.maxDelay < rc.baseDelay) rc.maxDelay = rc.baseDelay;
    rc.maxAttempts = readInt(*s, "Session/reconnectMaxAttempts", rc.maxAttempts, 0, 1000);

    tr.connectTimeout = milliseconds(readInt(*s, "Session/connectTimeoutMs", (int)tr.connectTimeout.count(), 100, 600000));
    tr.operationTimeout = milliseconds(readInt(*s, "Session/operationTimeoutMs", (int)tr.operationTimeout.count(), 100, 3600000));
    tr.keepaliveIntervalSec = readInt(*s, "Session/keepaliveSec", tr.keepaliveIntervalSec, 0, 3600);

    const QString dup = s->value("Session/duplicateHostPolicy", "returnExisting").toString();
    opt.duplicateHostPolicy = dup == "reject" ? sshdeck::DuplicateHostPolicy::Reject
                                              : sshdeck::DuplicateHostPolicy::ReturnExisting;

    const QString khp = s->value("Security/knownHostsPolicy", "acceptNew").toString();
    tr.knownHostsPolicy = khp == "strict" ? sshdeck::KnownHostsPolicy::Strict
                                          : sshdeck::KnownHostsPolicy::AcceptNew;
    const QString khPath = s->value("Security/knownHostsPath").toString();
    if (!khPath.isEmpty()) tr.knownHostsPath = khPath.toStdString();

    const QString term = s->value("Terminal/type", QString::fromStdString(tr.terminalType)).toString();
    if (!term.isEmpty()) tr.terminalType = term.toStdString();
    tr.terminalSize.rows = readInt(*s, "Terminal/rows", tr.terminalSize.rows, 1, 1000);
    tr.terminalSize.cols = readInt(*s, "Terminal/cols", tr.terminalSize.cols, 1, 1000);
    return opt;
}

bool CoreSettings::save(const sshdeck::SessionManagerOptions& opt) const {
    auto s = open();
    const auto& rc = opt.session.reconnect;
    const auto& tr = opt.session.transport;

    s->setValue("Session/reconnectEnabled", rc.enabled);
    s->setValue("Session/reconnectBaseMs", (int)rc.baseDelay.count());
    s->setValue("Session/reconnectMaxMs", (int)rc.maxDelay.count());
    s->setValue("Session/reconnectMaxAttempts", rc.maxAttempts);
    s->setValue("Session/connectTimeoutMs", (int)tr.connectTimeout.count());
    s->setValue("Session/operationTimeoutMs", (int)tr.operationTimeout.count());
    s->setValue("Session/keepaliveSec", tr.keepaliveIntervalSec);
    s->setValue("Session/duplicateHostPolicy",
                opt.duplicateHostPolicy == sshdeck::DuplicateHostPolicy::Reject ? "reject" : "returnExisting");

    s->setValue("Security/knownHostsPolicy",
                tr.knownHostsPolicy == sshdeck::KnownHostsPolicy::Strict ? "strict" : "acceptNew");
    if (tr.knownHostsPath) s->setValue("Security/knownHostsPath", QString::fromStdString(*tr.knownHostsPath));
    else s->remove("Security/knownHostsPath");

    s->setValue("Terminal/type", QString::fromStdString(tr.terminalType));
    s->setValue("Terminal/rows", tr.terminalSize.rows);
    s->setValue("Terminal/cols", tr.terminalSize.cols);
    s->sync();
    return s->status() == QSettings::NoError;
}
