// SecretStore implementation: optional fallback with QSettings.
#include "SecretStore.hpp"
#include "sshdeck/Log.hpp"
#include <QByteArray>
#include <QSettings>
#include <QVariant>
#include <cstdlib>

namespace {

QString groupFor(const std::string& hostId) {
    return QStringLiteral("host/") + QString::fromStdString(hostId);
}

void wipeBytes(QByteArray& b) {
    b.fill('\0');
    b.clear();
}

std::optional<std::string> readValue(QSettings& s, const QString& key) {
    QVariant v = s.value(key);
    if (!v.isValid()) return std::nullopt;
    QByteArray raw = v.toString().toUtf8();
    std::string out(raw.constData(), (std::size_t)raw.size());
    wipeBytes(raw);
    return out;
}

} // namespace

SecretStore::SecretStore(QString settingsFile) : file_(std::move(settingsFile)) {}

SecretStore::~SecretStore() = default;

bool SecretStore::insecureFallbackActive() {
#ifdef SSHDECK_BUILD_SECURE_ONLY
    return false;
#else
    const char* v = std::getenv("SSHDECK_ENABLE_INSECURE_FALLBACK");
    return v && *v == '1';
#endif
}

void SecretStore::setFallbackEnabled(bool on) {
    std::lock_guard<std::mutex> lk(mtx_);
    forced_ = on;
}

bool SecretStore::fallbackEnabled() const {
#ifdef SSHDECK_BUILD_SECURE_ONLY
    return false;
#else
    std::lock_guard<std::mutex> lk(mtx_);
    if (forced_) return *forced_;
    return insecureFallbackActive();
#endif
}

std::unique_ptr<QSettings> SecretStore::open() const {
    if (file_.isEmpty()) return std::make_unique<QSettings>("SshDeck", "Secrets");
    return std::make_unique<QSettings>(file_, QSettings::IniFormat);
}

std::optional<sshdeck::Secret> SecretStore::get(const std::string& hostId) {
    if (!fallbackEnabled()) return std::nullopt;
    std::lock_guard<std::mutex> lk(mtx_);
    auto s = open();
    s->beginGroup(groupFor(hostId));
    sshdeck::Secret secret;
    secret.password = readValue(*s, "password");
    secret.privateKey = readValue(*s, "privateKey");
    secret.passphrase = readValue(*s, "passphrase");
    s->endGroup();
    if (secret.empty()) return std::nullopt;
    return secret;
}

bool SecretStore::put(const std::string& hostId, const sshdeck::Secret& secret) {
    if (!fallbackEnabled()) {
        LOGW("secret for %s not stored: insecure fallback disabled", hostId.c_str());
        return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    auto s = open();
    s->remove(groupFor(hostId));
    s->beginGroup(groupFor(hostId));
    if (secret.password) s->setValue("password", QString::fromStdString(*secret.password));
    if (secret.privateKey) s->setValue("privateKey", QString::fromStdString(*secret.privateKey));
    if (secret.passphrase) s->setValue("passphrase", QString::fromStdString(*secret.passphrase));
    s->endGroup();
    s->sync();
    return s->status() == QSettings::NoError;
}

bool SecretStore::remove(const std::string& hostId) {
    if (!fallbackEnabled()) return false;
    std::lock_guard<std::mutex> lk(mtx_);
    auto s = open();
    s->remove(groupFor(hostId));
    s->sync();
    return s->status() == QSettings::NoError;
}
