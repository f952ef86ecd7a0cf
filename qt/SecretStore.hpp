// Credential Provider backed by QSettings.
// Stores secrets in plain text, so it only works when the insecure fallback is
// enabled explicitly (SSHDECK_ENABLE_INSECURE_FALLBACK=1 or setFallbackEnabled).
#pragma once
#include "sshdeck/CredentialProvider.hpp"
#include <QString>
#include <memory>
#include <mutex>
#include <optional>

class QSettings;

class SecretStore : public sshdeck::CredentialProvider {
public:
    // Empty settingsFile uses QSettings("SshDeck", "Secrets").
    explicit SecretStore(QString settingsFile = QString());
    ~SecretStore() override;

    std::optional<sshdeck::Secret> get(const std::string& hostId) override;
    bool put(const std::string& hostId, const sshdeck::Secret& secret) override;
    bool remove(const std::string& hostId) override;

    // Overrides the environment switch for this store.
    void setFallbackEnabled(bool on);
    bool fallbackEnabled() const;

    // Whether the environment enables the insecure fallback.
    // Always false in builds with SSHDECK_BUILD_SECURE_ONLY.
    static bool insecureFallbackActive();

private:
    std::unique_ptr<QSettings> open() const;

    QString file_;
    std::optional<bool> forced_;
    mutable std::mutex mtx_;   // QSettings instances are not shared across threads
};
