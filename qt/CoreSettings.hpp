// Loads and saves the core options through QSettings ("Group/key" naming).
// Missing or out-of-range keys fall back to the defaults of the option structs.
#pragma once
#include "sshdeck/SessionManager.hpp"
#include <QString>
#include <memory>

class QSettings;

class CoreSettings {
public:
    // Empty settingsFile uses QSettings("SshDeck", "SshDeck").
    explicit CoreSettings(QString settingsFile = QString());

    sshdeck::SessionManagerOptions load() const;
    bool save(const sshdeck::SessionManagerOptions& opt) const;

private:
    std::unique_ptr<QSettings> open() const;

    QString file_;
};
