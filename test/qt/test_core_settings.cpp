#include "CoreSettings.hpp"
#include <catch2/catch.hpp>

#include <QSettings>
#include <QTemporaryDir>

using namespace std::chrono_literals;

TEST_CASE("core settings default when nothing is stored", "[qt][settings]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    CoreSettings settings(dir.filePath("core.ini"));

    const sshdeck::SessionManagerOptions defaults;
    const auto opt = settings.load();
    CHECK(opt.session.reconnect.enabled == defaults.session.reconnect.enabled);
    CHECK(opt.session.reconnect.baseDelay == defaults.session.reconnect.baseDelay);
    CHECK(opt.session.reconnect.maxAttempts == defaults.session.reconnect.maxAttempts);
    CHECK(opt.session.transport.connectTimeout == defaults.session.transport.connectTimeout);
    CHECK(opt.duplicateHostPolicy == sshdeck::DuplicateHostPolicy::ReturnExisting);
    CHECK(opt.session.transport.knownHostsPolicy == sshdeck::KnownHostsPolicy::AcceptNew);
    CHECK_FALSE(opt.session.transport.knownHostsPath.has_value());
}

TEST_CASE("core settings save and load", "[qt][settings]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    CoreSettings settings(dir.filePath("core.ini"));

    sshdeck::SessionManagerOptions opt;
    opt.session.reconnect.enabled = false;
    opt.session.reconnect.baseDelay = 250ms;
    opt.session.reconnect.maxDelay = 8000ms;
    opt.session.reconnect.maxAttempts = 7;
    opt.session.transport.connectTimeout = 4000ms;
    opt.session.transport.keepaliveIntervalSec = 15;
    opt.session.transport.knownHostsPolicy = sshdeck::KnownHostsPolicy::Strict;
    opt.session.transport.knownHostsPath = "/tmp/kh";
    opt.session.transport.terminalType = "vt100";
    opt.session.transport.terminalSize = sshdeck::TerminalSize{50, 132};
    opt.duplicateHostPolicy = sshdeck::DuplicateHostPolicy::Reject;
    REQUIRE(settings.save(opt));

    const auto back = settings.load();
    CHECK_FALSE(back.session.reconnect.enabled);
    CHECK(back.session.reconnect.baseDelay == 250ms);
    CHECK(back.session.reconnect.maxDelay == 8000ms);
    CHECK(back.session.reconnect.maxAttempts == 7);
    CHECK(back.session.transport.connectTimeout == 4000ms);
    CHECK(back.session.transport.keepaliveIntervalSec == 15);
    CHECK(back.session.transport.knownHostsPolicy == sshdeck::KnownHostsPolicy::Strict);
    CHECK(back.session.transport.knownHostsPath == std::optional<std::string>("/tmp/kh"));
    CHECK(back.session.transport.terminalType == "vt100");
    CHECK(back.session.transport.terminalSize.rows == 50);
    CHECK(back.session.transport.terminalSize.cols == 132);
    CHECK(back.duplicateHostPolicy == sshdeck::DuplicateHostPolicy::Reject);
}

TEST_CASE("core settings ignore out of range values", "[qt][settings]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString file = dir.filePath("core.ini");
    {
        QSettings raw(file, QSettings::IniFormat);
        raw.setValue("Session/reconnectBaseMs", 5000);
        raw.setValue("Session/reconnectMaxMs", 100);
        raw.setValue("Session/reconnectMaxAttempts", -3);
        raw.setValue("Session/connectTimeoutMs", "soon");
        raw.setValue("Terminal/rows", 0);
        raw.sync();
    }
    const sshdeck::SessionManagerOptions defaults;
    const auto opt = CoreSettings(file).load();
    CHECK(opt.session.reconnect.baseDelay == 5000ms);
    // Max delay never drops below the base delay
    CHECK(opt.session.reconnect.maxDelay == 5000ms);
    CHECK(opt.session.reconnect.maxAttempts == defaults.session.reconnect.maxAttempts);
    CHECK(opt.session.transport.connectTimeout == defaults.session.transport.connectTimeout);
    CHECK(opt.session.transport.terminalSize.rows == defaults.session.transport.terminalSize.rows);
}
