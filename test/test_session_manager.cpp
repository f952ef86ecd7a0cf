#include "sshdeck/SessionManager.hpp"
#include "test_util.hpp"
#include <catch2/catch.hpp>

#include <stdexcept>

namespace sshdeck::test {

namespace {

SessionManagerOptions fastOptions(DuplicateHostPolicy policy = DuplicateHostPolicy::ReturnExisting) {
    SessionManagerOptions o;
    o.session.readTimeout = std::chrono::milliseconds(20);
    o.session.reconnect = quickReconnect(3);
    o.duplicateHostPolicy = policy;
    return o;
}

} // namespace

TEST_CASE("manager issues sequential ids and opens sessions", "[manager]") {
    auto factory = std::make_shared<MockTransportFactory>();
    SessionManager mgr(std::make_shared<InMemoryCredentialProvider>(), factory, fastOptions());
    EventLog log(mgr.subscribe());

    std::string a, b;
    Error err;
    REQUIRE(mgr.createSession(sshHost("h1"), a, err));
    REQUIRE(mgr.createSession(sshHost("h2"), b, err));
    CHECK(a == "s1");
    CHECK(b == "s2");
    CHECK(mgr.sessionInfo(a)->state == SessionState::Idle);

    REQUIRE(mgr.openSession(a, err));
    REQUIRE(mgr.openSession(b, err));
    REQUIRE(log.waitForState(a, SessionState::Connected));
    REQUIRE(log.waitForState(b, SessionState::Connected));
    CHECK(mgr.sessions().size() == 2);

    // Sequence numbers follow emission order
    std::uint64_t last = 0;
    for (const auto& ev : log.all()) {
        CHECK(ev.sequence > last);
        last = ev.sequence;
    }
}

TEST_CASE("unknown session ids throw", "[manager]") {
    SessionManager mgr(std::make_shared<InMemoryCredentialProvider>(),
                       std::make_shared<MockTransportFactory>(), fastOptions());
    Error err;
    CHECK_THROWS_AS(mgr.openSession("s42", err), std::out_of_range);
    CHECK_THROWS_AS(mgr.sendInput("nope", "x", err), std::out_of_range);
    CHECK_THROWS_AS(mgr.closeSession("s9", err), std::out_of_range);
    CHECK_THROWS_AS(mgr.subscribe("s9"), std::out_of_range);
    CHECK_THROWS_AS(mgr.sessionInfo("s9"), std::out_of_range);

    std::string id;
    HostDescriptor noId = sshHost("");
    CHECK_THROWS_AS(mgr.createSession(noId, id, err), std::invalid_argument);
}

TEST_CASE("closed sessions refuse commands until reopened", "[manager]") {
    auto factory = std::make_shared<MockTransportFactory>();
    SessionManager mgr(std::make_shared<InMemoryCredentialProvider>(), factory, fastOptions());
    EventLog all(mgr.subscribe());

    std::string id;
    Error err;
    REQUIRE(mgr.createSession(sshHost("h1"), id, err));
    auto perSession = mgr.subscribe(id);
    EventLog one(perSession);
    REQUIRE(mgr.openSession(id, err));
    REQUIRE(one.waitForState(id, SessionState::Connected));

    REQUIRE(mgr.closeSession(id, err));
    CHECK(factory->liveTransports("h1") == 0);
    CHECK(perSession->closed());
    all.drain();
    const std::size_t seen = all.all().size();

    // Commands other than reopen fail, repeated close is a no-op
    CHECK_FALSE(mgr.sendInput(id, "ls\n", err));
    CHECK(err.kind == ErrorKind::NotConnected);
    err.clear();
    CHECK_FALSE(mgr.openSession(id, err));
    CHECK(err.kind == ErrorKind::NotConnected);
    err.clear();
    CHECK_FALSE(mgr.resizeTerminal(id, 24, 80, err));
    CHECK(err.kind == ErrorKind::NotConnected);
    CHECK(mgr.closeSession(id, err));
    CHECK_FALSE(mgr.sessionInfo(id).has_value());
    CHECK(mgr.sessions().empty());

    auto late = mgr.subscribe(id);
    CHECK(late->closed());

    factory->inject("h1", "ghost");
    std::this_thread::sleep_for(50ms);
    CHECK(all.all().size() == seen);

    // Ids are never reissued
    std::string next;
    REQUIRE(mgr.createSession(sshHost("h1"), next, err));
    CHECK(next == "s2");
}

TEST_CASE("reopen brings a closed session back", "[manager]") {
    auto factory = std::make_shared<MockTransportFactory>();
    SessionManager mgr(std::make_shared<InMemoryCredentialProvider>(), factory, fastOptions());
    EventLog all(mgr.subscribe());

    std::string id;
    Error err;
    REQUIRE(mgr.createSession(sshHost("h1"), id, err));
    REQUIRE(mgr.openSession(id, err));
    REQUIRE(all.waitForState(id, SessionState::Connected));
    REQUIRE(mgr.closeSession(id, err));
    REQUIRE(all.waitForState(id, SessionState::Disconnected));
    const std::size_t seen = all.all().size();
    const std::uint64_t closedAt = all.all().back().sequence;

    // Nothing is emitted for the id while it is closed
    std::this_thread::sleep_for(50ms);
    CHECK(all.all().size() == seen);

    REQUIRE(mgr.reopenSession(id, err));
    REQUIRE(all.waitFor([&](const Event& ev) {
        return ev.sequence > closedAt && ev.type == Event::Type::SessionStateChanged &&
               ev.state == SessionState::Connected;
    }));
    CHECK(mgr.sessionInfo(id)->state == SessionState::Connected);
    CHECK(mgr.sessions().size() == 1);
    CHECK(factory->liveTransports("h1") == 1);

    // The reopened session takes commands and streams again
    EventLog one(mgr.subscribe(id));
    REQUIRE(mgr.sendInput(id, "pwd\n", err));
    REQUIRE(waitUntil([&] { return one.shellText(id).find("pwd\n") != std::string::npos; }));

    const auto states = all.states(id);
    REQUIRE(states.size() >= 4);
    const std::vector<SessionState> tail(states.end() - 4, states.end());
    CHECK(tail == std::vector<SessionState>{SessionState::Idle, SessionState::Connecting,
                                            SessionState::Authenticating, SessionState::Connected});
}

TEST_CASE("per-session subscription only sees its session", "[manager]") {
    auto factory = std::make_shared<MockTransportFactory>();
    SessionManager mgr(std::make_shared<InMemoryCredentialProvider>(), factory, fastOptions());
    std::string a, b;
    Error err;
    REQUIRE(mgr.createSession(sshHost("h1"), a, err));
    REQUIRE(mgr.createSession(sshHost("h2"), b, err));
    EventLog onlyB(mgr.subscribe(b));

    REQUIRE(mgr.openSession(a, err));
    REQUIRE(mgr.openSession(b, err));
    REQUIRE(onlyB.waitForState(b, SessionState::Connected));
    std::this_thread::sleep_for(50ms);
    for (const auto& ev : onlyB.all()) CHECK(ev.sessionId == b);
}

TEST_CASE("shell input and resize route to the session", "[manager]") {
    auto factory = std::make_shared<MockTransportFactory>();
    SessionManager mgr(std::make_shared<InMemoryCredentialProvider>(), factory, fastOptions());
    std::string id;
    Error err;
    REQUIRE(mgr.createSession(sshHost("h1"), id, err));
    EventLog log(mgr.subscribe(id));
    REQUIRE(mgr.openSession(id, err));
    REQUIRE(log.waitForState(id, SessionState::Connected));

    REQUIRE(mgr.sendInput(id, "uptime\n", err));
    REQUIRE(waitUntil([&] { return log.shellText(id).find("uptime\n") != std::string::npos; }));
    CHECK(factory->written("h1") == "uptime\n");

    REQUIRE(mgr.resizeTerminal(id, 40, 120, err));
    CHECK(factory->resizes("h1").back().cols == 120);

    CHECK_FALSE(mgr.resizeTerminal(id, 0, 80, err));
    CHECK(err.kind == ErrorKind::ProtocolError);
}

TEST_CASE("duplicate connects to a host return the in-flight session", "[manager]") {
    auto factory = std::make_shared<MockTransportFactory>();
    MockHostScript script;
    script.authGate = std::make_shared<MockGate>();
    factory->setScript("h1", script);
    SessionManager mgr(std::make_shared<InMemoryCredentialProvider>(), factory, fastOptions());

    std::string first, second;
    Error err;
    REQUIRE(mgr.createSession(sshHost("h1"), first, err));
    REQUIRE(mgr.openSession(first, err));
    REQUIRE(waitUntil([&] { return script.authGate->waiting() == 1; }));

    REQUIRE(mgr.createSession(sshHost("h1"), second, err));
    CHECK(second == first);
    CHECK(factory->connectAttempts("h1") == 1);

    script.authGate->open();
    REQUIRE(waitUntil([&] { return mgr.sessionInfo(first)->state == SessionState::Connected; }));

    // Connected sessions do not block a second one
    std::string third;
    REQUIRE(mgr.createSession(sshHost("h1"), third, err));
    CHECK(third != first);
}

TEST_CASE("reject policy refuses concurrent connects to a host", "[manager]") {
    auto factory = std::make_shared<MockTransportFactory>();
    MockHostScript script;
    script.authGate = std::make_shared<MockGate>();
    factory->setScript("h1", script);
    SessionManager mgr(std::make_shared<InMemoryCredentialProvider>(), factory,
                       fastOptions(DuplicateHostPolicy::Reject));

    std::string first, second, idle;
    Error err;
    REQUIRE(mgr.createSession(sshHost("h1"), idle, err));
    REQUIRE(mgr.createSession(sshHost("h1"), first, err));
    REQUIRE(mgr.openSession(first, err));
    REQUIRE(waitUntil([&] { return script.authGate->waiting() == 1; }));

    CHECK_FALSE(mgr.createSession(sshHost("h1"), second, err));
    CHECK(err.kind == ErrorKind::AlreadyConnecting);
    err.clear();
    CHECK_FALSE(mgr.openSession(idle, err));
    CHECK(err.kind == ErrorKind::AlreadyConnecting);

    script.authGate->open();
}

TEST_CASE("credentials are looked up per connect", "[manager]") {
    auto factory = std::make_shared<MockTransportFactory>();
    auto creds = std::make_shared<InMemoryCredentialProvider>();
    Secret s;
    s.password = "pw1";
    creds->put("h1", s);
    SessionManager mgr(creds, factory, fastOptions());

    std::string id;
    Error err;
    REQUIRE(mgr.createSession(sshHost("h1"), id, err));
    EventLog log(mgr.subscribe(id));
    REQUIRE(mgr.openSession(id, err));
    REQUIRE(log.waitForState(id, SessionState::Connected));
    CHECK(creds->lookups() == 1);
    CHECK(factory->lastPassword("h1") == std::optional<std::string>("pw1"));

    s.password = "pw2";
    creds->put("h1", s);
    factory->dropConnection("h1");
    REQUIRE(waitUntil([&] { return creds->lookups() == 2 && mgr.sessionInfo(id)->state == SessionState::Connected; }));
    CHECK(factory->lastPassword("h1") == std::optional<std::string>("pw2"));
}

TEST_CASE("a reconnect waits for another session connecting to the host", "[manager]") {
    auto factory = std::make_shared<MockTransportFactory>();
    MockHostScript script;
    script.authGate = std::make_shared<MockGate>(false);
    factory->setScript("h1", script);
    SessionManager mgr(std::make_shared<InMemoryCredentialProvider>(), factory, fastOptions());

    std::string first, second;
    Error err;
    REQUIRE(mgr.createSession(sshHost("h1"), first, err));
    REQUIRE(mgr.openSession(first, err));
    REQUIRE(waitUntil([&] { return mgr.sessionInfo(first)->state == SessionState::Connected; }));

    // Second session of the host holds the authentication phase
    script.authGate->close();
    REQUIRE(mgr.createSession(sshHost("h1"), second, err));
    REQUIRE(second != first);
    REQUIRE(mgr.openSession(second, err));
    REQUIRE(waitUntil([&] { return script.authGate->waiting() == 1; }));
    REQUIRE(factory->connectAttempts("h1") == 2);

    factory->dropConnection("h1");
    REQUIRE(waitUntil([&] { return mgr.sessionInfo(first)->state == SessionState::Reconnecting; }));
    std::this_thread::sleep_for(100ms);
    CHECK(mgr.sessionInfo(first)->state == SessionState::Reconnecting);
    CHECK(factory->connectAttempts("h1") == 2);
    CHECK(mgr.sessionInfo(first)->reconnectAttempts <= 1);

    script.authGate->open();
    REQUIRE(waitUntil([&] { return mgr.sessionInfo(first)->state == SessionState::Connected; }));
    CHECK(factory->connectAttempts("h1") >= 3);
}

TEST_CASE("finished transfers are dropped on close and on request", "[manager]") {
    auto factory = std::make_shared<MockTransportFactory>();
    factory->fileSystem("h1")->addFile("/a.txt", "a");
    factory->fileSystem("h2")->addFile("/b.txt", "b");
    SessionManager mgr(std::make_shared<InMemoryCredentialProvider>(), factory, fastOptions());
    EventLog log(mgr.subscribe());

    std::string a, b;
    Error err;
    REQUIRE(mgr.createSession(sshHost("h1"), a, err));
    REQUIRE(mgr.createSession(sshHost("h2"), b, err));
    REQUIRE(mgr.openSession(a, err));
    REQUIRE(mgr.openSession(b, err));
    REQUIRE(log.waitForState(a, SessionState::Connected));
    REQUIRE(log.waitForState(b, SessionState::Connected));

    std::vector<std::uint64_t> onA, onB;
    for (int i = 0; i < 50; ++i) {
        std::uint64_t t = 0;
        REQUIRE(mgr.submitTransfer(a, TransferRequest::list("/"), t, err));
        onA.push_back(t);
        REQUIRE(mgr.submitTransfer(b, TransferRequest::list("/"), t, err));
        onB.push_back(t);
    }
    for (auto t : onA) REQUIRE(mgr.waitTransfer(t, std::chrono::milliseconds(10000)));
    for (auto t : onB) REQUIRE(mgr.waitTransfer(t, std::chrono::milliseconds(10000)));

    REQUIRE(mgr.closeSession(a, err));
    for (auto t : onA) CHECK_FALSE(mgr.transferTask(t).has_value());
    for (auto t : onB) CHECK(mgr.transferTask(t).has_value());

    CHECK(mgr.clearCompleted() == onB.size());
    for (auto t : onB) CHECK_FALSE(mgr.transferTask(t).has_value());
    CHECK(mgr.clearCompleted() == 0);

    // New tasks still get fresh ids
    std::uint64_t fresh = 0;
    REQUIRE(mgr.submitTransfer(b, TransferRequest::list("/"), fresh, err));
    CHECK(fresh > onB.back());
    REQUIRE(mgr.waitTransfer(fresh, std::chrono::milliseconds(10000)));
    CHECK(mgr.transferTask(fresh)->state == TransferState::Done);
}

TEST_CASE("destroying the manager closes everything", "[manager]") {
    auto factory = std::make_shared<MockTransportFactory>();
    std::shared_ptr<EventStream> stream;
    {
        SessionManager mgr(std::make_shared<InMemoryCredentialProvider>(), factory, fastOptions());
        stream = mgr.subscribe();
        EventLog log(stream);
        std::string a, b;
        Error err;
        REQUIRE(mgr.createSession(sshHost("h1"), a, err));
        REQUIRE(mgr.createSession(telnetHost("h2"), b, err));
        REQUIRE(mgr.openSession(a, err));
        REQUIRE(mgr.openSession(b, err));
        REQUIRE(log.waitForState(a, SessionState::Connected));
        REQUIRE(log.waitForState(b, SessionState::Connected));
    }
    CHECK(factory->liveTransports("h1") == 0);
    CHECK(factory->liveTransports("h2") == 0);
    CHECK(stream->closed());
}

}
