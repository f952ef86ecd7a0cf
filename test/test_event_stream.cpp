#include "sshdeck/Event.hpp"
#include <catch2/catch.hpp>
#include <thread>

namespace sshdeck::test {

using namespace std::chrono_literals;

TEST_CASE("event stream filters by session", "[events]") {
    EventStream all;
    EventStream one("s1");

    const Event a = Event::shellData("s1", "a");
    const Event b = Event::shellData("s2", "b");
    CHECK(all.accepts(a));
    CHECK(all.accepts(b));
    CHECK(one.accepts(a));
    CHECK_FALSE(one.accepts(b));
}

TEST_CASE("event stream keeps order and times out when empty", "[events]") {
    EventStream s;
    s.push(Event::stateChanged("s1", SessionState::Idle, SessionState::Connecting));
    s.push(Event::shellData("s1", "hello"));
    CHECK(s.pending() == 2);

    Event ev;
    REQUIRE(s.next(ev, 10ms));
    CHECK(ev.type == Event::Type::SessionStateChanged);
    CHECK(ev.previous == SessionState::Idle);
    CHECK(ev.state == SessionState::Connecting);
    REQUIRE(s.tryNext(ev));
    CHECK(ev.data == "hello");

    CHECK_FALSE(s.next(ev, 10ms));
    CHECK_FALSE(s.tryNext(ev));
}

TEST_CASE("closing a stream wakes the reader and drops new events", "[events]") {
    EventStream s;
    s.push(Event::shellData("s1", "last"));

    std::thread closer([&] {
        std::this_thread::sleep_for(20ms);
        s.close();
    });
    Event ev;
    REQUIRE(s.next(ev, 1000ms));
    CHECK(ev.data == "last");
    CHECK_FALSE(s.next(ev, 5000ms));
    closer.join();

    CHECK(s.closed());
    s.push(Event::shellData("s1", "late"));
    CHECK(s.pending() == 0);
}

TEST_CASE("progress events do not carry listings", "[events]") {
    TransferTask t;
    t.id = 7;
    t.sessionId = "s3";
    t.listing.resize(3);
    const Event p = Event::transferProgress(t);
    CHECK(p.sessionId == "s3");
    CHECK(p.task.id == 7);
    CHECK(p.task.listing.empty());
    CHECK(Event::transferDone(t).task.listing.size() == 3);
}

}
