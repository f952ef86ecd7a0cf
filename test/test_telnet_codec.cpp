#include "telnet/TelnetCodec.hpp"
#include <catch2/catch.hpp>

namespace sshdeck::test {

using namespace sshdeck::telnet;

static std::string cmd(unsigned char verb, unsigned char opt) {
    return std::string{(char)IAC, (char)verb, (char)opt};
}

static std::string bytes(std::initializer_list<unsigned char> l) {
    std::string s;
    for (auto b : l) s.push_back((char)b);
    return s;
}

TEST_CASE("telnet initial negotiation", "[telnet]") {
    SECTION("default") {
        TelnetCodec c(TelnetCodec::Options{});
        CHECK(c.initialNegotiation() == cmd(DO, OPT_SGA) + cmd(DO, OPT_ECHO) + cmd(WILL, OPT_NAWS));
    }
    SECTION("local echo and binary") {
        TelnetCodec::Options o;
        o.localEcho = true;
        o.binary = true;
        TelnetCodec c(o);
        CHECK(c.initialNegotiation() ==
              cmd(DO, OPT_SGA) + cmd(WILL, OPT_NAWS) + cmd(WILL, OPT_BINARY) + cmd(DO, OPT_BINARY));
    }
}

TEST_CASE("telnet answers to requested options are not echoed back", "[telnet]") {
    TelnetCodec c(TelnetCodec::Options{});
    c.initialNegotiation();

    std::string data, reply;
    const std::string in = cmd(WILL, OPT_SGA) + cmd(WILL, OPT_ECHO);
    c.feed(in.data(), in.size(), data, reply);
    CHECK(data.empty());
    CHECK(reply.empty());
    CHECK(c.remoteOptionEnabled(OPT_SGA));
    CHECK(c.remoteEcho());
}

TEST_CASE("telnet refuses unsupported options", "[telnet]") {
    TelnetCodec c(TelnetCodec::Options{});
    std::string data, reply;
    const std::string in = cmd(DO, 39) + cmd(WILL, 5);
    c.feed(in.data(), in.size(), data, reply);
    CHECK(reply == cmd(WONT, 39) + cmd(DONT, 5));
    CHECK(data.empty());
}

TEST_CASE("telnet NAWS reports the window size", "[telnet]") {
    TelnetCodec::Options o;
    o.size.rows = 40;
    o.size.cols = 132;
    TelnetCodec c(o);
    c.initialNegotiation();

    CHECK(c.windowSize(40, 132).empty());  // not agreed yet

    std::string data, reply;
    const std::string in = cmd(DO, OPT_NAWS);
    c.feed(in.data(), in.size(), data, reply);
    CHECK(reply == bytes({IAC, SB, OPT_NAWS, 0, 132, 0, 40, IAC, SE}));

    CHECK(c.windowSize(50, 255) == bytes({IAC, SB, OPT_NAWS, 0, 255, 255, 0, 50, IAC, SE}));
}

TEST_CASE("telnet terminal type subnegotiation", "[telnet]") {
    TelnetCodec::Options o;
    o.terminalType = "vt100";
    TelnetCodec c(o);

    std::string data, reply;
    std::string in = cmd(DO, OPT_TTYPE);
    c.feed(in.data(), in.size(), data, reply);
    CHECK(reply == cmd(WILL, OPT_TTYPE));

    reply.clear();
    in = bytes({IAC, SB, OPT_TTYPE, 1, IAC, SE});
    c.feed(in.data(), in.size(), data, reply);
    CHECK(reply == bytes({IAC, SB, OPT_TTYPE, 0}) + "vt100" + bytes({IAC, SE}));
}

TEST_CASE("telnet data decoding", "[telnet]") {
    TelnetCodec c(TelnetCodec::Options{});
    std::string data, reply;

    SECTION("escaped IAC") {
        const std::string in = "a" + bytes({IAC, IAC}) + "b";
        c.feed(in.data(), in.size(), data, reply);
        CHECK(data == "a" + bytes({IAC}) + "b");
    }
    SECTION("CR NUL becomes CR") {
        const std::string in = std::string("x\r", 2) + std::string(1, '\0') + "y\r\nz";
        c.feed(in.data(), in.size(), data, reply);
        CHECK(data == "x\ry\r\nz");
    }
    SECTION("commands split across reads") {
        const std::string a = "ok" + bytes({IAC});
        const std::string b = bytes({DO});
        const std::string d = bytes({OPT_SGA}) + "!";
        c.feed(a.data(), a.size(), data, reply);
        c.feed(b.data(), b.size(), data, reply);
        c.feed(d.data(), d.size(), data, reply);
        CHECK(data == "ok!");
        CHECK(reply == cmd(WILL, OPT_SGA));
    }
    SECTION("NOP and GA carry no payload") {
        const std::string in = bytes({IAC, NOP}) + "p" + bytes({IAC, GA});
        c.feed(in.data(), in.size(), data, reply);
        CHECK(data == "p");
        CHECK(reply.empty());
    }
}

TEST_CASE("telnet encoding", "[telnet]") {
    TelnetCodec c(TelnetCodec::Options{});
    const std::string in = "a" + bytes({IAC}) + "\r\n" + "b\r";
    CHECK(c.encode(in.data(), in.size()) ==
          "a" + bytes({IAC, IAC}) + "\r\n" + "b\r" + std::string(1, '\0'));
}

TEST_CASE("telnet encoding in binary mode keeps bare CR", "[telnet]") {
    TelnetCodec::Options o;
    o.binary = true;
    TelnetCodec c(o);
    c.initialNegotiation();
    std::string data, reply;
    const std::string in = cmd(DO, OPT_BINARY) + cmd(WILL, OPT_BINARY);
    c.feed(in.data(), in.size(), data, reply);
    CHECK(c.localOptionEnabled(OPT_BINARY));
    CHECK(c.remoteOptionEnabled(OPT_BINARY));

    const std::string out = "x\ry";
    CHECK(c.encode(out.data(), out.size()) == "x\ry");
}

}
