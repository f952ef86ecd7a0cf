#include "telnet/TelnetLogin.hpp"
#include <catch2/catch.hpp>

namespace sshdeck::test {

using sshdeck::telnet::TelnetLogin;

TEST_CASE("telnet login answers username then password once", "[telnet]") {
    TelnetLogin login("alice", std::string("s3cret"));

    CHECK(login.onOutput("Ubuntu 22.04 LTS\r\n").empty());
    CHECK(login.onOutput("host login: ") == "alice\r\n");
    CHECK(login.usernameSent());
    CHECK_FALSE(login.finished());

    CHECK(login.onOutput("Pass").empty());
    CHECK(login.onOutput("word: ") == "s3cret\r\n");
    CHECK(login.passwordSent());
    CHECK(login.finished());

    // Answered once
    CHECK(login.onOutput("Password: ").empty());
}

TEST_CASE("telnet login prompt matching ignores case", "[telnet]") {
    TelnetLogin login("bob", std::nullopt);
    CHECK(login.onOutput("USERNAME:") == "bob\r\n");
    CHECK(login.finished());
}

TEST_CASE("telnet login with password only", "[telnet]") {
    TelnetLogin login("", std::string("pw"));
    CHECK(login.onOutput("login: ").empty());
    CHECK(login.onOutput("password:") == "pw\r\n");
}

TEST_CASE("telnet login gives up without prompts", "[telnet]") {
    TelnetLogin login("alice", std::string("pw"));
    const std::string noise(1024, 'x');
    for (int i = 0; i < 17; ++i) CHECK(login.onOutput(noise).empty());
    CHECK(login.finished());
    CHECK(login.onOutput("login: ").empty());
}

TEST_CASE("telnet login without credentials is inert", "[telnet]") {
    TelnetLogin login("", std::nullopt);
    CHECK(login.finished());
    CHECK(login.onOutput("login: ").empty());
}

}
