// Login-expect helper for Telnet sessions: answers the first login and password
// prompts seen in the remote output, once.
#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace sshdeck {
namespace telnet {

class TelnetLogin {
public:
    TelnetLogin(std::string username, std::optional<std::string> password);
    ~TelnetLogin();

    TelnetLogin(const TelnetLogin&) = delete;
    TelnetLogin& operator=(const TelnetLogin&) = delete;

    // Feeds decoded remote output. Returns the line to send (with CR LF), or an
    // empty string when no prompt was recognized.
    std::string onOutput(const std::string& data);

    bool finished() const { return done_; }
    bool usernameSent() const { return userSent_; }
    bool passwordSent() const { return passSent_; }

    static constexpr std::size_t kGiveUpAfter = 16 * 1024;

private:
    void finish();

    std::string username_;
    std::optional<std::string> password_;
    std::string tail_;
    std::size_t seen_ = 0;
    bool userSent_ = false;
    bool passSent_ = false;
    bool done_ = false;
};

} // namespace telnet
} // namespace sshdeck
