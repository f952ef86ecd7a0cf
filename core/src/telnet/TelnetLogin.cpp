#include "telnet/TelnetLogin.hpp"
#include "sshdeck/Log.hpp"
#include "sshdeck/SessionTypes.hpp"
#include <cctype>

namespace sshdeck {
namespace telnet {

namespace {
bool endsWith(const std::string& s, const char* suffix) {
    const std::string suf(suffix);
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}
} // namespace

TelnetLogin::TelnetLogin(std::string username, std::optional<std::string> password)
    : username_(std::move(username)), password_(std::move(password)) {
    if (username_.empty() && !password_) done_ = true;
}

TelnetLogin::~TelnetLogin() {
    finish();
}

void TelnetLogin::finish() {
    done_ = true;
    if (password_) {
        wipeString(*password_);
        password_.reset();
    }
    tail_.clear();
}

std::string TelnetLogin::onOutput(const std::string& data) {
    if (done_) return {};
    seen_ += data.size();
    for (char c : data) tail_.push_back((char)std::tolower((unsigned char)c));
    if (tail_.size() > 64) tail_.erase(0, tail_.size() - 64);

    std::string t = tail_;
    while (!t.empty() && (t.back() == ' ' || t.back() == '\t')) t.pop_back();

    if (password_ && !passSent_ && endsWith(t, "password:")) {
        std::string line = *password_ + "\r\n";
        passSent_ = true;
        LOGI("telnet login: answering password prompt");
        finish();
        return line;
    }
    if (!userSent_ && !username_.empty() &&
        (endsWith(t, "login:") || endsWith(t, "username:") || endsWith(t, "user:"))) {
        userSent_ = true;
        tail_.clear();
        LOGI("telnet login: answering login prompt for '%s'", username_.c_str());
        if (!password_) finish();
        return username_ + "\r\n";
    }
    if (seen_ > kGiveUpAfter) {
        LOGW("telnet login: no prompt after %zu bytes, giving up", seen_);
        finish();
    }
    return {};
}

} // namespace telnet
} // namespace sshdeck
