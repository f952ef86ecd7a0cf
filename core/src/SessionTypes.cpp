// String conversions and helpers for the shared session types.
#include "sshdeck/SessionTypes.hpp"
#include <algorithm>
#include <cstring>

namespace sshdeck {

const char* toString(SessionState s) {
    switch (s) {
        case SessionState::Idle: return "Idle";
        case SessionState::Connecting: return "Connecting";
        case SessionState::Authenticating: return "Authenticating";
        case SessionState::Connected: return "Connected";
        case SessionState::Reconnecting: return "Reconnecting";
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Failed: return "Failed";
    }
    return "?";
}

const char* toString(Protocol p) {
    return p == Protocol::Telnet ? "Telnet" : "SSH";
}

const char* toString(AuthMethod m) {
    switch (m) {
        case AuthMethod::Password: return "Password";
        case AuthMethod::PrivateKey: return "PrivateKey";
        case AuthMethod::Agent: return "Agent";
    }
    return "?";
}

void wipeString(std::string& s) {
    if (s.empty()) return;
    // volatile keeps the stores from being optimized away
    volatile char* p = &s[0];
    for (std::size_t i = 0; i < s.size(); ++i) p[i] = 0;
    s.clear();
    s.shrink_to_fit();
}

void Secret::wipe() {
    if (password) wipeString(*password);
    if (privateKey) wipeString(*privateKey);
    if (passphrase) wipeString(*passphrase);
    password.reset();
    privateKey.reset();
    passphrase.reset();
}

std::chrono::milliseconds ReconnectPolicy::delayFor(int attempt) const {
    if (attempt < 1) attempt = 1;
    long long d = baseDelay.count();
    const long long cap = maxDelay.count();
    for (int i = 1; i < attempt && d < cap; ++i) d *= 2;
    return std::chrono::milliseconds(std::min(d, cap));
}

} // namespace sshdeck
