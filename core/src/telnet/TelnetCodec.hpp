// Telnet (RFC 854) stream codec: option negotiation, IAC escaping and
// NVT line-ending handling. Pure byte transformation, no I/O.
#pragma once
#include "sshdeck/SessionTypes.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace sshdeck {
namespace telnet {

enum : unsigned char {
    SE = 240,
    NOP = 241,
    DM = 242,
    GA = 249,
    SB = 250,
    WILL = 251,
    WONT = 252,
    DO = 253,
    DONT = 254,
    IAC = 255
};

enum : unsigned char {
    OPT_BINARY = 0,
    OPT_ECHO = 1,
    OPT_SGA = 3,
    OPT_TTYPE = 24,
    OPT_NAWS = 31
};

class TelnetCodec {
public:
    struct Options {
        bool binary = false;      // negotiate BINARY both ways
        bool localEcho = false;   // refuse remote ECHO
        std::string terminalType = "xterm-256color";
        TerminalSize size;
    };

    explicit TelnetCodec(Options opt);

    // Requests sent right after the TCP connection is up.
    std::string initialNegotiation();

    // Consumes bytes received from the server. Application data is appended to
    // `data`, negotiation answers to `reply`. Commands may span calls.
    void feed(const char* in, std::size_t n, std::string& data, std::string& reply);

    // Escapes outgoing application bytes (IAC doubling, CR NUL outside binary mode).
    std::string encode(const char* in, std::size_t n) const;

    // Records the window size; returns the NAWS subnegotiation to send, or an empty
    // string while NAWS is not enabled.
    std::string windowSize(int rows, int cols);

    bool localOptionEnabled(unsigned char opt) const { return us_[opt].enabled; }
    bool remoteOptionEnabled(unsigned char opt) const { return him_[opt].enabled; }
    bool remoteEcho() const { return him_[OPT_ECHO].enabled; }

private:
    struct OptState {
        bool enabled = false;
        bool pending = false;   // we asked and wait for the answer
    };

    enum class ParseState { Data, Iac, Verb, Sb, SbIac };

    bool wantsRemote(unsigned char opt) const;
    bool supportsLocal(unsigned char opt) const;

    void onVerb(unsigned char verb, unsigned char opt, std::string& reply);
    void onSubnegotiation(std::string& reply);
    std::string nawsMessage() const;

    static void command(std::string& out, unsigned char verb, unsigned char opt);

    Options opt_;
    std::array<OptState, 256> us_{};   // options we perform (WILL/WONT)
    std::array<OptState, 256> him_{};  // options the server performs (DO/DONT)

    ParseState state_ = ParseState::Data;
    unsigned char verb_ = 0;
    std::string sb_;
    bool sawCr_ = false;
};

} // namespace telnet
} // namespace sshdeck
