#include "telnet/TelnetCodec.hpp"
#include "sshdeck/Log.hpp"

namespace sshdeck {
namespace telnet {

namespace {
constexpr unsigned char TTYPE_IS = 0;
constexpr unsigned char TTYPE_SEND = 1;

void appendEscaped(std::string& out, unsigned char b) {
    out.push_back((char)b);
    if (b == IAC) out.push_back((char)IAC);
}
} // namespace

TelnetCodec::TelnetCodec(Options opt) : opt_(std::move(opt)) {}

void TelnetCodec::command(std::string& out, unsigned char verb, unsigned char opt) {
    out.push_back((char)IAC);
    out.push_back((char)verb);
    out.push_back((char)opt);
}

bool TelnetCodec::wantsRemote(unsigned char opt) const {
    switch (opt) {
        case OPT_SGA: return true;
        case OPT_ECHO: return !opt_.localEcho;
        case OPT_BINARY: return opt_.binary;
        default: return false;
    }
}

bool TelnetCodec::supportsLocal(unsigned char opt) const {
    switch (opt) {
        case OPT_SGA:
        case OPT_TTYPE:
        case OPT_NAWS:
            return true;
        case OPT_BINARY:
            return opt_.binary;
        default:
            return false;
    }
}

std::string TelnetCodec::initialNegotiation() {
    std::string out;
    auto askRemote = [&](unsigned char o) {
        him_[o].pending = true;
        command(out, DO, o);
    };
    auto offerLocal = [&](unsigned char o) {
        us_[o].pending = true;
        command(out, WILL, o);
    };
    askRemote(OPT_SGA);
    if (!opt_.localEcho) askRemote(OPT_ECHO);
    offerLocal(OPT_NAWS);
    if (opt_.binary) {
        offerLocal(OPT_BINARY);
        askRemote(OPT_BINARY);
    }
    return out;
}

void TelnetCodec::onVerb(unsigned char verb, unsigned char opt, std::string& reply) {
    switch (verb) {
        case WILL: {
            OptState& s = him_[opt];
            if (wantsRemote(opt)) {
                if (!s.enabled) {
                    s.enabled = true;
                    if (!s.pending) command(reply, DO, opt);
                }
            } else if (s.enabled || !s.pending) {
                s.enabled = false;
                command(reply, DONT, opt);
            }
            s.pending = false;
            break;
        }
        case WONT: {
            OptState& s = him_[opt];
            if (s.enabled && !s.pending) command(reply, DONT, opt);
            s.enabled = false;
            s.pending = false;
            break;
        }
        case DO: {
            OptState& s = us_[opt];
            if (supportsLocal(opt)) {
                if (!s.enabled) {
                    s.enabled = true;
                    if (!s.pending) command(reply, WILL, opt);
                    if (opt == OPT_NAWS) reply += nawsMessage();
                }
            } else if (s.enabled || !s.pending) {
                s.enabled = false;
                command(reply, WONT, opt);
            }
            s.pending = false;
            break;
        }
        case DONT: {
            OptState& s = us_[opt];
            if (s.enabled && !s.pending) command(reply, WONT, opt);
            s.enabled = false;
            s.pending = false;
            break;
        }
        default:
            break;
    }
    LOGD("telnet option %u verb %u -> us=%d him=%d", (unsigned)opt, (unsigned)verb,
         (int)us_[opt].enabled, (int)him_[opt].enabled);
}

void TelnetCodec::onSubnegotiation(std::string& reply) {
    if (sb_.size() >= 2 && (unsigned char)sb_[0] == OPT_TTYPE &&
        (unsigned char)sb_[1] == TTYPE_SEND && us_[OPT_TTYPE].enabled) {
        reply.push_back((char)IAC);
        reply.push_back((char)SB);
        reply.push_back((char)OPT_TTYPE);
        reply.push_back((char)TTYPE_IS);
        for (char c : opt_.terminalType) appendEscaped(reply, (unsigned char)c);
        reply.push_back((char)IAC);
        reply.push_back((char)SE);
    }
    sb_.clear();
}

void TelnetCodec::feed(const char* in, std::size_t n, std::string& data, std::string& reply) {
    const bool binaryIn = him_[OPT_BINARY].enabled;
    for (std::size_t i = 0; i < n; ++i) {
        const unsigned char b = (unsigned char)in[i];
        switch (state_) {
            case ParseState::Data:
                if (b == IAC) {
                    state_ = ParseState::Iac;
                    break;
                }
                if (sawCr_) {
                    sawCr_ = false;
                    if (b == 0) break;  // CR NUL is a bare CR
                }
                if (b == '\r' && !binaryIn) sawCr_ = true;
                data.push_back((char)b);
                break;
            case ParseState::Iac:
                switch (b) {
                    case IAC:
                        data.push_back((char)IAC);
                        state_ = ParseState::Data;
                        break;
                    case WILL:
                    case WONT:
                    case DO:
                    case DONT:
                        verb_ = b;
                        state_ = ParseState::Verb;
                        break;
                    case SB:
                        sb_.clear();
                        state_ = ParseState::Sb;
                        break;
                    default:
                        // NOP, GA, DM and friends carry no payload
                        state_ = ParseState::Data;
                        break;
                }
                break;
            case ParseState::Verb:
                onVerb(verb_, b, reply);
                state_ = ParseState::Data;
                break;
            case ParseState::Sb:
                if (b == IAC) state_ = ParseState::SbIac;
                else if (sb_.size() < 512) sb_.push_back((char)b);
                break;
            case ParseState::SbIac:
                if (b == SE) {
                    onSubnegotiation(reply);
                    state_ = ParseState::Data;
                } else {
                    if (b == IAC && sb_.size() < 512) sb_.push_back((char)IAC);
                    state_ = ParseState::Sb;
                }
                break;
        }
    }
}

std::string TelnetCodec::encode(const char* in, std::size_t n) const {
    const bool binaryOut = us_[OPT_BINARY].enabled;
    std::string out;
    out.reserve(n + 8);
    for (std::size_t i = 0; i < n; ++i) {
        const unsigned char b = (unsigned char)in[i];
        if (b == IAC) {
            out.push_back((char)IAC);
            out.push_back((char)IAC);
        } else if (b == '\r' && !binaryOut) {
            out.push_back('\r');
            if (i + 1 >= n || in[i + 1] != '\n') out.push_back('\0');
        } else {
            out.push_back((char)b);
        }
    }
    return out;
}

std::string TelnetCodec::nawsMessage() const {
    std::string out;
    out.push_back((char)IAC);
    out.push_back((char)SB);
    out.push_back((char)OPT_NAWS);
    const unsigned cols = (unsigned)(opt_.size.cols > 0 ? opt_.size.cols : 0) & 0xFFFFu;
    const unsigned rows = (unsigned)(opt_.size.rows > 0 ? opt_.size.rows : 0) & 0xFFFFu;
    appendEscaped(out, (unsigned char)(cols >> 8));
    appendEscaped(out, (unsigned char)(cols & 0xFF));
    appendEscaped(out, (unsigned char)(rows >> 8));
    appendEscaped(out, (unsigned char)(rows & 0xFF));
    out.push_back((char)IAC);
    out.push_back((char)SE);
    return out;
}

std::string TelnetCodec::windowSize(int rows, int cols) {
    opt_.size.rows = rows;
    opt_.size.cols = cols;
    if (!us_[OPT_NAWS].enabled) return {};
    return nawsMessage();
}

} // namespace telnet
} // namespace sshdeck
