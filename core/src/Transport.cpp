#include "sshdeck/Transport.hpp"
#include "sshdeck/Libssh2Transport.hpp"
#include "sshdeck/TelnetTransport.hpp"

namespace sshdeck {

std::unique_ptr<Transport> DefaultTransportFactory::create(const HostDescriptor& host) {
    if (host.protocol == Protocol::Telnet) return std::make_unique<TelnetTransport>();
    return std::make_unique<Libssh2Transport>();
}

} // namespace sshdeck
