// Capability interface to the credential store. Implementations must be safe under
// concurrent calls: sessions for different hosts authenticate in parallel.
#pragma once
#include "SessionTypes.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace sshdeck {

class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    // Secret stored for the host id, or nullopt when none is stored.
    virtual std::optional<Secret> get(const std::string& hostId) = 0;
    virtual bool put(const std::string& hostId, const Secret& secret) = 0;
    virtual bool remove(const std::string& hostId) = 0;
};

// Process-local store for embedders without a keyring, and for tests.
class InMemoryCredentialProvider : public CredentialProvider {
public:
    std::optional<Secret> get(const std::string& hostId) override;
    bool put(const std::string& hostId, const Secret& secret) override;
    bool remove(const std::string& hostId) override;

    // Number of get() calls served so far.
    int lookups() const { return lookups_.load(); }

private:
    mutable std::mutex mtx_;
    std::map<std::string, Secret> secrets_;
    std::atomic<int> lookups_{0};
};

} // namespace sshdeck
