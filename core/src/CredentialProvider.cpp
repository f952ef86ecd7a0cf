#include "sshdeck/CredentialProvider.hpp"

namespace sshdeck {

std::optional<Secret> InMemoryCredentialProvider::get(const std::string& hostId) {
    ++lookups_;
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = secrets_.find(hostId);
    if (it == secrets_.end()) return std::nullopt;
    return it->second;
}

bool InMemoryCredentialProvider::put(const std::string& hostId, const Secret& secret) {
    std::lock_guard<std::mutex> lk(mtx_);
    secrets_[hostId] = secret;
    return true;
}

bool InMemoryCredentialProvider::remove(const std::string& hostId) {
    std::lock_guard<std::mutex> lk(mtx_);
    return secrets_.erase(hostId) > 0;
}

} // namespace sshdeck
