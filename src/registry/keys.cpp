// AEGIS - Authorized Key Registry Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/registry/keys.h"

namespace aegis {
namespace registry {

void AuthorizedKeyRegistry::Register(const std::string& keyId, const std::string& publicKey) {
    keys_[keyId] = publicKey;
}

std::optional<std::string> AuthorizedKeyRegistry::Find(const std::string& keyId) const {
    auto it = keys_.find(keyId);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool AuthorizedKeyRegistry::Contains(const std::string& keyId) const {
    return keys_.count(keyId) > 0;
}

std::vector<std::string> AuthorizedKeyRegistry::KeyIds() const {
    std::vector<std::string> ids;
    ids.reserve(keys_.size());
    for (const auto& entry : keys_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace registry
} // namespace aegis
