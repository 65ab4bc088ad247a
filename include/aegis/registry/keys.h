// AEGIS - Authorized Key Registry
// Copyright (c) 2024 AEGIS Developers
// MIT License

#ifndef AEGIS_REGISTRY_KEYS_H
#define AEGIS_REGISTRY_KEYS_H

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aegis {
namespace registry {

/// Identifier of the key installed by the demo bootstrap
constexpr const char* DEMO_KEY_ID = "admin";

/**
 * Public keys whose signatures the update pipeline accepts, keyed by id.
 * Registration is an upsert; the last write for an id wins.
 */
class AuthorizedKeyRegistry {
public:
    /// Insert or replace the key for keyId
    void Register(const std::string& keyId, const std::string& publicKey);

    /// Public key for keyId, if authorized
    std::optional<std::string> Find(const std::string& keyId) const;

    bool Contains(const std::string& keyId) const;

    size_t Size() const { return keys_.size(); }

    /// All key ids in sorted order
    std::vector<std::string> KeyIds() const;

private:
    std::map<std::string, std::string> keys_;
};

} // namespace registry
} // namespace aegis

#endif // AEGIS_REGISTRY_KEYS_H
