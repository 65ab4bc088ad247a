// AEGIS - Contract Registry
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// Registered contracts keyed by id, plus an index grouping ids by market
// segment in registration order. The index is derived from the contracts
// and is only ever changed together with them.

#ifndef AEGIS_REGISTRY_CONTRACT_H
#define AEGIS_REGISTRY_CONTRACT_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aegis {
namespace registry {

// ============================================================================
// Contract
// ============================================================================

enum class ContractStatus {
    Unregistered,   ///< Submitted, not yet accepted
    Active          ///< Accepted and stored in the registry
};

const char* ContractStatusToString(ContractStatus status);

/// A contract record. Empty identity fields count as missing.
struct Contract {
    std::string id;
    std::string version;
    std::string segment;

    /// Free-form additional fields carried with the submission
    std::map<std::string, std::string> fields;

    /// Assigned by the controller on acceptance
    ContractStatus status{ContractStatus::Unregistered};
    int64_t registrationTime{0};

    Contract() = default;
    Contract(std::string id_, std::string version_, std::string segment_)
        : id(std::move(id_)), version(std::move(version_)), segment(std::move(segment_)) {}

    std::string ToString() const;
};

// ============================================================================
// Contract Registry
// ============================================================================

class ContractRegistry {
public:
    /**
     * Store a contract and append its id to its segment.
     * Re-inserting an existing id replaces the record and moves the id to
     * the new segment, so every id stays in exactly one segment.
     */
    void Insert(const Contract& contract);

    /// Look up a contract by id
    std::optional<Contract> Find(const std::string& id) const;

    bool Contains(const std::string& id) const;

    /// Ids registered in a segment, in registration order
    std::vector<std::string> GetSegment(const std::string& segment) const;

    /// Names of all non-empty segments
    std::vector<std::string> GetSegments() const;

    size_t Size() const { return contracts_.size(); }
    bool Empty() const { return contracts_.empty(); }

    /// Remove all contracts and segments
    void Clear();

private:
    void RemoveFromSegment(const std::string& segment, const std::string& id);

    std::map<std::string, Contract> contracts_;
    std::map<std::string, std::vector<std::string>> segments_;
};

} // namespace registry
} // namespace aegis

#endif // AEGIS_REGISTRY_CONTRACT_H
