// AEGIS - Contract Registry Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/registry/contract.h"

#include <algorithm>
#include <sstream>

namespace aegis {
namespace registry {

const char* ContractStatusToString(ContractStatus status) {
    switch (status) {
        case ContractStatus::Unregistered: return "Unregistered";
        case ContractStatus::Active: return "Active";
    }
    return "Unknown";
}

std::string Contract::ToString() const {
    std::ostringstream ss;
    ss << "Contract(id=" << id
       << ", version=" << version
       << ", segment=" << segment
       << ", status=" << ContractStatusToString(status) << ")";
    return ss.str();
}

// ============================================================================
// ContractRegistry
// ============================================================================

void ContractRegistry::Insert(const Contract& contract) {
    auto it = contracts_.find(contract.id);
    if (it != contracts_.end()) {
        RemoveFromSegment(it->second.segment, contract.id);
        it->second = contract;
    } else {
        contracts_.emplace(contract.id, contract);
    }
    segments_[contract.segment].push_back(contract.id);
}

std::optional<Contract> ContractRegistry::Find(const std::string& id) const {
    auto it = contracts_.find(id);
    if (it == contracts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ContractRegistry::Contains(const std::string& id) const {
    return contracts_.count(id) > 0;
}

std::vector<std::string> ContractRegistry::GetSegment(const std::string& segment) const {
    auto it = segments_.find(segment);
    if (it == segments_.end()) {
        return {};
    }
    return it->second;
}

std::vector<std::string> ContractRegistry::GetSegments() const {
    std::vector<std::string> names;
    names.reserve(segments_.size());
    for (const auto& [name, ids] : segments_) {
        names.push_back(name);
    }
    return names;
}

void ContractRegistry::Clear() {
    contracts_.clear();
    segments_.clear();
}

void ContractRegistry::RemoveFromSegment(const std::string& segment, const std::string& id) {
    auto it = segments_.find(segment);
    if (it == segments_.end()) {
        return;
    }
    auto& ids = it->second;
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    if (ids.empty()) {
        segments_.erase(it);
    }
}

} // namespace registry
} // namespace aegis
