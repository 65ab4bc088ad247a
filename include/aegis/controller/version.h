// AEGIS - Version Comparison
// Copyright (c) 2024 AEGIS Developers
// MIT License

#ifndef AEGIS_CONTROLLER_VERSION_H
#define AEGIS_CONTROLLER_VERSION_H

#include <cstdint>
#include <string>
#include <vector>

namespace aegis {
namespace controller {

/**
 * Split a dotted version into numeric fields.
 * A field that is not a plain number contributes its leading digits
 * ("3rc1" -> 3), or 0 if it has none.
 */
std::vector<uint64_t> ParseVersionFields(const std::string& version);

/**
 * Compare two dotted versions field by field, left to right.
 * Missing trailing fields count as 0, so "1.0" equals "1.0.0".
 * @return negative if a < b, zero if equal, positive if a > b
 */
int CompareVersions(const std::string& a, const std::string& b);

} // namespace controller
} // namespace aegis

#endif // AEGIS_CONTROLLER_VERSION_H
