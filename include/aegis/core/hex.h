// AEGIS - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// Key material and signatures cross text boundaries (configuration files,
// update package fields) as lowercase hex.

#ifndef AEGIS_CORE_HEX_H
#define AEGIS_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace aegis {

using Bytes = std::vector<uint8_t>;

/// Convert bytes to lowercase hex
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const Bytes& data);

/// Convert hex (either case) to bytes.
/// Throws std::invalid_argument on odd length or a non-hex character.
Bytes HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace aegis

#endif // AEGIS_CORE_HEX_H
