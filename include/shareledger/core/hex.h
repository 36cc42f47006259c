// SHARELEDGER - Hex Encoding
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#ifndef SHARELEDGER_CORE_HEX_H
#define SHARELEDGER_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shareledger {

/// Lowercase hex, two digits per byte
std::string HexEncode(const uint8_t* data, size_t len);
std::string HexEncode(const std::vector<uint8_t>& data);

/// Decode hex digits of either case, with an optional "0x" prefix.
/// Returns nullopt on an odd digit count or a non-hex character.
std::optional<std::vector<uint8_t>> HexDecode(const std::string& hex);

} // namespace shareledger

#endif // SHARELEDGER_CORE_HEX_H
