// SHARELEDGER - Core Types Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/core/types.h"
#include "shareledger/core/hex.h"

#include <stdexcept>

namespace shareledger {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return HexEncode(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    auto bytes = HexDecode(hex);
    if (!bytes || bytes->size() != SIZE) {
        throw std::invalid_argument("expected " + std::to_string(SIZE * 2) +
                                    " hex digits, got '" + hex + "'");
    }
    return BaseHash(bytes->data(), bytes->size());
}

template class BaseHash<256>;
template class BaseHash<160>;

bool ParseAddress(const std::string& hex, Address& out) {
    auto bytes = HexDecode(hex);
    if (!bytes || bytes->size() != Address::SIZE) {
        return false;
    }
    out = Address(bytes->data(), bytes->size());
    return true;
}

} // namespace shareledger
