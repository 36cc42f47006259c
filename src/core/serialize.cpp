// SHARELEDGER - Serialization Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/core/serialize.h"
#include "shareledger/core/hex.h"

namespace shareledger {

std::string DataStream::ToHex() const {
    return HexEncode(data(), size());
}

} // namespace shareledger
