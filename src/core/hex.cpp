// SHARELEDGER - Hex Encoding Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/core/hex.h"

namespace shareledger {

namespace {

int Nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string HexEncode(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = digits[data[i] >> 4];
        out[2 * i + 1] = digits[data[i] & 0x0f];
    }
    return out;
}

std::string HexEncode(const std::vector<uint8_t>& data) {
    return HexEncode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> HexDecode(const std::string& hex) {
    size_t pos = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        pos = 2;
    }
    if ((hex.size() - pos) % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve((hex.size() - pos) / 2);
    for (; pos < hex.size(); pos += 2) {
        int high = Nibble(hex[pos]);
        int low = Nibble(hex[pos + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return out;
}

} // namespace shareledger
