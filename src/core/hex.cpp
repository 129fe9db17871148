// SEMAPHORE - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/core/hex.h"
#include "semaphore/core/types.h"

#include <stdexcept>

namespace semaphore {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int NibbleValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

size_t PrefixLength(const std::string& hex) {
    return (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) ? 2 : 0;
}

} // namespace

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return out;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    size_t start = PrefixLength(hex);
    if ((hex.size() - start) % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<uint8_t> out;
    out.reserve((hex.size() - start) / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        int hi = NibbleValue(hex[i]);
        int lo = NibbleValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    size_t start = PrefixLength(str);
    if (str.size() == start || (str.size() - start) % 2 != 0) {
        return false;
    }
    for (size_t i = start; i < str.size(); ++i) {
        if (NibbleValue(str[i]) < 0) return false;
    }
    return true;
}

std::string Hash256::ToHex() const {
    return BytesToHex(data(), SIZE);
}

} // namespace semaphore
