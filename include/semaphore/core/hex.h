// SEMAPHORE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#ifndef SEMAPHORE_CORE_HEX_H
#define SEMAPHORE_CORE_HEX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace semaphore {

/// Convert bytes to lowercase hex
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

template<size_t N>
std::string BytesToHex(const std::array<uint8_t, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex (optional 0x prefix) to bytes.
/// Throws std::invalid_argument on odd length or a non-hex character.
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is valid hex
bool IsValidHex(const std::string& str);

} // namespace semaphore

#endif // SEMAPHORE_CORE_HEX_H
