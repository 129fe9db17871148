// SEMAPHORE - Core Types Header
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Fundamental byte and digest types shared by every module.

#ifndef SEMAPHORE_CORE_TYPES_H
#define SEMAPHORE_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace semaphore {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer
using Bytes = std::vector<Byte>;

/// Convert a text string to its raw UTF-8 bytes
inline Bytes ToBytes(const std::string& str) {
    return Bytes(str.begin(), str.end());
}

// ============================================================================
// Hash256 - fixed 32-byte digest
// ============================================================================

class Hash256 {
public:
    static constexpr size_t SIZE = 32;

    /// Default constructor - all zeros
    Hash256() noexcept { data_.fill(0); }

    explicit Hash256(const std::array<Byte, SIZE>& data) noexcept : data_(data) {}

    /// Copies at most SIZE bytes; a short input is zero-padded on the right
    Hash256(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const Hash256& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const Hash256& other) const noexcept { return data_ != other.data_; }

    /// Hex in storage order (no byte reversal)
    std::string ToHex() const;

private:
    std::array<Byte, SIZE> data_;
};

} // namespace semaphore

#endif // SEMAPHORE_CORE_TYPES_H
