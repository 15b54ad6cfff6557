// RELIQUARY - Core Types Header
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// Fundamental types shared by every RELIQUARY module.

#ifndef RELIQUARY_CORE_TYPES_H
#define RELIQUARY_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace reliquary {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Agent principal identifier (address, key fingerprint, ...)
using AgentId = std::string;

/// Sequential governance proposal identifier (first proposal is 1)
using ProposalId = uint64_t;

/// Voting weight of an agent
using VotingPower = uint64_t;

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size hash value
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    /// Construct from raw bytes (short input is zero padded)
    BaseHash(const Byte* data, size_t len) noexcept {
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
    
    void SetNull() noexcept {
        data_.fill(0);
    }
    
    constexpr size_t size() const noexcept { return SIZE; }
    
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }
    
    /// Lowercase hex, in storage byte order
    std::string ToHex() const;
    
    /// Parse from hex produced by ToHex()
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}
    
    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

} // namespace reliquary

#endif // RELIQUARY_CORE_TYPES_H
