// RELIQUARY - SHA256 Hash Function
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// SHA-256 backed by the OpenSSL EVP digest interface.

#ifndef RELIQUARY_CRYPTO_SHA256_H
#define RELIQUARY_CRYPTO_SHA256_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "reliquary/core/types.h"

// Forward declaration so callers do not pull in OpenSSL headers
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace reliquary {

/// SHA-256 hasher class
/// Provides incremental hashing; throws std::runtime_error if the
/// underlying digest context cannot be created or updated.
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;
    
    SHA256();
    ~SHA256();
    
    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;
    
    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);
    
    /// Finalize the hash and write to output. The hasher must be Reset()
    /// before it is written to again.
    /// @param hash Pointer to output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);
    
    /// Reset hasher to initial state
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace reliquary

#endif // RELIQUARY_CRYPTO_SHA256_H
