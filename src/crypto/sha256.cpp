// RELIQUARY - SHA256 Implementation
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include "reliquary/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace reliquary {

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("SHA256: EVP_MD_CTX_new failed");
    }
    Reset();
}

SHA256::~SHA256() {
    EVP_MD_CTX_free(ctx_);
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestInit_ex failed");
    }
    return *this;
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: EVP_DigestFinal_ex failed");
    }
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 result;
    SHA256().Write(data, len).Finalize(result.data());
    return result;
}

} // namespace reliquary
