// SHARELEDGER - SHA256 Hash Function
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL's EVP interface. Used for the
// ledger state root.

#ifndef SHARELEDGER_CRYPTO_SHA256_H
#define SHARELEDGER_CRYPTO_SHA256_H

#include "shareledger/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Forward declaration to keep OpenSSL headers out of the public API
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace shareledger {

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Throws std::runtime_error if the digest context cannot be created
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    /// Write a string's bytes to the hasher
    SHA256& Write(const std::string& data) {
        return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    /// Finalize the hash and write to output (OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Finalize into a Hash256
    Hash256 Finalize();

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_{nullptr};
};

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a vector
inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace shareledger

#endif // SHARELEDGER_CRYPTO_SHA256_H
