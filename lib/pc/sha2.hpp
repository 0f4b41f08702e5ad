/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_SHA2_HPP
#define PRAOS_CRYPTO_SHA2_HPP

extern "C" {
#   include <sodium.h>
};
#include <pc/array.hpp>

namespace praos_crypto::sha2
{
    using hash_512 = byte_array<crypto_hash_sha512_BYTES>;

    extern void digest_512(const std::span<uint8_t> &out, const buffer &in);

    inline hash_512 digest_512(const buffer &in)
    {
        hash_512 out;
        digest_512(out, in);
        return out;
    }

    // Incremental SHA-512 for inputs assembled from several parts.
    // The internal state is wiped on destruction since it may be derived from secret data.
    struct hasher_512 {
        hasher_512();
        hasher_512(const hasher_512 &) =delete;
        ~hasher_512();

        hasher_512 &update(const buffer &in);
        void finalize(const std::span<uint8_t> &out);
        hash_512 finalize();
    private:
        crypto_hash_sha512_state _state;
    };
}

#endif // !PRAOS_CRYPTO_SHA2_HPP
