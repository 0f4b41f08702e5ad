/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

extern "C" {
#   include <sodium.h>
}
#include <pc/blake2b.hpp>
#include <pc/ed25519.hpp>

namespace praos_crypto {
    static_assert(sizeof(blake2b_256_hash) == crypto_generichash_BYTES);

    void blake2b_sodium(void *out, const size_t out_len, const void *in, const size_t in_len)
    {
        if (out_len < crypto_generichash_BYTES_MIN || out_len > crypto_generichash_BYTES_MAX) [[unlikely]]
            throw error(fmt::format("blake2b output must be between {} and {} bytes but got {}!",
                crypto_generichash_BYTES_MIN, crypto_generichash_BYTES_MAX, out_len));
        ed25519::ensure_initialized();
        if (crypto_generichash(reinterpret_cast<unsigned char*>(out), out_len, reinterpret_cast<const unsigned char *>(in), in_len, nullptr, 0) != 0)
            throw error("libsodium error: can't compute hash!");
    }
}
