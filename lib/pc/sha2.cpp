/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <pc/ed25519.hpp>
#include <pc/sha2.hpp>

namespace praos_crypto::sha2 {
    void digest_512(const std::span<uint8_t> &out, const buffer &in)
    {
        if (out.size() != sizeof(hash_512))
            throw error(fmt::format("output size must be {} but got {}", sizeof(hash_512), out.size()));
        ed25519::ensure_initialized();
        if (crypto_hash_sha512(out.data(), in.data(), in.size()) != 0)
            throw error("sha2 computation hash failed!");
    }

    hasher_512::hasher_512()
    {
        ed25519::ensure_initialized();
        if (crypto_hash_sha512_init(&_state) != 0)
            throw error("sha2 state initialization failed!");
    }

    hasher_512::~hasher_512()
    {
        sodium_memzero(&_state, sizeof(_state));
    }

    hasher_512 &hasher_512::update(const buffer &in)
    {
        if (crypto_hash_sha512_update(&_state, in.data(), in.size()) != 0)
            throw error("sha2 state update failed!");
        return *this;
    }

    void hasher_512::finalize(const std::span<uint8_t> &out)
    {
        if (out.size() != sizeof(hash_512))
            throw error(fmt::format("output size must be {} but got {}", sizeof(hash_512), out.size()));
        if (crypto_hash_sha512_final(&_state, out.data()) != 0)
            throw error("sha2 finalization failed!");
    }

    hash_512 hasher_512::finalize()
    {
        hash_512 out;
        finalize(out);
        return out;
    }
}
