/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_BLAKE2B_HPP
#define PRAOS_CRYPTO_BLAKE2B_HPP

#include <pc/array.hpp>
#include <pc/common/bytes.hpp>

namespace praos_crypto
{
    using blake2b_224_hash = byte_array<28>;
    using blake2b_256_hash = byte_array<32>;

    extern void blake2b_sodium(void *out, size_t out_len, const void *in, size_t in_len);

    inline void blake2b(const std::span<uint8_t> &out, const buffer &in)
    {
        blake2b_sodium(out.data(), out.size(), in.data(), in.size());
    }

    template<typename T>
    T blake2b(const buffer &in)
    {
        T out;
        blake2b_sodium(out.data(), out.size(), in.data(), in.size());
        return out;
    }
}

#endif // !PRAOS_CRYPTO_BLAKE2B_HPP
