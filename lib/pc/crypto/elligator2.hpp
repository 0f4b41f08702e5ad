/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_CRYPTO_ELLIGATOR2_HPP
#define PRAOS_CRYPTO_CRYPTO_ELLIGATOR2_HPP

#include <string_view>
#include <pc/crypto/montgomery.hpp>

namespace praos_crypto::crypto::elligator2 {
    struct map_result {
        field_element u;
        bool not_square;
    };

    // u = -A / (1 + 2r^2), replaced with -u - A when u^3 + A*u^2 + u is not a square
    extern map_result map(const field_element &r);
    // The 32-byte uniform-string variant: bit 255 selects the sign of x. The result is cofactor-cleared.
    extern edwards_point from_uniform(const buffer &r);
    // Interprets 64 little-endian bytes as an integer reduced modulo p. The result is cofactor-cleared.
    extern edwards_point from_hash(const buffer &h);
    // expand_message_xmd with SHA-512
    extern void expand_message_xmd(const std::span<uint8_t> &out, const buffer &msg, std::string_view dst);
    // Expands the message to 48 bytes, reads them as a big-endian integer, and maps it with from_hash
    extern edwards_point hash_to_curve(const buffer &msg, std::string_view dst);
}

#endif // !PRAOS_CRYPTO_CRYPTO_ELLIGATOR2_HPP
