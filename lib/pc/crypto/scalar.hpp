/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_CRYPTO_SCALAR_HPP
#define PRAOS_CRYPTO_CRYPTO_SCALAR_HPP

#include <pc/array.hpp>
#include <pc/common/bytes.hpp>

// Arithmetic modulo the prime order L = 2^252 + 27742317777372353535851937790883648493 of the Ed25519 base point.
// All values are 32-byte little-endian integers.
namespace praos_crypto::crypto::scalar {
    using value = secure_byte_array<32>;

    extern const byte_array<32> &order();
    extern void reduce(const std::span<uint8_t> &out, const buffer &wide);
    extern value reduce(const buffer &wide);
    // a * b + c mod L
    extern void mul_add(const std::span<uint8_t> &out, const buffer &a, const buffer &b, const buffer &c);
    extern value mul_add(const buffer &a, const buffer &b, const buffer &c);
    extern bool is_canonical(const buffer &s);
    // Ed25519 clamping of a 32-byte secret scalar
    extern void clamp(const std::span<uint8_t> &s);
}

#endif // !PRAOS_CRYPTO_CRYPTO_SCALAR_HPP
