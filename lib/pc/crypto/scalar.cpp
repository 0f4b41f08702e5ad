/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

extern "C" {
#   include <sodium.h>
}
#include <pc/crypto/scalar.hpp>
#include <pc/ed25519.hpp>

namespace praos_crypto::crypto::scalar {
    static_assert(sizeof(value) == crypto_core_ed25519_SCALARBYTES);

    const byte_array<32> &order()
    {
        static const auto l = byte_array<32>::from_hex("edd3f55c1a631258d69cf7a2def9de1400000000000000000000000000000010");
        return l;
    }

    static void check_size(const buffer &s, const size_t expected, const char *name)
    {
        if (s.size() != expected) [[unlikely]]
            throw error(fmt::format("{} must have {} bytes but got {}", name, expected, s.size()));
    }

    void reduce(const std::span<uint8_t> &out, const buffer &wide)
    {
        check_size(out, sizeof(value), "reduced scalar");
        check_size(wide, crypto_core_ed25519_NONREDUCEDSCALARBYTES, "wide scalar");
        ed25519::ensure_initialized();
        crypto_core_ed25519_scalar_reduce(out.data(), wide.data());
    }

    value reduce(const buffer &wide)
    {
        value res;
        reduce(res, wide);
        return res;
    }

    void mul_add(const std::span<uint8_t> &out, const buffer &a, const buffer &b, const buffer &c)
    {
        check_size(out, sizeof(value), "output scalar");
        check_size(a, sizeof(value), "scalar a");
        check_size(b, sizeof(value), "scalar b");
        check_size(c, sizeof(value), "scalar c");
        ed25519::ensure_initialized();
        value prod;
        crypto_core_ed25519_scalar_mul(prod.data(), a.data(), b.data());
        crypto_core_ed25519_scalar_add(out.data(), prod.data(), c.data());
    }

    value mul_add(const buffer &a, const buffer &b, const buffer &c)
    {
        value res;
        mul_add(res, a, b, c);
        return res;
    }

    bool is_canonical(const buffer &s)
    {
        check_size(s, sizeof(value), "scalar");
        const auto &l = order();
        // compares from the most significant byte without data-dependent branches
        unsigned int lt = 0;
        unsigned int eq = 1;
        for (size_t i = l.size(); i > 0; --i) {
            const unsigned int x = s[i - 1];
            const unsigned int y = l[i - 1];
            lt |= ((x - y) >> 8) & eq;
            eq &= ((x ^ y) - 1) >> 8;
        }
        return lt != 0;
    }

    void clamp(const std::span<uint8_t> &s)
    {
        check_size(s, sizeof(value), "secret scalar");
        s[0] &= 248;
        s[31] &= 127;
        s[31] |= 64;
    }
}
