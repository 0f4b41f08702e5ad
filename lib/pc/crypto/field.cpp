/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <pc/crypto/field.hpp>

namespace praos_crypto::crypto {
    using uint128_t = unsigned __int128;
    using limbs_type = field_element::limbs_type;

    static constexpr uint64_t mask51 = (uint64_t { 1 } << 51) - 1;
    // 4 * p in the limb representation, keeps subtraction results non-negative
    static constexpr limbs_type four_p { 0x1FFFFFFFFFFFB4ULL, 0x1FFFFFFFFFFFFCULL, 0x1FFFFFFFFFFFFCULL, 0x1FFFFFFFFFFFFCULL, 0x1FFFFFFFFFFFFCULL };

    static uint64_t load64_le(const uint8_t *p) noexcept
    {
        uint64_t v = 0;
        for (size_t i = 0; i < 8; ++i)
            v |= static_cast<uint64_t>(p[i]) << (8 * i);
        return v;
    }

    static void store64_le(uint8_t *p, uint64_t v) noexcept
    {
        for (size_t i = 0; i < 8; ++i) {
            p[i] = static_cast<uint8_t>(v);
            v >>= 8;
        }
    }

    static limbs_type carry(limbs_type l) noexcept
    {
        l[1] += l[0] >> 51;
        l[0] &= mask51;
        l[2] += l[1] >> 51;
        l[1] &= mask51;
        l[3] += l[2] >> 51;
        l[2] &= mask51;
        l[4] += l[3] >> 51;
        l[3] &= mask51;
        l[0] += 19 * (l[4] >> 51);
        l[4] &= mask51;
        return l;
    }

    field_element field_element::from_uint(const uint64_t v) noexcept
    {
        return field_element { limbs_type { v & mask51, v >> 51, 0, 0, 0 } };
    }

    field_element field_element::from_bytes(const buffer &bytes)
    {
        if (bytes.size() != sizeof(encoding)) [[unlikely]]
            throw error(fmt::format("a field element must be encoded with {} bytes but got {}", sizeof(encoding), bytes.size()));
        const uint8_t *b = bytes.data();
        return field_element { limbs_type {
            load64_le(b) & mask51,
            (load64_le(b + 6) >> 3) & mask51,
            (load64_le(b + 12) >> 6) & mask51,
            (load64_le(b + 19) >> 1) & mask51,
            (load64_le(b + 24) >> 12) & mask51
        } };
    }

    field_element field_element::select(const field_element &a, const field_element &b, const bool choose_b) noexcept
    {
        const uint64_t mask = ~(static_cast<uint64_t>(choose_b) - 1);
        limbs_type r;
        for (size_t i = 0; i < r.size(); ++i)
            r[i] = a._limbs[i] ^ (mask & (a._limbs[i] ^ b._limbs[i]));
        return field_element { r };
    }

    const field_element &field_element::sqrt_m1()
    {
        static const auto v = from_bytes(encoding::from_hex("b0a00e4a271beec478e42fad0618432fa7d7fb3d99004d2b0bdfc14f8024832b"));
        return v;
    }

    const field_element &field_element::edwards_d()
    {
        static const auto v = from_bytes(encoding::from_hex("a3785913ca4deb75abd841414d0a700098e879777940c78c73fe6f2bee6c0352"));
        return v;
    }

    const field_element &field_element::edwards_d2()
    {
        static const auto v = from_bytes(encoding::from_hex("59f1b226949bd6eb56b183829a14e00030d1f3eef2808e19e7fcdf56dcd90624"));
        return v;
    }

    field_element::encoding field_element::to_bytes() const noexcept
    {
        auto t = carry(carry(_limbs));
        // q is 1 iff t >= p
        uint64_t q = (t[0] + 19) >> 51;
        q = (t[1] + q) >> 51;
        q = (t[2] + q) >> 51;
        q = (t[3] + q) >> 51;
        q = (t[4] + q) >> 51;
        t[0] += 19 * q;
        t[1] += t[0] >> 51;
        t[0] &= mask51;
        t[2] += t[1] >> 51;
        t[1] &= mask51;
        t[3] += t[2] >> 51;
        t[2] &= mask51;
        t[4] += t[3] >> 51;
        t[3] &= mask51;
        t[4] &= mask51;
        encoding out;
        store64_le(out.data(), t[0] | (t[1] << 51));
        store64_le(out.data() + 8, (t[1] >> 13) | (t[2] << 38));
        store64_le(out.data() + 16, (t[2] >> 26) | (t[3] << 25));
        store64_le(out.data() + 24, (t[3] >> 39) | (t[4] << 12));
        return out;
    }

    void field_element::to_bytes(const std::span<uint8_t> &out) const
    {
        if (out.size() != sizeof(encoding)) [[unlikely]]
            throw error(fmt::format("a field element must be encoded with {} bytes but got {}", sizeof(encoding), out.size()));
        const auto enc = to_bytes();
        memcpy(out.data(), enc.data(), enc.size());
    }

    bool field_element::is_zero() const noexcept
    {
        const auto enc = to_bytes();
        uint8_t acc = 0;
        for (const auto b: enc)
            acc |= b;
        return acc == 0;
    }

    bool field_element::is_negative() const noexcept
    {
        return to_bytes()[0] & 1;
    }

    bool field_element::is_square() const noexcept
    {
        // Euler's criterion: this^((p-1)/2) with (p-1)/2 = 4 * (p-5)/8 + 2
        const auto chi = pow22523().pow2k(2) * square();
        return !(chi == -one());
    }

    field_element field_element::operator+(const field_element &o) const noexcept
    {
        limbs_type r;
        for (size_t i = 0; i < r.size(); ++i)
            r[i] = _limbs[i] + o._limbs[i];
        return field_element { carry(r) };
    }

    field_element field_element::operator-(const field_element &o) const noexcept
    {
        limbs_type r;
        for (size_t i = 0; i < r.size(); ++i)
            r[i] = _limbs[i] + four_p[i] - o._limbs[i];
        return field_element { carry(r) };
    }

    field_element field_element::operator-() const noexcept
    {
        return zero() - *this;
    }

    field_element field_element::operator*(const field_element &o) const noexcept
    {
        const auto &a = _limbs;
        const auto &b = o._limbs;
        const uint64_t b1_19 = b[1] * 19;
        const uint64_t b2_19 = b[2] * 19;
        const uint64_t b3_19 = b[3] * 19;
        const uint64_t b4_19 = b[4] * 19;

        uint128_t r0 = static_cast<uint128_t>(a[0]) * b[0] + static_cast<uint128_t>(a[1]) * b4_19
            + static_cast<uint128_t>(a[2]) * b3_19 + static_cast<uint128_t>(a[3]) * b2_19
            + static_cast<uint128_t>(a[4]) * b1_19;
        uint128_t r1 = static_cast<uint128_t>(a[0]) * b[1] + static_cast<uint128_t>(a[1]) * b[0]
            + static_cast<uint128_t>(a[2]) * b4_19 + static_cast<uint128_t>(a[3]) * b3_19
            + static_cast<uint128_t>(a[4]) * b2_19;
        uint128_t r2 = static_cast<uint128_t>(a[0]) * b[2] + static_cast<uint128_t>(a[1]) * b[1]
            + static_cast<uint128_t>(a[2]) * b[0] + static_cast<uint128_t>(a[3]) * b4_19
            + static_cast<uint128_t>(a[4]) * b3_19;
        uint128_t r3 = static_cast<uint128_t>(a[0]) * b[3] + static_cast<uint128_t>(a[1]) * b[2]
            + static_cast<uint128_t>(a[2]) * b[1] + static_cast<uint128_t>(a[3]) * b[0]
            + static_cast<uint128_t>(a[4]) * b4_19;
        uint128_t r4 = static_cast<uint128_t>(a[0]) * b[4] + static_cast<uint128_t>(a[1]) * b[3]
            + static_cast<uint128_t>(a[2]) * b[2] + static_cast<uint128_t>(a[3]) * b[1]
            + static_cast<uint128_t>(a[4]) * b[0];

        limbs_type r;
        r1 += static_cast<uint64_t>(r0 >> 51);
        r[0] = static_cast<uint64_t>(r0) & mask51;
        r2 += static_cast<uint64_t>(r1 >> 51);
        r[1] = static_cast<uint64_t>(r1) & mask51;
        r3 += static_cast<uint64_t>(r2 >> 51);
        r[2] = static_cast<uint64_t>(r2) & mask51;
        r4 += static_cast<uint64_t>(r3 >> 51);
        r[3] = static_cast<uint64_t>(r3) & mask51;
        r[4] = static_cast<uint64_t>(r4) & mask51;
        r[0] += static_cast<uint64_t>(r4 >> 51) * 19;
        r[1] += r[0] >> 51;
        r[0] &= mask51;
        return field_element { r };
    }

    bool field_element::operator==(const field_element &o) const noexcept
    {
        return to_bytes() == o.to_bytes();
    }

    field_element field_element::square() const noexcept
    {
        return *this * *this;
    }

    field_element field_element::pow2k(const size_t k) const noexcept
    {
        auto r = *this;
        for (size_t i = 0; i < k; ++i)
            r = r.square();
        return r;
    }

    // Computes z^(2^250 - 1) and z^11, the common prefix of the inversion and square-root exponents
    static void pow_chain(const field_element &z, field_element &z_250_0, field_element &z11) noexcept
    {
        const auto z2 = z.square();
        const auto z9 = z2.pow2k(2) * z;
        z11 = z9 * z2;
        const auto z_5_0 = z11.square() * z9;
        const auto z_10_0 = z_5_0.pow2k(5) * z_5_0;
        const auto z_20_0 = z_10_0.pow2k(10) * z_10_0;
        const auto z_40_0 = z_20_0.pow2k(20) * z_20_0;
        const auto z_50_0 = z_40_0.pow2k(10) * z_10_0;
        const auto z_100_0 = z_50_0.pow2k(50) * z_50_0;
        const auto z_200_0 = z_100_0.pow2k(100) * z_100_0;
        z_250_0 = z_200_0.pow2k(50) * z_50_0;
    }

    field_element field_element::invert() const noexcept
    {
        field_element z_250_0, z11;
        pow_chain(*this, z_250_0, z11);
        // 2^255 - 21 = p - 2
        return z_250_0.pow2k(5) * z11;
    }

    field_element field_element::pow22523() const noexcept
    {
        field_element z_250_0, z11;
        pow_chain(*this, z_250_0, z11);
        // 2^252 - 3
        return z_250_0.pow2k(2) * *this;
    }

    std::optional<field_element> field_element::sqrt() const noexcept
    {
        // p = 5 mod 8, so a candidate root is this^((p+3)/8) possibly multiplied by sqrt(-1)
        auto cand = pow22523() * *this;
        if (cand.square() == *this)
            return cand;
        cand = cand * sqrt_m1();
        if (cand.square() == *this)
            return cand;
        return {};
    }
}
