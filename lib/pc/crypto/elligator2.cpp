/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <pc/crypto/elligator2.hpp>
#include <pc/sha2.hpp>

namespace praos_crypto::crypto::elligator2 {
    map_result map(const field_element &r)
    {
        const auto one = field_element::one();
        const auto r2 = r.square();
        // 1 + 2r^2 is never zero since -1/2 is not a square modulo p
        const auto u = -montgomery::a() * (r2 + r2 + one).invert();
        const bool not_square = !montgomery::rhs(u).is_square();
        return { field_element::select(u, -u - montgomery::a(), not_square), not_square };
    }

    edwards_point from_uniform(const buffer &r)
    {
        if (r.size() != 32) [[unlikely]]
            throw error(fmt::format("elligator2 input must have 32 bytes but got {}", r.size()));
        field_element::encoding r_bytes = r;
        const uint8_t x_sign = r_bytes[31] >> 7;
        r_bytes[31] &= 0x7F;
        const auto u = map(field_element::from_bytes(r_bytes)).u;
        auto enc = montgomery::edwards_y(u).to_bytes();
        enc[31] |= x_sign << 7;
        const auto p = edwards_point::from_bytes(enc);
        if (!p) [[unlikely]]
            throw error("elligator2 mapping produced an invalid point!");
        return p->mul_by_cofactor();
    }

    edwards_point from_hash(const buffer &h)
    {
        if (h.size() != 64) [[unlikely]]
            throw error(fmt::format("elligator2 hash input must have 64 bytes but got {}", h.size()));
        field_element::encoding lo = h.subbuf(0, 32);
        field_element::encoding hi = h.subbuf(32, 32);
        const uint64_t lo_top = lo[31] >> 7;
        const uint64_t hi_top = hi[31] >> 7;
        lo[31] &= 0x7F;
        hi[31] &= 0x7F;
        // 2^255 = 19 and 2^256 = 38 modulo p
        const auto r = field_element::from_bytes(lo) + field_element::from_uint(19 * lo_top + 722 * hi_top)
            + field_element::from_bytes(hi) * field_element::from_uint(38);
        const auto [u, not_square] = map(r);
        auto v = montgomery::v_from_u(u);
        if (!v) [[unlikely]]
            throw error("elligator2 mapping produced a u coordinate off the curve!");
        // the sign of v is negative iff the first candidate was a square
        if (v->is_negative() == not_square)
            v = -*v;
        return montgomery::to_edwards(u, *v).mul_by_cofactor();
    }

    void expand_message_xmd(const std::span<uint8_t> &out, const buffer &msg, const std::string_view dst)
    {
        static constexpr size_t block_size = 128;
        static constexpr std::string_view oversize_prefix { "H2C-OVERSIZE-DST-" };
        static const byte_array<block_size> z_pad {};
        const size_t ell = (out.size() + sizeof(sha2::hash_512) - 1) / sizeof(sha2::hash_512);
        if (out.empty() || ell > 255 || out.size() > 0xFFFF) [[unlikely]]
            throw error(fmt::format("expand_message_xmd cannot produce {} bytes", out.size()));
        sha2::hash_512 dst_hash;
        buffer dst_bytes { dst };
        if (dst.size() > 255) {
            sha2::hasher_512 {}.update(oversize_prefix).update(dst).finalize(dst_hash);
            dst_bytes = dst_hash;
        }
        const uint8_t dst_len = static_cast<uint8_t>(dst_bytes.size());
        const byte_array<3> len_bytes { static_cast<uint8_t>(out.size() >> 8), static_cast<uint8_t>(out.size()), 0 };

        const auto b0 = sha2::hasher_512 {}.update(z_pad).update(msg).update(len_bytes)
            .update(dst_bytes).update(buffer { &dst_len, 1 }).finalize();
        sha2::hash_512 b_prev = b0;
        for (size_t i = 1; i <= ell; ++i) {
            sha2::hash_512 chain = b_prev;
            if (i > 1) {
                for (size_t j = 0; j < chain.size(); ++j)
                    chain[j] ^= b0[j];
            }
            const uint8_t idx = static_cast<uint8_t>(i);
            b_prev = sha2::hasher_512 {}.update(chain).update(buffer { &idx, 1 })
                .update(dst_bytes).update(buffer { &dst_len, 1 }).finalize();
            const size_t off = (i - 1) * b_prev.size();
            const size_t sz = std::min(b_prev.size(), out.size() - off);
            memcpy(out.data() + off, b_prev.data(), sz);
        }
    }

    edwards_point hash_to_curve(const buffer &msg, const std::string_view dst)
    {
        byte_array<48> h_be;
        expand_message_xmd(h_be, msg, dst);
        byte_array<64> h {};
        for (size_t i = 0; i < h_be.size(); ++i)
            h[i] = h_be[h_be.size() - 1 - i];
        return from_hash(h);
    }
}
