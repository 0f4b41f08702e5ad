/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <pc/big-int.hpp>
#include <pc/common/test.hpp>
#include <pc/crypto/scalar.hpp>
#include <pc/sha2.hpp>

using namespace praos_crypto;
using namespace praos_crypto::crypto;

namespace {
    const cpp_int &group_order()
    {
        static const cpp_int l = (cpp_int { 1 } << 252) + cpp_int { "27742317777372353535851937790883648493" };
        return l;
    }

    byte_array<32> scalar_bytes(const cpp_int &v)
    {
        byte_array<32> res {};
        big_uint_to_bytes_le(res, v);
        return res;
    }
}

suite crypto_scalar_suite = [] {
    "crypto::scalar"_test = [] {
        const auto &l = group_order();
        "order"_test = [&] {
            test_same(l, big_uint_from_bytes_le(scalar::order()));
        };
        "is_canonical"_test = [&] {
            expect(scalar::is_canonical(scalar_bytes(0)));
            expect(scalar::is_canonical(scalar_bytes(1)));
            expect(scalar::is_canonical(scalar_bytes(cpp_int { l - 1 })));
            expect(!scalar::is_canonical(scalar_bytes(l)));
            expect(!scalar::is_canonical(scalar_bytes(cpp_int { l + 1 })));
            expect(!scalar::is_canonical(scalar_bytes(cpp_int { (cpp_int { 1 } << 256) - 1 })));
            // differs from L only in the lowest byte
            expect(scalar::is_canonical(scalar_bytes(cpp_int { l - 0xED })));
            expect(throws([] { scalar::is_canonical(byte_array<31> {}); }));
        };
        "reduce"_test = [&] {
            for (uint8_t i = 0; i < 16; ++i) {
                const auto wide = sha2::digest_512(byte_array<1> { i });
                const auto exp = cpp_int { big_uint_from_bytes_le(wide) % l };
                const auto red = scalar::reduce(wide);
                test_same(exp, big_uint_from_bytes_le(red));
                expect(scalar::is_canonical(red));
            }
            byte_array<64> max_wide {};
            for (auto &b: max_wide)
                b = 0xFF;
            test_same(cpp_int { ((cpp_int { 1 } << 512) - 1) % l }, big_uint_from_bytes_le(scalar::reduce(max_wide)));
            expect(throws([] { scalar::reduce(byte_array<32> {}); }));
        };
        "mul_add"_test = [&] {
            for (uint8_t i = 0; i < 16; ++i) {
                const auto a = scalar::reduce(sha2::digest_512(byte_array<2> { 0x0A, i }));
                const auto b = scalar::reduce(sha2::digest_512(byte_array<2> { 0x0B, i }));
                const auto c = scalar::reduce(sha2::digest_512(byte_array<2> { 0x0C, i }));
                const auto ai = big_uint_from_bytes_le(a);
                const auto bi = big_uint_from_bytes_le(b);
                const auto ci = big_uint_from_bytes_le(c);
                test_same(cpp_int { (ai * bi + ci) % l }, big_uint_from_bytes_le(scalar::mul_add(a, b, c)));
            }
            // a 128-bit challenge times a clamped secret scalar that exceeds L
            auto x = sha2::digest_512(std::string_view { "secret" });
            scalar::clamp(std::span<uint8_t> { x.data(), 32 });
            const auto xi = big_uint_from_bytes_le(buffer { x.data(), 32 });
            expect(xi > l);
            const auto c = scalar_bytes(cpp_int { (cpp_int { 1 } << 128) - 1 });
            const auto k = scalar_bytes(cpp_int { l - 1 });
            test_same(cpp_int { (((cpp_int { 1 } << 128) - 1) * xi + l - 1) % l },
                big_uint_from_bytes_le(scalar::mul_add(c, buffer { x.data(), 32 }, k)));
        };
        "clamp"_test = [] {
            auto s = byte_array<32>::from_hex("ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
            scalar::clamp(s);
            expect(s[0] == 0xF8);
            expect(s[31] == 0x7F);
            auto z = byte_array<32> {};
            scalar::clamp(z);
            expect(z[0] == 0);
            expect(z[31] == 0x40);
        };
    };
};
