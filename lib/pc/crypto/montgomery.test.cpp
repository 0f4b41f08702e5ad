/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <pc/common/test.hpp>
#include <pc/crypto/montgomery.hpp>

using namespace praos_crypto;
using namespace praos_crypto::crypto;

suite crypto_montgomery_suite = [] {
    "crypto::montgomery"_test = [] {
        "sqrt_am2"_test = [] {
            const auto minus_am2 = -(montgomery::a() + field_element::from_uint(2));
            expect(montgomery::sqrt_am2().square() == minus_am2);
            const auto r = minus_am2.sqrt();
            expect(static_cast<bool>(r));
            if (r)
                expect(*r == montgomery::sqrt_am2() || -*r == montgomery::sqrt_am2());
        };
        "base point"_test = [] {
            // u = 9 is the Curve25519 base point and corresponds to the Ed25519 base point
            const auto u = field_element::from_uint(9);
            test_same(edwards_point::base().to_bytes(), montgomery::edwards_y(u).to_bytes());
            auto v = montgomery::v_from_u(u);
            expect(static_cast<bool>(v));
            if (v) {
                if (v->is_negative())
                    v = -*v;
                test_same(edwards_point::base().to_bytes(), montgomery::to_edwards(u, *v).to_bytes());
                test_same((-edwards_point::base()).to_bytes(), montgomery::to_edwards(u, -*v).to_bytes());
            }
        };
        "exceptional points"_test = [] {
            // u = 0 is the point of order 2 and v = 0 makes the denominator vanish
            expect(montgomery::to_edwards(field_element::zero(), field_element::zero()).is_identity());
            expect(montgomery::to_edwards(-field_element::one(), field_element::one()).is_identity());
        };
        "curve equation"_test = [] {
            const auto u = field_element::from_uint(9);
            test_same(field_element::from_uint(39420360).to_bytes(), montgomery::rhs(u).to_bytes());
            // u = 2 is not the u coordinate of a curve point
            expect(!montgomery::v_from_u(field_element::from_uint(2)));
        };
    };
};
