/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <pc/blake2b.hpp>
#include <pc/common/test.hpp>
#include <pc/ed25519.hpp>

using namespace praos_crypto;

suite ed25519_suite = [] {
    "ed25519"_test = [] {
        "rfc8032 test vector"_test = [] {
            const auto seed = ed25519::seed::from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
            const auto [sk, vk] = ed25519::create_from_seed(seed);
            test_same(ed25519::vkey::from_hex("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"), vk);
            const auto sig = ed25519::sign(std::string_view {}, sk);
            test_same(ed25519::signature::from_hex("e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065"
                "224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b"), sig);
            expect(ed25519::verify(sig, vk, std::string_view {}));
            expect(!ed25519::verify(sig, vk, std::string_view { "x" }));
        };
        "create-sign-verify"_test = [] {
            const auto [sk1, vk1] = ed25519::create();
            const auto [sk2, vk2] = ed25519::create();
            expect(sk1 != sk2);
            expect(vk1 != vk2);
            const std::string msg1 { "message1" }, msg2 { "message2" };
            const auto sig11 = ed25519::sign(msg1, sk1);
            const auto sig12 = ed25519::sign(msg2, sk1);
            const auto sig21 = ed25519::sign(msg1, sk2);
            expect(sig11 != sig12);
            expect(sig11 != sig21);
            expect(ed25519::verify(sig11, vk1, msg1));
            expect(!ed25519::verify(sig11, vk2, msg1));
            expect(!ed25519::verify(sig11, vk1, msg2));
            expect(ed25519::verify(sig12, vk1, msg2));
            expect(ed25519::verify(sig21, vk2, msg1));
            expect(!ed25519::verify(sig21, vk1, msg1));
        };
        "extract-vkey"_test = [] {
            const auto [sk, vk] = ed25519::create();
            test_same(vk, ed25519::extract_vk(sk));
        };
        "create-seed"_test = [] {
            const auto seed1 = blake2b<ed25519::seed>(std::string_view { "1" });
            const auto seed2 = blake2b<ed25519::seed>(std::string_view { "2" });
            const auto [sk1, vk1] = ed25519::create_from_seed(seed1);
            const auto [sk1b, vk1b] = ed25519::create_from_seed(seed1);
            const auto [sk2, vk2] = ed25519::create_from_seed(seed2);
            expect(sk1 == sk1b);
            test_same(vk1, vk1b);
            expect(vk1 != vk2);
            // the secret key is the seed followed by the verification key
            expect(static_cast<buffer>(sk1).subbuf(0, 32) == static_cast<buffer>(seed1));
            expect(static_cast<buffer>(sk1).subbuf(32) == static_cast<buffer>(vk1));
        };
        "wrong sizes"_test = [] {
            expect(throws([] { ed25519::create_from_seed(byte_array<31> {}); }));
            expect(throws([] { ed25519::extract_vk(byte_array<32> {}); }));
            expect(throws([] {
                ed25519::skey sk {};
                byte_array<31> vk {};
                ed25519::create(sk, vk);
            }));
        };
    };
};
