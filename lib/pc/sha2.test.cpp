/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <pc/common/test.hpp>
#include <pc/sha2.hpp>

using namespace praos_crypto;

suite sha2_suite = [] {
    "sha2"_test = [] {
        "digest_512"_test = [] {
            test_same(sha2::hash_512::from_hex("cf83e1357eefb8bdf1542850d66d8007d620e4050b5715dc83f4a921d36ce9ce"
                "47d0d13c5d85f2b0ff8318d2877eec2f63b931bd47417a81a538327af927da3e"), sha2::digest_512(std::string_view {}));
            test_same(sha2::hash_512::from_hex("ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
                "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f"), sha2::digest_512(std::string_view { "abc" }));
            expect(throws([] {
                byte_array<32> out;
                sha2::digest_512(out, std::string_view { "abc" });
            }));
        };
        "hasher_512"_test = [] {
            uint8_vector data(200);
            for (size_t i = 0; i < data.size(); ++i)
                data[i] = static_cast<uint8_t>(i);
            const auto exp = sha2::hash_512::from_hex("986058e9895e2c2ab8f9e8cbdf801db12a44842a56a91d5a4e87b1fc98b29372"
                "2c4664142e42c3c551ff898646268cd92b84ed230b8c94bed7798d4f27cd7465");
            test_same(exp, sha2::digest_512(data));
            const buffer buf { data };
            test_same(exp, sha2::hasher_512 {}.update(buf.subbuf(0, 1)).update(buf.subbuf(1, 130)).update(buf.subbuf(131)).finalize());
        };
    };
};
