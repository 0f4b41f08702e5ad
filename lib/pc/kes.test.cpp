/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <pc/common/test.hpp>
#include <pc/kes.hpp>
#include <pc/secure-memory.hpp>

using namespace praos_crypto;

namespace {
    kes::seed test_seed()
    {
        kes::seed sd {};
        for (size_t i = 0; i < sd.size(); ++i)
            sd[i] = static_cast<uint8_t>(i);
        return sd;
    }

    static constexpr std::string_view test_msg { "block header body" };

    // Evolves a key through all its periods checking that each signature verifies only for its own period
    template<typename K>
    void test_evolution(const buffer &seed)
    {
        K sk { seed };
        const auto vk = sk.vk();
        for (size_t p = 0; p < K::period_end; ++p) {
            test_same(p, sk.period());
            const auto sig = sk.sign(p, test_msg);
            expect(K::verify(vk, p, sig, test_msg)) << fmt::format("depth {} period {}", K::depth, p);
            expect(!K::verify(vk, p, sig, std::string_view { "other" }));
            if (p > 0)
                expect(!K::verify(vk, p - 1, sig, test_msg));
            if (p + 1 < K::period_end) {
                expect(!K::verify(vk, p + 1, sig, test_msg));
                sk.update();
            }
        }
        expect(throws<kes::expired_error>([&] { sk.update(); }));
        test_same(K::period_end - 1, sk.period());
    }

    // Signs every period and checks that flipping any single bit of a signature fails verification
    template<typename K>
    void test_tamper(const buffer &seed)
    {
        K sk { seed };
        const auto vk = sk.vk();
        for (size_t p = 0; p < K::period_end; ++p) {
            const auto sig = sk.sign(p, test_msg);
            expect(K::verify(vk, p, sig, test_msg));
            size_t accepted = 0;
            for (size_t i = 0; i < sig.size(); ++i) {
                for (size_t bit = 0; bit < 8; ++bit) {
                    auto bad = sig;
                    bad[i] ^= static_cast<uint8_t>(1 << bit);
                    if (K::verify(vk, p, bad, test_msg))
                        ++accepted;
                }
            }
            expect(accepted == 0) << fmt::format("depth {} period {}: {} modified signatures accepted", K::depth, p, accepted);
            if (p + 1 < K::period_end)
                sk.update();
        }
    }
}

suite kes_suite = [] {
    "kes"_test = [] {
        const auto seed = test_seed();
        "sizes"_test = [] {
            test_same(size_t { 64 }, kes::single::signature_size);
            test_same(size_t { 96 }, kes::compact_single::signature_size);
            test_same(size_t { 256 }, kes::sum<3>::signature_size);
            test_same(size_t { 192 }, kes::compact_sum<3>::signature_size);
            test_same(size_t { 448 }, kes::sum6::signature_size);
            test_same(size_t { 288 }, kes::compact_sum6::signature_size);
            test_same(size_t { 64 }, kes::sum6::period_end);
            test_same(size_t { 128 }, kes::sum<7>::period_end);
            test_same(kes::sum<1>::signature_size, kes::compact_sum<1>::signature_size);
            static_assert(kes::compact_sum<2>::signature_size < kes::sum<2>::signature_size);
            static_assert(kes::compact_sum<7>::signature_size < kes::sum<7>::signature_size);
            test_same(size_t { 32 }, kes::vkey_size());
        };
        "single"_test = [&] {
            const kes::single sk { seed };
            test_same(kes_vkey::from_hex("03a107bff3ce10be1d70dd18e74bc09967e4d6309ba50d5f1ddc8664125531b8"), sk.vk());
            const auto sig = sk.sign(0, test_msg);
            test_same(kes::single::signature::from_hex("c9c43790e561dad5ff838448bdc6d109982d39ffa014589e9fc879e83a16e45e"
                "d2d641aa608103408d7db2e2c4b33960090ea4b6f975b53acc5c29eabb49f407"), sig);
            expect(kes::single::verify(sk.vk(), 0, sig, test_msg));
            expect(throws<kes::period_error>([&] { sk.sign(1, test_msg); }));
            expect(throws([&] { kes::single::verify(sk.vk(), 1, sig, test_msg); }));
        };
        "compact single"_test = [&] {
            const kes::compact_single sk { seed };
            const auto sig = sk.sign(0, test_msg);
            test_same(buffer { kes::single { seed }.sign(0, test_msg) }, buffer { sig }.subbuf(0, 64));
            test_same(buffer { sk.vk() }, buffer { sig }.subbuf(64));
            expect(kes::compact_single::verify(sk.vk(), 0, sig, test_msg));
            auto other_vk = sk.vk();
            other_vk[5] ^= 0x10;
            expect(!kes::compact_single::verify(other_vk, 0, sig, test_msg));
        };
        // regression values produced by this implementation for seed 00..1f
        "sum vectors"_test = [&] {
            static const std::array<std::string_view, 8> sig_hashes {
                "b06e3ff5b1f097f5f4fb685f01e14ee4808f2293f4d2169831324f96306abab7",
                "999929b3a22ab5ba9767d08a6e86acba91d0399064e9cdd27a17723fb9435993",
                "56d8eb338e1f9c65e92a572f432410805c55bbbdecdc181310e2e751212b041e",
                "e33cfc5e313c03be44ba51a937455d747fd38164bf0f41d110cc5f924f106d20",
                "49d29c3aaff43bf888e7ebfd71fb3cd85367b8682571b5ee6609569ddb099396",
                "c364908dd1e6676818ca1eebf164a453223814ebea846b4d370027cbb9d082bc",
                "573312f8315f529873acc4b3bfccdf7cbcb6b188c0e070153d73fb7fdb7d2e8b",
                "e68d73548e11a32f2ffb99c6ba121c952a838a3dd1efc988503e2c8ce958ed60"
            };
            kes::sum<3> sk { seed };
            test_same(kes_vkey::from_hex("c5d5cb12ef2e8f10c68c7f673a1529322ac11ea5355c5ba593cbd75b8e1e23d2"), sk.vk());
            for (size_t p = 0; p < sig_hashes.size(); ++p) {
                const auto sig = sk.sign(p, test_msg);
                test_same(blake2b_256_hash::from_hex(sig_hashes[p]), blake2b<blake2b_256_hash>(sig));
                expect(kes::sum<3>::verify(sk.vk(), p, sig, test_msg));
                if (p + 1 < sig_hashes.size())
                    sk.update();
            }
        };
        "compact sum vectors"_test = [&] {
            static const std::array<std::string_view, 8> sig_hashes {
                "a87e3620e8be510a3cbd7a02b4e0bd9b4b1b4868ac12caebfc357957fbdec4bf",
                "d630cae694a41872fda5285134e57202d1e98bdb3d25629a5db0baa4764df359",
                "b78563a77cdcacc4df978136285b0762fba8903fd4e6b727375f583cb31ddf5d",
                "4a063a856d73ad4ae3fb73b9344924bce09e32015ba8a4f7452ab3f7457a0167",
                "0ede90e8987b9bd9e3ab23eff0a140e04f2116ca9ccda8a54237e950f4a2340e",
                "c90d262b9d5b27a566e6224c7b247b103070fe147330140825b7c22c601f8901",
                "5ddc8a1a8ef5fc7af8577e2e1010ab226125da68121a01fb1a5c0aafbdea942f",
                "a2c790bd3ea4dfb2792c985245519d05f8c467996dcadd1e286cfd163018edd1"
            };
            kes::compact_sum<3> sk { seed };
            // both compositions derive the same verification key
            test_same(kes_vkey::from_hex("c5d5cb12ef2e8f10c68c7f673a1529322ac11ea5355c5ba593cbd75b8e1e23d2"), sk.vk());
            for (size_t p = 0; p < sig_hashes.size(); ++p) {
                const auto sig = sk.sign(p, test_msg);
                test_same(blake2b_256_hash::from_hex(sig_hashes[p]), blake2b<blake2b_256_hash>(sig));
                expect(kes::compact_sum<3>::verify(sk.vk(), p, sig, test_msg));
                test_same(sk.vk(), kes::compact_signature<3> { sig }.vk(p));
                if (p + 1 < sig_hashes.size())
                    sk.update();
            }
        };
        "evolution"_test = [&] {
            test_evolution<kes::sum<1>>(seed);
            test_evolution<kes::sum<2>>(seed);
            test_evolution<kes::compact_sum<2>>(seed);
            test_evolution<kes::sum6>(seed);
            test_evolution<kes::compact_sum6>(seed);
            test_evolution<kes::compact_sum<7>>(seed);
        };
        "depth 7"_test = [&] {
            kes::sum<7> sk { seed };
            const kes::compact_sum<7> csk { seed };
            test_same(sk.vk(), csk.vk());
            const auto sig = sk.sign(0, test_msg);
            test_same(size_t { 512 }, sig.size());
            expect(kes::sum<7>::verify(sk.vk(), 0, sig, test_msg));
            expect(throws([&] { kes::sum<7>::verify(sk.vk(), 128, sig, test_msg); }));
        };
        "forward security"_test = [&] {
            kes::sum<2> sk { seed };
            const auto vk = sk.vk();
            const auto sig0 = sk.sign(0, test_msg);
            sk.update();
            test_same(size_t { 1 }, sk.period());
            expect(throws<kes::period_error>([&] { sk.sign(0, test_msg); }));
            const auto before = secure_memory::snapshot();
            // moving to the right subtree drops the secrets of the left one
            sk.update();
            expect(secure_memory::snapshot().zeroizations > before.zeroizations);
            expect(throws<kes::period_error>([&] { sk.sign(1, test_msg); }));
            // the old signatures remain valid
            expect(kes::sum<2>::verify(vk, 0, sig0, test_msg));
            const auto sig2 = sk.sign(2, test_msg);
            expect(kes::sum<2>::verify(vk, 2, sig2, test_msg));
        };
        "forget"_test = [&] {
            kes::sum<2> sk { seed };
            const auto vk = sk.vk();
            const auto before = secure_memory::snapshot();
            sk.forget();
            expect(secure_memory::snapshot().zeroizations >= before.zeroizations + 2);
            expect(throws([&] { sk.sign(0, test_msg); }));
            test_same(vk, sk.vk());
        };
        "move"_test = [&] {
            kes::compact_sum<2> sk1 { seed };
            const auto vk = sk1.vk();
            sk1.update();
            kes::compact_sum<2> sk2 { std::move(sk1) };
            test_same(size_t { 1 }, sk2.period());
            expect(kes::compact_sum<2>::verify(vk, 1, sk2.sign(1, test_msg), test_msg));
        };
        "verification failures"_test = [&] {
            const kes::sum<3> sk { seed };
            const auto vk = sk.vk();
            const auto sig = sk.sign(0, test_msg);
            {
                auto bad = sig;
                bad[0] ^= 0x01;
                expect(!kes::sum<3>::verify(vk, 0, bad, test_msg));
            }
            {
                // a vkey in the last level no longer hashes to the root key
                auto bad = sig;
                bad[bad.size() - 1] ^= 0x01;
                expect(!kes::sum<3>::verify(vk, 0, bad, test_msg));
            }
            {
                auto bad_vk = vk;
                bad_vk[0] ^= 0x01;
                expect(!kes::sum<3>::verify(bad_vk, 0, sig, test_msg));
            }
            expect(throws([&] { kes::sum<3>::verify(vk, 8, sig, test_msg); }));
            expect(throws([&] { kes::sum<3>::verify(vk, 0, buffer { sig }.subbuf(1), test_msg); }));
            expect(throws([&] { kes::sum<3>::verify(buffer { vk }.subbuf(1), 0, sig, test_msg); }));
            expect(throws([&] { kes::sum<3>::verify(vk, 0, byte_array<192> {}, test_msg); }));
            expect(throws([&] { kes::compact_sum<3>::verify(vk, 0, sig, test_msg); }));
            const kes::compact_sum<3> csk { seed };
            const auto csig = csk.sign(0, test_msg);
            {
                auto bad = csig;
                bad[bad.size() - 1] ^= 0x01;
                expect(!kes::compact_sum<3>::verify(vk, 0, bad, test_msg));
            }
            expect(throws([&] { kes::compact_sum<3>::verify(vk, 8, csig, test_msg); }));
        };
        "single-bit flips"_test = [&] {
            test_tamper<kes::sum<3>>(seed);
            test_tamper<kes::compact_sum<3>>(seed);
        };
        "hash_vkey"_test = [&] {
            const kes::single sk { seed };
            test_same(blake2b<blake2b_224_hash>(sk.vk()), kes::hash_vkey<blake2b_224_hash>(sk.vk()));
            test_same(blake2b<blake2b_256_hash>(sk.vk()), kes::hash_vkey(sk.vk()));
            expect(throws([] { kes::hash_vkey(byte_array<31> {}); }));
            const kes::sum<1> sk1 { seed };
            const auto [left, right] = kes::split_seed { seed };
            test_same(sk1.vk(), kes::hash_vkey_pair(kes::single { left }.vk(), kes::single { right }.vk()));
        };
        "seed split"_test = [&] {
            const kes::split_seed split { seed };
            expect(!(split.left == split.right));
            expect(throws([] { kes::split_seed { byte_array<31> {} }; }));
            expect(throws([] { kes::sum<2> { byte_array<16> {} }; }));
        };
    };
};
