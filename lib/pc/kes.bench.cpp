/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <pc/benchmark.hpp>
#include <pc/kes.hpp>

using namespace boost::ut;
using namespace praos_crypto;

suite kes_bench_suite = [] {
    "kes"_test = [] {
        const auto seed = blake2b<kes::seed>(std::string_view { "kes benchmark seed" });
        const std::string_view msg { "block header body" };
        const kes::sum6 sk { seed };
        const auto sig = sk.sign(0, msg);
        const kes::compact_sum6 csk { seed };
        const auto csig = csk.sign(0, msg);
        benchmark_r("kes/sum6 create+verify", 2000.0, 2000, [&] {
            return kes_signature<6> { sig }.verify(0, sk.vk(), msg) ? 1 : 0;
        });
        benchmark_r("kes/compact_sum6 create+verify", 2000.0, 2000, [&] {
            return kes_compact_signature<6> { csig }.verify(0, csk.vk(), msg) ? 1 : 0;
        });
        benchmark_r("kes/sum6 keygen", 10.0, 20, [&] {
            kes::sum6 tmp { seed };
        });
        benchmark_r("kes/sum6 full evolution", 1.0, 2, [&] {
            kes::sum6 tmp { seed };
            for (size_t p = 0; p + 1 < kes::sum6::period_end; ++p)
                tmp.update();
        });
    };
};
