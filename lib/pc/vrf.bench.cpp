/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <pc/benchmark.hpp>
#include <pc/vrf.hpp>

using namespace boost::ut;
using namespace praos_crypto;

suite vrf_bench_suite = [] {
    "vrf"_test = [] {
        const auto vkey = uint8_vector::from_hex("5ca0ed2b774adf3bae5e3e7da2f8ec877d9f063cc3d7050a6c49dfbbe2641dec");
        const auto proof = uint8_vector::from_hex("02180c447320b66012420971b70b448d11fead6d6e334c398f4daf01ccd92bfbcc4a8730a296ab33241f72da3c3a1fd53f1206a2b9f27ff6a5d9b8860fd955c39f55f9293ab58d1a2c18d555d2686101");
        const auto result = uint8_vector::from_hex("deb23fdc1267fa447fb087796544ce02b0580df8f1927450bed0df134ddc3548075ed48ffd72ae2a9ea65f79429cfbe2e15b625cb239ad0ec3910003765a8eb3");
        const auto msg = uint8_vector::from_hex("fc9f719740f900ee2809f6fdcf31bb6f096f0af133c604a27aaf85379c");
        benchmark_r("vrf/draft-03 verify", 200.0, 1000, [&] {
            return vrf_verify_result<vrf03>(result, vkey, proof, msg) ? 1 : 0;
        });
        const auto [sk, vk] = vrf_create_from_seed(vrf_seed::from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"));
        benchmark_r("vrf/draft-03 prove", 200.0, 1000, [&] {
            vrf03::prove(sk, msg);
        });
        const auto proof13 = vrf13::prove(sk, msg);
        benchmark_r("vrf/draft-13 prove", 200.0, 1000, [&] {
            vrf13::prove(sk, msg);
        });
        benchmark_r("vrf/draft-13 verify", 200.0, 1000, [&] {
            return vrf13::verify(vk, proof13, msg) ? 1 : 0;
        });
    };
};
