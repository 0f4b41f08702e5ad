/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_VRF_HPP
#define PRAOS_CRYPTO_VRF_HPP

#include <concepts>
#include <optional>
#include <string_view>
#include <pc/array.hpp>
#include <pc/big-int.hpp>
#include <pc/common/bytes.hpp>
#include <pc/secure-memory.hpp>

namespace praos_crypto {
    using vrf_result = byte_array<64>;
    using vrf_skey = secure_memory::array<64>;
    using vrf_vkey = byte_array<32>;
    using vrf_seed = secure_memory::array<32>;

    // A signing key is the 32-byte seed followed by the 32-byte verification key.
    // The key layout is shared by both VRF variants.
    extern void vrf_create(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk);
    extern std::pair<vrf_skey, vrf_vkey> vrf_create();
    extern void vrf_create_from_seed(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk, const buffer &seed);
    extern std::pair<vrf_skey, vrf_vkey> vrf_create_from_seed(const buffer &seed);
    extern void vrf_extract_vk(const std::span<uint8_t> &vk, const buffer &sk);
    extern vrf_vkey vrf_extract_vk(const buffer &sk);
    extern vrf_seed vrf_skey_to_seed(const buffer &sk);
    // The output read as a big-endian natural number
    extern cpp_int vrf_output_to_nat(const buffer &result);

    // ECVRF-EDWARDS25519-SHA512-Elligator2 as specified by draft-irtf-cfrg-vrf-03
    struct vrf03 {
        static constexpr std::string_view name = "ietfdraft03";
        static constexpr size_t proof_size = 80;
        using proof = byte_array<proof_size>;

        static void prove(const std::span<uint8_t> &proof, const buffer &sk, const buffer &msg);
        static proof prove(const buffer &sk, const buffer &msg);
        // Malformed proofs and keys fail the verification; only wrong input sizes throw
        static std::optional<vrf_result> verify(const buffer &vk, const buffer &proof, const buffer &msg);
        static vrf_result proof_to_hash(const buffer &proof);
    };

    // ECVRF-EDWARDS25519-SHA512-ELL2 of draft-irtf-cfrg-vrf-13 with the batch-compatible proof layout
    struct vrf13 {
        static constexpr std::string_view name = "ietfdraft13";
        static constexpr size_t proof_size = 128;
        using proof = byte_array<proof_size>;

        static void prove(const std::span<uint8_t> &proof, const buffer &sk, const buffer &msg);
        static proof prove(const buffer &sk, const buffer &msg);
        static std::optional<vrf_result> verify(const buffer &vk, const buffer &proof, const buffer &msg);
        static vrf_result proof_to_hash(const buffer &proof);
    };

    template<typename T>
    concept vrf_algorithm = requires(const buffer &b) {
        typename T::proof;
        { T::name } -> std::convertible_to<std::string_view>;
        { T::proof_size } -> std::convertible_to<size_t>;
        { T::prove(b, b) } -> std::same_as<typename T::proof>;
        { T::verify(b, b, b) } -> std::same_as<std::optional<vrf_result>>;
        { T::proof_to_hash(b) } -> std::same_as<vrf_result>;
    };

    static_assert(vrf_algorithm<vrf03>);
    static_assert(vrf_algorithm<vrf13>);

    template<vrf_algorithm T>
    bool vrf_verify_result(const buffer &exp_res, const buffer &vk, const buffer &proof, const buffer &msg)
    {
        if (exp_res.size() != sizeof(vrf_result)) [[unlikely]]
            throw error(fmt::format("result must be {} bytes but got {}!", sizeof(vrf_result), exp_res.size()));
        const auto res = T::verify(vk, proof, msg);
        return res && static_cast<buffer>(*res) == exp_res;
    }
}

#endif //!PRAOS_CRYPTO_VRF_HPP
