/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

extern "C" {
#   include <sodium.h>
}
#include <pc/crypto/elligator2.hpp>
#include <pc/crypto/scalar.hpp>
#include <pc/ed25519.hpp>
#include <pc/logger.hpp>
#include <pc/sha2.hpp>
#include <pc/vrf.hpp>

namespace praos_crypto {
    using crypto::edwards_point;

    static_assert(sizeof(vrf_result) == crypto_hash_sha512_BYTES);
    static_assert(vrf_skey::static_size == ed25519::skey::static_size);
    static_assert(sizeof(vrf_vkey) == sizeof(ed25519::vkey));
    static_assert(vrf_seed::static_size == ed25519::seed::static_size);

    static constexpr uint8_t suite = 0x04;
    static constexpr std::string_view h2c_dst = "ECVRF_edwards25519_XMD:SHA-512_ELL2_NU_\x04";
    static constexpr size_t challenge_size = 16;

    void vrf_create(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk)
    {
        const auto sd = vrf_seed::random();
        vrf_create_from_seed(sk, vk, sd);
    }

    std::pair<vrf_skey, vrf_vkey> vrf_create()
    {
        vrf_skey sk {};
        vrf_vkey vk {};
        vrf_create(sk, vk);
        return std::make_pair(std::move(sk), vk);
    }

    // Identical to the Ed25519 key derivation: vk = clamp(SHA512(seed)[0..32]) * B
    void vrf_create_from_seed(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk, const buffer &seed)
    {
        if (sk.size() != vrf_skey::static_size)
            throw error(fmt::format("skey must be {} bytes but got {}!", vrf_skey::static_size, sk.size()));
        if (vk.size() != sizeof(vrf_vkey))
            throw error(fmt::format("vkey must be {} bytes but got {}!", sizeof(vrf_vkey), vk.size()));
        if (seed.size() != vrf_seed::static_size)
            throw error(fmt::format("seed must be {} bytes but got {}!", vrf_seed::static_size, seed.size()));
        ed25519::create_from_seed(sk, vk, seed);
        logger::debug("created a VRF key pair with vkey {}", buffer { vk });
    }

    std::pair<vrf_skey, vrf_vkey> vrf_create_from_seed(const buffer &seed)
    {
        vrf_skey sk {};
        vrf_vkey vk {};
        vrf_create_from_seed(sk, vk, seed);
        return std::make_pair(std::move(sk), vk);
    }

    void vrf_extract_vk(const std::span<uint8_t> &vk, const buffer &sk)
    {
        if (vk.size() != sizeof(vrf_vkey))
            throw error(fmt::format("vkey must be {} bytes but got {}!", sizeof(vrf_vkey), vk.size()));
        if (sk.size() != vrf_skey::static_size)
            throw error(fmt::format("skey must be {} bytes but got {}!", vrf_skey::static_size, sk.size()));
        span_memcpy(vk, sk.subbuf(vrf_seed::static_size));
    }

    vrf_vkey vrf_extract_vk(const buffer &sk)
    {
        vrf_vkey vk {};
        vrf_extract_vk(vk, sk);
        return vk;
    }

    vrf_seed vrf_skey_to_seed(const buffer &sk)
    {
        if (sk.size() != vrf_skey::static_size)
            throw error(fmt::format("skey must be {} bytes but got {}!", vrf_skey::static_size, sk.size()));
        return vrf_seed { sk.subbuf(0, vrf_seed::static_size) };
    }

    cpp_int vrf_output_to_nat(const buffer &result)
    {
        if (result.size() != sizeof(vrf_result))
            throw error(fmt::format("result must be {} bytes but got {}!", sizeof(vrf_result), result.size()));
        return big_uint_from_bytes(result);
    }

    namespace {
        // The expanded signing key: the clamped secret scalar followed by the nonce prefix
        struct expanded_key {
            secure_byte_array<64> az {};
            vrf_vkey vk {};

            explicit expanded_key(const buffer &sk)
            {
                if (sk.size() != vrf_skey::static_size) [[unlikely]]
                    throw error(fmt::format("skey must be {} bytes but got {}!", vrf_skey::static_size, sk.size()));
                vk = sk.subbuf(vrf_seed::static_size);
                if (!edwards_point::from_bytes(vk)) [[unlikely]]
                    throw error(fmt::format("the signing key contains an invalid verification key {}!", vk));
                sha2::digest_512(az, sk.subbuf(0, vrf_seed::static_size));
                crypto::scalar::clamp(std::span<uint8_t> { az.data(), 32 });
            }

            [[nodiscard]] buffer x() const
            {
                return { az.data(), 32 };
            }

            [[nodiscard]] buffer nonce_prefix() const
            {
                return { az.data() + 32, 32 };
            }
        };

        // The proving steps shared by both variants
        struct proof_parts {
            edwards_point::encoding h;
            edwards_point::encoding gamma;
            edwards_point::encoding kb;
            edwards_point::encoding kh;
            crypto::scalar::value k;
        };

        proof_parts make_proof_parts(const expanded_key &key, const edwards_point &h)
        {
            proof_parts res {};
            res.h = h.to_bytes();
            res.gamma = h.mul(key.x()).to_bytes();
            secure_byte_array<64> k_wide {};
            sha2::hasher_512 {}.update(key.nonce_prefix()).update(res.h).finalize(k_wide);
            res.k = crypto::scalar::reduce(k_wide);
            res.kb = edwards_point::mul_base(res.k).to_bytes();
            res.kh = h.mul(res.k).to_bytes();
            return res;
        }

        // The first 16 bytes of the hash zero-extended to a 32-byte scalar
        byte_array<32> challenge_scalar(const sha2::hash_512 &digest)
        {
            byte_array<32> c {};
            memcpy(c.data(), digest.data(), challenge_size);
            return c;
        }

        std::optional<edwards_point> decode_vkey(const buffer &vk)
        {
            auto y = edwards_point::from_bytes(vk);
            if (!y || y->has_small_order())
                return {};
            return y;
        }

        vrf_result gamma_to_hash(const buffer &gamma_bytes, const bool trailer)
        {
            const auto gamma = edwards_point::from_bytes(gamma_bytes);
            if (!gamma) [[unlikely]]
                throw error(fmt::format("the proof contains an invalid Gamma point {}!", gamma_bytes));
            sha2::hasher_512 hasher {};
            hasher.update(byte_array<2> { suite, 0x03 }).update(gamma->mul_by_cofactor().to_bytes());
            if (trailer)
                hasher.update(byte_array<1> { 0x00 });
            return hasher.finalize();
        }

        void check_proof_size(const buffer &proof, const size_t expected)
        {
            if (proof.size() != expected) [[unlikely]]
                throw error(fmt::format("proof must be {} bytes but got {}!", expected, proof.size()));
        }

        void check_vkey_size(const buffer &vk)
        {
            if (vk.size() != sizeof(vrf_vkey)) [[unlikely]]
                throw error(fmt::format("vkey must be {} bytes but got {}!", sizeof(vrf_vkey), vk.size()));
        }

        edwards_point hash_to_curve_03(const buffer &vk, const buffer &msg)
        {
            const auto digest = sha2::hasher_512 {}.update(byte_array<2> { suite, 0x01 }).update(vk).update(msg).finalize();
            byte_array<32> r {};
            memcpy(r.data(), digest.data(), r.size());
            r[31] &= 0x7F;
            return crypto::elligator2::from_uniform(r);
        }

        sha2::hash_512 challenge_hash_03(const buffer &h, const buffer &gamma, const buffer &u, const buffer &v)
        {
            return sha2::hasher_512 {}.update(byte_array<2> { suite, 0x02 }).update(h).update(gamma).update(u).update(v).finalize();
        }

        edwards_point hash_to_curve_13(const buffer &vk, const buffer &msg)
        {
            uint8_vector h2c_msg {};
            h2c_msg << vk << msg;
            return crypto::elligator2::hash_to_curve(h2c_msg, h2c_dst);
        }

        sha2::hash_512 challenge_hash_13(const buffer &vk, const buffer &h, const buffer &gamma, const buffer &u, const buffer &v)
        {
            return sha2::hasher_512 {}.update(byte_array<2> { suite, 0x02 })
                .update(vk).update(h).update(gamma).update(u).update(v)
                .update(byte_array<1> { 0x00 }).finalize();
        }
    }

    void vrf03::prove(const std::span<uint8_t> &proof, const buffer &sk, const buffer &msg)
    {
        check_proof_size(proof, proof_size);
        const expanded_key key { sk };
        const auto h = hash_to_curve_03(key.vk, msg);
        const auto parts = make_proof_parts(key, h);
        const auto c = challenge_scalar(challenge_hash_03(parts.h, parts.gamma, parts.kb, parts.kh));
        const auto s = crypto::scalar::mul_add(c, key.x(), parts.k);
        memcpy(proof.data(), parts.gamma.data(), parts.gamma.size());
        memcpy(proof.data() + 32, c.data(), challenge_size);
        memcpy(proof.data() + 48, s.data(), s.size());
    }

    vrf03::proof vrf03::prove(const buffer &sk, const buffer &msg)
    {
        proof res {};
        prove(res, sk, msg);
        return res;
    }

    std::optional<vrf_result> vrf03::verify(const buffer &vk, const buffer &proof, const buffer &msg)
    {
        check_vkey_size(vk);
        check_proof_size(proof, proof_size);
        const auto y = decode_vkey(vk);
        if (!y)
            return {};
        const auto gamma_bytes = proof.subbuf(0, 32);
        const auto gamma = edwards_point::from_bytes(gamma_bytes);
        if (!gamma)
            return {};
        byte_array<32> c {};
        memcpy(c.data(), proof.data() + 32, challenge_size);
        const auto s = proof.subbuf(48, 32);
        if (!crypto::scalar::is_canonical(s))
            return {};
        const auto h = hash_to_curve_03(vk, msg);
        const auto u = edwards_point::mul_base(s) - y->mul(c);
        const auto v = h.mul(s) - gamma->mul(c);
        const auto c_exp = challenge_hash_03(h.to_bytes(), gamma_bytes, u.to_bytes(), v.to_bytes());
        if (crypto_verify_16(c_exp.data(), c.data()) != 0)
            return {};
        return proof_to_hash(proof);
    }

    vrf_result vrf03::proof_to_hash(const buffer &proof)
    {
        check_proof_size(proof, proof_size);
        return gamma_to_hash(proof.subbuf(0, 32), false);
    }

    void vrf13::prove(const std::span<uint8_t> &proof, const buffer &sk, const buffer &msg)
    {
        check_proof_size(proof, proof_size);
        const expanded_key key { sk };
        const auto h = hash_to_curve_13(key.vk, msg);
        const auto parts = make_proof_parts(key, h);
        const auto c = challenge_scalar(challenge_hash_13(key.vk, parts.h, parts.gamma, parts.kb, parts.kh));
        const auto s = crypto::scalar::mul_add(c, key.x(), parts.k);
        memcpy(proof.data(), parts.gamma.data(), parts.gamma.size());
        memcpy(proof.data() + 32, parts.kb.data(), parts.kb.size());
        memcpy(proof.data() + 64, parts.kh.data(), parts.kh.size());
        memcpy(proof.data() + 96, s.data(), s.size());
    }

    vrf13::proof vrf13::prove(const buffer &sk, const buffer &msg)
    {
        proof res {};
        prove(res, sk, msg);
        return res;
    }

    std::optional<vrf_result> vrf13::verify(const buffer &vk, const buffer &proof, const buffer &msg)
    {
        check_vkey_size(vk);
        check_proof_size(proof, proof_size);
        const auto y = decode_vkey(vk);
        if (!y)
            return {};
        const auto gamma_bytes = proof.subbuf(0, 32);
        const auto kb_bytes = proof.subbuf(32, 32);
        const auto kh_bytes = proof.subbuf(64, 32);
        const auto gamma = edwards_point::from_bytes(gamma_bytes);
        const auto kb = edwards_point::from_bytes(kb_bytes);
        const auto kh = edwards_point::from_bytes(kh_bytes);
        if (!gamma || !kb || !kh)
            return {};
        const auto s = proof.subbuf(96, 32);
        if (!crypto::scalar::is_canonical(s))
            return {};
        const auto h = hash_to_curve_13(vk, msg);
        const auto c = challenge_scalar(challenge_hash_13(vk, h.to_bytes(), gamma_bytes, kb_bytes, kh_bytes));
        const bool u_ok = edwards_point::mul_base(s) - y->mul(c) == *kb;
        const bool v_ok = h.mul(s) - gamma->mul(c) == *kh;
        if (!(u_ok & v_ok))
            return {};
        return proof_to_hash(proof);
    }

    vrf_result vrf13::proof_to_hash(const buffer &proof)
    {
        check_proof_size(proof, proof_size);
        return gamma_to_hash(proof.subbuf(0, 32), true);
    }
}
