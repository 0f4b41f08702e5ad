/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

extern "C" {
#   include <sodium.h>
};
#include <pc/ed25519.hpp>

namespace praos_crypto::ed25519 {
    static_assert(sizeof(vkey) == crypto_sign_PUBLICKEYBYTES);
    static_assert(skey::static_size == crypto_sign_SECRETKEYBYTES);
    static_assert(sizeof(signature) == crypto_sign_BYTES);
    static_assert(seed::static_size == crypto_sign_SEEDBYTES);

    struct sodium_initializer {
        sodium_initializer() {
            if (sodium_init() == -1)
                throw error("Failed to initialize libsodium!");
        }
    };

    void ensure_initialized()
    {
        // will be initialized on the first call, after that do nothing
        static sodium_initializer init {};
    }

    void create(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk)
    {
        if (sk.size() != skey::static_size)
            throw error(fmt::format("private key must have {} bytes but got: {}!", skey::static_size, sk.size()));
        if (vk.size() != sizeof(vkey))
            throw error(fmt::format("verification key must have {} bytes but got: {}!", sizeof(vkey), vk.size()));
        ensure_initialized();
        if (crypto_sign_keypair(vk.data(), sk.data()) != 0)
            throw error("failed to generate a cryptographic key pair!");
    }

    std::pair<skey, vkey> create()
    {
        skey sk {};
        vkey vk {};
        create(sk, vk);
        return std::make_pair(std::move(sk), vk);
    }

    void create_from_seed(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk, const buffer &sd)
    {
        if (sk.size() != skey::static_size)
            throw error(fmt::format("private key must have {} bytes but got: {}!", skey::static_size, sk.size()));
        if (vk.size() != sizeof(vkey))
            throw error(fmt::format("verification key must have {} bytes but got: {}!", sizeof(vkey), vk.size()));
        if (sd.size() != seed::static_size)
            throw error(fmt::format("seed must have {} bytes but got: {}!", seed::static_size, sd.size()));
        ensure_initialized();
        if (crypto_sign_seed_keypair(vk.data(), sk.data(), sd.data()) != 0)
            throw error("failed to generate a cryptographic key pair!");
    }

    std::pair<skey, vkey> create_from_seed(const buffer &seed)
    {
        skey sk {};
        vkey vk {};
        create_from_seed(sk, vk, seed);
        return std::make_pair(std::move(sk), vk);
    }

    void extract_vk(const std::span<uint8_t> &vk, const buffer &sk)
    {
        if (sk.size() != skey::static_size)
            throw error(fmt::format("private key must have {} bytes but got: {}!", skey::static_size, sk.size()));
        if (vk.size() != sizeof(vkey))
            throw error(fmt::format("verification key must have {} bytes but got: {}!", sizeof(vkey), vk.size()));
        if (crypto_sign_ed25519_sk_to_pk(vk.data(), sk.data()) != 0)
            throw error("failed to extract the verification key from a secret key!");
    }

    vkey extract_vk(const buffer &sk)
    {
        vkey vk {};
        extract_vk(vk, sk);
        return vk;
    }

    void sign(const std::span<uint8_t> &sig, const buffer &msg, const buffer &sk)
    {
        if (sk.size() != skey::static_size)
            throw error(fmt::format("private key must have {} bytes but got: {}!", skey::static_size, sk.size()));
        if (sig.size() != sizeof(signature))
            throw error(fmt::format("signature buffer must have {} bytes but got: {}!", sizeof(signature), sig.size()));
        ensure_initialized();
        if (crypto_sign_detached(sig.data(), nullptr, msg.data(), msg.size(), sk.data()) != 0)
            throw error("failed to cryptographically sign a message!");
    }

    signature sign(const buffer &msg, const buffer &sk)
    {
        signature sig {};
        sign(sig, msg, sk);
        return sig;
    }

    bool verify(const buffer &sig, const buffer &vk, const buffer &msg)
    {
        if (sig.size() != sizeof(signature))
            throw error(fmt::format("signature must have {} bytes but got: {}!", sizeof(signature), sig.size()));
        if (vk.size() != sizeof(vkey))
            throw error(fmt::format("public key must have {} bytes but got: {}!", sizeof(vkey), vk.size()));
        ensure_initialized();
        return crypto_sign_verify_detached(sig.data(), msg.data(), msg.size(), vk.data()) == 0;
    }
}
