/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_ED25519_HPP
#define PRAOS_CRYPTO_ED25519_HPP

#include <pc/array.hpp>
#include <pc/secure-memory.hpp>
#include <pc/util.hpp>

namespace praos_crypto::ed25519 {
    using vkey = byte_array<32>;
    using skey = secure_memory::array<64>;
    using signature = byte_array<64>;
    using seed = secure_memory::array<32>;

    extern void ensure_initialized();
    extern void create(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk);
    extern std::pair<skey, vkey> create();
    extern void create_from_seed(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk, const buffer &sd);
    extern std::pair<skey, vkey> create_from_seed(const buffer &seed);
    extern void extract_vk(const std::span<uint8_t> &vk, const buffer &sk);
    extern vkey extract_vk(const buffer &sk);
    extern void sign(const std::span<uint8_t> &sig, const buffer &msg, const buffer &sk);
    extern signature sign(const buffer &msg, const buffer &sk);
    extern bool verify(const buffer &sig, const buffer &vk, const buffer &msg);
}

#endif // !PRAOS_CRYPTO_ED25519_HPP
