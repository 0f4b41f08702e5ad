/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_KES_HPP
#define PRAOS_CRYPTO_KES_HPP

#include <optional>
#include <span>
#include <type_traits>
#include <pc/blake2b.hpp>
#include <pc/ed25519.hpp>
#include <pc/logger.hpp>
#include <pc/util.hpp>

namespace praos_crypto {
    using kes_vkey = ed25519::vkey;

    namespace kes {
        struct period_error: error {
            using error::error;
        };

        // signals that a key has already been evolved through all of its periods
        struct expired_error: period_error {
            using period_error::period_error;
        };

        using vkey = kes_vkey;
        using seed = ed25519::seed;

        constexpr size_t max_depth = 7;

        constexpr size_t total_periods(const size_t depth)
        {
            return size_t { 1 } << depth;
        }

        constexpr size_t vkey_size()
        {
            return sizeof(vkey);
        }

        constexpr size_t signature_size(const size_t depth, const bool compact=false)
        {
            if (compact)
                return sizeof(ed25519::signature) + sizeof(vkey) + depth * sizeof(vkey);
            return sizeof(ed25519::signature) + depth * 2 * sizeof(vkey);
        }

        // Blake2b-256 of the concatenation of the two child verification keys
        extern vkey hash_vkey_pair(const buffer &lhs, const buffer &rhs);

        template<typename H=blake2b_256_hash>
        H hash_vkey(const buffer &vk)
        {
            if (vk.size() != sizeof(vkey)) [[unlikely]]
                throw error(fmt::format("KES vkey must be of {} bytes but got {}!", sizeof(vkey), vk.size()));
            return blake2b<H>(vk);
        }

        struct split_seed {
            seed left;
            seed right;

            explicit split_seed(const buffer &sd);
        };

        inline void check_vkey_size(const buffer &vk)
        {
            if (vk.size() != sizeof(vkey)) [[unlikely]]
                throw error(fmt::format("KES vkey must be of {} bytes but got {}!", sizeof(vkey), vk.size()));
        }

        inline void check_period(const size_t period, const size_t period_end)
        {
            if (period >= period_end) [[unlikely]]
                throw error(fmt::format("KES period out of range: {} while the maximum is {}!", period, period_end - 1));
        }
    }

    // A view of a Sum KES signature: the signature of the active child followed by both child verification keys
    template <size_t DEPTH>
    struct kes_signature {
        static constexpr size_t period_max = kes::total_periods(DEPTH);
        static constexpr size_t period_split_point = period_max / 2;

        static constexpr size_t size()
        {
            return kes::signature_size(DEPTH);
        }

        explicit kes_signature(const buffer &bytes):
            _signature { _check_size(bytes).subbuf(0, kes_signature<DEPTH - 1>::size()) },
            _lhs_vk { bytes.subbuf(kes_signature<DEPTH - 1>::size(), sizeof(_lhs_vk)) },
            _rhs_vk { bytes.subbuf(kes_signature<DEPTH - 1>::size() + sizeof(_lhs_vk), sizeof(_rhs_vk)) }
        {
        }

        [[nodiscard]] bool verify(const size_t period, const buffer &vkey, const buffer &msg) const
        {
            kes::check_vkey_size(vkey);
            kes::check_period(period, period_max);
            if (span_memcmp(kes::hash_vkey_pair(_lhs_vk, _rhs_vk), vkey) != 0)
                return false;
            if (period < period_split_point)
                return _signature.verify(period, _lhs_vk, msg);
            return _signature.verify(period - period_split_point, _rhs_vk, msg);
        }
    private:
        kes_signature<DEPTH - 1> _signature;
        kes_vkey _lhs_vk;
        kes_vkey _rhs_vk;

        static const buffer &_check_size(const buffer &bytes)
        {
            if (bytes.size() != size()) [[unlikely]]
                throw error(fmt::format("KES signature of depth {} must have {} bytes but got {}!", DEPTH, size(), bytes.size()));
            return bytes;
        }
    };

    template <>
    struct kes_signature<0> {
        static constexpr size_t period_max = 1;

        static constexpr size_t size()
        {
            return kes::signature_size(0);
        }

        explicit kes_signature(const buffer &bytes): _signature { bytes }
        {
        }

        [[nodiscard]] bool verify(const size_t period, const buffer &vkey, const buffer &msg) const
        {
            kes::check_vkey_size(vkey);
            kes::check_period(period, period_max);
            return ed25519::verify(_signature, vkey, msg);
        }
    private:
        ed25519::signature _signature;
    };

    // A view of a CompactSum KES signature: the signature of the active child followed by the verification key
    // of the inactive one. The active key is reconstructed from the nested signature.
    template <size_t DEPTH>
    struct kes_compact_signature {
        static constexpr size_t period_max = kes::total_periods(DEPTH);
        static constexpr size_t period_split_point = period_max / 2;

        static constexpr size_t size()
        {
            return kes::signature_size(DEPTH, true);
        }

        explicit kes_compact_signature(const buffer &bytes):
            _signature { _check_size(bytes).subbuf(0, kes_compact_signature<DEPTH - 1>::size()) },
            _other_vk { bytes.subbuf(kes_compact_signature<DEPTH - 1>::size(), sizeof(_other_vk)) }
        {
        }

        // The verification key that this signature implies for the given period
        [[nodiscard]] kes_vkey vk(const size_t period) const
        {
            kes::check_period(period, period_max);
            if (period < period_split_point)
                return kes::hash_vkey_pair(_signature.vk(period), _other_vk);
            return kes::hash_vkey_pair(_other_vk, _signature.vk(period - period_split_point));
        }

        [[nodiscard]] bool verify(const size_t period, const buffer &vkey, const buffer &msg) const
        {
            kes::check_vkey_size(vkey);
            if (span_memcmp(vk(period), vkey) != 0)
                return false;
            return verify_leaf(msg);
        }

        [[nodiscard]] bool verify_leaf(const buffer &msg) const
        {
            return _signature.verify_leaf(msg);
        }
    private:
        kes_compact_signature<DEPTH - 1> _signature;
        kes_vkey _other_vk;

        static const buffer &_check_size(const buffer &bytes)
        {
            if (bytes.size() != size()) [[unlikely]]
                throw error(fmt::format("compact KES signature of depth {} must have {} bytes but got {}!", DEPTH, size(), bytes.size()));
            return bytes;
        }
    };

    template <>
    struct kes_compact_signature<0> {
        static constexpr size_t period_max = 1;

        static constexpr size_t size()
        {
            return kes::signature_size(0, true);
        }

        explicit kes_compact_signature(const buffer &bytes):
            _signature { _check_size(bytes).subbuf(0, sizeof(_signature)) },
            _vk { bytes.subbuf(sizeof(_signature), sizeof(_vk)) }
        {
        }

        [[nodiscard]] const kes_vkey &vk(const size_t period) const
        {
            kes::check_period(period, period_max);
            return _vk;
        }

        [[nodiscard]] bool verify(const size_t period, const buffer &vkey, const buffer &msg) const
        {
            kes::check_vkey_size(vkey);
            if (span_memcmp(vk(period), vkey) != 0)
                return false;
            return verify_leaf(msg);
        }

        [[nodiscard]] bool verify_leaf(const buffer &msg) const
        {
            return ed25519::verify(_signature, _vk, msg);
        }
    private:
        ed25519::signature _signature;
        kes_vkey _vk;

        static const buffer &_check_size(const buffer &bytes)
        {
            if (bytes.size() != size()) [[unlikely]]
                throw error(fmt::format("compact KES signature of depth 0 must have {} bytes but got {}!", size(), bytes.size()));
            return bytes;
        }
    };

    namespace kes {
        template<size_t DEPTH>
        using signature = kes_signature<DEPTH>;

        template<size_t DEPTH>
        using compact_signature = kes_compact_signature<DEPTH>;

        template<size_t DEPTH, bool COMPACT>
        using signature_view = std::conditional_t<COMPACT, kes_compact_signature<DEPTH>, kes_signature<DEPTH>>;

        // A signing key of the Sum composition: the active child, the seed of the right subtree
        // while it has not been activated, and the verification keys of both children.
        template <size_t DEPTH, bool COMPACT=false>
        struct secret {
            static_assert(DEPTH <= max_depth);
            static constexpr size_t depth = DEPTH;
            static constexpr size_t period_end = total_periods(DEPTH);
            static constexpr size_t period_split_point = period_end / 2;
            static constexpr size_t signature_size = signature_view<DEPTH, COMPACT>::size();
            using child_type = secret<DEPTH - 1, COMPACT>;
            using signature = byte_array<signature_size>;

            static bool verify(const buffer &vk, const size_t period, const buffer &sig, const buffer &msg)
            {
                return signature_view<DEPTH, COMPACT> { sig }.verify(period, vk, msg);
            }

            explicit secret(const buffer &sd): secret { split_seed { sd } }
            {
            }

            secret(secret &&) noexcept =default;
            secret(const secret &) =delete;
            secret &operator=(secret &&) =default;
            secret &operator=(const secret &) =delete;

            void sign(const std::span<uint8_t> &sig, const size_t period, const buffer &msg) const
            {
                if (sig.size() != signature_size) [[unlikely]]
                    throw error(fmt::format("KES signature of depth {} must have {} bytes but got {}!", DEPTH, signature_size, sig.size()));
                if (period != _period) [[unlikely]]
                    throw period_error(fmt::format("KES key of depth {} is at period {} and cannot sign for period {}!", DEPTH, _period, period));
                const auto child_period = _period < period_split_point ? _period : _period - period_split_point;
                _child.sign(sig.subspan(0, child_type::signature_size), child_period, msg);
                if constexpr (COMPACT) {
                    span_memcpy(sig.subspan(child_type::signature_size, sizeof(vkey)), _period < period_split_point ? _rhs_vk : _lhs_vk);
                } else {
                    span_memcpy(sig.subspan(child_type::signature_size, sizeof(vkey)), _lhs_vk);
                    span_memcpy(sig.subspan(child_type::signature_size + sizeof(vkey), sizeof(vkey)), _rhs_vk);
                }
            }

            [[nodiscard]] signature sign(const size_t period, const buffer &msg) const
            {
                signature sig;
                sign(sig, period, msg);
                return sig;
            }

            // Moves the key to the next period. The secrets of the previous period are wiped.
            void update()
            {
                if (_period + 1 >= period_end) [[unlikely]] {
                    logger::debug("a KES key of depth {} has expired at period {}", DEPTH, _period);
                    throw expired_error(fmt::format("KES key of depth {} cannot evolve past period {}!", DEPTH, _period));
                }
                if (_period + 1 == period_split_point) {
                    if (!_right_seed) [[unlikely]]
                        throw error(fmt::format("KES key of depth {} has no seed left for its right subtree!", DEPTH));
                    _child = child_type { *_right_seed };
                    _right_seed.reset();
                    logger::trace("a KES key of depth {} switched to its right subtree", DEPTH);
                } else {
                    _child.update();
                }
                ++_period;
            }

            // Wipes all secret material. The key cannot sign or evolve afterwards.
            void forget()
            {
                _child.forget();
                _right_seed.reset();
            }

            [[nodiscard]] const vkey &vk() const
            {
                return _vk;
            }

            [[nodiscard]] size_t period() const
            {
                return _period;
            }
        private:
            child_type _child;
            std::optional<seed> _right_seed;
            vkey _lhs_vk;
            vkey _rhs_vk;
            vkey _vk;
            size_t _period = 0;

            explicit secret(split_seed &&sd):
                _child { sd.left },
                _right_seed { std::move(sd.right) },
                _lhs_vk { _child.vk() },
                _rhs_vk { child_type { *_right_seed }.vk() },
                _vk { hash_vkey_pair(_lhs_vk, _rhs_vk) }
            {
            }
        };

        // A single-period key wrapping Ed25519. The compact variant appends its verification key to each signature.
        template <bool COMPACT>
        struct secret<0, COMPACT> {
            static constexpr size_t depth = 0;
            static constexpr size_t period_end = 1;
            static constexpr size_t signature_size = signature_view<0, COMPACT>::size();
            using signature = byte_array<signature_size>;

            static bool verify(const buffer &vk, const size_t period, const buffer &sig, const buffer &msg)
            {
                return signature_view<0, COMPACT> { sig }.verify(period, vk, msg);
            }

            explicit secret(const buffer &sd)
            {
                ed25519::create_from_seed(_sk, _vk, sd);
            }

            secret(secret &&) noexcept =default;
            secret(const secret &) =delete;
            secret &operator=(secret &&) =default;
            secret &operator=(const secret &) =delete;

            void sign(const std::span<uint8_t> &sig, const size_t period, const buffer &msg) const
            {
                if (sig.size() != signature_size) [[unlikely]]
                    throw error(fmt::format("KES signature of depth 0 must have {} bytes but got {}!", signature_size, sig.size()));
                if (period != 0) [[unlikely]]
                    throw period_error(fmt::format("KES key of depth 0 cannot sign for period {}!", period));
                if (_sk.empty()) [[unlikely]]
                    throw error("the KES signing key has been forgotten!");
                ed25519::sign(sig.subspan(0, sizeof(ed25519::signature)), msg, _sk);
                if constexpr (COMPACT)
                    span_memcpy(sig.subspan(sizeof(ed25519::signature), sizeof(vkey)), _vk);
            }

            [[nodiscard]] signature sign(const size_t period, const buffer &msg) const
            {
                signature sig;
                sign(sig, period, msg);
                return sig;
            }

            void update()
            {
                throw expired_error("KES key of depth 0 cannot be updated!");
            }

            void forget()
            {
                _sk.release();
            }

            [[nodiscard]] const vkey &vk() const
            {
                return _vk;
            }

            [[nodiscard]] size_t period() const
            {
                return 0;
            }
        private:
            ed25519::skey _sk {};
            vkey _vk {};
        };

        using single = secret<0>;
        using compact_single = secret<0, true>;

        template<size_t DEPTH>
        using sum = secret<DEPTH>;

        template<size_t DEPTH>
        using compact_sum = secret<DEPTH, true>;

        // The depth used by the Praos protocol: 64 periods
        using sum6 = sum<6>;
        using compact_sum6 = compact_sum<6>;
    }
}

#endif //!PRAOS_CRYPTO_KES_HPP
