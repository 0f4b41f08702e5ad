/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_CRYPTO_FIELD_HPP
#define PRAOS_CRYPTO_CRYPTO_FIELD_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <pc/array.hpp>
#include <pc/common/bytes.hpp>

namespace praos_crypto::crypto {
    // An element of GF(2^255 - 19) stored as five 51-bit limbs.
    // Between operations the limbs are only loosely reduced; to_bytes always produces the canonical value.
    struct field_element {
        using limbs_type = std::array<uint64_t, 5>;
        using encoding = byte_array<32>;

        static field_element zero() noexcept
        {
            return {};
        }

        static field_element one() noexcept
        {
            return field_element { limbs_type { 1, 0, 0, 0, 0 } };
        }

        static field_element from_uint(uint64_t v) noexcept;
        // Reads 32 little-endian bytes ignoring the top bit. Values in [p, 2^255) are accepted and reduced.
        static field_element from_bytes(const buffer &bytes);
        static field_element select(const field_element &a, const field_element &b, bool choose_b) noexcept;

        static const field_element &sqrt_m1();
        static const field_element &edwards_d();
        static const field_element &edwards_d2();

        field_element() =default;

        explicit field_element(const limbs_type &limbs) noexcept: _limbs { limbs }
        {
        }

        [[nodiscard]] encoding to_bytes() const noexcept;
        void to_bytes(const std::span<uint8_t> &out) const;
        [[nodiscard]] bool is_zero() const noexcept;
        // The least significant bit of the canonical encoding
        [[nodiscard]] bool is_negative() const noexcept;
        // Zero counts as a square
        [[nodiscard]] bool is_square() const noexcept;

        [[nodiscard]] field_element square() const noexcept;
        [[nodiscard]] field_element pow2k(size_t k) const noexcept;
        // Returns zero for zero
        [[nodiscard]] field_element invert() const noexcept;
        // this^((p-5)/8)
        [[nodiscard]] field_element pow22523() const noexcept;
        [[nodiscard]] std::optional<field_element> sqrt() const noexcept;

        field_element operator+(const field_element &o) const noexcept;
        field_element operator-(const field_element &o) const noexcept;
        field_element operator-() const noexcept;
        field_element operator*(const field_element &o) const noexcept;
        bool operator==(const field_element &o) const noexcept;
    private:
        limbs_type _limbs {};
    };
}

namespace fmt {
    template<>
    struct formatter<praos_crypto::crypto::field_element>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.to_bytes());
        }
    };
}

#endif // !PRAOS_CRYPTO_CRYPTO_FIELD_HPP
