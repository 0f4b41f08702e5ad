/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_CRYPTO_EDWARDS_HPP
#define PRAOS_CRYPTO_CRYPTO_EDWARDS_HPP

#include <optional>
#include <pc/crypto/field.hpp>

namespace praos_crypto::crypto {
    // A point of the twisted Edwards curve -x^2 + y^2 = 1 + d*x^2*y^2 in extended coordinates (X:Y:Z:T), x = X/Z, y = Y/Z, xy = T/Z
    struct edwards_point {
        using encoding = byte_array<32>;

        static edwards_point identity() noexcept
        {
            return edwards_point { field_element::zero(), field_element::one(), field_element::one(), field_element::zero() };
        }

        static const edwards_point &base();
        static edwards_point from_affine(const field_element &x, const field_element &y) noexcept;
        // Strict decoding: rejects non-canonical y, points off the curve, and x = 0 with the sign bit set
        static std::optional<edwards_point> from_bytes(const buffer &bytes);
        static edwards_point select(const edwards_point &a, const edwards_point &b, bool choose_b) noexcept;
        // The scalar is a 32-byte little-endian integer and is not required to be reduced
        static edwards_point mul_base(const buffer &scalar);

        edwards_point() =default;

        edwards_point(const field_element &x, const field_element &y, const field_element &z, const field_element &t) noexcept:
            _x { x }, _y { y }, _z { z }, _t { t }
        {
        }

        [[nodiscard]] encoding to_bytes() const noexcept;
        [[nodiscard]] edwards_point dbl() const noexcept;
        [[nodiscard]] edwards_point mul_by_cofactor() const noexcept;
        // The sequence of curve operations does not depend on the bits of the scalar
        [[nodiscard]] edwards_point mul(const buffer &scalar) const;
        [[nodiscard]] bool is_identity() const noexcept;
        [[nodiscard]] bool has_small_order() const noexcept;

        edwards_point operator+(const edwards_point &o) const noexcept;
        edwards_point operator-(const edwards_point &o) const noexcept;
        edwards_point operator-() const noexcept;
        bool operator==(const edwards_point &o) const noexcept;
    private:
        field_element _x {}, _y { field_element::one() }, _z { field_element::one() }, _t {};
    };
}

namespace fmt {
    template<>
    struct formatter<praos_crypto::crypto::edwards_point>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.to_bytes());
        }
    };
}

#endif // !PRAOS_CRYPTO_CRYPTO_EDWARDS_HPP
