/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <pc/crypto/edwards.hpp>

namespace praos_crypto::crypto {
    const edwards_point &edwards_point::base()
    {
        static const auto b = [] {
            const auto p = from_bytes(encoding::from_hex("5866666666666666666666666666666666666666666666666666666666666666"));
            if (!p)
                throw error("failed to decode the base point!");
            return *p;
        }();
        return b;
    }

    edwards_point edwards_point::from_affine(const field_element &x, const field_element &y) noexcept
    {
        return edwards_point { x, y, field_element::one(), x * y };
    }

    std::optional<edwards_point> edwards_point::from_bytes(const buffer &bytes)
    {
        if (bytes.size() != sizeof(encoding)) [[unlikely]]
            throw error(fmt::format("a point must be encoded with {} bytes but got {}", sizeof(encoding), bytes.size()));
        encoding y_bytes = bytes;
        const bool x_sign = y_bytes[31] >> 7;
        y_bytes[31] &= 0x7F;
        const auto y = field_element::from_bytes(y_bytes);
        if (y.to_bytes() != y_bytes)
            return {};
        const auto one = field_element::one();
        const auto y2 = y.square();
        const auto u = y2 - one;
        const auto v = field_element::edwards_d() * y2 + one;
        const auto v3 = v.square() * v;
        // x = u * v^3 * (u * v^7)^((p-5)/8)
        auto x = (v3.square() * v * u).pow22523() * v3 * u;
        const auto vxx = v * x.square();
        if (!(vxx == u)) {
            if (!(vxx == -u))
                return {};
            x = x * field_element::sqrt_m1();
        }
        if (x.is_zero() && x_sign)
            return {};
        if (x.is_negative() != x_sign)
            x = -x;
        return from_affine(x, y);
    }

    edwards_point edwards_point::select(const edwards_point &a, const edwards_point &b, const bool choose_b) noexcept
    {
        return edwards_point {
            field_element::select(a._x, b._x, choose_b),
            field_element::select(a._y, b._y, choose_b),
            field_element::select(a._z, b._z, choose_b),
            field_element::select(a._t, b._t, choose_b)
        };
    }

    edwards_point edwards_point::mul_base(const buffer &scalar)
    {
        return base().mul(scalar);
    }

    edwards_point::encoding edwards_point::to_bytes() const noexcept
    {
        const auto z_inv = _z.invert();
        const auto x = _x * z_inv;
        const auto y = _y * z_inv;
        auto enc = y.to_bytes();
        enc[31] |= static_cast<uint8_t>(x.is_negative()) << 7;
        return enc;
    }

    edwards_point edwards_point::operator+(const edwards_point &o) const noexcept
    {
        const auto a = (_y - _x) * (o._y - o._x);
        const auto b = (_y + _x) * (o._y + o._x);
        const auto c = _t * field_element::edwards_d2() * o._t;
        const auto d = _z * o._z;
        const auto d2 = d + d;
        const auto e = b - a;
        const auto f = d2 - c;
        const auto g = d2 + c;
        const auto h = b + a;
        return edwards_point { e * f, g * h, f * g, e * h };
    }

    edwards_point edwards_point::operator-() const noexcept
    {
        return edwards_point { -_x, _y, _z, -_t };
    }

    edwards_point edwards_point::operator-(const edwards_point &o) const noexcept
    {
        return *this + (-o);
    }

    edwards_point edwards_point::dbl() const noexcept
    {
        const auto a = _x.square();
        const auto b = _y.square();
        const auto z2 = _z.square();
        const auto c = z2 + z2;
        // the curve constant a = -1
        const auto d = -a;
        const auto e = (_x + _y).square() - a - b;
        const auto g = d + b;
        const auto f = g - c;
        const auto h = d - b;
        return edwards_point { e * f, g * h, f * g, e * h };
    }

    edwards_point edwards_point::mul_by_cofactor() const noexcept
    {
        return dbl().dbl().dbl();
    }

    edwards_point edwards_point::mul(const buffer &scalar) const
    {
        if (scalar.size() != 32) [[unlikely]]
            throw error(fmt::format("a scalar must have 32 bytes but got {}", scalar.size()));
        auto q = identity();
        for (size_t i = 256; i > 0; --i) {
            const size_t bit_no = i - 1;
            const bool bit = (scalar[bit_no / 8] >> (bit_no % 8)) & 1;
            q = q.dbl();
            q = select(q, q + *this, bit);
        }
        return q;
    }

    bool edwards_point::is_identity() const noexcept
    {
        return _x.is_zero() && _y == _z;
    }

    bool edwards_point::has_small_order() const noexcept
    {
        return mul_by_cofactor().is_identity();
    }

    bool edwards_point::operator==(const edwards_point &o) const noexcept
    {
        return _x * o._z == o._x * _z && _y * o._z == o._y * _z;
    }
}
