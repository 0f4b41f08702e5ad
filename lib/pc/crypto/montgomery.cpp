/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <pc/crypto/montgomery.hpp>

namespace praos_crypto::crypto::montgomery {
    const field_element &a()
    {
        static const auto v = field_element::from_uint(486662);
        return v;
    }

    const field_element &sqrt_am2()
    {
        static const auto v = field_element::from_bytes(field_element::encoding::from_hex("067e45ffaa046ecc821a7d4bd1d3a1c57e4ffc03dc087bd2bb06a060f4ed260f"));
        return v;
    }

    field_element rhs(const field_element &u)
    {
        const auto u2 = u.square();
        return u2 * u + a() * u2 + u;
    }

    std::optional<field_element> v_from_u(const field_element &u)
    {
        return rhs(u).sqrt();
    }

    field_element edwards_y(const field_element &u)
    {
        return (u - field_element::one()) * (u + field_element::one()).invert();
    }

    edwards_point to_edwards(const field_element &u, const field_element &v)
    {
        const auto u_plus_1 = u + field_element::one();
        // a single inversion covers both denominators
        const auto inv = (u_plus_1 * v).invert();
        if (inv.is_zero())
            return edwards_point::identity();
        const auto x = sqrt_am2() * u * inv * u_plus_1;
        const auto y = inv * v * (u - field_element::one());
        return edwards_point::from_affine(x, y);
    }
}
