/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_CRYPTO_MONTGOMERY_HPP
#define PRAOS_CRYPTO_CRYPTO_MONTGOMERY_HPP

#include <pc/crypto/edwards.hpp>

// Curve25519 in Montgomery form: v^2 = u^3 + A*u^2 + u
namespace praos_crypto::crypto::montgomery {
    extern const field_element &a();
    // sqrt(-(A + 2)), the scaling factor of the birational map to the Edwards form
    extern const field_element &sqrt_am2();
    extern field_element rhs(const field_element &u);
    // Either of the two v coordinates of the point with the given u, if the point exists
    extern std::optional<field_element> v_from_u(const field_element &u);
    // The Edwards y coordinate: (u - 1) / (u + 1)
    extern field_element edwards_y(const field_element &u);
    // Maps (u, v) to (sqrt(-(A+2)) * u / v, (u - 1) / (u + 1)), sending the exceptional inputs to the identity
    extern edwards_point to_edwards(const field_element &u, const field_element &v);
}

#endif // !PRAOS_CRYPTO_CRYPTO_MONTGOMERY_HPP
