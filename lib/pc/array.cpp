/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

extern "C" {
#   include <sodium.h>
}
#include <pc/array.hpp>

namespace praos_crypto {
    void secure_clear(const std::span<uint8_t> store)
    {
        sodium_memzero(store.data(), store.size());
    }
}
