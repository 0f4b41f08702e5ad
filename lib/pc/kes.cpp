/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <pc/kes.hpp>

namespace praos_crypto::kes {
    static_assert(signature_size(0) == sizeof(ed25519::signature));
    static_assert(signature_size(0, true) == sizeof(ed25519::signature) + sizeof(vkey));
    static_assert(secret<6>::signature_size == 448);
    static_assert(secret<6, true>::signature_size == 288);

    vkey hash_vkey_pair(const buffer &lhs, const buffer &rhs)
    {
        check_vkey_size(lhs);
        check_vkey_size(rhs);
        byte_array<sizeof(vkey) * 2> data;
        memcpy(data.data(), lhs.data(), lhs.size());
        memcpy(data.data() + lhs.size(), rhs.data(), rhs.size());
        return blake2b<vkey>(data);
    }

    split_seed::split_seed(const buffer &sd)
    {
        if (sd.size() != seed::static_size)
            throw error(fmt::format("seed buffer must be of {} bytes but got {}!", seed::static_size, sd.size()));
        secure_byte_array<1 + seed::static_size> tmp;
        memcpy(tmp.data() + 1, sd.data(), sd.size());
        tmp[0] = 0x01;
        blake2b(left, tmp);
        tmp[0] = 0x02;
        blake2b(right, tmp);
    }
}
