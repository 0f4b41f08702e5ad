/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_FILE_HPP
#define PRAOS_CRYPTO_FILE_HPP

#include <string>
#include <pc/common/bytes.hpp>

namespace praos_crypto::file {
    extern void read(const std::string &path, uint8_vector &buf);
    extern void write(const std::string &path, const buffer &data);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }
}

#endif // !PRAOS_CRYPTO_FILE_HPP
