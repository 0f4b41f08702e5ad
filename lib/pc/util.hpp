/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_UTIL_HPP
#define PRAOS_CRYPTO_UTIL_HPP

#include <cstring>
#include <source_location>
#include <span>
#include <pc/common/error.hpp>
#include <pc/common/bytes.hpp>

namespace praos_crypto {
    inline void span_memcpy(const std::span<uint8_t> &dst, const buffer &src, const std::source_location &loc=std::source_location::current())
    {
        if (dst.size() != src.size()) [[unlikely]]
            throw error(fmt::format("expected src span to be of {} bytes but got {} in file {}, line {}!",
                dst.size(), src.size(), loc.file_name(), loc.line()));
        if (!dst.empty())
            memcpy(dst.data(), src.data(), dst.size());
    }

    inline int span_memcmp(const buffer &dst, const buffer &src, const std::source_location &loc=std::source_location::current())
    {
        if (dst.size() != src.size()) [[unlikely]]
            throw error(fmt::format("expected src span to be of {} bytes but got {} in file {}, line {}!",
                dst.size(), src.size(), loc.file_name(), loc.line()));
        return dst.empty() ? 0 : memcmp(dst.data(), src.data(), dst.size());
    }
}

#endif // !PRAOS_CRYPTO_UTIL_HPP
