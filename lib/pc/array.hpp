/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_ARRAY_HPP
#define PRAOS_CRYPTO_ARRAY_HPP

#include <array>
#include <cstring>
#include <initializer_list>
#include <span>
#include <pc/common/error.hpp>
#include <pc/common/format.hpp>
#include <pc/common/bytes.hpp>

namespace praos_crypto {
    template<size_t SZ>
    struct
#   ifndef _MSC_VER
        __attribute__((packed))
#   endif
    byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;
        using base_type::base_type;

        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data;
            init_from_hex(data, hex);
            return data;
        }

        byte_array() =default;

        byte_array(const std::initializer_list<uint8_t> s) {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("span must be of size {} but got {}", SZ, s.size()));
            size_t i = 0;
            for (const auto b: s)
                *(base_type::data() + i++) = b;
        }

        byte_array(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("buffer must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), std::data(s), SZ);
        }

        byte_array(const std::string_view s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("string_view must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), std::data(s), SZ);
        }

        byte_array &operator=(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("buffer must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), std::data(s), SZ);
            return *this;
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }

        explicit operator std::string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(base_type::data()), base_type::size() };
        }
    };

    // overwrites the memory in a way that the compiler is not allowed to optimize away
    extern void secure_clear(std::span<uint8_t> store);

    template<size_t SZ>
    struct secure_byte_array: byte_array<SZ>
    {
        using byte_array<SZ>::byte_array;

        static secure_byte_array<SZ> from_hex(const std::string_view &hex)
        {
            secure_byte_array<SZ> data;
            init_from_hex(data, hex);
            return data;
        }

        secure_byte_array() =default;
        secure_byte_array(const secure_byte_array<SZ> &) =default;
        secure_byte_array<SZ> &operator=(const secure_byte_array<SZ> &) =default;

        ~secure_byte_array()
        {
            secure_clear(*this);
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<praos_crypto::byte_array<SZ>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", std::span<const uint8_t>(v));
        }
    };

    template<size_t SZ>
    struct formatter<praos_crypto::secure_byte_array<SZ>>: formatter<praos_crypto::byte_array<SZ>> {
    };
}

#endif // !PRAOS_CRYPTO_ARRAY_HPP
