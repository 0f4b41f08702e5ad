/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_BIG_INT_HPP
#define PRAOS_CRYPTO_BIG_INT_HPP

#include <sstream>
#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <pc/common/format.hpp>
#include <pc/common/bytes.hpp>

namespace praos_crypto {
    using boost::multiprecision::cpp_int;

    static constexpr size_t big_int_max_size = 8192;

    inline size_t msb_size(const cpp_int &val)
    {
        return val == 0 ? 0 : boost::multiprecision::msb(val) / 8 + 1;
    }

    // big-endian
    inline cpp_int big_uint_from_bytes(const buffer data)
    {
        if (data.size() > big_int_max_size)
            throw error(fmt::format("big ints larger than {} bytes are not supported but got: {}!", big_int_max_size, data.size()));
        cpp_int val = 0;
        for (const uint8_t &b: data) {
            val *= 256;
            val += b;
        }
        return val;
    }

    inline cpp_int big_uint_from_bytes_le(const buffer data)
    {
        if (data.size() > big_int_max_size)
            throw error(fmt::format("big ints larger than {} bytes are not supported but got: {}!", big_int_max_size, data.size()));
        cpp_int val = 0;
        for (auto it = data.rbegin(); it != data.rend(); ++it) {
            val *= 256;
            val += *it;
        }
        return val;
    }

    inline void big_uint_to_bytes_le(const std::span<uint8_t> out, const cpp_int &val)
    {
        if (val < 0 || msb_size(val) > out.size())
            throw error(fmt::format("value does not fit into {} bytes", out.size()));
        auto tmp = val;
        for (auto &b: out) {
            const cpp_int low = tmp & 0xFF;
            b = static_cast<uint8_t>(low);
            tmp >>= 8;
        }
    }
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif // !PRAOS_CRYPTO_BIG_INT_HPP
