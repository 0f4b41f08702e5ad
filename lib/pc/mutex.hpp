/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_MUTEX_HPP
#define PRAOS_CRYPTO_MUTEX_HPP

#include <mutex>
#include <new>

namespace praos_crypto::mutex {
#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Winterference-size"
#   endif
#endif
#   ifdef __cpp_lib_hardware_interference_size
        static const size_t alignment = std::hardware_destructive_interference_size;
#   else
        static const size_t alignment = 64;
#   endif
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

    using scoped_lock = std::scoped_lock<std::mutex>;
    using unique_lock = std::unique_lock<std::mutex>;
}

#endif // !PRAOS_CRYPTO_MUTEX_HPP
