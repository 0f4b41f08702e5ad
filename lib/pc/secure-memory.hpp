/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_SECURE_MEMORY_HPP
#define PRAOS_CRYPTO_SECURE_MEMORY_HPP

#include <cstdint>
#include <span>
#include <pc/common/error.hpp>
#include <pc/common/bytes.hpp>
#include <pc/util.hpp>

namespace praos_crypto::secure_memory {
    struct lock_error: error_sys {
        using error_sys::error_sys;
    };

    struct metrics {
        uint64_t allocations = 0;
        uint64_t allocation_bytes = 0;
        uint64_t failed_locks = 0;
        uint64_t zeroizations = 0;

        bool operator==(const metrics &o) const =default;
    };

    extern metrics snapshot();
    extern size_t page_size();
    extern void random_fill(std::span<uint8_t> out);

    // A heap block for secret material. It is locked in RAM when the OS permits and
    // is always wiped before it is returned to the allocator.
    struct region {
        explicit region(size_t size);
        region(region &&o) noexcept;
        region(const region &) =delete;
        ~region();

        region &operator=(region &&o);
        region &operator=(const region &) =delete;

        void release();

        [[nodiscard]] uint8_t *data() noexcept
        {
            return _ptr;
        }

        [[nodiscard]] const uint8_t *data() const noexcept
        {
            return _ptr;
        }

        [[nodiscard]] size_t size() const noexcept
        {
            return _size;
        }

        [[nodiscard]] size_t capacity() const noexcept
        {
            return _capacity;
        }

        [[nodiscard]] bool locked() const noexcept
        {
            return _locked;
        }
    private:
        uint8_t *_ptr = nullptr;
        size_t _size = 0;
        size_t _capacity = 0;
        bool _locked = false;
    };

    template<size_t SZ>
    struct array {
        static constexpr size_t static_size = SZ;

        static array<SZ> random()
        {
            array<SZ> res {};
            random_fill(res);
            return res;
        }

        static array<SZ> from_hex(const std::string_view hex)
        {
            array<SZ> res {};
            init_from_hex(res, hex);
            return res;
        }

        array(): _region { SZ }
        {
        }

        array(const buffer bytes): _region { SZ }
        {
            span_memcpy(*this, bytes);
        }

        array(const array<SZ> &o): _region { SZ }
        {
            span_memcpy(*this, o);
        }

        array(array<SZ> &&o) noexcept =default;

        array<SZ> &operator=(const array<SZ> &o)
        {
            if (&o != this) {
                if (!_region.data())
                    _region = region { SZ };
                span_memcpy(*this, o);
            }
            return *this;
        }

        array<SZ> &operator=(array<SZ> &&o) =default;

        // wipes the secret and returns the memory; the object is empty afterwards
        void release()
        {
            _region.release();
        }

        [[nodiscard]] bool empty() const noexcept
        {
            return _region.data() == nullptr;
        }

        [[nodiscard]] uint8_t *data() noexcept
        {
            return _region.data();
        }

        [[nodiscard]] const uint8_t *data() const noexcept
        {
            return _region.data();
        }

        [[nodiscard]] size_t size() const noexcept
        {
            return _region.size();
        }

        [[nodiscard]] bool locked() const noexcept
        {
            return _region.locked();
        }

        uint8_t &operator[](const size_t idx)
        {
            return _region.data()[idx];
        }

        uint8_t operator[](const size_t idx) const
        {
            return _region.data()[idx];
        }

        operator buffer() const noexcept
        {
            return { _region.data(), _region.size() };
        }

        operator std::span<uint8_t>() noexcept
        {
            return { _region.data(), _region.size() };
        }

        bool operator==(const array<SZ> &o) const
        {
            return static_cast<buffer>(*this) == static_cast<buffer>(o);
        }
    private:
        region _region;
    };
}

#endif // !PRAOS_CRYPTO_SECURE_MEMORY_HPP
