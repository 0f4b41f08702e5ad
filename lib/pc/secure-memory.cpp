/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

extern "C" {
#   include <sodium.h>
}
#include <atomic>
#include <cstdlib>
#include <unistd.h>
#include <pc/config.hpp>
#include <pc/ed25519.hpp>
#include <pc/logger.hpp>
#include <pc/secure-memory.hpp>

namespace praos_crypto::secure_memory {
    static std::atomic_uint64_t num_allocations { 0 };
    static std::atomic_uint64_t num_allocation_bytes { 0 };
    static std::atomic_uint64_t num_failed_locks { 0 };
    static std::atomic_uint64_t num_zeroizations { 0 };

    metrics snapshot()
    {
        return {
            num_allocations.load(std::memory_order_relaxed),
            num_allocation_bytes.load(std::memory_order_relaxed),
            num_failed_locks.load(std::memory_order_relaxed),
            num_zeroizations.load(std::memory_order_relaxed)
        };
    }

    size_t page_size()
    {
        static const size_t sz = [] {
            const auto res = sysconf(_SC_PAGESIZE);
            if (res <= 0)
                throw error_sys("failed to determine the memory page size");
            return static_cast<size_t>(res);
        }();
        return sz;
    }

    void random_fill(const std::span<uint8_t> out)
    {
        ed25519::ensure_initialized();
        randombytes_buf(out.data(), out.size());
    }

    region::region(const size_t size): _size { size }
    {
        if (!size)
            return;
        const auto settings = crypto_settings::get();
        if (settings.page_aligned) {
            const auto psz = page_size();
            _capacity = (size + psz - 1) / psz * psz;
            _ptr = static_cast<uint8_t *>(std::aligned_alloc(psz, _capacity));
        } else {
            _capacity = size;
            _ptr = static_cast<uint8_t *>(std::malloc(_capacity));
        }
        if (!_ptr) [[unlikely]]
            throw error_sys(fmt::format("failed to allocate {} bytes of secure memory", _capacity));
        sodium_memzero(_ptr, _capacity);
        num_allocations.fetch_add(1, std::memory_order_relaxed);
        num_allocation_bytes.fetch_add(_capacity, std::memory_order_relaxed);
        if (sodium_mlock(_ptr, _capacity) == 0) [[likely]] {
            _locked = true;
            return;
        }
        num_failed_locks.fetch_add(1, std::memory_order_relaxed);
        if (settings.require_lock) {
            lock_error err { fmt::format("failed to lock {} bytes of secure memory", _capacity) };
            std::free(_ptr);
            _ptr = nullptr;
            throw err;
        }
        logger::warn("failed to lock {} bytes of secure memory in RAM; secrets may be swapped to disk", _capacity);
    }

    region::region(region &&o) noexcept:
        _ptr { o._ptr }, _size { o._size }, _capacity { o._capacity }, _locked { o._locked }
    {
        o._ptr = nullptr;
        o._size = 0;
        o._capacity = 0;
        o._locked = false;
    }

    region::~region()
    {
        release();
    }

    region &region::operator=(region &&o)
    {
        if (&o != this) {
            release();
            _ptr = o._ptr;
            _size = o._size;
            _capacity = o._capacity;
            _locked = o._locked;
            o._ptr = nullptr;
            o._size = 0;
            o._capacity = 0;
            o._locked = false;
        }
        return *this;
    }

    void region::release()
    {
        if (!_ptr)
            return;
        sodium_memzero(_ptr, _capacity);
        num_zeroizations.fetch_add(1, std::memory_order_relaxed);
        if (_locked && sodium_munlock(_ptr, _capacity) != 0)
            logger::error("failed to unlock {} bytes of secure memory", _capacity);
        std::free(_ptr);
        _ptr = nullptr;
        _size = 0;
        _capacity = 0;
        _locked = false;
    }
}
