/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <typeinfo>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"
#include <pc/logger.hpp>

namespace praos_crypto {
    base_error::base_error(const std::string_view msg):
        _msg { msg }
    {
        // skips the frames of safe_dump_to and of the exception constructors
        boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
    }

    std::string base_error::stacktrace() const
    {
        std::array<char, 0x2000> buf {};
        // one byte is left outside of the stream's window to keep the string terminated
        boost::interprocess::obufferstream os { buf.data(), buf.size() - 1 };
        os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
        return { buf.data() };
    }

    const char *base_error::what() const noexcept
    {
        if (logger::tracing_enabled()) {
            try {
                logger::trace("{} at:\n{}", _msg, stacktrace());
            } catch (const std::exception &ex) {
                std::fputs(ex.what(), stderr);
            }
        }
        return _msg.c_str();
    }

    error::error(const std::string_view msg)
        : base_error { msg }
    {
    }

    error::error(const std::string_view msg, const std::exception &ex)
        : error { fmt::format("{} caused by {}: {}", msg, typeid(ex).name(), ex.what()) }
    {
    }

    error_sys::error_sys(const std::string_view msg)
        : error_sys { msg, errno }
    {
    }

    error_sys::error_sys(const std::string_view msg, const int code)
        : error { fmt::format("{} errno: {} strerror: {}", msg, code, std::strerror(code)) }, _code { code }
    {
    }
}
