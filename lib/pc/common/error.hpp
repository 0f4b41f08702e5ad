/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_COMMON_ERROR_HPP
#define PRAOS_CRYPTO_COMMON_ERROR_HPP

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

namespace praos_crypto {
    // The root of the project's exceptions. The call stack is captured at construction
    // and is rendered only on request.
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
        [[nodiscard]] std::string stacktrace() const;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);
    };

    // An OS call failure. The errno value is taken at construction.
    struct error_sys: error {
        explicit error_sys(std::string_view msg);

        [[nodiscard]] int code() const noexcept
        {
            return _code;
        }
    private:
        int _code;

        error_sys(std::string_view msg, int code);
    };
}

#endif // !PRAOS_CRYPTO_COMMON_ERROR_HPP
