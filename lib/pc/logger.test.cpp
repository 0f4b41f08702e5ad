/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <pc/logger.hpp>
#include <pc/common/test.hpp>

using namespace praos_crypto;

suite logger_suite = [] {
    "logger"_test = [] {
        "api"_test = [] {
            // checks that the code compiles and does not fail
            logger::trace("OK - trace");
            logger::trace("OK - {}", "trace");
            logger::debug("OK - debug");
            logger::debug("OK - {}", "debug");
            logger::info("OK - info");
            logger::info("OK - {}", "info");
            logger::warn("OK - warn");
            logger::warn("OK - {}", "warn");
            expect(true);
        };
        "last_error"_test = [] {
            logger::reset_last_error();
            expect(!logger::last_error());
            logger::error("OK - {}", "error");
            const auto last = logger::last_error();
            expect(static_cast<bool>(last));
            if (last)
                test_same(std::string { "OK - error" }, *last);
            logger::reset_last_error();
            expect(!logger::last_error());
        };
        "run_and_log_errors"_test = [] {
            const auto ex1 = logger::run_log_errors([] {});
            expect(!ex1);
            const auto ex2 = logger::run_log_errors([] { throw error("Something bad!"); });
            expect(static_cast<bool>(ex2));
            const auto ex3 = logger::run_log_errors([] { throw std::runtime_error("Something else!"); });
            expect(static_cast<bool>(ex3));
        };
        "cleanup"_test = [] {
            size_t cleanups = 0;
            logger::run_log_errors([] {}, [&] { ++cleanups; });
            logger::run_log_errors([] { throw error("Something bad!"); }, [&] { ++cleanups; });
            expect(cleanups == 2);
        };
        "run_log_errors_and_rethrow"_test = [] {
            expect(nothrow([] { logger::run_log_errors_rethrow([] {}); }));
            expect(throws<error>([] { logger::run_log_errors_rethrow([] { throw error("Something bad!"); }); }));
        };
    };
};
