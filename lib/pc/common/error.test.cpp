/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cerrno>
#include <cstring>
#include <optional>
#include <source_location>
#include <pc/array.hpp>
#include <pc/common/error.hpp>
#include <pc/common/test.hpp>

using namespace praos_crypto;

namespace {
    template<typename E=error, typename F>
    void expect_throws_msg(const F &f, const std::initializer_list<std::string> &matches, const std::source_location &src_loc=std::source_location::current())
    {
        expect(boost::ut::throws<E>(f)) << "no exception has been thrown";
        std::optional<std::string> msg {};
        try {
            f();
        } catch (const E &ex) {
            msg = ex.what();
        }
        expect(static_cast<bool>(msg)) << "exception message is empty";
        if (msg) {
            for (const auto &match: matches) {
                expect(msg->find(match) != msg->npos) << fmt::format("'{}' does not contain '{}' from {}:{}", *msg, match, src_loc.file_name(), src_loc.line());
            }
        }
    }
}

suite error_suite = [] {
    "error"_test = [] {
        "no_args"_test = [] {
            expect_throws_msg([] { throw error("Hello!"); }, { "Hello!" });
        };
        "formatted"_test = [] {
            expect_throws_msg([] { throw error(fmt::format("Hello {}!", 123)); }, { "Hello 123!" });
        };
        "buffer"_test = [] {
            const auto buf = byte_array<4>::from_hex("DEADBEEF");
            expect_throws_msg([&] { throw error(fmt::format("Hello {}!", buf)); }, { "Hello DEADBEEF!" });
        };
        "caused_by"_test = [] {
            const std::runtime_error cause { "disk is full" };
            expect_throws_msg([&] { throw error("write failed", cause); }, { "write failed", "disk is full" });
        };
        "error_sys"_test = [] {
            expect_throws_msg<error_sys>([] { errno = 2; throw error_sys("Hello world!"); }, { "Hello world!", "errno: 2", "No such file or directory" });
        };
        "error_sys code"_test = [] {
            errno = ENOMEM;
            const error_sys err { "allocation failed" };
            errno = 0;
            test_same(ENOMEM, err.code());
            expect(std::string_view { err.what() }.find(std::strerror(ENOMEM)) != std::string_view::npos);
        };
        "stacktrace"_test = [] {
            const error err { "traced" };
            expect(!err.stacktrace().empty());
        };
        "hierarchy"_test = [] {
            expect(throws<base_error>([] { throw error_sys("failure"); }));
            expect(throws<std::exception>([] { throw error("failure"); }));
        };
        "what is stable"_test = [] {
            const error err { "repeated call" };
            const std::string first { err.what() };
            const std::string second { err.what() };
            test_same(first, second);
            test_same(std::string { "repeated call" }, first);
        };
    };
};
