/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <pc/common/test.hpp>
#include <pc/array.hpp>

using namespace praos_crypto;

suite array_suite = [] {
    "array"_test = [] {
        "initialize empty"_test = [] {
            byte_array<4> a {};
            expect(a.size() == 4);
            for (auto v: a)
                expect(v == 0) << v;
        };

        "initialize"_test = [] {
            byte_array<4> a { 1, 2, 3, 4 };
            expect(a.size() == 4);
            expect(a[0] == 1);
            expect(a[1] == 2);
            expect(a[2] == 3);
            expect(a[3] == 4);
            expect(throws([] { byte_array<4> { 1, 2, 3 }; }));
        };

        "construct_buffer"_test = [] {
            const byte_array<4> b { 9, 8, 7, 6 };
            const byte_array<4> c { buffer { b } };
            expect(c[0] == 9);
            expect(c[3] == 6);
            const auto longer = uint8_vector::from_hex("0102030405");
            expect(throws([&] { byte_array<4> d { buffer { longer } }; }));
        };

        "construct_string_view"_test = [] {
            using namespace std::literals;
            byte_array<4> a { "\x01\x02\x03\x04"sv };
            expect(a[0] == 1);
            expect(a[3] == 4);
            expect(throws([] { byte_array<4> b { "\x01\x02"sv }; }));
        };

        "assign_buffer"_test = [] {
            byte_array<4> a { 1, 2, 3, 4 };
            const byte_array<4> b { 9, 8, 7, 6 };
            a = buffer { b };
            expect(a[0] == 9);
            expect(a[1] == 8);
            expect(a[2] == 7);
            expect(a[3] == 6);
            const auto shorter = uint8_vector::from_hex("01");
            expect(throws([&] { a = buffer { shorter }; }));
        };

        "from_hex"_test = [] {
            const auto data = byte_array<4>::from_hex("f0e1d2c3");
            expect(data[0] == 0xF0);
            expect(data[3] == 0xC3);
            expect(throws([] { byte_array<4>::from_hex("f0e1"); }));
            expect(throws([] { byte_array<4>::from_hex("f0e1d2zz"); }));
        };

        "uint8_t array can be formatted"_test = [] {
            auto data = byte_array<4>::from_hex("f0e1d2c3");
            expect(fmt::format("{}", data) == "F0E1D2C3");
        };

        "secure_clear"_test = [] {
            auto data = byte_array<4>::from_hex("DEADBEAF");
            secure_clear(data);
            test_same(byte_array<4>::from_hex("00000000"), data);
        };

        "secure_byte_array"_test = [] {
            const auto filled = secure_byte_array<4>::from_hex("DEADBEAF");
            secure_byte_array<4> copy { filled };
            test_same(static_cast<buffer>(filled), static_cast<buffer>(copy));
            expect(fmt::format("{}", copy) == "DEADBEAF");
        };
    };
};
