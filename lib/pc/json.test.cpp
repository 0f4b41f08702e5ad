/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <filesystem>
#include <pc/common/test.hpp>
#include <pc/json.hpp>

using namespace praos_crypto;

suite json_suite = [] {
    "json"_test = [] {
        "parse"_test = [] {
            const auto j = json::parse(std::string_view { R"({"name": "abc", "version": 123, "flags": [true, false]})" });
            expect(j.at("name").as_string() == std::string_view { "abc" });
            expect(j.at("version").as_int64() == 123);
            expect(j.at("flags").as_array().size() == 2);
        };
        "invalid"_test = [] {
            expect(throws<error>([] { json::parse(std::string_view { R"({"name": )" }); }));
            expect(throws<error>([] { json::parse(std::string_view {}); }));
        };
        "load"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "pc-json-load-test.json").string();
            file::write(path, std::string_view { R"({"secure_memory": {"require_lock": true}})" });
            const auto j = json::load(path);
            expect(j.at("secure_memory").at("require_lock").as_bool());
            std::filesystem::remove(path);
        };
    };
};
