/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_CONFIG_HPP
#define PRAOS_CRYPTO_CONFIG_HPP

#include <optional>
#include <pc/json.hpp>

namespace praos_crypto {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] const json::value *find(const std::string_view &name) const
        {
            const auto &obj = _json_impl();
            if (const auto it = obj.find(name); it != obj.end())
                return &it->value();
            return nullptr;
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }

        [[nodiscard]] const buffer bytes() const
        {
            return _bytes_impl();
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const =0;
        virtual const json::object &_json_impl() const =0;
        virtual const buffer _bytes_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json)
            : _json { std::move(json) }, _bytes { json::serialize(_json) }
        {
        }

        explicit config_json(const config &c): _json { c.json() }, _bytes { c.bytes() }
        {
        }
    private:
        const json::object _json;
        const uint8_vector _bytes;

        const json::value &_at_impl(const std::string_view &name) const override
        {
            const auto it = _json.find(name);
            if (it == _json.end())
                throw error(fmt::format("config does not have the requested {} element!", name));
            return it->value();
        }

        const json::object &_json_impl() const override
        {
            return _json;
        }

        const buffer _bytes_impl() const override
        {
            return _bytes;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        uint8_vector _raw;
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;

        const json::object &_json_impl() const override
        {
            return _parsed;
        }

        const buffer _bytes_impl() const override
        {
            return _raw;
        }
    };

    // Process-wide settings of the key-memory manager.
    // Loaded once from the JSON file named by the PC_CONFIG environment variable, if set.
    struct crypto_settings {
        bool require_lock = false;
        bool page_aligned = true;

        static crypto_settings from_config(const config &cfg);
        static crypto_settings get();
        static void set(const crypto_settings &s);
        static void reset();

        bool operator==(const crypto_settings &o) const =default;
    };
}

#endif // !PRAOS_CRYPTO_CONFIG_HPP
