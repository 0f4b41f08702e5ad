/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdlib>
#include <pc/config.hpp>
#include <pc/logger.hpp>
#include <pc/mutex.hpp>

namespace praos_crypto {
    config_file::config_file(const std::string &path)
        : _raw { file::read(path) }, _parsed { json::parse(_raw).as_object() }
    {
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error(fmt::format("configuration file does not have the element {}!", name));
        return it->value();
    }

    static bool bool_setting(const json::object &obj, const std::string_view name, const bool def)
    {
        const auto it = obj.find(name);
        if (it == obj.end())
            return def;
        if (!it->value().is_bool())
            throw error(fmt::format("setting {} must be a boolean but got: {}", name, json::serialize(it->value())));
        return it->value().get_bool();
    }

    crypto_settings crypto_settings::from_config(const config &cfg)
    {
        crypto_settings s {};
        const auto *mem = cfg.find("secure_memory");
        if (!mem)
            return s;
        if (!mem->is_object())
            throw error(fmt::format("secure_memory setting must be an object but got: {}", json::serialize(*mem)));
        const auto &obj = mem->get_object();
        s.require_lock = bool_setting(obj, "require_lock", s.require_lock);
        s.page_aligned = bool_setting(obj, "page_aligned", s.page_aligned);
        return s;
    }

    alignas(mutex::alignment) static mutex::unique_lock::mutex_type settings_mutex {};
    static std::optional<crypto_settings> settings_current {};

    static crypto_settings load_settings()
    {
        const char *path = std::getenv("PC_CONFIG");
        if (!path)
            return {};
        logger::debug("loading crypto settings from {}", path);
        return crypto_settings::from_config(config_file { path });
    }

    crypto_settings crypto_settings::get()
    {
        mutex::scoped_lock lk { settings_mutex };
        if (!settings_current)
            settings_current.emplace(load_settings());
        return *settings_current;
    }

    void crypto_settings::set(const crypto_settings &s)
    {
        mutex::scoped_lock lk { settings_mutex };
        settings_current.emplace(s);
    }

    void crypto_settings::reset()
    {
        mutex::scoped_lock lk { settings_mutex };
        settings_current.reset();
    }
}
