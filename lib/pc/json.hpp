/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_JSON_HPP
#define PRAOS_CRYPTO_JSON_HPP

#include <boost/json.hpp>
#include <pc/common/bytes.hpp>
#include <pc/file.hpp>

namespace praos_crypto::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        boost::system::error_code ec {};
        auto val = boost::json::parse(buf.string_view(), ec, sp);
        if (ec)
            throw praos_crypto::error(fmt::format("invalid json: {}", ec.message()));
        return val;
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }
}

#endif // !PRAOS_CRYPTO_JSON_HPP
