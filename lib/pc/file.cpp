/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdio>
#include <filesystem>
#include <memory>
#include <pc/file.hpp>

namespace praos_crypto::file {
    struct file_closer {
        void operator()(std::FILE *f) const
        {
            std::fclose(f);
        }
    };
    using file_ptr = std::unique_ptr<std::FILE, file_closer>;

    void read(const std::string &path, uint8_vector &buf)
    {
        file_ptr f { std::fopen(path.c_str(), "rb") };
        if (!f)
            throw error_sys(fmt::format("failed to open file {} for reading", path));
        std::error_code ec {};
        const auto sz = std::filesystem::file_size(path, ec);
        if (ec)
            throw error(fmt::format("failed to determine the size of {}: {}", path, ec.message()));
        buf.resize(sz);
        if (sz > 0 && std::fread(buf.data(), 1, buf.size(), f.get()) != buf.size())
            throw error_sys(fmt::format("failed to read {} bytes from {}", sz, path));
    }

    void write(const std::string &path, const buffer &data)
    {
        file_ptr f { std::fopen(path.c_str(), "wb") };
        if (!f)
            throw error_sys(fmt::format("failed to open file {} for writing", path));
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f.get()) != data.size())
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
        if (std::fclose(f.release()) != 0)
            throw error_sys(fmt::format("failed to close {}", path));
    }
}
