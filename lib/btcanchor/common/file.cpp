/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cerrno>
#include <cstdio>
#include <memory>
#include "file.hpp"

namespace btcanchor::file {
    std::string install_path(const std::string_view rel_path)
    {
        // provide a dummy implementation at the moment
        return fmt::format("./{}", rel_path);
    }

    uint8_vector read(const std::string &path)
    {
        std::unique_ptr<FILE, decltype(&std::fclose)> f { std::fopen(path.c_str(), "rb"), &std::fclose };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} for reading", path), errno);
        uint8_vector res {};
        std::array<uint8_t, 0x4000> chunk {};
        for (;;) {
            const auto num_read = std::fread(chunk.data(), 1, chunk.size(), f.get());
            res << buffer { chunk.data(), num_read };
            if (num_read < chunk.size()) {
                if (std::ferror(f.get())) [[unlikely]]
                    throw error_sys(fmt::format("failed to read from {}", path), errno);
                break;
            }
        }
        return res;
    }

    void write(const std::string &path, const buffer data)
    {
        const auto parent = std::filesystem::path { path }.parent_path();
        if (!parent.empty())
            std::filesystem::create_directories(parent);
        std::unique_ptr<FILE, decltype(&std::fclose)> f { std::fopen(path.c_str(), "wb"), &std::fclose };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} for writing", path), errno);
        if (std::fwrite(data.data(), 1, data.size(), f.get()) != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path), errno);
    }
}
