#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <filesystem>
#include <string>
#include <string_view>
#include "bytes.hpp"

namespace btcanchor::file {
    extern std::string install_path(std::string_view rel_path);
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, buffer data);

    struct tmp {
        explicit tmp(const std::string_view name):
            _path { (std::filesystem::temp_directory_path() / name).string() }
        {
        }

        tmp(const tmp &) = delete;

        ~tmp()
        {
            std::error_code ec {};
            std::filesystem::remove(_path, ec);
        }

        [[nodiscard]] const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}
