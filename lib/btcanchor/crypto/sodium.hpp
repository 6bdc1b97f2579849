#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <span>
#include <string_view>
#include <btcanchor/common/error.hpp>
#include <btcanchor/common/format.hpp>

namespace btcanchor::crypto::sodium
{
    extern "C" {
#       include <sodium.h>
    }

    // sodium_init is idempotent but every entry point of the crypto module calls this first
    extern void ensure_initialized();

    inline void check(const int rc, const std::string_view op)
    {
        if (rc != 0) [[unlikely]]
            throw error(fmt::format("libsodium: {} failed with code {}", op, rc));
    }

    extern void random_bytes(std::span<uint8_t> out);
}
