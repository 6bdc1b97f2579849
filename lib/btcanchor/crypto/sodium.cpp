/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "sodium.hpp"

namespace btcanchor::crypto::sodium {
    void ensure_initialized()
    {
        // 0 on the first initialization, 1 when already initialized
        static const int rc = sodium_init();
        if (rc < 0) [[unlikely]]
            throw error(fmt::format("libsodium: initialization failed with code {}", rc));
    }

    void random_bytes(const std::span<uint8_t> out)
    {
        ensure_initialized();
        randombytes_buf(out.data(), out.size());
    }
}
