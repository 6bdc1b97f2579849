/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "bytes.hpp"

namespace btcanchor {
    namespace {
        uint8_t nibble(const char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            throw error(fmt::format("an invalid hex character: '{}'", c));
        }
    }

    void init_from_hex(const std::span<uint8_t> out, const std::string_view hex)
    {
        if (hex.size() != out.size() * 2) [[unlikely]]
            throw error(fmt::format("expected {} hex characters but got {}", out.size() * 2, hex.size()));
        for (size_t i = 0; i < out.size(); ++i)
            out[i] = static_cast<uint8_t>(nibble(hex[2 * i]) << 4 | nibble(hex[2 * i + 1]));
    }

    std::string to_hex(const buffer bytes)
    {
        return fmt::format("{:x}", static_cast<std::span<const uint8_t>>(bytes));
    }

    void secure_clear(const std::span<uint8_t> store)
    {
        volatile uint8_t *p = store.data();
        for (size_t i = 0; i < store.size(); ++i)
            p[i] = 0;
    }
}
