#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <fmt/format.h>

namespace btcanchor {
    // formats with a format string known only at runtime, e.g. the one passed to the logger
    template<typename... Args>
    std::string format(const std::string_view fmt_str, Args&&... a)
    {
        return fmt::format(fmt::runtime(fmt_str), std::forward<Args>(a)...);
    }
}

namespace fmt {
    // byte sequences are printed in hex: uppercase with {}, lowercase with {:x}
    template<>
    struct formatter<std::span<const uint8_t>> {
        bool lowercase = false;

        constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin())
        {
            auto it = ctx.begin();
            if (it != ctx.end() && *it == 'x') {
                lowercase = true;
                ++it;
            }
            if (it != ctx.end() && *it != '}')
                throw format_error("invalid format specifier for a byte sequence");
            return it;
        }

        template<typename FormatContext>
        auto format(const std::span<const uint8_t> &data, FormatContext &ctx) const -> decltype(ctx.out())
        {
            static constexpr std::string_view upper_digits { "0123456789ABCDEF" };
            static constexpr std::string_view lower_digits { "0123456789abcdef" };
            const auto &digits = lowercase ? lower_digits : upper_digits;
            auto out_it = ctx.out();
            for (const uint8_t v: data) {
                *out_it++ = digits[v >> 4];
                *out_it++ = digits[v & 0xF];
            }
            return out_it;
        }
    };

    template<>
    struct formatter<std::span<uint8_t>>: formatter<std::span<const uint8_t>> {
    };

    template<typename T>
    struct formatter<std::optional<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::optional<T> &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "none");
        }
    };
}
