#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <concepts>
#include <limits>
#include <utility>
#include "format.hpp"
#include "error.hpp"

namespace btcanchor {
    struct err_numeric_range_t: error {
        using error::error;
    };

    // Converts between integer types and throws when the value is not representable in the target type
    template<std::integral TO, std::integral FROM>
    constexpr TO numeric_cast(const FROM from)
    {
        if (!std::in_range<TO>(from)) [[unlikely]]
            throw err_numeric_range_t(fmt::format("{} is outside of the target range [{}, {}]",
                from, std::numeric_limits<TO>::min(), std::numeric_limits<TO>::max()));
        return static_cast<TO>(from);
    }
}
