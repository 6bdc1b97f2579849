/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "errors.hpp"
#include "scheduler.hpp"

namespace btcanchor::anchoring {
    bool is_anchoring_point(const height_t height, const uint64_t frequency)
    {
        if (!frequency) [[unlikely]]
            throw err_zero_frequency_t {};
        return height % frequency == 0;
    }

    std::optional<height_t> next_target(const anchoring_state_t &state, const height_t height, const std::optional<height_t> latest_anchored)
    {
        const auto target = std::visit([&](const auto &st) {
            using T = std::decay_t<decltype(st)>;
            if constexpr (std::is_same_v<T, actual_t>) {
                return st.configuration.latest_anchoring_height(height);
            } else {
                return st.following_since;
            }
        }, static_cast<const anchoring_state_base_t &>(state));
        if (latest_anchored && *latest_anchored >= target)
            return {};
        return target;
    }
}
