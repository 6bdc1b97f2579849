#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include "state.hpp"

namespace btcanchor::anchoring {
    // whether the block at the height is an anchoring point, a query for hosts and monitoring
    // throws err_zero_frequency_t
    extern bool is_anchoring_point(height_t height, uint64_t frequency);

    // The ledger height the next chain transaction must anchor or nullopt when nothing is due.
    // In a transition the transfer transaction anchors the activation height of the following configuration.
    extern std::optional<height_t> next_target(const anchoring_state_t &state, height_t height, std::optional<height_t> latest_anchored);
}
