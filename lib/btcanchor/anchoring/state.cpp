/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/common/logger.hpp>
#include "errors.hpp"
#include "state.hpp"

namespace btcanchor::anchoring {
    const config_t &anchoring_state_t::actual_configuration() const
    {
        return std::visit([](const auto &st) -> const config_t & {
            using T = std::decay_t<decltype(st)>;
            if constexpr (std::is_same_v<T, actual_t>) {
                return st.configuration;
            } else {
                return st.actual_configuration;
            }
        }, static_cast<const base_type &>(*this));
    }

    const config_t &anchoring_state_t::output_configuration() const
    {
        return std::visit([](const auto &st) -> const config_t & {
            using T = std::decay_t<decltype(st)>;
            if constexpr (std::is_same_v<T, actual_t>) {
                return st.configuration;
            } else {
                return st.following_configuration;
            }
        }, static_cast<const base_type &>(*this));
    }

    btc::address_t anchoring_state_t::spending_address() const
    {
        return actual_configuration().address();
    }

    btc::address_t anchoring_state_t::output_address() const
    {
        return output_configuration().address();
    }

    anchoring_state_t project_state(const epoch_log_t &epochs, const height_t height, const std::optional<btc::transaction_t> &tip)
    {
        auto active_end = epochs.begin();
        while (active_end != epochs.end() && active_end->activation_height <= height)
            ++active_end;
        if (active_end == epochs.begin()) [[unlikely]]
            throw error(fmt::format("no configuration epoch is active at height {}", height));
        const auto &latest = *std::prev(active_end);
        if (!tip)
            return actual_t { latest.config };
        if (tip->outputs.empty()) [[unlikely]]
            throw err_ledger_corruption_t {};
        const auto &tip_script = tip->outputs[0].script_pubkey;
        for (auto it = active_end; it != epochs.begin();) {
            --it;
            if (!it->config.address().paid_by(tip_script))
                continue;
            if (it == std::prev(active_end))
                return actual_t { latest.config };
            return transition_t { it->config, latest.config, latest.activation_height };
        }
        logger::error("the anchoring chain tip {} pays an address unknown to all {} active configurations", tip->txid(), epochs.size());
        throw err_ledger_corruption_t {};
    }
}
