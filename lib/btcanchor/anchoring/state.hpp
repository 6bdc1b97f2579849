#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <variant>
#include "config.hpp"

namespace btcanchor::anchoring {
    struct config_epoch_t {
        height_t activation_height = 0;
        config_t config {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("activation_height"sv, activation_height);
            archive.process("config"sv, config);
        }

        bool operator==(const config_epoch_t &o) const = default;
    };
    // strictly increasing in the activation height, the first epoch activates at the genesis
    using epoch_log_t = sequence_t<config_epoch_t>;

    struct actual_t {
        config_t configuration {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("configuration"sv, configuration);
        }

        bool operator==(const actual_t &o) const = default;
    };

    // the chain still pays an address of an older configuration
    struct transition_t {
        config_t actual_configuration {};
        config_t following_configuration {};
        height_t following_since = 0;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("actual_configuration"sv, actual_configuration);
            archive.process("following_configuration"sv, following_configuration);
            archive.process("following_since"sv, following_since);
        }

        bool operator==(const transition_t &o) const = default;
    };

    using anchoring_state_base_t = std::variant<actual_t, transition_t>;

    struct anchoring_state_t: anchoring_state_base_t {
        using base_type = anchoring_state_base_t;
        using base_type::base_type;

        [[nodiscard]] bool is_transition() const noexcept
        {
            return std::holds_alternative<transition_t>(*this);
        }

        // the configuration whose keys spend the chain tip
        [[nodiscard]] const config_t &actual_configuration() const;
        // the configuration whose address receives the next chain output
        [[nodiscard]] const config_t &output_configuration() const;
        [[nodiscard]] btc::address_t spending_address() const;
        [[nodiscard]] btc::address_t output_address() const;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            static codec::variant_names_t<base_type> names {
                "actual"sv,
                "transition"sv
            };
            archive.template process_variant<base_type>(*this, names);
        }
    };

    // Projects the state from the epochs active at the height and the chain tip.
    // Throws err_ledger_corruption_t when the tip pays an address no active epoch derives.
    extern anchoring_state_t project_state(const epoch_log_t &epochs, height_t height, const std::optional<btc::transaction_t> &tip);
}
