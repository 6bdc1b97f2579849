#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <compare>
#include <string>
#include "network.hpp"
#include "script.hpp"

namespace btcanchor::btc {
    // A native segwit v0 address
    struct address_t {
        network_t network = network_t::testnet;
        uint8_t version = 0;
        uint8_vector program {};

        static address_t p2wsh(network_t net, const crypto::sha256::hash_t &script_hash);
        // throws err_invalid_address_t, the network is inferred from the human-readable part
        static address_t from_string(std::string_view addr);

        [[nodiscard]] std::string to_string() const;
        [[nodiscard]] script_t script_pubkey() const;
        // tells if an output script pays this address
        [[nodiscard]] bool paid_by(buffer script_pubkey) const;

        std::strong_ordering operator<=>(const address_t &o) const = default;
        bool operator==(const address_t &o) const = default;
    };

    // a redeem script bound to the address it derives
    struct multisig_t {
        redeem_script_t redeem_script;
        address_t address;

        bool operator==(const multisig_t &o) const = default;
    };

    // Pure: the same keys, quorum and network always give the same script and address
    extern multisig_t derive_multisig(std::vector<public_key_t> keys, size_t quorum, network_t net);
}

namespace fmt {
    template<>
    struct formatter<btcanchor::btc::address_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const btcanchor::btc::address_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}
