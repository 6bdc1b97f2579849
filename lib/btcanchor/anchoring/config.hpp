#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <string>
#include <btcanchor/btc/address.hpp>
#include <btcanchor/btc/transaction.hpp>
#include <btcanchor/codec/types.hpp>

namespace btcanchor::anchoring {
    using height_t = uint64_t;
    using validator_key_t = byte_array_t<sizeof(btc::public_key_t)>;

    // floor(2n/3) + 1, the number of signatures that finalize a transaction
    inline size_t majority_count(const size_t num_validators) noexcept
    {
        return num_validators * 2 / 3 + 1;
    }

    // The global anchoring configuration of one configuration epoch
    struct config_t {
        static constexpr btc::amount_t default_fee = 1000;
        static constexpr uint64_t default_frequency = 500;
        static constexpr uint64_t default_utxo_confirmations = 5;

        sequence_t<validator_key_t> validators {};
        std::optional<btc::transaction_t> funding {};
        btc::amount_t fee = default_fee;
        uint64_t frequency = default_frequency;
        uint64_t utxo_confirmations = default_utxo_confirmations;
        btc::network_t network = btc::network_t::testnet;

        // a bootstrap configuration with a single validator and no funding transaction
        static config_t make(btc::network_t net, const btc::public_key_t &public_key);
        static config_t make_with_funding_tx(btc::network_t net, const std::vector<btc::public_key_t> &validators, btc::transaction_t funding_tx);
        static config_t load(const std::string &path);

        [[nodiscard]] size_t majority_count() const noexcept
        {
            return anchoring::majority_count(validators.size());
        }

        [[nodiscard]] height_t latest_anchoring_height(height_t height) const;
        // throws err_missing_funding_transaction_t
        [[nodiscard]] const btc::transaction_t &funding_tx() const;
        [[nodiscard]] std::vector<btc::public_key_t> public_keys() const;
        [[nodiscard]] btc::multisig_t redeem_script() const;
        [[nodiscard]] btc::address_t address() const;
        // throws one of the config_error_t errors
        void validate() const;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("validators"sv, validators);
            archive.process("funding_tx"sv, funding);
            archive.process("fee"sv, fee);
            archive.process("frequency"sv, frequency);
            archive.process("utxo_confirmations"sv, utxo_confirmations);
            std::string net { btc::to_string(network) };
            archive.process("network"sv, net);
            network = btc::network_from_string(net);
        }

        bool operator==(const config_t &o) const = default;
    };

    struct private_key_t: crypto::secp256k1::skey_t {
        using base_type = crypto::secp256k1::skey_t;
        using base_type::base_type;

        private_key_t() = default;

        private_key_t(const base_type &o):
            base_type { o }
        {
        }

        void serialize(auto &archive)
        {
            archive.process_bytes_fixed(*this);
        }
    };

    struct rpc_config_t {
        std::string host {};
        std::string username {};
        std::string password {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("host"sv, host);
            archive.process("username"sv, username);
            archive.process("password"sv, password);
        }

        bool operator==(const rpc_config_t &o) const = default;
    };

    // The per-node part of the configuration: never leaves the node
    struct local_config_t {
        std::optional<rpc_config_t> rpc {};
        // anchoring address -> the secp256k1 key of this node for that address
        map_t<std::string, private_key_t> private_keys {};

        static local_config_t load(const std::string &path);

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("rpc"sv, rpc);
            archive.push("private_keys"sv);
            archive.process_map(private_keys, "address"sv, "private_key"sv);
            archive.pop();
        }

        bool operator==(const local_config_t &o) const = default;
    };
}
