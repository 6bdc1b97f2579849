#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <boost/json.hpp>
#include "messages.hpp"
#include "relay.hpp"

namespace btcanchor::anchoring {
    // the consensus identity of the node, absent on auditor nodes
    struct service_identity_t {
        validator_id_t validator = 0;
        crypto::ed25519::key_pair_t consensus_key {};
    };

    // The anchoring service as seen by the host ledger
    struct service_t {
        static constexpr uint32_t service_id = 3;
        static constexpr std::string_view service_name { "btc_anchoring" };

        explicit service_t(config_t genesis, key_store_ptr_t keys={}, relay_ptr_t relay={}, std::optional<service_identity_t> identity={});

        [[nodiscard]] std::vector<crypto::blake2b::hash_t> state_hash(const snapshot_t &snapshot) const;
        // throws err_decoding_t
        [[nodiscard]] message_t decode(buffer raw) const;
        // seeds the epoch log with the genesis configuration and returns it in its persisted form
        boost::json::value initialize(fork_t &fork) const;
        // throws one of the protocol_error_t or config_error_t errors, the fork is left untouched in that case
        void execute(fork_t &fork, const message_t &msg) const;
        // The per-block handler of a validator: rotates the anchoring keys, relays the chain tip,
        // and signs the current proposal. Returns the messages to be submitted to the ledger.
        [[nodiscard]] std::vector<message_t> after_commit(const snapshot_t &snapshot);
        // a vote of this validator for a new configuration epoch
        [[nodiscard]] message_t propose_config(const config_proposal_t &proposal) const;
    private:
        config_t _genesis;
        key_store_ptr_t _keys;
        relay_ptr_t _relay;
        std::optional<service_identity_t> _identity;
        std::optional<signer_t> _signer {};

        void _vote_config(fork_t &fork, validator_id_t author, const config_proposal_t &proposal) const;
        void _sign(const snapshot_t &snapshot, const anchoring_state_t &state, std::vector<message_t> &out);
    };
}
