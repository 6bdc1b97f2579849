#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <string_view>
#include <btcanchor/btc/p2wsh.hpp>
#include <btcanchor/crypto/blake2b.hpp>
#include <btcanchor/storage/common.hpp>
#include "state.hpp"

namespace btcanchor::anchoring {
    using validator_id_t = uint32_t;
    using vote_hash_t = byte_array_t<32>;

    // a proposed epoch and the consensus validators who voted for it
    struct config_vote_t {
        config_epoch_t proposal {};
        set_t<validator_id_t> voters {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("proposal"sv, proposal);
            archive.process("voters"sv, voters);
        }

        bool operator==(const config_vote_t &o) const = default;
    };
    using config_votes_t = map_t<vote_hash_t, config_vote_t>;

    // indexed by the position of the validator in the spending configuration
    using input_signatures_t = sequence_t<std::optional<btc::p2wsh::input_signature_t>>;
    // indexed by the input of the proposal
    using tx_signatures_t = sequence_t<input_signatures_t>;

    // the partial signature set of the only proposal being signed
    struct pending_signatures_t {
        btc::txid_t txid {};
        tx_signatures_t sigs {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("txid"sv, txid);
            archive.process("sigs"sv, sigs);
        }

        bool operator==(const pending_signatures_t &o) const = default;
    };

    // The ledger-resident state of the anchoring service
    struct schema_t {
        static constexpr std::string_view prefix { "btc_anchoring." };

        explicit schema_t(const storage::db_t &db);

        [[nodiscard]] epoch_log_t epochs() const;
        [[nodiscard]] size_t chain_size() const;
        [[nodiscard]] btc::transaction_t chain_at(size_t idx) const;
        [[nodiscard]] std::optional<btc::transaction_t> chain_tip() const;
        [[nodiscard]] std::vector<btc::transaction_t> chain() const;
        // the height committed by the payload of the chain tip
        [[nodiscard]] std::optional<height_t> latest_anchored_height() const;
        [[nodiscard]] set_t<btc::txid_t> spent_funding() const;
        [[nodiscard]] bool funding_spent(const btc::txid_t &txid) const;
        // empty unless txid is the proposal whose signatures are being collected
        [[nodiscard]] tx_signatures_t signatures(const btc::txid_t &txid) const;
        [[nodiscard]] std::optional<pending_signatures_t> pending_signatures() const;
        [[nodiscard]] config_votes_t config_votes() const;
        [[nodiscard]] anchoring_state_t state(height_t height) const;
        // the digests of the chain, the spent funding transactions and the epoch log
        [[nodiscard]] std::vector<crypto::blake2b::hash_t> state_hash() const;
    protected:
        static uint8_vector _key(std::string_view name);
        static uint8_vector _key(std::string_view name, buffer suffix);
        static uint8_vector _chain_key(size_t idx);

        template<typename T>
        [[nodiscard]] std::optional<T> _get(const buffer key) const
        {
            if (const auto bytes = _db.get(key); bytes)
                return codec::binary::from_bytes<T>(*bytes);
            return {};
        }
    private:
        const storage::db_t &_db;
    };

    struct mutable_schema_t: schema_t {
        explicit mutable_schema_t(storage::db_t &db);

        // throws err_invalid_activation_height_t unless the activation height grows
        void push_epoch(const config_epoch_t &epoch);
        void push_chain(const btc::transaction_t &tx);
        void add_spent_funding(const btc::txid_t &txid);
        // replaces the signatures collected for any other proposal
        void set_signatures(const btc::txid_t &txid, const tx_signatures_t &sigs);
        void erase_signatures();
        void set_config_votes(const config_votes_t &votes);
    private:
        storage::db_t &_mutable_db;

        template<typename T>
        void _set(const buffer key, const T &val)
        {
            _mutable_db.set(key, codec::binary::to_bytes(val));
        }
    };
}
