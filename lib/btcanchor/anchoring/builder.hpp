#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <optional>
#include "host.hpp"
#include "schema.hpp"

namespace btcanchor::anchoring {
    // the number of Bitcoin confirmations of a transaction, nullopt when the transaction is unknown
    using confirmations_fn_t = std::function<std::optional<uint64_t>(const btc::txid_t &)>;

    // An unsigned chain transaction together with the outputs its inputs spend
    struct proposal_t {
        height_t height = 0;
        btc::transaction_t tx {};
        sequence_t<btc::tx_out_t> spent_outputs {};

        [[nodiscard]] btc::txid_t txid() const
        {
            return tx.txid();
        }

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("height"sv, height);
            archive.process("tx"sv, tx);
            archive.process("spent_outputs"sv, spent_outputs);
        }

        bool operator==(const proposal_t &o) const = default;
    };

    // Builds the proposal the chain needs at the height of the snapshot or returns nullopt when nothing is due.
    // With a confirmations source every spent transaction must have at least utxo_confirmations of the
    // spending configuration. Deterministic for a given snapshot.
    extern std::optional<proposal_t> build_proposal(const snapshot_t &snapshot, const confirmations_fn_t &confirmations={});
}
