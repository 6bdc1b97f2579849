/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/common/logger.hpp>
#include "builder.hpp"
#include "errors.hpp"
#include "scheduler.hpp"

namespace btcanchor::anchoring {
    namespace {
        std::optional<uint32_t> find_output(const btc::transaction_t &tx, const btc::address_t &addr)
        {
            for (size_t i = 0; i < tx.outputs.size(); ++i) {
                if (addr.paid_by(tx.outputs[i].script_pubkey))
                    return numeric_cast<uint32_t>(i);
            }
            return {};
        }

        void add_input(proposal_t &p, const btc::transaction_t &prev_tx, const uint32_t vout)
        {
            auto &in = p.tx.inputs.emplace_back();
            in.prevout = btc::outpoint_t { prev_tx.txid(), vout };
            in.sequence = btc::sequence_final;
            p.spent_outputs.emplace_back(prev_tx.outputs.at(vout));
        }
    }

    std::optional<proposal_t> build_proposal(const snapshot_t &snapshot, const confirmations_fn_t &confirmations)
    {
        const schema_t schema { snapshot.db() };
        const auto height = snapshot.height();
        const auto tip = schema.chain_tip();
        const auto state = project_state(schema.epochs(), height, tip);
        std::optional<height_t> latest_anchored {};
        if (tip) {
            if (const auto payload = btc::payload_t::from_transaction(*tip); payload)
                latest_anchored = payload->height;
        }
        const auto target = next_target(state, height, latest_anchored);
        if (!target)
            return {};

        const auto &actual = state.actual_configuration();
        const auto spending_addr = actual.address();
        proposal_t p {};
        p.height = *target;
        std::vector<btc::txid_t> prev_txids {};
        if (tip) {
            add_input(p, *tip, 0);
            prev_txids.emplace_back(p.tx.inputs.back().prevout.txid);
            if (actual.funding) {
                const auto &funding_tx = *actual.funding;
                const auto funding_txid = funding_tx.txid();
                if (!schema.funding_spent(funding_txid)) {
                    if (const auto vout = find_output(funding_tx, spending_addr); vout) {
                        logger::debug("btc_anchoring: top-up funding transaction {} is added to the proposal for height {}", funding_txid, p.height);
                        add_input(p, funding_tx, *vout);
                        prev_txids.emplace_back(funding_txid);
                    }
                }
            }
        } else {
            if (!actual.funding) [[unlikely]]
                throw err_no_funding_transaction_t {};
            const auto vout = find_output(*actual.funding, spending_addr);
            if (!vout) [[unlikely]]
                throw err_unsuitable_funding_tx_t {};
            add_input(p, *actual.funding, *vout);
            prev_txids.emplace_back(p.tx.inputs.back().prevout.txid);
        }

        if (confirmations) {
            for (const auto &txid: prev_txids) {
                if (confirmations(txid).value_or(0) < actual.utxo_confirmations) [[unlikely]]
                    throw err_insufficient_confirmations_t {};
            }
        }

        const auto total = btc::value_sum(p.spent_outputs);
        if (total <= actual.fee) [[unlikely]]
            throw err_insufficient_funds_t {};

        btc::payload_t payload {};
        payload.height = p.height;
        payload.block_hash = snapshot.block_hash(p.height);
        p.tx.outputs.emplace_back(btc::tx_out_t { total - actual.fee, state.output_address().script_pubkey() });
        p.tx.outputs.emplace_back(btc::tx_out_t { 0, payload.script_pubkey() });
        return p;
    }
}
