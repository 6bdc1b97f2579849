/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/common/logger.hpp>
#include "errors.hpp"
#include "signatures.hpp"

namespace btcanchor::anchoring {
    signer_t::signer_t(const validator_id_t validator, key_store_ptr_t keys):
        _validator { validator },
        _keys { std::move(keys) }
    {
        if (!_keys) [[unlikely]]
            throw error("a signer requires a key store");
    }

    std::vector<signature_record_t> signer_t::sign(const proposal_t &proposal, const anchoring_state_t &state)
    {
        const auto &actual = state.actual_configuration();
        const auto sk = _keys->lookup(state.spending_address());
        if (!sk || _validator >= actual.validators.size()) [[unlikely]]
            throw err_no_private_key_t {};
        const auto public_keys = actual.public_keys();
        if (crypto::secp256k1::public_key(*sk) != public_keys[_validator]) [[unlikely]]
            throw err_no_private_key_t {};

        const auto txid = proposal.txid();
        if (const auto it = _signed.find(proposal.height); it != _signed.end() && it->second != txid) [[unlikely]] {
            logger::warn("btc_anchoring: validator {} refuses to sign proposal {} for height {} since it already signed {}",
                _validator, txid, proposal.height, it->second);
            throw err_duplicate_proposal_signature_t {};
        }
        _signed.try_emplace(proposal.height, txid);

        const btc::p2wsh::input_signer_t signer { actual.redeem_script().redeem_script };
        std::vector<signature_record_t> records {};
        records.reserve(proposal.tx.inputs.size());
        for (size_t i = 0; i < proposal.tx.inputs.size(); ++i) {
            auto &rec = records.emplace_back();
            rec.validator = _validator;
            rec.txid = txid;
            rec.input = numeric_cast<uint32_t>(i);
            rec.signature = signer.sign(proposal.tx, i, proposal.spent_outputs.at(i).value, *sk);
        }
        logger::debug("btc_anchoring: validator {} signed {} inputs of {} for height {}", _validator, records.size(), txid, proposal.height);
        return records;
    }

    void signer_t::forget_anchored(const height_t latest_anchored)
    {
        _signed.erase(_signed.begin(), _signed.upper_bound(latest_anchored));
    }

    bool apply_signature(fork_t &fork, const signature_record_t &record)
    {
        std::optional<proposal_t> proposal {};
        precondition_error_t::catch_into(
            [&] { proposal = build_proposal(fork); },
            [&](const precondition_error_t &) {
                logger::debug("btc_anchoring: no proposal can be built at height {}", fork.height());
            }
        );
        if (!proposal || proposal->txid() != record.txid) [[unlikely]]
            throw err_unexpected_proposal_t {};
        const auto &tx = proposal->tx;
        if (record.input >= tx.inputs.size()) [[unlikely]]
            throw err_invalid_input_t {};

        mutable_schema_t schema { fork.mutable_db() };
        const auto tip = schema.chain_tip();
        const auto state = project_state(schema.epochs(), fork.height(), tip);
        const auto &actual = state.actual_configuration();
        const auto public_keys = actual.public_keys();
        if (record.validator >= public_keys.size()) [[unlikely]]
            throw err_unknown_validator_t {};
        const btc::p2wsh::input_signer_t signer { actual.redeem_script().redeem_script };
        const auto amount = proposal->spent_outputs.at(record.input).value;
        if (!signer.verify(tx, record.input, amount, public_keys[record.validator], record.signature)) [[unlikely]]
            throw err_invalid_signature_t {};

        auto sigs = schema.signatures(record.txid);
        if (sigs.empty())
            sigs.resize(tx.inputs.size(), input_signatures_t(public_keys.size()));
        auto &slot = sigs.at(record.input).at(record.validator);
        if (slot) [[unlikely]]
            throw err_duplicate_signature_t {};
        slot = record.signature;

        const auto majority = actual.majority_count();
        for (const auto &input_sigs: sigs) {
            size_t num_sigs = 0;
            for (const auto &sig: input_sigs)
                num_sigs += sig ? 1 : 0;
            if (num_sigs < majority) {
                schema.set_signatures(record.txid, sigs);
                return false;
            }
        }

        auto final_tx = tx;
        for (size_t i = 0; i < sigs.size(); ++i) {
            std::vector<btc::p2wsh::input_signature_t> input_sigs {};
            for (const auto &sig: sigs[i]) {
                if (sig && input_sigs.size() < majority)
                    input_sigs.emplace_back(*sig);
            }
            signer.spend(final_tx, i, input_sigs);
        }
        const auto tip_txid = tip ? tip->txid() : btc::txid_t {};
        for (const auto &in: final_tx.inputs) {
            if (!tip || in.prevout.txid != tip_txid)
                schema.add_spent_funding(in.prevout.txid);
        }
        schema.push_chain(final_tx);
        schema.erase_signatures();
        logger::info("btc_anchoring: transaction {} anchoring height {} is finalized as #{} of the chain",
            record.txid, proposal->height, schema.chain_size() - 1);
        return true;
    }
}
