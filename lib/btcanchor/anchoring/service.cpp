/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/codec/json.hpp>
#include <btcanchor/common/logger.hpp>
#include "errors.hpp"
#include "service.hpp"

namespace btcanchor::anchoring {
    service_t::service_t(config_t genesis, key_store_ptr_t keys, relay_ptr_t relay, std::optional<service_identity_t> identity):
        _genesis { std::move(genesis) },
        _keys { std::move(keys) },
        _relay { std::move(relay) },
        _identity { std::move(identity) }
    {
        if (_identity && _keys)
            _signer.emplace(_identity->validator, _keys);
    }

    std::vector<crypto::blake2b::hash_t> service_t::state_hash(const snapshot_t &snapshot) const
    {
        return schema_t { snapshot.db() }.state_hash();
    }

    message_t service_t::decode(const buffer raw) const
    {
        return message_t::decode(raw);
    }

    boost::json::value service_t::initialize(fork_t &fork) const
    {
        _genesis.validate();
        mutable_schema_t { fork.mutable_db() }.push_epoch({ 0, _genesis });
        logger::info("btc_anchoring: initialized with {} validators and the anchoring address {}",
            _genesis.validators.size(), _genesis.address());
        return codec::json::to_json(_genesis);
    }

    void service_t::execute(fork_t &fork, const message_t &msg) const
    {
        msg.verify(fork.service_keys());
        std::visit([&](const auto &payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, config_proposal_t>) {
                _vote_config(fork, msg.author, payload);
            } else if constexpr (std::is_same_v<T, signature_record_t>) {
                if (payload.validator != msg.author) [[unlikely]]
                    throw err_unauthorized_t {};
                apply_signature(fork, payload);
            } else {
                static_assert(sizeof(T) == 0, "every message payload must be handled");
            }
        }, static_cast<const message_payload_base_t &>(msg.payload));
    }

    void service_t::_vote_config(fork_t &fork, const validator_id_t author, const config_proposal_t &proposal) const
    {
        proposal.config.validate();
        mutable_schema_t schema { fork.mutable_db() };
        const auto epochs = schema.epochs();
        if (proposal.activation_height <= fork.height() || (!epochs.empty() && proposal.activation_height <= epochs.back().activation_height)) [[unlikely]]
            throw err_invalid_activation_height_t {};

        const vote_hash_t vote_hash = crypto::blake2b::digest(codec::binary::to_bytes(proposal));
        auto votes = schema.config_votes();
        // a proposal whose activation height has passed can never be accepted
        // and a validator has at most one pending vote, its latest one
        for (auto it = votes.begin(); it != votes.end(); ) {
            if (it->first != vote_hash)
                it->second.voters.erase(author);
            if (it->second.proposal.activation_height <= fork.height() || it->second.voters.empty())
                it = votes.erase(it);
            else
                ++it;
        }
        auto &vote = votes[vote_hash];
        vote.proposal = proposal;
        vote.voters.emplace(author);
        const auto majority = majority_count(fork.service_keys().size());
        logger::debug("btc_anchoring: validator {} voted for the configuration activating at {}: {} of {} votes",
            author, proposal.activation_height, vote.voters.size(), majority);
        if (vote.voters.size() >= majority) {
            schema.push_epoch(proposal);
            for (auto it = votes.begin(); it != votes.end(); ) {
                if (it->second.proposal.activation_height <= proposal.activation_height)
                    it = votes.erase(it);
                else
                    ++it;
            }
            logger::info("btc_anchoring: the configuration with the address {} activates at height {}",
                proposal.config.address(), proposal.activation_height);
        }
        schema.set_config_votes(votes);
    }

    std::vector<message_t> service_t::after_commit(const snapshot_t &snapshot)
    {
        std::vector<message_t> out {};
        logger::run_log_errors(fmt::format("btc_anchoring after_commit at height {}", snapshot.height()), [&] {
            const schema_t schema { snapshot.db() };
            const auto state = schema.state(snapshot.height());
            if (_keys) {
                if (const auto *transition = std::get_if<transition_t>(&state); transition)
                    _keys->rotate(transition->actual_configuration.address(), transition->following_configuration.address());
            }
            if (_relay) {
                logger::run_log_errors("btc_anchoring relay sync", [&] {
                    if (const auto tip = schema.chain_tip(); tip && !_relay->confirmations(tip->txid()))
                        _relay->broadcast(*tip);
                    _relay->watch_address(state.output_address());
                });
            }
            if (_signer) {
                if (const auto anchored = schema.latest_anchored_height(); anchored)
                    _signer->forget_anchored(*anchored);
                _sign(snapshot, state, out);
            }
        });
        return out;
    }

    void service_t::_sign(const snapshot_t &snapshot, const anchoring_state_t &state, std::vector<message_t> &out)
    {
        precondition_error_t::catch_into(
            [&] {
                confirmations_fn_t confirmations {};
                if (_relay)
                    confirmations = [&](const btc::txid_t &txid) { return _relay->confirmations(txid); };
                const auto proposal = build_proposal(snapshot, confirmations);
                if (!proposal)
                    return;
                const auto stored = schema_t { snapshot.db() }.signatures(proposal->txid());
                for (auto &rec: _signer->sign(*proposal, state)) {
                    // the ledger already holds this signature
                    if (rec.input < stored.size() && rec.validator < stored[rec.input].size() && stored[rec.input][rec.validator])
                        continue;
                    out.emplace_back(message_t::make(_identity->validator, std::move(rec), _identity->consensus_key));
                }
            },
            [&](const precondition_error_t &err) {
                logger::debug("btc_anchoring: validator {} does not sign at height {}: {}", _identity->validator, snapshot.height(), err);
            }
        );
    }

    message_t service_t::propose_config(const config_proposal_t &proposal) const
    {
        if (!_identity) [[unlikely]]
            throw error("only a validator node can propose a configuration");
        return message_t::make(_identity->validator, proposal, _identity->consensus_key);
    }
}
