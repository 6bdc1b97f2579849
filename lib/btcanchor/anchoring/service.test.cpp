/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/codec/json.hpp>
#include <btcanchor/common/test.hpp>
#include "testkit.hpp"

namespace {
    using namespace btcanchor;
    using namespace btcanchor::anchoring;
    using namespace btcanchor::anchoring::testkit;

    std::vector<message_t> propose(testkit_t &kit, const std::initializer_list<size_t> nodes, const config_proposal_t &proposal)
    {
        std::vector<message_t> msgs {};
        for (const auto idx: nodes)
            msgs.emplace_back(kit.node(idx).service->propose_config(proposal));
        return msgs;
    }
}

suite btcanchor_anchoring_service_suite = [] {
    "btcanchor::anchoring::service"_test = [] {
        "initialize"_test = [] {
            auto cfg = config_t::make(btc::network_t::testnet, btc::public_key_t::from_hex("0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"));
            service_t service { cfg };
            const auto db = std::make_shared<storage::memory::db_t>();
            const std::vector<btc::block_hash_t> hashes {};
            const service_keys_t keys {};
            view_t view { 0, hashes, keys, *db };
            const auto jv = service.initialize(view);
            expect_equal(cfg, codec::json::from_json<config_t>(jv));
            const auto epochs = schema_t { *db }.epochs();
            expect_equal(size_t { 1 }, epochs.size());
            expect(epochs[0] == config_epoch_t { 0, cfg });
            expect(service.state_hash(view) == schema_t { *db }.state_hash());
            // an auditor node never submits anything
            expect(service.after_commit(view).empty());

            cfg.frequency = 0;
            const service_t invalid { cfg };
            const auto db2 = std::make_shared<storage::memory::db_t>();
            view_t view2 { 0, hashes, keys, *db2 };
            expect(throws<err_zero_frequency_t>([&] { return invalid.initialize(view2); }));
            expect(schema_t { *db2 }.epochs().empty());
        };
        "message encoding"_test = [] {
            testkit_t kit { 2 };
            const auto msgs = kit.take_outboxes();
            const auto &msg = msgs.at(0);
            const auto raw = msg.encode();
            // author, payload tag, payload fields, signature
            expect_equal(uint8_vector::from_hex("00000000" "01"), static_cast<uint8_vector>(buffer { raw.data(), 5 }));
            expect(buffer { raw.data() + raw.size() - 64, 64 } == static_cast<buffer>(msg.signature));
            const auto &service = *kit.node(0).service;
            expect(service.decode(raw) == msg);
            expect(throws<err_decoding_t>([&] { return service.decode(buffer { raw.data(), raw.size() - 1 }); }));
            auto trailing = raw;
            trailing << uint8_t { 0 };
            expect(throws<err_decoding_t>([&] { return service.decode(trailing); }));
            auto bad_tag = raw;
            bad_tag[4] = 7;
            expect(throws<err_decoding_t>([&] { return service.decode(bad_tag); }));
            expect(throws<err_decoding_t>([&] { return service.decode(uint8_vector {}); }));
            // a huge length prefix of the signature bytes
            auto bad_len = static_cast<uint8_vector>(buffer { raw.data(), 5 + 4 + 32 + 4 });
            bad_len << uint8_t { 0xFE } << uint8_t { 0xFF } << uint8_t { 0xFF } << uint8_t { 0xFF } << uint8_t { 0x7F };
            expect(throws<err_decoding_t>([&] { return service.decode(bad_len); }));
            msg.verify(kit.snapshot().service_keys());
            expect(throws<err_unauthorized_t>([&] { msg.verify(service_keys_t {}); }));
        };
        "the chain grows every frequency blocks"_test = [] {
            testkit_t kit { 4 };
            expect(kit.create_blocks_until_chain_size(3));
            const auto schema = kit.schema();
            const auto chain = schema.chain();
            expect_equal(size_t { 3 }, chain.size());
            const auto &funding = kit.genesis().funding_tx();
            expect(chain[0].inputs[0].prevout == btc::outpoint_t { funding.txid(), 0 });
            const auto addr = kit.genesis().address();
            for (size_t i = 0; i < chain.size(); ++i) {
                const auto &tx = chain[i];
                expect_equal(size_t { 1 }, tx.inputs.size());
                expect_equal(size_t { 2 }, tx.outputs.size());
                expect(addr.paid_by(tx.outputs[0].script_pubkey));
                expect_equal(testkit_t::default_funds - (i + 1) * kit.genesis().fee, tx.outputs[0].value);
                const auto payload = btc::payload_t::from_transaction(tx);
                expect(payload.has_value());
                expect_equal(static_cast<height_t>(i * 5), payload->height);
                expect(payload->block_hash == kit.snapshot().block_hash(payload->height));
                if (i > 0)
                    expect(tx.inputs[0].prevout == btc::outpoint_t { chain[i - 1].txid(), 0 });
                expect(kit.relay().find(tx.txid()).has_value());
            }
            expect(kit.relay().watched(addr));
            // the ledgers of all nodes commit to the same state
            expect_equal(size_t { 3 }, schema.state_hash().size());
            for (const auto &n: kit.nodes())
                expect(n.service->state_hash(kit.snapshot()) == schema.state_hash());
        };
        "transition to a larger validator set"_test = [] {
            testkit_t kit { 3 };
            expect(kit.create_blocks_until_chain_size(1));
            const auto old_addr = kit.genesis().address();
            const auto id = kit.add_validator();
            expect_equal(size_t { 3 }, id);
            const auto new_cfg = kit.config_for_all_nodes();
            const auto new_addr = new_cfg.address();
            expect(new_addr != old_addr);
            const config_proposal_t proposal { kit.height() + 3, new_cfg };

            // two votes of four consensus validators are not enough
            kit.create_block(propose(kit, { 0, 1 }, proposal));
            expect(kit.rejected().empty());
            expect_equal(size_t { 1 }, kit.schema().epochs().size());
            expect_equal(size_t { 1 }, kit.schema().config_votes().size());
            // a repeated vote is not counted twice
            kit.create_block(propose(kit, { 1 }, proposal));
            expect_equal(size_t { 1 }, kit.schema().epochs().size());
            kit.create_block(propose(kit, { 2 }, proposal));
            expect(kit.rejected().empty());
            expect_equal(size_t { 2 }, kit.schema().epochs().size());
            expect(kit.schema().epochs().back() == proposal);
            expect(kit.schema().config_votes().empty());

            while (kit.height() < proposal.activation_height) {
                expect(!kit.schema().state(kit.height()).is_transition());
                kit.create_block();
            }
            const auto state = kit.schema().state(kit.height());
            expect(state.is_transition());
            expect(state.spending_address() == old_addr);
            expect(state.output_address() == new_addr);
            expect_equal(size_t { 1 }, kit.schema().chain_size());
            // the anchoring keys were rotated on observing the transition
            for (size_t i = 0; i < 3; ++i)
                expect(kit.node(i).keys->lookup(new_addr) == kit.node(i).keys->lookup(old_addr));
            expect(!kit.node(3).keys->lookup(old_addr).has_value());

            kit.create_block();
            expect_equal(size_t { 2 }, kit.schema().chain_size());
            const auto transfer = *kit.schema().chain_tip();
            expect(new_addr.paid_by(transfer.outputs[0].script_pubkey));
            expect_equal(proposal.activation_height, btc::payload_t::from_transaction(transfer)->height);
            const auto actual = kit.schema().state(kit.height());
            expect(!actual.is_transition());
            expect_equal(new_cfg, actual.actual_configuration());

            bool new_validator_signed = false;
            for (size_t i = 0; i < 64 && kit.schema().chain_size() < 3; ++i) {
                const auto msgs = kit.take_outboxes();
                for (const auto &m: msgs)
                    new_validator_signed |= m.author == 3;
                kit.create_block(msgs);
            }
            expect(new_validator_signed);
            expect_equal(size_t { 3 }, kit.schema().chain_size());
            const auto tip = *kit.schema().chain_tip();
            expect(tip.inputs[0].prevout == btc::outpoint_t { transfer.txid(), 0 });
            expect(new_addr.paid_by(tip.outputs[0].script_pubkey));
            expect_equal(size_t { 2 + new_cfg.majority_count() }, tip.inputs[0].witness.size());
        };
        "invalid configuration proposals"_test = [] {
            testkit_t kit { 3 };
            auto cfg = kit.config_for_all_nodes();
            kit.create_block(propose(kit, { 0 }, config_proposal_t { kit.height(), cfg }));
            auto no_keys = cfg;
            no_keys.validators.clear();
            kit.create_block(propose(kit, { 0 }, config_proposal_t { kit.height() + 10, no_keys }));
            auto zero_freq = cfg;
            zero_freq.frequency = 0;
            kit.create_block(propose(kit, { 0 }, config_proposal_t { kit.height() + 10, zero_freq }));
            const std::vector<std::string> exp {
                "err_invalid_activation_height_t",
                "err_empty_key_set_t",
                "err_zero_frequency_t"
            };
            expect(kit.rejected() == exp);
            expect(kit.schema().config_votes().empty());

            // votes for a height that has passed are discarded
            kit.create_block(propose(kit, { 0 }, config_proposal_t { kit.height() + 2, cfg }));
            expect_equal(size_t { 1 }, kit.schema().config_votes().size());
            kit.create_blocks(3);
            kit.create_block(propose(kit, { 1 }, config_proposal_t { kit.height() + 2, cfg }));
            const auto votes = kit.schema().config_votes();
            expect_equal(size_t { 1 }, votes.size());
            expect_equal(size_t { 1 }, votes.begin()->second.voters.size());
            expect_equal(size_t { 1 }, kit.schema().epochs().size());
        };
        "a validator has one pending configuration vote"_test = [] {
            testkit_t kit { 3 };
            const auto cfg = kit.config_for_all_nodes();
            const config_proposal_t first { kit.height() + 100, cfg };
            const config_proposal_t second { kit.height() + 101, cfg };
            kit.create_block(propose(kit, { 0 }, first));
            kit.create_block(propose(kit, { 0, 1 }, second));
            expect(kit.rejected().empty());
            // the second vote of validator 0 replaced its first one
            auto votes = kit.schema().config_votes();
            expect_equal(size_t { 1 }, votes.size());
            expect(votes.begin()->second.proposal == second);
            expect_equal(size_t { 2 }, votes.begin()->second.voters.size());

            for (height_t h = 12; h < 20; ++h)
                kit.create_block(propose(kit, { 2 }, config_proposal_t { kit.height() + h, cfg }));
            expect(kit.rejected().empty());
            votes = kit.schema().config_votes();
            expect_equal(size_t { 2 }, votes.size());
            expect_equal(size_t { 1 }, kit.schema().epochs().size());

            // a new vote of validator 1 leaves validator 0 alone on the second proposal
            kit.create_block(propose(kit, { 1 }, config_proposal_t { kit.height() + 30, cfg }));
            votes = kit.schema().config_votes();
            expect_equal(size_t { 3 }, votes.size());
            for (const auto &[hash, vote]: votes)
                expect_equal(size_t { 1 }, vote.voters.size());
        };
        "relay outage delays anchoring"_test = [] {
            testkit_t kit { 1 };
            expect(kit.create_blocks_until_chain_size(1));
            kit.relay().set_available(false);
            while (kit.height() < 12)
                kit.create_block();
            expect_equal(size_t { 1 }, kit.schema().chain_size());
            kit.relay().set_available(true);
            expect(kit.create_blocks_until_chain_size(2));
            expect_equal(height_t { 10 }, *kit.schema().latest_anchored_height());
        };
        "insufficient funds stop the chain"_test = [] {
            testkit_t kit { 1, 5, 1500 };
            expect(kit.create_blocks_until_chain_size(1));
            expect_equal(btc::amount_t { 500 }, kit.schema().chain_tip()->outputs[0].value);
            kit.create_blocks(12);
            expect_equal(size_t { 1 }, kit.schema().chain_size());
            expect(kit.rejected().empty());
        };
    };
};
