/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/common/test.hpp>
#include "testkit.hpp"

namespace {
    using namespace btcanchor;
    using namespace btcanchor::anchoring;
    using namespace btcanchor::anchoring::testkit;

    signature_record_t record_of(const message_t &msg)
    {
        return std::get<signature_record_t>(static_cast<const message_payload_base_t &>(msg.payload));
    }

    message_t resign(const node_t &node, const validator_id_t author, signature_record_t rec)
    {
        return message_t::make(author, std::move(rec), node.consensus_key);
    }
}

suite btcanchor_anchoring_signatures_suite = [] {
    "btcanchor::anchoring::signatures"_test = [] {
        "signer"_test = [] {
            testkit_t kit { 4 };
            const auto snap = kit.snapshot();
            const auto state = kit.schema().state(snap.height());
            const auto proposal = build_proposal(snap);
            expect(proposal.has_value());
            signer_t signer { 1, kit.node(1).keys };
            const auto recs = signer.sign(*proposal, state);
            expect_equal(size_t { 1 }, recs.size());
            expect_equal(validator_id_t { 1 }, recs[0].validator);
            expect(recs[0].txid == proposal->txid());
            expect_equal(uint32_t { 0 }, recs[0].input);
            const btc::p2wsh::input_signer_t verifier { state.actual_configuration().redeem_script().redeem_script };
            expect(verifier.verify(proposal->tx, 0, proposal->spent_outputs[0].value, kit.node(1).anchoring_key.vk, recs[0].signature));
            // retrying the same proposal is allowed
            expect_equal(size_t { 1 }, signer.sign(*proposal, state).size());
            // but a different one at the same height is not
            auto other = *proposal;
            other.tx.outputs[0].value -= 1;
            expect(throws<err_duplicate_proposal_signature_t>([&] { return signer.sign(other, state); }));
            // signing a later height keeps the earlier one locked
            auto later = other;
            later.height += 5;
            expect_equal(size_t { 1 }, signer.sign(later, state).size());
            expect(throws<err_duplicate_proposal_signature_t>([&] { return signer.sign(other, state); }));
            expect_equal(size_t { 2 }, signer.num_remembered());
            // until the chain anchors past it
            signer.forget_anchored(proposal->height);
            expect_equal(size_t { 1 }, signer.num_remembered());
            expect_equal(size_t { 1 }, signer.sign(other, state).size());
            expect(throws<err_duplicate_proposal_signature_t>([&] {
                auto another_later = later;
                another_later.tx.outputs[0].value -= 1;
                return signer.sign(another_later, state);
            }));
        };
        "signer without a matching key"_test = [] {
            testkit_t kit { 2 };
            const auto snap = kit.snapshot();
            const auto state = kit.schema().state(snap.height());
            const auto proposal = build_proposal(snap);
            signer_t no_keys { 0, std::make_shared<memory_key_store_t>() };
            expect(throws<err_no_private_key_t>([&] { return no_keys.sign(*proposal, state); }));
            // the key of validator 1 is not the key at position 0
            signer_t wrong_position { 0, kit.node(1).keys };
            expect(throws<err_no_private_key_t>([&] { return wrong_position.sign(*proposal, state); }));
            signer_t outsider { 7, kit.node(1).keys };
            expect(throws<err_no_private_key_t>([&] { return outsider.sign(*proposal, state); }));
        };
        "two of four signatures do not finalize, three do"_test = [] {
            testkit_t kit { 4 };
            const auto msgs = kit.take_outboxes();
            expect_equal(size_t { 4 }, msgs.size());
            kit.create_block({ msgs[0], msgs[1] });
            expect(kit.rejected().empty());
            expect_equal(size_t { 0 }, kit.schema().chain_size());
            const auto txid = record_of(msgs[0]).txid;
            const auto sigs = kit.schema().signatures(txid);
            expect_equal(size_t { 1 }, sigs.size());
            expect(sigs[0][0].has_value() && sigs[0][1].has_value() && !sigs[0][2].has_value() && !sigs[0][3].has_value());

            // the handlers do not resubmit what the ledger already holds
            const auto resubmitted = kit.take_outboxes();
            expect_equal(size_t { 2 }, resubmitted.size());
            for (const auto &m: resubmitted)
                expect(m.author == 2 || m.author == 3);

            kit.create_block({ msgs[2] });
            expect(kit.rejected().empty());
            expect_equal(size_t { 1 }, kit.schema().chain_size());
            const auto tx = *kit.schema().chain_tip();
            expect(tx.txid() == txid);
            expect_equal(size_t { 5 }, tx.inputs[0].witness.size());
            expect(tx.inputs[0].witness[0].empty());
            expect(kit.schema().signatures(txid).empty());
            expect(!kit.schema().pending_signatures());
            expect(kit.schema().funding_spent(kit.genesis().funding_tx().txid()));
            expect_equal(height_t { 0 }, *kit.schema().latest_anchored_height());

            // a late signature no longer matches any proposal
            kit.create_block({ msgs[3] });
            expect_equal(size_t { 1 }, kit.rejected().size());
            expect_equal(std::string { "err_unexpected_proposal_t" }, kit.rejected().back());
            expect_equal(size_t { 1 }, kit.schema().chain_size());
        };
        "protocol violations are rejected"_test = [] {
            testkit_t kit { 4 };
            const auto msgs = kit.take_outboxes();
            const auto rec0 = record_of(msgs[0]);
            std::vector<message_t> bad {};

            auto wrong_txid = rec0;
            wrong_txid.txid[0] ^= 0xFF;
            bad.emplace_back(resign(kit.node(0), 0, wrong_txid));

            auto wrong_input = rec0;
            wrong_input.input = 1;
            bad.emplace_back(resign(kit.node(0), 0, wrong_input));

            // the signature of validator 1 presented as the one of validator 0
            auto stolen = record_of(msgs[1]);
            stolen.validator = 0;
            bad.emplace_back(resign(kit.node(0), 0, stolen));

            // a record authored by one validator on behalf of another
            bad.emplace_back(resign(kit.node(0), 0, record_of(msgs[1])));

            // the consensus key does not match the author
            bad.emplace_back(resign(kit.node(1), 0, rec0));

            const auto outsider = kit.add_validator();
            auto unknown = rec0;
            unknown.validator = numeric_cast<validator_id_t>(outsider);
            bad.emplace_back(resign(kit.node(outsider), unknown.validator, unknown));

            bad.emplace_back(msgs[0]);
            bad.emplace_back(msgs[0]);

            kit.create_block(bad);
            const std::vector<std::string> exp {
                "err_unexpected_proposal_t",
                "err_invalid_input_t",
                "err_invalid_signature_t",
                "err_unauthorized_t",
                "err_unauthorized_t",
                "err_unknown_validator_t",
                "err_duplicate_signature_t"
            };
            expect(kit.rejected() == exp);
            const auto sigs = kit.schema().signatures(rec0.txid);
            expect_equal(size_t { 1 }, sigs.size());
            size_t num_sigs = 0;
            for (const auto &s: sigs[0])
                num_sigs += s ? 1 : 0;
            expect_equal(size_t { 1 }, num_sigs);
        };
    };
};
