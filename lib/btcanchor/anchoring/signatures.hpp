#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <vector>
#include "builder.hpp"
#include "key-store.hpp"

namespace btcanchor::anchoring {
    // A signature of one input of a proposal by the validator at the given position of the spending configuration
    struct signature_record_t {
        validator_id_t validator = 0;
        btc::txid_t txid {};
        uint32_t input = 0;
        btc::p2wsh::input_signature_t signature {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("validator"sv, validator);
            archive.process("txid"sv, txid);
            archive.process("input"sv, input);
            archive.process("signature"sv, signature);
        }

        bool operator==(const signature_record_t &o) const = default;
    };

    // The validator side of the signature collection.
    // Remembers the proposal it signed for every height so that it never signs two different ones.
    struct signer_t {
        explicit signer_t(validator_id_t validator, key_store_ptr_t keys);

        // throws err_no_private_key_t and err_duplicate_proposal_signature_t
        [[nodiscard]] std::vector<signature_record_t> sign(const proposal_t &proposal, const anchoring_state_t &state);

        // the chain never anchors a height at or below its latest anchored one again
        void forget_anchored(height_t latest_anchored);

        [[nodiscard]] size_t num_remembered() const noexcept
        {
            return _signed.size();
        }

        [[nodiscard]] validator_id_t validator() const noexcept
        {
            return _validator;
        }
    private:
        validator_id_t _validator;
        key_store_ptr_t _keys;
        std::map<height_t, btc::txid_t> _signed {};
    };

    // The ledger side: verifies the record against the proposal of the fork and stores it.
    // Once every input has a majority of signatures the transaction is finalized and appended to the chain.
    // Returns true when the record finalized the transaction, throws one of the protocol_error_t errors.
    extern bool apply_signature(fork_t &fork, const signature_record_t &record);
}
