#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/crypto/secp256k1.hpp>
#include "transaction.hpp"

namespace btcanchor::btc::p2wsh {
    // a DER-encoded ECDSA signature followed by the signature hash type byte
    using input_signature_t = byte_sequence_t;

    // Signs and assembles spends of outputs locked by a multisig witness script
    struct input_signer_t {
        explicit input_signer_t(redeem_script_t redeem_script);

        [[nodiscard]] crypto::sha256::hash_t signature_hash(const transaction_t &tx, size_t input_idx, amount_t amount) const;
        [[nodiscard]] input_signature_t sign(const transaction_t &tx, size_t input_idx, amount_t amount, const crypto::secp256k1::skey_t &sk) const;
        [[nodiscard]] bool verify(const transaction_t &tx, size_t input_idx, amount_t amount, const public_key_t &vk, buffer sig) const;
        // [<empty>, sig_1, ..., sig_m, witness_script], signatures must follow the key order of the script
        [[nodiscard]] sequence_t<byte_sequence_t> witness(const std::vector<input_signature_t> &sigs) const;
        void spend(transaction_t &tx, size_t input_idx, const std::vector<input_signature_t> &sigs) const;

        [[nodiscard]] const redeem_script_t &redeem_script() const noexcept
        {
            return _redeem_script;
        }
    private:
        redeem_script_t _redeem_script;
        script_t _script;
    };
}
