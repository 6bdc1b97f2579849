/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "p2wsh.hpp"

namespace btcanchor::btc::p2wsh {
    input_signer_t::input_signer_t(redeem_script_t redeem_script):
        _redeem_script { std::move(redeem_script) },
        _script { _redeem_script.script() }
    {
    }

    crypto::sha256::hash_t input_signer_t::signature_hash(const transaction_t &tx, const size_t input_idx, const amount_t amount) const
    {
        return tx.signature_hash(input_idx, _script, amount, sighash_all);
    }

    input_signature_t input_signer_t::sign(const transaction_t &tx, const size_t input_idx, const amount_t amount, const crypto::secp256k1::skey_t &sk) const
    {
        input_signature_t sig { crypto::secp256k1::sign(signature_hash(tx, input_idx, amount), sk) };
        sig.emplace_back(static_cast<uint8_t>(sighash_all));
        return sig;
    }

    bool input_signer_t::verify(const transaction_t &tx, const size_t input_idx, const amount_t amount, const public_key_t &vk, const buffer sig) const
    {
        if (sig.size() < 2 || sig[sig.size() - 1] != sighash_all)
            return false;
        if (input_idx >= tx.inputs.size())
            return false;
        return crypto::secp256k1::verify(sig.subbuf(0, sig.size() - 1), signature_hash(tx, input_idx, amount), vk);
    }

    sequence_t<byte_sequence_t> input_signer_t::witness(const std::vector<input_signature_t> &sigs) const
    {
        if (sigs.size() != _redeem_script.quorum) [[unlikely]]
            throw error(fmt::format("a witness requires exactly {} signatures but got {}", _redeem_script.quorum, sigs.size()));
        sequence_t<byte_sequence_t> w {};
        w.reserve(sigs.size() + 2);
        // OP_CHECKMULTISIG consumes an extra stack element
        w.emplace_back();
        for (const auto &sig: sigs)
            w.emplace_back(sig);
        w.emplace_back(_script);
        return w;
    }

    void input_signer_t::spend(transaction_t &tx, const size_t input_idx, const std::vector<input_signature_t> &sigs) const
    {
        if (input_idx >= tx.inputs.size()) [[unlikely]]
            throw error(fmt::format("input index {} is out of range, the transaction has {} inputs", input_idx, tx.inputs.size()));
        tx.inputs[input_idx].witness = witness(sigs);
    }
}
