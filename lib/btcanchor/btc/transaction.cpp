/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <btcanchor/common/logger.hpp>
#include "errors.hpp"
#include "transaction.hpp"

namespace btcanchor::btc {
    namespace {
        void write_var_bytes(codec::binary::encoder &enc, const buffer bytes)
        {
            enc.process_bytes(bytes);
        }

        uint8_vector read_var_bytes(codec::binary::decoder &dec)
        {
            return uint8_vector { dec.next_bytes(dec.count()) };
        }

        void write_outpoint(codec::binary::encoder &enc, const outpoint_t &op)
        {
            enc.next_bytes(op.txid);
            enc.uint_fixed(4, op.vout);
        }

        void write_tx(codec::binary::encoder &enc, const transaction_t &tx, const bool with_witness)
        {
            enc.uint_fixed(4, tx.version);
            if (with_witness) {
                enc.uint_fixed(1, 0x00);
                enc.uint_fixed(1, 0x01);
            }
            enc.compact_size(tx.inputs.size());
            for (const auto &in: tx.inputs) {
                write_outpoint(enc, in.prevout);
                write_var_bytes(enc, in.script_sig);
                enc.uint_fixed(4, in.sequence);
            }
            enc.compact_size(tx.outputs.size());
            for (const auto &out: tx.outputs) {
                enc.uint_fixed(8, out.value);
                write_var_bytes(enc, out.script_pubkey);
            }
            if (with_witness) {
                for (const auto &in: tx.inputs) {
                    enc.compact_size(in.witness.size());
                    for (const auto &item: in.witness)
                        write_var_bytes(enc, item);
                }
            }
            enc.uint_fixed(4, tx.lock_time);
        }

        transaction_t read_tx(codec::binary::decoder &dec)
        {
            transaction_t tx {};
            tx.version = dec.uint_fixed<uint32_t>(4);
            auto num_inputs = dec.count();
            bool with_witness = false;
            if (num_inputs == 0) {
                // the segwit marker is followed by the flag
                if (dec.uint_fixed<uint8_t>(1) != 0x01) [[unlikely]]
                    throw err_invalid_transaction_t {};
                with_witness = true;
                num_inputs = dec.count();
            }
            if (num_inputs == 0) [[unlikely]]
                throw err_invalid_transaction_t {};
            tx.inputs.resize(num_inputs);
            for (auto &in: tx.inputs) {
                dec.process_bytes_fixed(in.prevout.txid);
                in.prevout.vout = dec.uint_fixed<uint32_t>(4);
                in.script_sig = read_var_bytes(dec);
                in.sequence = dec.uint_fixed<uint32_t>(4);
            }
            tx.outputs.resize(dec.count());
            for (auto &out: tx.outputs) {
                out.value = dec.uint_fixed<uint64_t>(8);
                out.script_pubkey = read_var_bytes(dec);
            }
            if (with_witness) {
                for (auto &in: tx.inputs) {
                    in.witness.resize(dec.count());
                    for (auto &item: in.witness)
                        item = read_var_bytes(dec);
                }
                if (!tx.has_witness()) [[unlikely]]
                    throw err_invalid_transaction_t {};
            }
            tx.lock_time = dec.uint_fixed<uint32_t>(4);
            return tx;
        }
    }

    txid_t txid_t::from_string(const std::string_view hex)
    {
        auto res = txid_t::from_hex<txid_t>(hex);
        std::reverse(res.begin(), res.end());
        return res;
    }

    std::string txid_t::to_string() const
    {
        auto rev = static_cast<const byte_array<32> &>(*this);
        std::reverse(rev.begin(), rev.end());
        return to_hex(rev);
    }

    transaction_t transaction_t::from_raw(const buffer bytes)
    {
        codec::binary::decoder dec { bytes };
        try {
            auto tx = read_tx(dec);
            if (!dec.empty()) [[unlikely]]
                throw err_invalid_transaction_t {};
            return tx;
        } catch (const err_invalid_transaction_t &) {
            throw;
        } catch (const error &ex) {
            logger::debug("failed to parse a bitcoin transaction: {}", ex.what());
            throw err_invalid_transaction_t {};
        }
    }

    transaction_t transaction_t::from_hex(const std::string_view hex)
    {
        if (hex.size() % 2 != 0) [[unlikely]]
            throw err_invalid_transaction_t {};
        return from_raw(uint8_vector::from_hex(hex));
    }

    transaction_t transaction_t::from_bytes(codec::binary::decoder &dec)
    {
        uint8_vector raw_bytes {};
        dec.process_bytes(raw_bytes);
        return from_raw(raw_bytes);
    }

    transaction_t transaction_t::from_json(const boost::json::value &jv)
    {
        return from_hex(codec::json::strip_hex_prefix(boost::json::value_to<std::string_view>(jv)));
    }

    uint8_vector transaction_t::raw() const
    {
        codec::binary::encoder enc {};
        write_tx(enc, *this, has_witness());
        return std::move(enc.bytes());
    }

    uint8_vector transaction_t::raw_without_witness() const
    {
        codec::binary::encoder enc {};
        write_tx(enc, *this, false);
        return std::move(enc.bytes());
    }

    std::string transaction_t::to_hex() const
    {
        return btcanchor::to_hex(raw());
    }

    bool transaction_t::has_witness() const
    {
        return std::any_of(inputs.begin(), inputs.end(), [](const auto &in) { return !in.witness.empty(); });
    }

    txid_t transaction_t::txid() const
    {
        return crypto::sha256::double_digest<txid_t>(raw_without_witness());
    }

    crypto::sha256::hash_t transaction_t::signature_hash(const size_t input_idx, const buffer script_code, const amount_t amount, const uint32_t hash_type) const
    {
        if (hash_type != sighash_all) [[unlikely]]
            throw error(fmt::format("unsupported signature hash type: {}", hash_type));
        if (input_idx >= inputs.size()) [[unlikely]]
            throw error(fmt::format("input index {} is out of range, the transaction has {} inputs", input_idx, inputs.size()));

        codec::binary::encoder prevouts {};
        codec::binary::encoder sequences {};
        for (const auto &in: inputs) {
            write_outpoint(prevouts, in.prevout);
            sequences.uint_fixed(4, in.sequence);
        }
        codec::binary::encoder outs {};
        for (const auto &out: outputs) {
            outs.uint_fixed(8, out.value);
            write_var_bytes(outs, out.script_pubkey);
        }

        const auto &in = inputs[input_idx];
        codec::binary::encoder preimage {};
        preimage.uint_fixed(4, version);
        preimage.next_bytes(crypto::sha256::double_digest(prevouts.bytes()));
        preimage.next_bytes(crypto::sha256::double_digest(sequences.bytes()));
        write_outpoint(preimage, in.prevout);
        write_var_bytes(preimage, script_code);
        preimage.uint_fixed(8, amount);
        preimage.uint_fixed(4, in.sequence);
        preimage.next_bytes(crypto::sha256::double_digest(outs.bytes()));
        preimage.uint_fixed(4, lock_time);
        preimage.uint_fixed(4, hash_type);
        return crypto::sha256::double_digest(preimage.bytes());
    }

    amount_t value_sum(const sequence_t<tx_out_t> &outs)
    {
        amount_t sum = 0;
        for (const auto &out: outs) {
            if (sum + out.value < sum) [[unlikely]]
                throw err_invalid_transaction_t {};
            sum += out.value;
        }
        return sum;
    }

    void transaction_t::to_bytes(codec::binary::encoder &enc) const
    {
        enc.process_bytes(raw());
    }

    boost::json::value transaction_t::to_json() const
    {
        return boost::json::value(to_hex());
    }
}
