#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/codec/binary.hpp>
#include <btcanchor/codec/json.hpp>
#include <btcanchor/codec/types.hpp>
#include <btcanchor/crypto/sha256.hpp>
#include "script.hpp"

namespace btcanchor::btc {
    // satoshis
    using amount_t = uint64_t;

    static constexpr uint32_t sighash_all = 1;
    static constexpr uint32_t sequence_final = 0xFFFFFFFF;

    // Stored in the internal byte order, printed and parsed in the reversed one like block explorers do
    struct txid_t: byte_array_t<32> {
        using base_type = byte_array_t<32>;
        using base_type::base_type;

        static txid_t from_string(std::string_view hex);
        [[nodiscard]] std::string to_string() const;
    };

    struct outpoint_t {
        txid_t txid {};
        uint32_t vout = 0;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("txid"sv, txid);
            archive.process("vout"sv, vout);
        }

        std::strong_ordering operator<=>(const outpoint_t &o) const = default;
        bool operator==(const outpoint_t &o) const = default;
    };

    struct tx_in_t {
        outpoint_t prevout {};
        script_t script_sig {};
        uint32_t sequence = sequence_final;
        sequence_t<byte_sequence_t> witness {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("prevout"sv, prevout);
            archive.process("script_sig"sv, script_sig);
            archive.process("sequence"sv, sequence);
            archive.process("witness"sv, witness);
        }

        bool operator==(const tx_in_t &o) const = default;
    };

    struct tx_out_t {
        amount_t value = 0;
        script_t script_pubkey {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("value"sv, value);
            archive.process("script_pubkey"sv, script_pubkey);
        }

        bool operator==(const tx_out_t &o) const = default;
    };

    // throws err_invalid_transaction_t when the sum does not fit amount_t
    [[nodiscard]] amount_t value_sum(const sequence_t<tx_out_t> &outs);

    struct transaction_t {
        uint32_t version = 2;
        sequence_t<tx_in_t> inputs {};
        sequence_t<tx_out_t> outputs {};
        uint32_t lock_time = 0;

        // throws err_invalid_transaction_t
        static transaction_t from_raw(buffer bytes);
        static transaction_t from_hex(std::string_view hex);
        static transaction_t from_bytes(codec::binary::decoder &dec);
        static transaction_t from_json(const boost::json::value &jv);

        // the segwit serialization when any input carries a witness
        [[nodiscard]] uint8_vector raw() const;
        [[nodiscard]] uint8_vector raw_without_witness() const;
        [[nodiscard]] std::string to_hex() const;
        [[nodiscard]] bool has_witness() const;
        [[nodiscard]] txid_t txid() const;
        // BIP143 signature hash of an input spending a segwit v0 output
        [[nodiscard]] crypto::sha256::hash_t signature_hash(size_t input_idx, buffer script_code, amount_t amount, uint32_t hash_type=sighash_all) const;

        void to_bytes(codec::binary::encoder &enc) const;
        [[nodiscard]] boost::json::value to_json() const;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("version"sv, version);
            archive.process("inputs"sv, inputs);
            archive.process("outputs"sv, outputs);
            archive.process("lock_time"sv, lock_time);
        }

        bool operator==(const transaction_t &o) const = default;
    };
}

namespace fmt {
    template<>
    struct formatter<btcanchor::btc::txid_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const btcanchor::btc::txid_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}
