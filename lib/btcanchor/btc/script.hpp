#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <vector>
#include <btcanchor/codec/types.hpp>
#include <btcanchor/crypto/secp256k1.hpp>
#include <btcanchor/crypto/sha256.hpp>

namespace btcanchor::btc {
    using public_key_t = crypto::secp256k1::vkey_t;

    // the key limit of OP_CHECKMULTISIG
    static constexpr size_t max_multisig_keys = 20;

    namespace opcode {
        static constexpr uint8_t op_0 = 0x00;
        static constexpr uint8_t op_pushdata1 = 0x4c;
        static constexpr uint8_t op_pushdata2 = 0x4d;
        static constexpr uint8_t op_1 = 0x51;
        static constexpr uint8_t op_16 = 0x60;
        static constexpr uint8_t op_return = 0x6a;
        static constexpr uint8_t op_checkmultisig = 0xae;
    }

    struct script_t: byte_sequence_t {
        using base_type = byte_sequence_t;
        using base_type::base_type;

        script_t &push_opcode(uint8_t op);
        // minimal push of a byte string
        script_t &push_data(buffer data);
        // OP_1 .. OP_16
        script_t &push_small_int(size_t n);
    };

    // Accepts compressed and uncompressed SEC1 keys, always returns the compressed form
    extern public_key_t parse_public_key(buffer bytes);

    // m-of-n OP_CHECKMULTISIG script used as a P2WSH witness script
    struct redeem_script_t {
        size_t quorum = 0;
        std::vector<public_key_t> keys {};

        // throws err_empty_key_set_t, err_invalid_threshold_t or err_too_many_keys_t
        static redeem_script_t make(std::vector<public_key_t> keys, size_t quorum);
        static redeem_script_t from_script(buffer script);

        [[nodiscard]] script_t script() const;
        [[nodiscard]] crypto::sha256::hash_t script_hash() const;
        // OP_0 <sha256(script)>
        [[nodiscard]] script_t script_pubkey() const;
        [[nodiscard]] std::optional<size_t> key_index(const public_key_t &key) const;

        bool operator==(const redeem_script_t &o) const = default;
    };

    extern script_t op_return_script(buffer data);
}
