#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <variant>
#include "host.hpp"
#include "signatures.hpp"

namespace btcanchor::anchoring {
    // a new configuration epoch put to the vote of the consensus validators
    using config_proposal_t = config_epoch_t;

    using message_payload_base_t = std::variant<config_proposal_t, signature_record_t>;

    struct message_payload_t: message_payload_base_t {
        using base_type = message_payload_base_t;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            static codec::variant_names_t<base_type> names {
                "config_proposal"sv,
                "signature"sv
            };
            archive.template process_variant<base_type>(*this, names);
        }
    };

    // A service message authenticated with the consensus key of its author.
    // Binary layout: author (u32), payload tag (u8), payload fields, ed25519 signature (64 bytes).
    struct message_t {
        validator_id_t author = 0;
        message_payload_t payload {};
        byte_array_t<sizeof(crypto::ed25519::signature_t)> signature {};

        static message_t make(validator_id_t author, message_payload_t payload, const crypto::ed25519::key_pair_t &key);
        // throws err_decoding_t for anything but a complete well-formed message
        static message_t decode(buffer raw);

        // the bytes covered by the signature
        [[nodiscard]] uint8_vector signed_bytes() const;
        [[nodiscard]] uint8_vector encode() const;
        // throws err_unauthorized_t unless the author is a consensus validator and the signature is valid
        void verify(const service_keys_t &service_keys) const;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("author"sv, author);
            archive.process("payload"sv, payload);
            archive.process("signature"sv, signature);
        }

        bool operator==(const message_t &o) const = default;
    };
}
