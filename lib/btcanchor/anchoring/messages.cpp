/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/common/logger.hpp>
#include "errors.hpp"
#include "messages.hpp"

namespace btcanchor::anchoring {
    message_t message_t::make(const validator_id_t author, message_payload_t payload, const crypto::ed25519::key_pair_t &key)
    {
        message_t msg { author, std::move(payload) };
        msg.signature = key.sign(msg.signed_bytes());
        return msg;
    }

    message_t message_t::decode(const buffer raw)
    {
        try {
            return codec::binary::from_bytes<message_t>(raw);
        } catch (const error &ex) {
            logger::debug("btc_anchoring: failed to decode a message of {} bytes: {}", raw.size(), ex.what());
            throw err_decoding_t {};
        }
    }

    uint8_vector message_t::signed_bytes() const
    {
        codec::binary::encoder enc {};
        enc.process(author);
        enc.process(payload);
        return std::move(enc.bytes());
    }

    uint8_vector message_t::encode() const
    {
        return codec::binary::to_bytes(*this);
    }

    void message_t::verify(const service_keys_t &service_keys) const
    {
        if (author >= service_keys.size()) [[unlikely]]
            throw err_unauthorized_t {};
        if (!crypto::ed25519::verify(service_keys[author], signed_bytes(), signature)) [[unlikely]]
            throw err_unauthorized_t {};
    }
}
