#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/common/bytes.hpp>

namespace btcanchor::crypto::secp256k1
{
    using skey_t = secure_byte_array<32>;
    // SEC1 compressed point encoding
    using vkey_t = byte_array<33>;
    using digest_t = byte_array<32>;
    // DER-encoded with a low S value
    using signature_t = uint8_vector;

    struct key_pair_t {
        skey_t sk;
        vkey_t vk;
    };

    extern vkey_t public_key(const skey_t &sk);
    extern key_pair_t create();
    extern signature_t sign(const digest_t &digest, const skey_t &sk);
    // Returns false for any malformed, non-canonical or high-S signature
    extern bool verify(const buffer &sig, const digest_t &digest, const vkey_t &vk);
    extern bool valid_public_key(const buffer &vk);
}
