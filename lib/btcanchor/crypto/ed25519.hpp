#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/common/bytes.hpp>

// Consensus keys of the ledger's validators, used to authenticate service messages
namespace btcanchor::crypto::ed25519
{
    using skey_t = secure_byte_array<64>;
    using seed_t = secure_byte_array<32>;
    using vkey_t = byte_array<32>;
    using signature_t = byte_array<64>;

    struct key_pair_t {
        skey_t sk {};
        vkey_t vk {};

        static key_pair_t from_seed(const seed_t &seed);
        static key_pair_t random();

        [[nodiscard]] signature_t sign(const buffer &msg) const;
    };

    [[nodiscard]] extern bool verify(const vkey_t &vk, const buffer &msg, const signature_t &sig);
}
