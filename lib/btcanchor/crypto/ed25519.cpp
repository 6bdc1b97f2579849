/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "ed25519.hpp"
#include "sodium.hpp"

namespace btcanchor::crypto::ed25519 {
    key_pair_t key_pair_t::from_seed(const seed_t &seed)
    {
        sodium::ensure_initialized();
        key_pair_t kp {};
        sodium::check(sodium::crypto_sign_seed_keypair(kp.vk.data(), kp.sk.data(), seed.data()), "crypto_sign_seed_keypair");
        return kp;
    }

    key_pair_t key_pair_t::random()
    {
        seed_t seed {};
        sodium::random_bytes(seed);
        return from_seed(seed);
    }

    signature_t key_pair_t::sign(const buffer &msg) const
    {
        sodium::ensure_initialized();
        signature_t sig {};
        sodium::check(sodium::crypto_sign_detached(sig.data(), nullptr, msg.data(), msg.size(), sk.data()), "crypto_sign_detached");
        return sig;
    }

    bool verify(const vkey_t &vk, const buffer &msg, const signature_t &sig)
    {
        sodium::ensure_initialized();
        return sodium::crypto_sign_verify_detached(sig.data(), msg.data(), msg.size(), vk.data()) == 0;
    }
}
