/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/common/test.hpp>
#include "ed25519.hpp"

namespace {
    using namespace btcanchor;
    using namespace crypto::ed25519;
}

suite btcanchor_crypto_ed25519_suite = [] {
    "btcanchor::crypto::ed25519"_test = [] {
        "from_seed"_test = [] {
            // RFC 8032 test 1
            const auto kp = key_pair_t::from_seed(seed_t::from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"));
            expect_equal(vkey_t::from_hex("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"), kp.vk);
            const auto sig = kp.sign(buffer {});
            expect_equal(signature_t::from_hex("e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b"), sig);
            expect(verify(kp.vk, buffer {}, sig));
        };
        "random keys"_test = [] {
            const auto kp = key_pair_t::random();
            const auto other = key_pair_t::random();
            expect(kp.vk != other.vk);
            const std::string_view msg { "anchoring" };
            const auto sig = kp.sign(msg);
            expect(verify(kp.vk, msg, sig));
            expect(!verify(kp.vk, std::string_view { "anchorinG" }, sig));
            expect(!verify(other.vk, msg, sig));
        };
    };
};
