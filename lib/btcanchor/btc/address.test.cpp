/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/common/test.hpp>
#include "address.hpp"
#include "errors.hpp"

namespace {
    using namespace btcanchor;
    using namespace btcanchor::btc;

    const std::vector<public_key_t> &test_keys()
    {
        static const std::vector<public_key_t> keys {
            public_key_t::from_hex("0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"),
            public_key_t::from_hex("02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"),
            public_key_t::from_hex("02f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9")
        };
        return keys;
    }
}

suite btcanchor_btc_address_suite = [] {
    "btcanchor::btc::address"_test = [] {
        "redeem script layout"_test = [] {
            const auto rs = redeem_script_t::make(test_keys(), 2);
            expect_equal(uint8_vector::from_hex("52210279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f817982102c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee52102f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f953ae"),
                static_cast<const uint8_vector &>(rs.script()));
            expect_equal(uint8_vector::from_hex("002012c2ffbc6ec1cf5d746dfbd49b1063356212ea55f43023ffc0145934af20c572"),
                static_cast<const uint8_vector &>(rs.script_pubkey()));
            expect(rs == redeem_script_t::from_script(rs.script()));
            expect_equal(size_t { 1 }, *rs.key_index(test_keys()[1]));
            expect(!rs.key_index(public_key_t {}).has_value());
        };
        "derivation"_test = [] {
            const auto ms = derive_multisig(test_keys(), 2, network_t::testnet);
            expect_equal(std::string { "tb1qztp0l0rwc8846ardl02fkyrrx43p96j47scz8l7qz3vnfteqc4equpkpz5" }, ms.address.to_string());
            const auto ms_main = derive_multisig(test_keys(), 2, network_t::bitcoin);
            expect_equal(std::string { "bc1qztp0l0rwc8846ardl02fkyrrx43p96j47scz8l7qz3vnfteqc4eqtfqwcm" }, ms_main.address.to_string());
            expect(ms == derive_multisig(test_keys(), 2, network_t::testnet));
            auto other_keys = test_keys();
            other_keys[2] = other_keys[0];
            expect(ms.address != derive_multisig(other_keys, 2, network_t::testnet).address);
            expect(ms.address != derive_multisig(test_keys(), 3, network_t::testnet).address);
            expect(ms.address.paid_by(ms.redeem_script.script_pubkey()));
            expect(!ms.address.paid_by(ms.address.program));
        };
        "single key"_test = [] {
            const auto ms = derive_multisig({ test_keys()[0] }, 1, network_t::testnet);
            expect_equal(std::string { "tb1q9qs9xv7mjghkd69fgx62xttxmeww5q7eekjxu0nxtzf4yu4ekf8szffujl" }, ms.address.to_string());
        };
        "derivation errors"_test = [] {
            expect(throws<err_empty_key_set_t>([] { derive_multisig({}, 1, network_t::testnet); }));
            expect(throws<err_invalid_threshold_t>([] { derive_multisig(test_keys(), 0, network_t::testnet); }));
            expect(throws<err_invalid_threshold_t>([] { derive_multisig(test_keys(), 4, network_t::testnet); }));
            const std::vector<public_key_t> many_keys(21, test_keys()[0]);
            expect(throws<err_too_many_keys_t>([&] { derive_multisig(many_keys, 15, network_t::testnet); }));
            const std::vector<public_key_t> repeated { test_keys()[0], test_keys()[1], test_keys()[0] };
            expect(throws<err_duplicate_key_t>([&] { derive_multisig(repeated, 2, network_t::testnet); }));
        };
        "address strings"_test = [] {
            const auto addr = address_t::from_string("tb1qztp0l0rwc8846ardl02fkyrrx43p96j47scz8l7qz3vnfteqc4equpkpz5");
            expect(addr.network == network_t::testnet);
            expect_equal(uint8_vector::from_hex("12c2ffbc6ec1cf5d746dfbd49b1063356212ea55f43023ffc0145934af20c572"), addr.program);
            const auto p2wpkh = address_t::from_string("BC1QW508D6QEJXTDG4Y5R3ZARVARY0C5XW7KV8F3T4");
            expect(p2wpkh.network == network_t::bitcoin);
            expect_equal(uint8_vector::from_hex("0014751e76e8199196d454941c45d1b3a323f1433bd6"), static_cast<const uint8_vector &>(p2wpkh.script_pubkey()));
            expect(throws<err_invalid_address_t>([] { address_t::from_string("ltc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4"); }));
        };
        "public keys"_test = [] {
            const auto uncompressed = uint8_vector::from_hex("0479be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8");
            expect_equal(test_keys()[0], parse_public_key(uncompressed));
            expect_equal(test_keys()[1], parse_public_key(test_keys()[1]));
            expect(throws<err_invalid_public_key_t>([] { parse_public_key(uint8_vector::from_hex("0011")); }));
            expect(throws<err_invalid_public_key_t>([] { parse_public_key(public_key_t {}); }));
        };
        "network literals"_test = [] {
            expect(network_from_string("bitcoin") == network_t::bitcoin);
            expect(network_from_string("testnet") == network_t::testnet);
            expect(throws<err_invalid_network_literal_t>([] { network_from_string("regtest"); }));
            expect_equal(std::string_view { "testnet" }, to_string(network_t::testnet));
        };
    };
};
