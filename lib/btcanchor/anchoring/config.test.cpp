/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/codec/binary.hpp>
#include <btcanchor/codec/json.hpp>
#include <btcanchor/common/test.hpp>
#include "config.hpp"
#include "errors.hpp"

namespace {
    using namespace btcanchor;
    using namespace btcanchor::anchoring;

    const std::vector<btc::public_key_t> &test_keys()
    {
        static const std::vector<btc::public_key_t> keys {
            btc::public_key_t::from_hex("0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"),
            btc::public_key_t::from_hex("02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"),
            btc::public_key_t::from_hex("02f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9"),
            btc::public_key_t::from_hex("02e493dbf1c10d80f3581e4904930b1404cc6c13900ee0758474fa94abe8c4cd13")
        };
        return keys;
    }

    btc::transaction_t test_funding_tx(const btc::address_t &addr, const btc::amount_t amount)
    {
        btc::transaction_t tx {};
        tx.inputs.emplace_back().prevout = btc::outpoint_t { btc::txid_t::from_string("4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b"), 0 };
        tx.outputs.emplace_back(btc::tx_out_t { amount, addr.script_pubkey() });
        return tx;
    }
}

suite btcanchor_anchoring_config_suite = [] {
    "btcanchor::anchoring::config"_test = [] {
        "majority count"_test = [] {
            expect_equal(size_t { 1 }, majority_count(1));
            expect_equal(size_t { 2 }, majority_count(2));
            expect_equal(size_t { 3 }, majority_count(3));
            expect_equal(size_t { 3 }, majority_count(4));
            expect_equal(size_t { 4 }, majority_count(5));
            expect_equal(size_t { 5 }, majority_count(7));
            expect_equal(size_t { 14 }, majority_count(20));
            for (size_t n = 1; n <= btc::max_multisig_keys; ++n) {
                const auto m = majority_count(n);
                expect(m >= 1 && m <= n) << n;
                // more than two thirds of the validators
                expect(3 * m > 2 * n) << n;
            }
        };
        "latest anchoring height"_test = [] {
            auto cfg = config_t::make(btc::network_t::testnet, test_keys()[0]);
            expect_equal(height_t { 1000 }, cfg.latest_anchoring_height(1200));
            expect_equal(height_t { 0 }, cfg.latest_anchoring_height(499));
            expect_equal(height_t { 500 }, cfg.latest_anchoring_height(500));
            cfg.frequency = 7;
            for (height_t h = 0; h < 50; ++h) {
                const auto lh = cfg.latest_anchoring_height(h);
                expect(lh % cfg.frequency == 0 && lh <= h && h - lh < cfg.frequency) << h;
            }
            cfg.frequency = 0;
            expect(throws<err_zero_frequency_t>([&] { return cfg.latest_anchoring_height(10); }));
        };
        "bootstrap configuration"_test = [] {
            const auto cfg = config_t::make(btc::network_t::testnet, test_keys()[0]);
            expect_equal(size_t { 1 }, cfg.validators.size());
            expect(cfg.validators[0] == test_keys()[0]);
            expect_equal(size_t { 1 }, cfg.majority_count());
            expect(!cfg.funding.has_value());
            expect_equal(btc::amount_t { 1000 }, cfg.fee);
            expect_equal(uint64_t { 500 }, cfg.frequency);
            expect_equal(uint64_t { 5 }, cfg.utxo_confirmations);
            expect_equal(std::string { "tb1q9qs9xv7mjghkd69fgx62xttxmeww5q7eekjxu0nxtzf4yu4ekf8szffujl" }, cfg.address().to_string());
            expect(throws<err_missing_funding_transaction_t>([&] { return cfg.funding_tx(); }));
        };
        "missing funding transaction"_test = [] {
            config_t cfg {};
            for (const auto &vk: test_keys())
                cfg.validators.emplace_back(vk);
            expect_equal(size_t { 3 }, cfg.majority_count());
            expect(throws<err_missing_funding_transaction_t>([&] { return cfg.funding_tx(); }));
            cfg.validate();
        };
        "redeem script binds the address"_test = [] {
            const std::vector<btc::public_key_t> keys(test_keys().begin(), test_keys().begin() + 3);
            const auto bootstrap = config_t::make_with_funding_tx(btc::network_t::testnet, keys, btc::transaction_t {});
            const auto ms = bootstrap.redeem_script();
            expect_equal(size_t { 3 }, ms.redeem_script.quorum);
            expect(ms.redeem_script.keys == keys);
            expect(ms.address == btc::derive_multisig(keys, 3, btc::network_t::testnet).address);
            const auto cfg = config_t::make_with_funding_tx(btc::network_t::testnet, keys, test_funding_tx(ms.address, 20000));
            expect_equal(ms.address, cfg.address());
            expect(cfg.funding_tx().outputs.at(0).script_pubkey == ms.address.script_pubkey());
            auto mainnet = cfg;
            mainnet.network = btc::network_t::bitcoin;
            expect(mainnet.address() != cfg.address());
            expect(mainnet.address().program == cfg.address().program);
        };
        "validate"_test = [] {
            auto cfg = config_t::make(btc::network_t::testnet, test_keys()[0]);
            cfg.validate();
            auto zero_freq = cfg;
            zero_freq.frequency = 0;
            expect(throws<err_zero_frequency_t>([&] { zero_freq.validate(); }));
            auto empty = cfg;
            empty.validators.clear();
            expect(throws<btc::err_empty_key_set_t>([&] { empty.validate(); }));
            auto bad_key = cfg;
            bad_key.validators[0][0] = 0x05;
            expect(throws<btc::err_invalid_public_key_t>([&] { bad_key.validate(); }));
            auto too_many = cfg;
            too_many.validators.assign(21, cfg.validators[0]);
            expect(throws<btc::err_too_many_keys_t>([&] { too_many.validate(); }));
            // one party holding two slots would count twice toward the majority
            auto repeated = config_t::make_with_funding_tx(btc::network_t::testnet, test_keys(), btc::transaction_t {});
            repeated.validators[1] = repeated.validators[0];
            expect(throws<btc::err_duplicate_key_t>([&] { repeated.validate(); }));
            std::optional<config_error_t> dup_caught {};
            config_error_t::catch_into(
                [&] { repeated.validate(); },
                [&](config_error_t err) { dup_caught.emplace(std::move(err)); }
            );
            expect(dup_caught.has_value() && std::holds_alternative<btc::err_duplicate_key_t>(*dup_caught));
            std::optional<config_error_t> caught {};
            config_error_t::catch_into(
                [&] { zero_freq.validate(); },
                [&](config_error_t err) { caught.emplace(std::move(err)); }
            );
            expect(caught.has_value() && std::holds_alternative<err_zero_frequency_t>(*caught));
        };
        "json"_test = [] {
            const auto jv = boost::json::parse(R"({
                "validators": [
                    "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798",
                    "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"
                ],
                "fee": 2000,
                "frequency": 100,
                "utxo_confirmations": 3,
                "network": "bitcoin"
            })");
            const auto cfg = codec::json::from_json<config_t>(jv);
            expect_equal(size_t { 2 }, cfg.validators.size());
            expect(cfg.validators[1] == test_keys()[1]);
            expect(!cfg.funding.has_value());
            expect_equal(btc::amount_t { 2000 }, cfg.fee);
            expect_equal(uint64_t { 100 }, cfg.frequency);
            expect_equal(uint64_t { 3 }, cfg.utxo_confirmations);
            expect_equal(btc::network_t::bitcoin, cfg.network);

            const auto out = codec::json::to_json(cfg);
            expect(out.as_object().at("network").as_string() == "bitcoin");
            expect(!out.as_object().contains("funding_tx"));
            expect_equal(cfg, codec::json::from_json<config_t>(out));

            auto bad_net = jv;
            bad_net.as_object()["network"] = "regtest";
            expect(throws<btc::err_invalid_network_literal_t>([&] { codec::json::from_json<config_t>(bad_net); }));
            auto no_fee = jv;
            no_fee.as_object().erase("fee");
            expect(throws([&] { codec::json::from_json<config_t>(no_fee); }));
        };
        "json with a funding transaction"_test = [] {
            const std::vector<btc::public_key_t> keys(test_keys().begin(), test_keys().begin() + 3);
            const auto addr = btc::derive_multisig(keys, 3, btc::network_t::testnet).address;
            const auto cfg = config_t::make_with_funding_tx(btc::network_t::testnet, keys, test_funding_tx(addr, 50000));
            const auto jv = codec::json::to_json(cfg);
            expect(jv.as_object().at("funding_tx").as_string() == cfg.funding_tx().to_hex());
            expect(jv.as_object().at("network").as_string() == "testnet");
            expect_equal(cfg, codec::json::from_json<config_t>(jv));
            expect_equal(cfg, codec::binary::from_bytes<config_t>(codec::binary::to_bytes(cfg)));

            file::tmp t { "anchoring-config-test.json" };
            codec::json::save_pretty(t.path(), jv);
            expect_equal(cfg, config_t::load(t.path()));
        };
        "local configuration"_test = [] {
            const auto jv = boost::json::parse(R"({
                "rpc": { "host": "http://127.0.0.1:18332", "username": "user", "password": "secret" },
                "private_keys": [
                    {
                        "address": "tb1q9qs9xv7mjghkd69fgx62xttxmeww5q7eekjxu0nxtzf4yu4ekf8szffujl",
                        "private_key": "0000000000000000000000000000000000000000000000000000000000000001"
                    }
                ]
            })");
            const auto local = codec::json::from_json<local_config_t>(jv);
            expect(local.rpc.has_value());
            expect_equal(std::string { "http://127.0.0.1:18332" }, local.rpc->host);
            expect_equal(std::string { "user" }, local.rpc->username);
            expect_equal(size_t { 1 }, local.private_keys.size());
            const auto &sk = local.private_keys.at("tb1q9qs9xv7mjghkd69fgx62xttxmeww5q7eekjxu0nxtzf4yu4ekf8szffujl");
            expect(crypto::secp256k1::public_key(sk) == test_keys()[0]);
            expect(local == codec::json::from_json<local_config_t>(codec::json::to_json(local)));

            auto no_rpc = jv;
            no_rpc.as_object().erase("rpc");
            expect(!codec::json::from_json<local_config_t>(no_rpc).rpc.has_value());
        };
    };
};
