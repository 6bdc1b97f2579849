/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <btcanchor/common/test.hpp>
#include "errors.hpp"
#include "transaction.hpp"

namespace {
    using namespace btcanchor;
    using namespace btcanchor::btc;

    // the unsigned transaction of the native P2WPKH example from BIP143
    static constexpr std::string_view bip143_unsigned_hex {
        "0100000002fff7f7881a8099afa6940d42d1e7f6362bec38171ea3edf433541db4e4ad969f0000000000eeffffffef51e1b804cc89d182d279655c3aa89e815b1b309fe287d9b2b55d57b90ec68a0100000000ffffffff02202cb206000000001976a9148280b37df378db99f66f85c95a783a76ac7a6d5988ac9093510d000000001976a9143bde42dbee7e4dbe6a21b2d50ce2f0167faa815988ac11000000"
    };
}

suite btcanchor_btc_transaction_suite = [] {
    "btcanchor::btc::transaction"_test = [] {
        "genesis coinbase"_test = [] {
            const std::string_view hex { "01000000010000000000000000000000000000000000000000000000000000000000000000ffffffff4d04ffff001d0104455468652054696d65732030332f4a616e2f32303039204368616e63656c6c6f72206f6e206272696e6b206f66207365636f6e64206261696c6f757420666f722062616e6b73ffffffff0100f2052a01000000434104678afdb0fe5548271967f1a67130b7105cd6a828e03909a67962e0ea1f61deb649f6bc3f4cef38c4f35504e51ec112de5c384df7ba0b8d578a4c702b6bf11d5fac00000000" };
            const auto tx = transaction_t::from_hex(hex);
            expect_equal(uint32_t { 1 }, tx.version);
            expect_equal(size_t { 1 }, tx.inputs.size());
            expect_equal(size_t { 1 }, tx.outputs.size());
            expect_equal(amount_t { 5000000000ULL }, tx.outputs[0].value);
            expect(!tx.has_witness());
            expect_equal(std::string { hex }, tx.to_hex());
            expect_equal(std::string { "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b" }, tx.txid().to_string());
        };
        "txid string order"_test = [] {
            const auto id = txid_t::from_string("4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b");
            expect_equal(uint8_t { 0x3b }, id[0]);
            expect_equal(uint8_t { 0x4a }, id[31]);
            expect_equal(std::string { "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b" }, fmt::format("{}", id));
        };
        "segwit serialization"_test = [] {
            auto tx = transaction_t::from_hex(bip143_unsigned_hex);
            const auto txid = tx.txid();
            expect_equal(std::string { "3335ffae0df20c5407e8de12b49405c8e912371f00fe4132bfaf95ad49c40243" }, txid.to_string());
            tx.inputs[1].witness.emplace_back();
            tx.inputs[1].witness.emplace_back(uint8_vector::from_hex("aabbcc"));
            const auto exp_hex = "01000000000102fff7f7881a8099afa6940d42d1e7f6362bec38171ea3edf433541db4e4ad969f0000000000eeffffffef51e1b804cc89d182d279655c3aa89e815b1b309fe287d9b2b55d57b90ec68a0100000000ffffffff02202cb206000000001976a9148280b37df378db99f66f85c95a783a76ac7a6d5988ac9093510d000000001976a9143bde42dbee7e4dbe6a21b2d50ce2f0167faa815988ac00020003aabbcc11000000";
            expect_equal(std::string { exp_hex }, tx.to_hex());
            // the witness does not change the txid
            expect_equal(txid, tx.txid());
            const auto parsed = transaction_t::from_hex(exp_hex);
            expect(parsed == tx);
        };
        "bip143 signature hash"_test = [] {
            const auto tx = transaction_t::from_hex(bip143_unsigned_hex);
            const auto script_code = uint8_vector::from_hex("76a9141d0f172a0ecb48aee1be1f2687d2963ae33f71a188ac");
            expect_equal(crypto::sha256::hash_t::from_hex("c37af31116d1b27caf68aae9e3ac82f1477929014d5b917657d0eb49478cb670"),
                tx.signature_hash(1, script_code, 600000000));
            expect(throws([&] { static_cast<void>(tx.signature_hash(2, script_code, 600000000)); }));
            expect(throws([&] { static_cast<void>(tx.signature_hash(1, script_code, 600000000, 2)); }));
        };
        "malformed transactions"_test = [] {
            const auto raw = uint8_vector::from_hex(bip143_unsigned_hex);
            expect(throws<err_invalid_transaction_t>([&] { transaction_t::from_raw(buffer { raw.data(), raw.size() - 1 }); }));
            auto extra = raw;
            extra.emplace_back(0);
            expect(throws<err_invalid_transaction_t>([&] { transaction_t::from_raw(extra); }));
            expect(throws<err_invalid_transaction_t>([] { transaction_t::from_hex("abc"); }));
            // a segwit marker without any witness data
            expect(throws<err_invalid_transaction_t>([] { transaction_t::from_hex("010000000001010000000000000000000000000000000000000000000000000000000000000000ffffffff00ffffffff010000000000000000000000000000"); }));
        };
        "value sum"_test = [] {
            sequence_t<tx_out_t> outs {};
            expect_equal(amount_t { 0 }, value_sum(outs));
            outs.emplace_back(tx_out_t { 5000 });
            outs.emplace_back(tx_out_t { 700 });
            expect_equal(amount_t { 5700 }, value_sum(outs));
            outs.emplace_back(tx_out_t { std::numeric_limits<amount_t>::max() - 5000 });
            expect(throws<err_invalid_transaction_t>([&] { static_cast<void>(value_sum(outs)); }));
        };
        "codecs"_test = [] {
            const auto tx = transaction_t::from_hex(bip143_unsigned_hex);
            const auto jv = codec::json::to_json(tx);
            expect(jv.is_string());
            expect(tx == codec::json::from_json<transaction_t>(jv));
            const auto bytes = codec::binary::to_bytes(tx);
            expect(tx == codec::binary::from_bytes<transaction_t>(bytes));
        };
    };
};
