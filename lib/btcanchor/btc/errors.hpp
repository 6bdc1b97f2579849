#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/common/error.hpp>

namespace btcanchor::btc {
    struct err_empty_key_set_t final: error {
        err_empty_key_set_t(): error { "err_empty_key_set_t" } {}
        bool operator==(const err_empty_key_set_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_threshold_t final: error {
        err_invalid_threshold_t(): error { "err_invalid_threshold_t" } {}
        bool operator==(const err_invalid_threshold_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_too_many_keys_t final: error {
        err_too_many_keys_t(): error { "err_too_many_keys_t" } {}
        bool operator==(const err_too_many_keys_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_duplicate_key_t final: error {
        err_duplicate_key_t(): error { "err_duplicate_key_t" } {}
        bool operator==(const err_duplicate_key_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_public_key_t final: error {
        err_invalid_public_key_t(): error { "err_invalid_public_key_t" } {}
        bool operator==(const err_invalid_public_key_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_network_literal_t final: error {
        err_invalid_network_literal_t(): error { "err_invalid_network_literal_t" } {}
        bool operator==(const err_invalid_network_literal_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_address_t final: error {
        err_invalid_address_t(): error { "err_invalid_address_t" } {}
        bool operator==(const err_invalid_address_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_script_t final: error {
        err_invalid_script_t(): error { "err_invalid_script_t" } {}
        bool operator==(const err_invalid_script_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_transaction_t final: error {
        err_invalid_transaction_t(): error { "err_invalid_transaction_t" } {}
        bool operator==(const err_invalid_transaction_t &) const { return true; }
        void serialize(auto &) {}
    };
}
