#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <string_view>
#include <btcanchor/common/bytes.hpp>

// Segregated witness v0 addresses as defined by BIP173
namespace btcanchor::btc::bech32 {
    struct segwit_address_t {
        std::string hrp {};
        uint8_t version = 0;
        uint8_vector program {};
    };

    extern std::string encode(std::string_view hrp, uint8_t witness_version, buffer program);
    // accepts all-lowercase and all-uppercase strings, throws err_invalid_address_t otherwise
    extern segwit_address_t decode(std::string_view addr);
}
