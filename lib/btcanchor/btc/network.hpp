#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <string_view>
#include <btcanchor/common/format.hpp>

namespace btcanchor::btc {
    enum class network_t: uint8_t {
        bitcoin,
        testnet
    };

    // the human-readable part of bech32 addresses
    extern std::string_view hrp(network_t net);
    extern std::string_view to_string(network_t net);
    // throws err_invalid_network_literal_t for anything but "bitcoin" and "testnet"
    extern network_t network_from_string(std::string_view literal);
}

namespace fmt {
    template<>
    struct formatter<btcanchor::btc::network_t>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const btcanchor::btc::network_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", btcanchor::btc::to_string(v));
        }
    };
}
