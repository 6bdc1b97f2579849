/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "errors.hpp"
#include "network.hpp"

namespace btcanchor::btc {
    std::string_view hrp(const network_t net)
    {
        switch (net) {
            case network_t::bitcoin: return "bc";
            case network_t::testnet: return "tb";
            [[unlikely]] default: throw error(fmt::format("unsupported network value: {}", static_cast<int>(net)));
        }
    }

    std::string_view to_string(const network_t net)
    {
        switch (net) {
            case network_t::bitcoin: return "bitcoin";
            case network_t::testnet: return "testnet";
            [[unlikely]] default: throw error(fmt::format("unsupported network value: {}", static_cast<int>(net)));
        }
    }

    network_t network_from_string(const std::string_view literal)
    {
        if (literal == "bitcoin")
            return network_t::bitcoin;
        if (literal == "testnet")
            return network_t::testnet;
        throw err_invalid_network_literal_t {};
    }
}
