#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include "script.hpp"
#include "transaction.hpp"

namespace btcanchor::btc {
    using block_hash_t = byte_array_t<32>;

    // OP_RETURN commitment of a ledger block: "ANCHOR" | version | kind | height (u64 LE) | block hash
    struct payload_t {
        static constexpr std::string_view magic { "ANCHOR" };
        static constexpr uint8_t current_version = 1;
        static constexpr uint8_t kind_regular = 0;
        static constexpr size_t size = 6 + 1 + 1 + 8 + 32;

        uint64_t height = 0;
        block_hash_t block_hash {};

        [[nodiscard]] uint8_vector bytes() const;
        [[nodiscard]] script_t script_pubkey() const;
        // nullopt for any script that is not an anchoring payload
        static std::optional<payload_t> from_script(buffer script);
        // looks through the outputs of the transaction
        static std::optional<payload_t> from_transaction(const transaction_t &tx);

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("height"sv, height);
            archive.process("block_hash"sv, block_hash);
        }

        bool operator==(const payload_t &o) const = default;
    };
}
