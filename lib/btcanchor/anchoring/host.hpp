#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <vector>
#include <btcanchor/btc/payload.hpp>
#include <btcanchor/crypto/ed25519.hpp>
#include <btcanchor/storage/common.hpp>
#include "config.hpp"

namespace btcanchor::anchoring {
    // the consensus keys of the validators, indexed by validator id
    using service_keys_t = std::vector<crypto::ed25519::vkey_t>;

    // A read-only view of the ledger after its latest committed block
    struct snapshot_t {
        virtual ~snapshot_t() = default;
        [[nodiscard]] virtual height_t height() const = 0;
        // defined for heights up to height()
        [[nodiscard]] virtual btc::block_hash_t block_hash(height_t height) const = 0;
        [[nodiscard]] virtual const service_keys_t &service_keys() const = 0;
        [[nodiscard]] virtual const storage::db_t &db() const = 0;
    };

    // A snapshot with pending changes of the block being executed
    struct fork_t: snapshot_t {
        [[nodiscard]] virtual storage::db_t &mutable_db() = 0;
    };
}
