#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <initializer_list>
#include <memory>
#include <btcanchor/common/bytes.hpp>

// unkeyed BLAKE2b-256 used for the ledger state and vote hashes
namespace btcanchor::crypto::blake2b {
    using hash_t = byte_array<32>;

    // incremental hashing of data that arrives in parts
    struct hasher_t {
        hasher_t();
        ~hasher_t();
        hasher_t(const hasher_t &) =delete;
        hasher_t &operator=(const hasher_t &) =delete;

        hasher_t &update(buffer data);
        // the hasher cannot be updated after this call
        [[nodiscard]] hash_t finish();
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };

    [[nodiscard]] extern hash_t digest(buffer in);
    // hashes the concatenation of all inputs
    [[nodiscard]] extern hash_t digest_many(std::initializer_list<buffer> ins);
}
