#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <shared_mutex>
#include "common.hpp"

namespace btcanchor::storage::memory {
    // The store of tests and single-process deployments.
    // Concurrent readers are allowed, writers are exclusive.
    struct db_t final: storage::db_t {
        value_t get(buffer key) const override;
        void set(buffer key, buffer val) override;
        void erase(buffer key) override;
        void clear() override;
        // observers receive a snapshot and may modify the db
        void foreach(const observer_t &obs) const override;
        [[nodiscard]] size_t size() const override;
    private:
        using map_t = std::map<uint8_vector, uint8_vector, std::less<>>;

        mutable std::shared_mutex _mutex {};
        map_t _records {};
    };
}
