#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include "common.hpp"

namespace btcanchor::storage::update {
    // A write overlay over another db: the ledger's view of a block under construction.
    // Reads see the pending changes, the base db is modified only by commit.
    // Not thread safe. The base db must not be modified by others while the overlay is alive.
    struct db_t final: storage::db_t {
        // std::nullopt marks an erased key
        using change_map_t = std::map<uint8_vector, value_t>;

        explicit db_t(storage::db_ptr_t base);
        db_t(const db_t &) = delete;

        void clear() override;
        void erase(buffer key) override;
        void foreach(const observer_t &obs) const override;
        value_t get(buffer key) const override;
        void set(buffer key, buffer val) override;
        [[nodiscard]] size_t size() const override;

        // applies the pending changes to the base db and returns the number of keys written or erased
        size_t commit();
        // drops the pending changes
        void rollback();

        [[nodiscard]] const change_map_t &changes() const noexcept
        {
            return _changes;
        }
    private:
        storage::db_ptr_t _base;
        change_map_t _changes {};
        // the difference in the number of keys between the overlay and the base
        std::ptrdiff_t _size_delta = 0;

        void _change(buffer key, value_t val);
    };
}
