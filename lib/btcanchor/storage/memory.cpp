/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <mutex>
#include "memory.hpp"

namespace btcanchor::storage::memory {
    value_t db_t::get(const buffer key) const
    {
        std::shared_lock lk { _mutex };
        if (const auto it = _records.find(key); it != _records.end())
            return it->second;
        return {};
    }

    void db_t::set(const buffer key, const buffer val)
    {
        std::unique_lock lk { _mutex };
        _records.insert_or_assign(uint8_vector { key }, uint8_vector { val });
    }

    void db_t::erase(const buffer key)
    {
        std::unique_lock lk { _mutex };
        if (const auto it = _records.find(key); it != _records.end())
            _records.erase(it);
    }

    void db_t::clear()
    {
        std::unique_lock lk { _mutex };
        _records.clear();
    }

    void db_t::foreach(const observer_t &obs) const
    {
        map_t snapshot {};
        {
            std::shared_lock lk { _mutex };
            snapshot = _records;
        }
        for (const auto &[k, v]: snapshot)
            obs(k, v);
    }

    size_t db_t::size() const
    {
        std::shared_lock lk { _mutex };
        return _records.size();
    }
}
