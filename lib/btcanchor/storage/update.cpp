/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/common/logger.hpp>
#include "update.hpp"

namespace btcanchor::storage::update {
    db_t::db_t(storage::db_ptr_t base):
        _base { std::move(base) }
    {
        if (!_base) [[unlikely]]
            throw error("update::db_t requires a base db");
    }

    void db_t::clear()
    {
        rollback();
        _base->foreach([&](const auto &k, const auto &) {
            _changes.insert_or_assign(k, value_t {});
            --_size_delta;
        });
    }

    void db_t::erase(const buffer key)
    {
        _change(key, {});
    }

    void db_t::set(const buffer key, const buffer val)
    {
        _change(key, uint8_vector { val });
    }

    value_t db_t::get(const buffer key) const
    {
        if (const auto it = _changes.find(uint8_vector { key }); it != _changes.end())
            return it->second;
        return _base->get(key);
    }

    size_t db_t::size() const
    {
        return static_cast<size_t>(static_cast<std::ptrdiff_t>(_base->size()) + _size_delta);
    }

    void db_t::foreach(const observer_t &obs) const
    {
        // merges two ordered sequences, the pending changes win on equal keys
        auto chg_it = _changes.begin();
        const auto emit_changes_before = [&](const uint8_vector *key) {
            for (; chg_it != _changes.end() && (!key || chg_it->first < *key); ++chg_it) {
                if (chg_it->second)
                    obs(chg_it->first, *chg_it->second);
            }
        };
        _base->foreach([&](const auto &k, const auto &v) {
            emit_changes_before(&k);
            if (chg_it != _changes.end() && chg_it->first == k) {
                if (chg_it->second)
                    obs(k, *chg_it->second);
                ++chg_it;
            } else {
                obs(k, v);
            }
        });
        emit_changes_before(nullptr);
    }

    size_t db_t::commit()
    {
        // an exception thrown by the base db leaves the changes partially applied
        size_t num_written = 0;
        for (const auto &[k, v]: _changes) {
            if (v)
                _base->set(k, *v);
            else
                _base->erase(k);
            ++num_written;
        }
        logger::trace("storage::update::db: committed {} changes", num_written);
        rollback();
        return num_written;
    }

    void db_t::rollback()
    {
        _changes.clear();
        _size_delta = 0;
    }

    void db_t::_change(const buffer key, value_t val)
    {
        uint8_vector k { key };
        const auto base_val = _base->get(k);
        const auto prev_val = [&]() -> value_t {
            if (const auto it = _changes.find(k); it != _changes.end())
                return it->second;
            return base_val;
        }();
        _size_delta += (val ? 1 : 0) - (prev_val ? 1 : 0);
        if (val == base_val)
            _changes.erase(k);
        else
            _changes.insert_or_assign(std::move(k), std::move(val));
    }
}
