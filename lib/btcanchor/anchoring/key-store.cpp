/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <mutex>
#include <shared_mutex>
#include <btcanchor/common/logger.hpp>
#include "key-store.hpp"

namespace btcanchor::anchoring {
    struct memory_key_store_t::impl {
        void insert(const btc::address_t &addr, const private_key_t &sk)
        {
            std::unique_lock lk { _mutex };
            _keys.insert_or_assign(addr, sk);
        }

        std::optional<private_key_t> lookup(const btc::address_t &addr) const
        {
            std::shared_lock lk { _mutex };
            if (const auto it = _keys.find(addr); it != _keys.end())
                return it->second;
            return {};
        }

        bool rotate(const btc::address_t &old_addr, const btc::address_t &new_addr)
        {
            if (old_addr == new_addr)
                return false;
            std::unique_lock lk { _mutex };
            const auto old_it = _keys.find(old_addr);
            if (old_it == _keys.end())
                return false;
            // an existing binding of the new address is never replaced
            const private_key_t sk = old_it->second;
            return _keys.try_emplace(new_addr, sk).second;
        }

        size_t size() const
        {
            std::shared_lock lk { _mutex };
            return _keys.size();
        }
    private:
        mutable std::shared_mutex _mutex {};
        std::map<btc::address_t, private_key_t> _keys {};
    };

    std::shared_ptr<memory_key_store_t> memory_key_store_t::from_local_config(const local_config_t &local)
    {
        auto store = std::make_shared<memory_key_store_t>();
        for (const auto &[addr, sk]: local.private_keys)
            store->insert(btc::address_t::from_string(addr), sk);
        return store;
    }

    memory_key_store_t::memory_key_store_t():
        _impl { std::make_unique<impl>() }
    {
    }

    memory_key_store_t::~memory_key_store_t() = default;

    void memory_key_store_t::insert(const btc::address_t &addr, const private_key_t &sk)
    {
        _impl->insert(addr, sk);
    }

    std::optional<private_key_t> memory_key_store_t::lookup(const btc::address_t &addr) const
    {
        return _impl->lookup(addr);
    }

    bool memory_key_store_t::rotate(const btc::address_t &old_addr, const btc::address_t &new_addr)
    {
        const auto rotated = _impl->rotate(old_addr, new_addr);
        if (rotated)
            logger::info("btc_anchoring: the anchoring key of {} is now bound to {}", old_addr, new_addr);
        return rotated;
    }

    size_t memory_key_store_t::size() const
    {
        return _impl->size();
    }
}
