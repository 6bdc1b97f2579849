/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <mutex>
#include <set>
#include <btcanchor/common/logger.hpp>
#include "errors.hpp"
#include "relay.hpp"

namespace btcanchor::anchoring {
    struct memory_relay_t::impl {
        void broadcast(const btc::transaction_t &tx)
        {
            std::scoped_lock lk { _mutex };
            _check_available();
            ++_num_broadcasts;
            const auto txid = tx.txid();
            if (const auto [it, created] = _txs.try_emplace(txid, tx_info_t { tx, 0 }); created)
                logger::debug("btc_anchoring: relay accepted transaction {}", txid);
        }

        std::optional<uint64_t> confirmations(const btc::txid_t &txid) const
        {
            std::scoped_lock lk { _mutex };
            _check_available();
            if (const auto it = _txs.find(txid); it != _txs.end())
                return it->second.confirmations;
            return {};
        }

        void watch_address(const btc::address_t &addr)
        {
            std::scoped_lock lk { _mutex };
            _check_available();
            _watched.emplace(addr);
        }

        void add_confirmed(const btc::transaction_t &tx, const uint64_t confirmations)
        {
            std::scoped_lock lk { _mutex };
            _txs.insert_or_assign(tx.txid(), tx_info_t { tx, confirmations });
        }

        void mine(const uint64_t num_blocks)
        {
            std::scoped_lock lk { _mutex };
            for (auto &[txid, info]: _txs)
                info.confirmations += num_blocks;
        }

        void set_available(const bool available)
        {
            std::scoped_lock lk { _mutex };
            _available = available;
        }

        std::optional<btc::transaction_t> find(const btc::txid_t &txid) const
        {
            std::scoped_lock lk { _mutex };
            if (const auto it = _txs.find(txid); it != _txs.end())
                return it->second.tx;
            return {};
        }

        size_t num_broadcasts() const
        {
            std::scoped_lock lk { _mutex };
            return _num_broadcasts;
        }

        bool watched(const btc::address_t &addr) const
        {
            std::scoped_lock lk { _mutex };
            return _watched.contains(addr);
        }
    private:
        struct tx_info_t {
            btc::transaction_t tx;
            uint64_t confirmations = 0;
        };

        mutable std::mutex _mutex {};
        std::map<btc::txid_t, tx_info_t> _txs {};
        std::set<btc::address_t> _watched {};
        size_t _num_broadcasts = 0;
        bool _available = true;

        void _check_available() const
        {
            if (!_available) [[unlikely]]
                throw err_relay_unavailable_t {};
        }
    };

    memory_relay_t::memory_relay_t():
        _impl { std::make_unique<impl>() }
    {
    }

    memory_relay_t::~memory_relay_t() = default;

    void memory_relay_t::broadcast(const btc::transaction_t &tx)
    {
        _impl->broadcast(tx);
    }

    std::optional<uint64_t> memory_relay_t::confirmations(const btc::txid_t &txid) const
    {
        return _impl->confirmations(txid);
    }

    void memory_relay_t::watch_address(const btc::address_t &addr)
    {
        _impl->watch_address(addr);
    }

    void memory_relay_t::add_confirmed(const btc::transaction_t &tx, const uint64_t confirmations)
    {
        _impl->add_confirmed(tx, confirmations);
    }

    void memory_relay_t::mine(const uint64_t num_blocks)
    {
        _impl->mine(num_blocks);
    }

    void memory_relay_t::set_available(const bool available)
    {
        _impl->set_available(available);
    }

    std::optional<btc::transaction_t> memory_relay_t::find(const btc::txid_t &txid) const
    {
        return _impl->find(txid);
    }

    size_t memory_relay_t::num_broadcasts() const
    {
        return _impl->num_broadcasts();
    }

    bool memory_relay_t::watched(const btc::address_t &addr) const
    {
        return _impl->watched(addr);
    }
}
