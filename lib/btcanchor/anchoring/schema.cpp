/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/btc/payload.hpp>
#include "errors.hpp"
#include "schema.hpp"

namespace btcanchor::anchoring {
    schema_t::schema_t(const storage::db_t &db):
        _db { db }
    {
    }

    uint8_vector schema_t::_key(const std::string_view name)
    {
        uint8_vector key {};
        key << buffer { prefix } << buffer { name };
        return key;
    }

    uint8_vector schema_t::_key(const std::string_view name, const buffer suffix)
    {
        auto key = _key(name);
        key << uint8_t { '.' } << suffix;
        return key;
    }

    // big-endian so that the keys sort in the chain order
    uint8_vector schema_t::_chain_key(const size_t idx)
    {
        std::array<uint8_t, sizeof(uint64_t)> idx_bytes {};
        for (size_t i = 0; i < idx_bytes.size(); ++i)
            idx_bytes[i] = static_cast<uint8_t>(static_cast<uint64_t>(idx) >> ((idx_bytes.size() - 1 - i) * 8));
        return _key("chain", buffer { idx_bytes.data(), idx_bytes.size() });
    }

    epoch_log_t schema_t::epochs() const
    {
        return _get<epoch_log_t>(_key("epochs")).value_or(epoch_log_t {});
    }

    size_t schema_t::chain_size() const
    {
        return numeric_cast<size_t>(_get<uint64_t>(_key("chain_size")).value_or(0));
    }

    btc::transaction_t schema_t::chain_at(const size_t idx) const
    {
        const auto raw = _db.get(_chain_key(idx));
        if (!raw) [[unlikely]]
            throw error(fmt::format("the anchoring chain has no transaction #{}", idx));
        return btc::transaction_t::from_raw(*raw);
    }

    std::optional<btc::transaction_t> schema_t::chain_tip() const
    {
        if (const auto sz = chain_size(); sz > 0)
            return chain_at(sz - 1);
        return {};
    }

    std::vector<btc::transaction_t> schema_t::chain() const
    {
        std::vector<btc::transaction_t> txs {};
        const auto sz = chain_size();
        txs.reserve(sz);
        for (size_t i = 0; i < sz; ++i)
            txs.emplace_back(chain_at(i));
        return txs;
    }

    std::optional<height_t> schema_t::latest_anchored_height() const
    {
        if (const auto tip = chain_tip(); tip) {
            if (const auto payload = btc::payload_t::from_transaction(*tip); payload)
                return payload->height;
        }
        return {};
    }

    set_t<btc::txid_t> schema_t::spent_funding() const
    {
        return _get<set_t<btc::txid_t>>(_key("spent_funding")).value_or(set_t<btc::txid_t> {});
    }

    bool schema_t::funding_spent(const btc::txid_t &txid) const
    {
        const auto spent = spent_funding();
        return spent.find(txid) != spent.end();
    }

    tx_signatures_t schema_t::signatures(const btc::txid_t &txid) const
    {
        if (auto pending = pending_signatures(); pending && pending->txid == txid)
            return std::move(pending->sigs);
        return {};
    }

    std::optional<pending_signatures_t> schema_t::pending_signatures() const
    {
        return _get<pending_signatures_t>(_key("signatures"));
    }

    config_votes_t schema_t::config_votes() const
    {
        return _get<config_votes_t>(_key("config_votes")).value_or(config_votes_t {});
    }

    anchoring_state_t schema_t::state(const height_t height) const
    {
        return project_state(epochs(), height, chain_tip());
    }

    std::vector<crypto::blake2b::hash_t> schema_t::state_hash() const
    {
        sequence_t<btc::txid_t> txids {};
        const auto sz = chain_size();
        txids.reserve(sz);
        for (size_t i = 0; i < sz; ++i)
            txids.emplace_back(chain_at(i).txid());
        return {
            crypto::blake2b::digest(codec::binary::to_bytes(txids)),
            crypto::blake2b::digest(codec::binary::to_bytes(spent_funding())),
            crypto::blake2b::digest(codec::binary::to_bytes(epochs()))
        };
    }

    mutable_schema_t::mutable_schema_t(storage::db_t &db):
        schema_t { db },
        _mutable_db { db }
    {
    }

    void mutable_schema_t::push_epoch(const config_epoch_t &epoch)
    {
        auto log = epochs();
        if (log.empty() ? epoch.activation_height != 0 : epoch.activation_height <= log.back().activation_height) [[unlikely]]
            throw err_invalid_activation_height_t {};
        log.emplace_back(epoch);
        _set(_key("epochs"), log);
    }

    void mutable_schema_t::push_chain(const btc::transaction_t &tx)
    {
        const auto sz = chain_size();
        _mutable_db.set(_chain_key(sz), tx.raw());
        _set(_key("chain_size"), static_cast<uint64_t>(sz + 1));
    }

    void mutable_schema_t::add_spent_funding(const btc::txid_t &txid)
    {
        auto spent = spent_funding();
        spent.emplace(txid);
        _set(_key("spent_funding"), spent);
    }

    void mutable_schema_t::set_signatures(const btc::txid_t &txid, const tx_signatures_t &sigs)
    {
        _set(_key("signatures"), pending_signatures_t { txid, sigs });
    }

    void mutable_schema_t::erase_signatures()
    {
        _mutable_db.erase(_key("signatures"));
    }

    void mutable_schema_t::set_config_votes(const config_votes_t &votes)
    {
        _set(_key("config_votes"), votes);
    }
}
