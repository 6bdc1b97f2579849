/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/codec/json.hpp>
#include "config.hpp"
#include "errors.hpp"

namespace btcanchor::anchoring {
    config_t config_t::make(const btc::network_t net, const btc::public_key_t &public_key)
    {
        config_t cfg {};
        cfg.validators.emplace_back(public_key);
        cfg.network = net;
        return cfg;
    }

    config_t config_t::make_with_funding_tx(const btc::network_t net, const std::vector<btc::public_key_t> &validators, btc::transaction_t funding_tx)
    {
        config_t cfg {};
        cfg.validators.reserve(validators.size());
        for (const auto &vk: validators)
            cfg.validators.emplace_back(vk);
        cfg.funding.emplace(std::move(funding_tx));
        cfg.network = net;
        return cfg;
    }

    config_t config_t::load(const std::string &path)
    {
        return codec::json::load_obj<config_t>(path);
    }

    height_t config_t::latest_anchoring_height(const height_t height) const
    {
        if (!frequency) [[unlikely]]
            throw err_zero_frequency_t {};
        return height - height % frequency;
    }

    const btc::transaction_t &config_t::funding_tx() const
    {
        if (!funding) [[unlikely]]
            throw err_missing_funding_transaction_t {};
        return *funding;
    }

    std::vector<btc::public_key_t> config_t::public_keys() const
    {
        std::vector<btc::public_key_t> keys {};
        keys.reserve(validators.size());
        for (const auto &vk: validators)
            keys.emplace_back(vk);
        return keys;
    }

    btc::multisig_t config_t::redeem_script() const
    {
        return btc::derive_multisig(public_keys(), majority_count(), network);
    }

    btc::address_t config_t::address() const
    {
        return redeem_script().address;
    }

    void config_t::validate() const
    {
        if (validators.empty()) [[unlikely]]
            throw btc::err_empty_key_set_t {};
        if (!frequency) [[unlikely]]
            throw err_zero_frequency_t {};
        std::vector<btc::public_key_t> keys {};
        keys.reserve(validators.size());
        for (const auto &vk: validators)
            keys.emplace_back(btc::parse_public_key(vk));
        btc::redeem_script_t::make(std::move(keys), majority_count());
    }

    local_config_t local_config_t::load(const std::string &path)
    {
        return codec::json::load_obj<local_config_t>(path);
    }
}
