#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <memory>
#include <optional>
#include "config.hpp"

namespace btcanchor::anchoring {
    // The private anchoring keys of a node, bound to the addresses they spend from
    struct key_store_t {
        virtual ~key_store_t() = default;
        [[nodiscard]] virtual std::optional<private_key_t> lookup(const btc::address_t &addr) const = 0;
        // binds the key of old_addr to new_addr as well,
        // returns false when old_addr has no key or new_addr already has one
        virtual bool rotate(const btc::address_t &old_addr, const btc::address_t &new_addr) = 0;
    };
    using key_store_ptr_t = std::shared_ptr<key_store_t>;

    // Thread-safe: lookups proceed concurrently while a rotation is exclusive
    struct memory_key_store_t final: key_store_t {
        // throws err_invalid_address_t for a malformed address
        static std::shared_ptr<memory_key_store_t> from_local_config(const local_config_t &local);

        explicit memory_key_store_t();
        ~memory_key_store_t() override;
        void insert(const btc::address_t &addr, const private_key_t &sk);
        [[nodiscard]] std::optional<private_key_t> lookup(const btc::address_t &addr) const override;
        bool rotate(const btc::address_t &old_addr, const btc::address_t &new_addr) override;
        [[nodiscard]] size_t size() const;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
