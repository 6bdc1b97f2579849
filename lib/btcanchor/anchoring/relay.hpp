#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <memory>
#include <optional>
#include <btcanchor/btc/address.hpp>
#include <btcanchor/btc/transaction.hpp>

namespace btcanchor::anchoring {
    // The connection of a node to the Bitcoin network, the methods throw on transport failures
    struct relay_t {
        virtual ~relay_t() = default;
        // broadcasting an already known transaction has no effect
        virtual void broadcast(const btc::transaction_t &tx) = 0;
        // nullopt when the transaction is unknown to the network
        [[nodiscard]] virtual std::optional<uint64_t> confirmations(const btc::txid_t &txid) const = 0;
        virtual void watch_address(const btc::address_t &addr) = 0;
    };
    using relay_ptr_t = std::shared_ptr<relay_t>;

    // A simulated Bitcoin network shared by the nodes of a test ledger
    struct memory_relay_t final: relay_t {
        explicit memory_relay_t();
        ~memory_relay_t() override;

        void broadcast(const btc::transaction_t &tx) override;
        [[nodiscard]] std::optional<uint64_t> confirmations(const btc::txid_t &txid) const override;
        void watch_address(const btc::address_t &addr) override;

        // makes a transaction known with the given number of confirmations
        void add_confirmed(const btc::transaction_t &tx, uint64_t confirmations);
        // every known transaction gains num_blocks confirmations
        void mine(uint64_t num_blocks=1);
        // an unavailable relay fails every request with err_relay_unavailable_t
        void set_available(bool available);
        [[nodiscard]] std::optional<btc::transaction_t> find(const btc::txid_t &txid) const;
        [[nodiscard]] size_t num_broadcasts() const;
        [[nodiscard]] bool watched(const btc::address_t &addr) const;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
