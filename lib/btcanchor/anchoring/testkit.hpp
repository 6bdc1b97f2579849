#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/storage/memory.hpp>
#include <btcanchor/storage/update.hpp>
#include "errors.hpp"
#include "service.hpp"

namespace btcanchor::anchoring::testkit {
    // Presents a database as the ledger state after the given height
    struct view_t final: fork_t {
        view_t(const height_t height, const std::vector<btc::block_hash_t> &block_hashes, const service_keys_t &service_keys, storage::db_t &db):
            _height { height },
            _block_hashes { block_hashes },
            _service_keys { service_keys },
            _db { db }
        {
        }

        height_t height() const override
        {
            return _height;
        }

        btc::block_hash_t block_hash(const height_t height) const override
        {
            if (height > _height || height >= _block_hashes.size()) [[unlikely]]
                throw error(fmt::format("no block at height {}", height));
            return _block_hashes[height];
        }

        const service_keys_t &service_keys() const override
        {
            return _service_keys;
        }

        const storage::db_t &db() const override
        {
            return _db;
        }

        storage::db_t &mutable_db() override
        {
            return _db;
        }
    private:
        height_t _height;
        const std::vector<btc::block_hash_t> &_block_hashes;
        const service_keys_t &_service_keys;
        storage::db_t &_db;
    };

    struct node_t {
        crypto::ed25519::key_pair_t consensus_key;
        crypto::secp256k1::key_pair_t anchoring_key;
        std::shared_ptr<memory_key_store_t> keys;
        std::unique_ptr<service_t> service;
        std::vector<message_t> outbox {};
    };

    // A ledger replicated by in-process validators sharing a simulated Bitcoin network.
    // Every block executes the submitted messages, commits, mines one Bitcoin block,
    // and runs the per-block handler of every node.
    struct testkit_t {
        static constexpr btc::amount_t default_funds = 100000;

        explicit testkit_t(const size_t num_validators, const uint64_t frequency=5, const btc::amount_t funds=default_funds)
        {
            if (num_validators == 0) [[unlikely]]
                throw error("a test ledger requires at least one validator");
            for (size_t i = 0; i < num_validators; ++i)
                _add_node();
            auto cfg = config_for_all_nodes();
            cfg.frequency = frequency;
            cfg.utxo_confirmations = 2;
            btc::transaction_t funding {};
            funding.inputs.emplace_back().prevout.txid = btc::txid_t::from_string("4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b");
            funding.outputs.emplace_back(btc::tx_out_t { funds, cfg.address().script_pubkey() });
            cfg.funding = std::move(funding);
            _relay->add_confirmed(*cfg.funding, 100);
            for (auto &n: _nodes) {
                n.keys->insert(cfg.address(), n.anchoring_key.sk);
                n.service = std::make_unique<service_t>(cfg, n.keys, _relay, service_identity_t { numeric_cast<validator_id_t>(&n - _nodes.data()), n.consensus_key });
            }
            _genesis = std::move(cfg);

            storage::update::db_t fork { _db };
            view_t genesis_view { 0, _block_hashes, _service_keys, fork };
            _nodes.front().service->initialize(genesis_view);
            fork.commit();
            _finish_block();
        }

        // the height of the latest committed block
        [[nodiscard]] height_t height() const
        {
            return _block_hashes.size() - 1;
        }

        [[nodiscard]] view_t snapshot()
        {
            return { height(), _block_hashes, _service_keys, *_db };
        }

        [[nodiscard]] schema_t schema() const
        {
            return schema_t { *_db };
        }

        [[nodiscard]] const config_t &genesis() const
        {
            return _genesis;
        }

        [[nodiscard]] memory_relay_t &relay()
        {
            return *_relay;
        }

        [[nodiscard]] std::vector<node_t> &nodes()
        {
            return _nodes;
        }

        [[nodiscard]] node_t &node(const size_t idx)
        {
            return _nodes.at(idx);
        }

        // the names of the errors of the messages the ledger rejected, in the order of execution
        [[nodiscard]] const std::vector<std::string> &rejected() const
        {
            return _rejected;
        }

        // the outboxes of all nodes, leaving them empty
        [[nodiscard]] std::vector<message_t> take_outboxes()
        {
            std::vector<message_t> msgs {};
            for (auto &n: _nodes) {
                for (auto &m: n.outbox)
                    msgs.emplace_back(std::move(m));
                n.outbox.clear();
            }
            return msgs;
        }

        // executes the given messages in a new block
        void create_block(const std::vector<message_t> &msgs)
        {
            storage::update::db_t fork { _db };
            const auto fork_ptr = std::shared_ptr<storage::db_t>(&fork, [](storage::db_t *) {});
            for (const auto &msg: msgs) {
                storage::update::db_t msg_db { fork_ptr };
                view_t view { height(), _block_hashes, _service_keys, msg_db };
                protocol_error_t::catch_into([&] {
                    config_error_t::catch_into([&] {
                        // the ledger executes the binary form as received from the network
                        const auto decoded = _nodes.front().service->decode(msg.encode());
                        _nodes.front().service->execute(view, decoded);
                        msg_db.commit();
                    }, [&](const config_error_t &err) {
                        _reject(static_cast<const config_error_base_t &>(err));
                    });
                }, [&](const protocol_error_t &err) {
                    _reject(static_cast<const protocol_error_base_t &>(err));
                });
            }
            fork.commit();
            _finish_block();
        }

        // executes the messages the nodes submitted after the previous block
        void create_block()
        {
            create_block(take_outboxes());
        }

        void create_blocks(const size_t num_blocks)
        {
            for (size_t i = 0; i < num_blocks; ++i)
                create_block();
        }

        // keeps creating blocks until the chain reaches the given size
        bool create_blocks_until_chain_size(const size_t chain_size, const size_t max_blocks=64)
        {
            for (size_t i = 0; i < max_blocks; ++i) {
                if (schema().chain_size() >= chain_size)
                    return true;
                create_block();
            }
            return schema().chain_size() >= chain_size;
        }

        // Adds a consensus validator that is not yet a part of the anchoring configuration.
        // Its anchoring key is bound to the address of config_for_all_nodes().
        size_t add_validator()
        {
            auto &n = _add_node();
            const auto id = _nodes.size() - 1;
            n.keys->insert(config_for_all_nodes().address(), n.anchoring_key.sk);
            n.service = std::make_unique<service_t>(_genesis, n.keys, _relay, service_identity_t { numeric_cast<validator_id_t>(id), n.consensus_key });
            return id;
        }

        // the genesis parameters over the anchoring keys of all nodes and without a funding transaction
        [[nodiscard]] config_t config_for_all_nodes() const
        {
            std::vector<btc::public_key_t> keys {};
            for (const auto &n: _nodes)
                keys.emplace_back(n.anchoring_key.vk);
            auto cfg = _genesis;
            cfg.validators.clear();
            for (const auto &k: keys)
                cfg.validators.emplace_back(k);
            cfg.funding.reset();
            return cfg;
        }
    private:
        std::shared_ptr<storage::memory::db_t> _db = std::make_shared<storage::memory::db_t>();
        std::shared_ptr<memory_relay_t> _relay = std::make_shared<memory_relay_t>();
        std::vector<node_t> _nodes {};
        service_keys_t _service_keys {};
        std::vector<btc::block_hash_t> _block_hashes {};
        std::vector<std::string> _rejected {};
        config_t _genesis {};

        node_t &_add_node()
        {
            auto &n = _nodes.emplace_back(node_t { crypto::ed25519::key_pair_t::random(), crypto::secp256k1::create(), std::make_shared<memory_key_store_t>() });
            _service_keys.emplace_back(n.consensus_key.vk);
            return n;
        }

        template<typename T>
        void _reject(const T &err)
        {
            std::visit([&](const auto &e) {
                _rejected.emplace_back(e.what());
            }, err);
        }

        void _finish_block()
        {
            const height_t new_height = _block_hashes.size();
            const auto height_bytes = codec::binary::to_bytes(new_height);
            const auto prev_hash = _block_hashes.empty() ? btc::block_hash_t {} : _block_hashes.back();
            const auto state_hashes = schema().state_hash();
            _block_hashes.emplace_back(crypto::blake2b::digest_many({ height_bytes, prev_hash, state_hashes.at(0), state_hashes.at(1), state_hashes.at(2) }));
            _relay->mine(1);
            for (auto &n: _nodes) {
                auto msgs = n.service->after_commit(snapshot());
                for (auto &m: msgs)
                    n.outbox.emplace_back(std::move(m));
            }
        }
    };
}
