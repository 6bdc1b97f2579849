/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "blake2b.hpp"
#include "sodium.hpp"

namespace btcanchor::crypto::blake2b {
    struct hasher_t::impl {
        impl()
        {
            sodium::ensure_initialized();
            sodium::check(sodium::crypto_generichash_init(&_state, nullptr, 0, sizeof(hash_t)), "crypto_generichash_init");
        }

        void update(const buffer data)
        {
            if (_finished) [[unlikely]]
                throw error("blake2b: update after finish");
            sodium::check(sodium::crypto_generichash_update(&_state, data.data(), data.size()), "crypto_generichash_update");
        }

        hash_t finish()
        {
            if (_finished) [[unlikely]]
                throw error("blake2b: finish called twice");
            _finished = true;
            hash_t out {};
            sodium::check(sodium::crypto_generichash_final(&_state, out.data(), out.size()), "crypto_generichash_final");
            return out;
        }
    private:
        sodium::crypto_generichash_state _state {};
        bool _finished = false;
    };

    hasher_t::hasher_t():
        _impl { std::make_unique<impl>() }
    {
    }

    hasher_t::~hasher_t() =default;

    hasher_t &hasher_t::update(const buffer data)
    {
        _impl->update(data);
        return *this;
    }

    hash_t hasher_t::finish()
    {
        return _impl->finish();
    }

    hash_t digest(const buffer in)
    {
        return digest_many({ in });
    }

    hash_t digest_many(const std::initializer_list<buffer> ins)
    {
        hasher_t h {};
        for (const auto &in: ins)
            h.update(in);
        return h.finish();
    }
}
