/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <btcanchor/codec/binary.hpp>
#include "errors.hpp"
#include "script.hpp"

namespace btcanchor::btc {
    script_t &script_t::push_opcode(const uint8_t op)
    {
        emplace_back(op);
        return *this;
    }

    script_t &script_t::push_data(const buffer data)
    {
        if (data.size() < opcode::op_pushdata1) {
            emplace_back(static_cast<uint8_t>(data.size()));
        } else if (data.size() <= 0xFF) {
            emplace_back(opcode::op_pushdata1);
            emplace_back(static_cast<uint8_t>(data.size()));
        } else if (data.size() <= 0xFFFF) {
            emplace_back(opcode::op_pushdata2);
            emplace_back(static_cast<uint8_t>(data.size() & 0xFF));
            emplace_back(static_cast<uint8_t>(data.size() >> 8));
        } else [[unlikely]] {
            throw error(fmt::format("script push data is too large: {} bytes", data.size()));
        }
        insert(end(), data.begin(), data.end());
        return *this;
    }

    script_t &script_t::push_small_int(const size_t n)
    {
        if (n < 1 || n > 16) [[unlikely]]
            throw error(fmt::format("a small int must be in [1, 16] but got {}", n));
        emplace_back(static_cast<uint8_t>(opcode::op_1 + n - 1));
        return *this;
    }

    public_key_t parse_public_key(const buffer bytes)
    {
        public_key_t res;
        if (bytes.size() == sizeof(public_key_t)) {
            res = bytes;
        } else if (bytes.size() == 65 && bytes[0] == 0x04) {
            res[0] = (bytes[64] & 1) ? 0x03 : 0x02;
            std::copy(bytes.begin() + 1, bytes.begin() + 33, res.begin() + 1);
        } else {
            throw err_invalid_public_key_t {};
        }
        if (!crypto::secp256k1::valid_public_key(res)) [[unlikely]]
            throw err_invalid_public_key_t {};
        return res;
    }

    redeem_script_t redeem_script_t::make(std::vector<public_key_t> keys, const size_t quorum)
    {
        if (keys.empty()) [[unlikely]]
            throw err_empty_key_set_t {};
        if (keys.size() > max_multisig_keys) [[unlikely]]
            throw err_too_many_keys_t {};
        if (quorum == 0 || quorum > keys.size()) [[unlikely]]
            throw err_invalid_threshold_t {};
        // every signature slot must belong to a distinct signer
        auto sorted_keys = keys;
        std::sort(sorted_keys.begin(), sorted_keys.end());
        if (std::adjacent_find(sorted_keys.begin(), sorted_keys.end()) != sorted_keys.end()) [[unlikely]]
            throw err_duplicate_key_t {};
        return { quorum, std::move(keys) };
    }

    redeem_script_t redeem_script_t::from_script(const buffer script)
    {
        codec::binary::decoder dec { script };
        const auto m_op = dec.next();
        if (m_op < opcode::op_1 || m_op > opcode::op_16) [[unlikely]]
            throw err_invalid_script_t {};
        std::vector<public_key_t> keys {};
        for (;;) {
            const auto op = dec.next();
            if (op == sizeof(public_key_t)) {
                keys.emplace_back(parse_public_key(dec.next_bytes(sizeof(public_key_t))));
                continue;
            }
            if (op < opcode::op_1 || op > opcode::op_16 || static_cast<size_t>(op - opcode::op_1 + 1) != keys.size()) [[unlikely]]
                throw err_invalid_script_t {};
            break;
        }
        if (dec.next() != opcode::op_checkmultisig || !dec.empty()) [[unlikely]]
            throw err_invalid_script_t {};
        return make(std::move(keys), m_op - opcode::op_1 + 1);
    }

    script_t redeem_script_t::script() const
    {
        script_t s {};
        s.push_small_int(quorum);
        for (const auto &k: keys)
            s.push_data(k);
        s.push_small_int(keys.size());
        s.push_opcode(opcode::op_checkmultisig);
        return s;
    }

    crypto::sha256::hash_t redeem_script_t::script_hash() const
    {
        return crypto::sha256::digest(script());
    }

    script_t redeem_script_t::script_pubkey() const
    {
        script_t s {};
        s.push_opcode(opcode::op_0);
        s.push_data(script_hash());
        return s;
    }

    std::optional<size_t> redeem_script_t::key_index(const public_key_t &key) const
    {
        if (const auto it = std::find(keys.begin(), keys.end(), key); it != keys.end())
            return static_cast<size_t>(it - keys.begin());
        return {};
    }

    script_t op_return_script(const buffer data)
    {
        script_t s {};
        s.push_opcode(opcode::op_return);
        s.push_data(data);
        return s;
    }
}
