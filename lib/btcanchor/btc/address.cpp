/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "address.hpp"
#include "bech32.hpp"
#include "errors.hpp"

namespace btcanchor::btc {
    address_t address_t::p2wsh(const network_t net, const crypto::sha256::hash_t &script_hash)
    {
        return { net, 0, uint8_vector { static_cast<buffer>(script_hash) } };
    }

    address_t address_t::from_string(const std::string_view addr)
    {
        auto dec = bech32::decode(addr);
        address_t res {};
        if (dec.hrp == hrp(network_t::bitcoin))
            res.network = network_t::bitcoin;
        else if (dec.hrp == hrp(network_t::testnet))
            res.network = network_t::testnet;
        else [[unlikely]]
            throw err_invalid_address_t {};
        res.version = dec.version;
        res.program = std::move(dec.program);
        return res;
    }

    std::string address_t::to_string() const
    {
        return bech32::encode(hrp(network), version, program);
    }

    script_t address_t::script_pubkey() const
    {
        script_t s {};
        if (version == 0)
            s.push_opcode(opcode::op_0);
        else
            s.push_small_int(version);
        s.push_data(program);
        return s;
    }

    bool address_t::paid_by(const buffer script_pubkey_bytes) const
    {
        return script_pubkey() == script_pubkey_bytes;
    }

    multisig_t derive_multisig(std::vector<public_key_t> keys, const size_t quorum, const network_t net)
    {
        auto rs = redeem_script_t::make(std::move(keys), quorum);
        auto addr = address_t::p2wsh(net, rs.script_hash());
        return { std::move(rs), std::move(addr) };
    }
}
