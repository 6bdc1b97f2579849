/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "payload.hpp"

namespace btcanchor::btc {
    uint8_vector payload_t::bytes() const
    {
        codec::binary::encoder enc {};
        enc.next_bytes(magic);
        enc.uint_fixed(1, current_version);
        enc.uint_fixed(1, kind_regular);
        enc.uint_fixed(8, height);
        enc.next_bytes(block_hash);
        return std::move(enc.bytes());
    }

    script_t payload_t::script_pubkey() const
    {
        return op_return_script(bytes());
    }

    std::optional<payload_t> payload_t::from_script(const buffer script)
    {
        if (script.size() != size + 2 || script[0] != opcode::op_return || script[1] != size)
            return {};
        codec::binary::decoder dec { script.subbuf(2) };
        if (dec.next_bytes(magic.size()) != buffer { magic })
            return {};
        if (dec.next() != current_version || dec.next() != kind_regular)
            return {};
        payload_t res {};
        res.height = dec.uint_fixed<uint64_t>(8);
        dec.process_bytes_fixed(res.block_hash);
        return res;
    }

    std::optional<payload_t> payload_t::from_transaction(const transaction_t &tx)
    {
        for (const auto &out: tx.outputs) {
            if (auto p = from_script(out.script_pubkey); p)
                return p;
        }
        return {};
    }
}
