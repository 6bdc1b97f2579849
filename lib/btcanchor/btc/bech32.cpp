/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <array>
#include <cctype>
#include <vector>
#include "bech32.hpp"
#include "errors.hpp"

namespace btcanchor::btc::bech32 {
    static constexpr std::string_view charset { "qpzry9x8gf2tvdw0s3jn54khce6mua7l" };
    static constexpr size_t checksum_size = 6;
    static constexpr size_t max_size = 90;

    static uint32_t polymod(const std::vector<uint8_t> &values)
    {
        static constexpr std::array<uint32_t, 5> gen { 0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };
        uint32_t chk = 1;
        for (const auto v: values) {
            const auto top = chk >> 25;
            chk = ((chk & 0x1ffffff) << 5) ^ v;
            for (size_t i = 0; i < gen.size(); ++i) {
                if ((top >> i) & 1)
                    chk ^= gen[i];
            }
        }
        return chk;
    }

    static std::vector<uint8_t> hrp_expand(const std::string_view hrp)
    {
        std::vector<uint8_t> res {};
        res.reserve(hrp.size() * 2 + 1);
        for (const auto c: hrp)
            res.emplace_back(static_cast<uint8_t>(c) >> 5);
        res.emplace_back(0);
        for (const auto c: hrp)
            res.emplace_back(static_cast<uint8_t>(c) & 0x1f);
        return res;
    }

    // regroups a sequence of from_bits-wide values into to_bits-wide ones
    static std::vector<uint8_t> convert_bits(const buffer in, const unsigned from_bits, const unsigned to_bits, const bool pad)
    {
        std::vector<uint8_t> res {};
        uint32_t acc = 0;
        unsigned bits = 0;
        const uint32_t max_v = (uint32_t { 1 } << to_bits) - 1;
        for (const auto v: in) {
            if ((v >> from_bits) != 0) [[unlikely]]
                throw err_invalid_address_t {};
            acc = (acc << from_bits) | v;
            bits += from_bits;
            while (bits >= to_bits) {
                bits -= to_bits;
                res.emplace_back(static_cast<uint8_t>((acc >> bits) & max_v));
            }
        }
        if (pad) {
            if (bits)
                res.emplace_back(static_cast<uint8_t>((acc << (to_bits - bits)) & max_v));
        } else if (bits >= from_bits || ((acc << (to_bits - bits)) & max_v)) [[unlikely]] {
            throw err_invalid_address_t {};
        }
        return res;
    }

    static void validate_program(const uint8_t version, const size_t program_size)
    {
        // witness versions above 0 use the bech32m checksum which is not supported here
        if (version != 0) [[unlikely]]
            throw err_invalid_address_t {};
        if (program_size != 20 && program_size != 32) [[unlikely]]
            throw err_invalid_address_t {};
    }

    std::string encode(const std::string_view hrp, const uint8_t witness_version, const buffer program)
    {
        validate_program(witness_version, program.size());
        if (hrp.empty()) [[unlikely]]
            throw err_invalid_address_t {};
        std::vector<uint8_t> data { witness_version };
        const auto program5 = convert_bits(program, 8, 5, true);
        data.insert(data.end(), program5.begin(), program5.end());

        auto values = hrp_expand(hrp);
        values.insert(values.end(), data.begin(), data.end());
        values.resize(values.size() + checksum_size, 0);
        const auto mod = polymod(values) ^ 1;

        std::string res { hrp };
        res.reserve(hrp.size() + 1 + data.size() + checksum_size);
        res += '1';
        for (const auto v: data)
            res += charset[v];
        for (size_t i = 0; i < checksum_size; ++i)
            res += charset[(mod >> (5 * (5 - i))) & 0x1f];
        return res;
    }

    segwit_address_t decode(const std::string_view addr)
    {
        if (addr.size() > max_size) [[unlikely]]
            throw err_invalid_address_t {};
        bool has_lower = false;
        bool has_upper = false;
        std::string lower {};
        lower.reserve(addr.size());
        for (const auto c: addr) {
            if (c < 33 || c > 126) [[unlikely]]
                throw err_invalid_address_t {};
            has_lower |= std::islower(static_cast<unsigned char>(c)) != 0;
            has_upper |= std::isupper(static_cast<unsigned char>(c)) != 0;
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (has_lower && has_upper) [[unlikely]]
            throw err_invalid_address_t {};
        const auto sep = lower.rfind('1');
        if (sep == std::string::npos || sep == 0 || sep + 1 + checksum_size > lower.size()) [[unlikely]]
            throw err_invalid_address_t {};

        segwit_address_t res {};
        res.hrp = lower.substr(0, sep);
        std::vector<uint8_t> data {};
        data.reserve(lower.size() - sep - 1);
        for (size_t i = sep + 1; i < lower.size(); ++i) {
            const auto pos = charset.find(lower[i]);
            if (pos == std::string_view::npos) [[unlikely]]
                throw err_invalid_address_t {};
            data.emplace_back(static_cast<uint8_t>(pos));
        }
        auto values = hrp_expand(res.hrp);
        values.insert(values.end(), data.begin(), data.end());
        if (polymod(values) != 1) [[unlikely]]
            throw err_invalid_address_t {};
        data.resize(data.size() - checksum_size);
        if (data.empty()) [[unlikely]]
            throw err_invalid_address_t {};
        res.version = data.front();
        res.program = convert_bits(buffer { data.data() + 1, data.size() - 1 }, 5, 8, false);
        validate_program(res.version, res.program.size());
        return res;
    }
}
