#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <array>
#include <compare>
#include <cstring>
#include <span>
#include <string>
#include <vector>
#include "error.hpp"
#include "format.hpp"

namespace btcanchor {
    // A non-owning view of a byte sequence, ordered lexicographically
    struct buffer: std::span<const uint8_t> {
        buffer() =default;
        buffer(const buffer &) =default;
        buffer &operator=(const buffer &) =default;

        buffer(const uint8_t *data, const size_t sz):
            std::span<const uint8_t> { data, sz }
        {
        }

        template <typename T, size_t SZ>
        buffer(const std::span<T, SZ> bytes):
            buffer { reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size_bytes() }
        {
        }

        buffer(const std::string_view s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer(const std::string &s):
            buffer { std::string_view { s } }
        {
        }

        operator std::string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            if (const auto common_sz = std::min(size(), o.size()); common_sz > 0) {
                if (const auto cmp = std::memcmp(data(), o.data(), common_sz); cmp != 0)
                    return cmp < 0 ? std::strong_ordering::less : std::strong_ordering::greater;
            }
            return size() <=> o.size();
        }

        bool operator==(const buffer &o) const noexcept
        {
            return size() == o.size() && (empty() || std::memcmp(data(), o.data(), size()) == 0);
        }

        buffer subbuf(const size_t offset, const size_t sz) const
        {
            if (offset > size() || sz > size() - offset) [[unlikely]]
                throw error(fmt::format("a slice [{}, {}) is outside of a buffer of {} bytes", offset, offset + sz, size()));
            return { data() + offset, sz };
        }

        buffer subbuf(const size_t offset) const
        {
            if (offset > size()) [[unlikely]]
                throw error(fmt::format("an offset {} is outside of a buffer of {} bytes", offset, size()));
            return subbuf(offset, size() - offset);
        }
    };

    // accepts both cases, the output must have exactly half the number of characters
    extern void init_from_hex(std::span<uint8_t> out, std::string_view hex);
    // lowercase hex
    extern std::string to_hex(buffer bytes);
    // zeroes memory in a way the optimizer cannot elide
    extern void secure_clear(std::span<uint8_t> store);

    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;

        template<typename C=byte_array<SZ>>
        static C from_hex(const std::string_view hex)
        {
            C res;
            init_from_hex(res, hex);
            return res;
        }

        byte_array(): base_type {}
        {
        }

        byte_array(const std::initializer_list<uint8_t> s)
        {
            *this = buffer { std::data(s), s.size() };
        }

        byte_array(const buffer s)
        {
            *this = s;
        }

        byte_array &operator=(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("expected {} bytes but got {}", SZ, s.size()));
            std::copy(s.begin(), s.end(), base_type::begin());
            return *this;
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }

        explicit operator std::string_view() const noexcept
        {
            return static_cast<buffer>(*this);
        }
    };

    // key material, zeroed on destruction
    template<size_t SZ>
    struct secure_byte_array: byte_array<SZ>
    {
        using byte_array<SZ>::byte_array;

        static secure_byte_array<SZ> from_hex(const std::string_view hex)
        {
            return byte_array<SZ>::template from_hex<secure_byte_array<SZ>>(hex);
        }

        secure_byte_array() =default;
        secure_byte_array(const secure_byte_array &) =default;
        secure_byte_array &operator=(const secure_byte_array &) =default;

        ~secure_byte_array()
        {
            secure_clear(*this);
        }
    };

    struct uint8_vector: std::vector<uint8_t> {
        using base_type = std::vector<uint8_t>;
        using base_type::base_type;

        template<typename C=uint8_vector>
        static C from_hex(const std::string_view hex)
        {
            if (hex.size() % 2 != 0) [[unlikely]]
                throw error(fmt::format("a hex string of odd length {}", hex.size()));
            C res(hex.size() / 2);
            init_from_hex(res, hex);
            return res;
        }

        uint8_vector() noexcept =default;

        uint8_vector(base_type &&o) noexcept:
            base_type { std::move(o) }
        {
        }

        uint8_vector(const size_t sz):
            base_type(sz)
        {
        }

        uint8_vector(const buffer bytes):
            base_type(bytes.begin(), bytes.end())
        {
        }

        uint8_vector &operator=(const buffer bytes)
        {
            assign(bytes.begin(), bytes.end());
            return *this;
        }

        operator buffer() const noexcept
        {
            return { data(), size() };
        }

        std::string_view str() const noexcept
        {
            return static_cast<buffer>(*this);
        }

        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            return static_cast<buffer>(*this) <=> o;
        }

        std::strong_ordering operator<=>(const uint8_vector &o) const noexcept
        {
            return *this <=> static_cast<buffer>(o);
        }

        bool operator==(const buffer &o) const noexcept
        {
            return static_cast<buffer>(*this) == o;
        }

        bool operator==(const uint8_vector &o) const noexcept
        {
            return *this == static_cast<buffer>(o);
        }
    };

    static_assert(std::is_constructible_v<uint8_vector, buffer>);
    static_assert(std::is_convertible_v<uint8_vector, buffer>);

    inline uint8_vector &operator<<(uint8_vector &v, const uint8_t b)
    {
        v.emplace_back(b);
        return v;
    }

    inline uint8_vector &operator<<(uint8_vector &v, const buffer buf)
    {
        v.insert(v.end(), buf.begin(), buf.end());
        return v;
    }
}

namespace fmt {
    template<size_t SZ>
    struct formatter<btcanchor::byte_array<SZ>>: formatter<std::span<const uint8_t>> {
        template<typename FormatContext>
        auto format(const btcanchor::byte_array<SZ> &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return formatter<std::span<const uint8_t>>::format(std::span<const uint8_t> { v.data(), v.size() }, ctx);
        }
    };

    template<size_t SZ>
    struct formatter<btcanchor::secure_byte_array<SZ>>: formatter<btcanchor::byte_array<SZ>> {
    };

    template<>
    struct formatter<btcanchor::buffer>: formatter<std::span<const uint8_t>> {
    };

    template<>
    struct formatter<btcanchor::uint8_vector>: formatter<std::span<const uint8_t>> {
        template<typename FormatContext>
        auto format(const btcanchor::uint8_vector &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return formatter<std::span<const uint8_t>>::format(std::span<const uint8_t> { v.data(), v.size() }, ctx);
        }
    };
}
