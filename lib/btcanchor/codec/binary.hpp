#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <concepts>
#include <cstdint>
#include <iterator>
#include <btcanchor/common/bytes.hpp>
#include <btcanchor/common/numeric-cast.hpp>
#include "serializable.hpp"

// Bitcoin-style serialization of persisted records and service messages:
// little-endian fixed-width integers and CompactSize prefixes for every variable-length item.
namespace btcanchor::codec::binary {
    struct decoder;
    struct encoder;

    template<typename T>
    concept from_bytes_c = requires(decoder &dec)
    {
        { T::from_bytes(dec) } -> std::convertible_to<T>;
    };

    template<typename T>
    concept to_bytes_c = requires(const T &t, encoder &enc)
    {
        { t.to_bytes(enc) };
    };

    template<typename T>
    concept fixed_uint_c = std::unsigned_integral<T> && !std::same_as<T, bool>;

    struct encoder: codec::archive_t {
        void push(const std::string_view)
        {
        }

        void pop()
        {
        }

        void uint_fixed(const size_t num_bytes, const uint64_t val)
        {
            if (num_bytes == 0 || num_bytes > 8 || (num_bytes < 8 && val >> (num_bytes * 8))) [[unlikely]]
                throw error(fmt::format("{} cannot be encoded with {} bytes", val, num_bytes));
            for (size_t i = 0; i < num_bytes; ++i)
                _bytes.emplace_back(static_cast<uint8_t>(val >> (i * 8)));
        }

        // 1, 3, 5 or 9 bytes depending on the value
        void compact_size(const uint64_t x)
        {
            if (x < 0xFD) {
                uint_fixed(1, x);
            } else if (x <= 0xFFFF) {
                uint_fixed(1, 0xFD);
                uint_fixed(2, x);
            } else if (x <= 0xFFFFFFFF) {
                uint_fixed(1, 0xFE);
                uint_fixed(4, x);
            } else {
                uint_fixed(1, 0xFF);
                uint_fixed(8, x);
            }
        }

        void next_bytes(const buffer data)
        {
            _bytes << data;
        }

        template<typename T>
        void process(const T &val)
        {
            if constexpr (to_bytes_c<T>) {
                val.to_bytes(*this);
            } else if constexpr (codec::serializable_c<T>) {
                // serialize does not modify the value when given an encoder
                const_cast<T &>(val).serialize(*this);
            } else if constexpr (codec::optional_c<T>) {
                process_optional(val);
            } else if constexpr (std::is_same_v<T, std::string>) {
                process_bytes(buffer { val });
            } else if constexpr (std::is_same_v<T, bool>) {
                uint_fixed(1, val ? 1 : 0);
            } else if constexpr (fixed_uint_c<T>) {
                uint_fixed(sizeof(T), val);
            } else {
                throw error(fmt::format("binary encoding is not supported for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process(const std::string_view, const T &val)
        {
            process(val);
        }

        void process_optional(const auto &val)
        {
            uint_fixed(1, val.has_value() ? 1 : 0);
            if (val.has_value())
                process(*val);
        }

        template<typename T>
        void process_variant(const T &val, const codec::variant_names_t<T> &)
        {
            uint_fixed(1, val.index());
            std::visit([&](const auto &vv) {
                process(vv);
            }, static_cast<const T &>(val));
        }

        void process_array(const auto &items, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            if (items.size() < min_sz || items.size() > max_sz) [[unlikely]]
                throw error(fmt::format("array size {} is outside of [{}, {}]", items.size(), min_sz, max_sz));
            compact_size(items.size());
            process_array_fixed(items);
        }

        void process_array_fixed(const auto &items)
        {
            for (const auto &v: items)
                process(v);
        }

        void process_map(const auto &m, const std::string_view, const std::string_view)
        {
            compact_size(m.size());
            for (const auto &[k, v]: m) {
                process(k);
                process(v);
            }
        }

        void process_bytes(const buffer bytes)
        {
            compact_size(bytes.size());
            next_bytes(bytes);
        }

        void process_bytes_fixed(const buffer bytes)
        {
            next_bytes(bytes);
        }

        uint8_vector &bytes()
        {
            return _bytes;
        }
    private:
        uint8_vector _bytes {};
    };

    struct decoder: codec::archive_t {
        explicit decoder(const buffer bytes) noexcept:
            _rest { bytes }
        {
        }

        void push(const std::string_view)
        {
        }

        void pop()
        {
        }

        template<typename T>
        T uint_fixed(const size_t num_bytes)
        {
            if (num_bytes > 8) [[unlikely]]
                throw error(fmt::format("fixed-width integers are at most 8 bytes long, requested {}", num_bytes));
            const auto data = next_bytes(num_bytes);
            uint64_t x = 0;
            for (size_t i = 0; i < num_bytes; ++i)
                x |= static_cast<uint64_t>(data[i]) << (i * 8);
            return numeric_cast<T>(x);
        }

        // rejects the encodings that are longer than necessary
        uint64_t compact_size()
        {
            const auto prefix = next();
            size_t num_bytes = 0;
            uint64_t min_val = 0;
            switch (prefix) {
                case 0xFD: num_bytes = 2; min_val = 0xFD; break;
                case 0xFE: num_bytes = 4; min_val = 0x10000; break;
                case 0xFF: num_bytes = 8; min_val = 0x100000000ULL; break;
                default: return prefix;
            }
            const auto x = uint_fixed<uint64_t>(num_bytes);
            if (x < min_val) [[unlikely]]
                throw error(fmt::format("a non-canonical compact size {} with prefix {:02X}", x, prefix));
            return x;
        }

        // a count of items that each take at least one byte
        size_t count()
        {
            const auto sz = compact_size();
            if (sz > size()) [[unlikely]]
                throw error(fmt::format("a count of {} exceeds the remaining {} bytes", sz, size()));
            return static_cast<size_t>(sz);
        }

        template<typename T>
        void process(T &val)
        {
            if constexpr (from_bytes_c<T>) {
                val = T::from_bytes(*this);
            } else if constexpr (codec::serializable_c<T>) {
                val.serialize(*this);
            } else if constexpr (codec::optional_c<T>) {
                process_optional(val);
            } else if constexpr (std::is_same_v<T, std::string>) {
                const auto data = next_bytes(count());
                val.assign(reinterpret_cast<const char *>(data.data()), data.size());
            } else if constexpr (std::is_same_v<T, bool>) {
                switch (const auto b = next()) {
                    case 0: val = false; break;
                    case 1: val = true; break;
                    [[unlikely]] default: throw error(fmt::format("an invalid boolean value: {}", b));
                }
            } else if constexpr (fixed_uint_c<T>) {
                val = uint_fixed<T>(sizeof(T));
            } else {
                throw error(fmt::format("binary decoding is not supported for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process(const std::string_view, T &val)
        {
            process(val);
        }

        void process_optional(auto &val)
        {
            val.reset();
            switch (const auto tag = next()) {
                case 0: break;
                case 1:
                    val.emplace();
                    process(*val);
                    break;
                [[unlikely]] default: throw error(fmt::format("an invalid optional tag: {}", tag));
            }
        }

        template<typename T>
        void process_variant(T &val, const codec::variant_names_t<T> &)
        {
            variant_set_type<T, 0>(val, next(), *this);
        }

        void process_array(auto &items, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            using T = std::decay_t<decltype(items)>;
            const auto sz = count();
            if (sz < min_sz || sz > max_sz) [[unlikely]]
                throw error(fmt::format("array size {} is outside of [{}, {}]", sz, min_sz, max_sz));
            items.clear();
            items.reserve(sz);
            for (size_t i = 0; i < sz; ++i) {
                typename T::value_type v {};
                process(v);
                if constexpr (codec::has_emplace_c<T>) {
                    // sets keep their items ordered and unique
                    if (!items.empty() && !(*std::prev(items.end()) < v)) [[unlikely]]
                        throw error("set items must be strictly increasing");
                    items.emplace_hint(items.end(), std::move(v));
                } else {
                    items.emplace_back(std::move(v));
                }
            }
        }

        void process_array_fixed(auto &items)
        {
            for (auto &v: items)
                process(v);
        }

        void process_map(auto &m, const std::string_view, const std::string_view)
        {
            using T = std::decay_t<decltype(m)>;
            const auto sz = count();
            m.clear();
            for (size_t i = 0; i < sz; ++i) {
                typename T::key_type k {};
                process(k);
                typename T::mapped_type v {};
                process(v);
                if (!m.try_emplace(std::move(k), std::move(v)).second) [[unlikely]]
                    throw error("a map contains a duplicate key");
            }
        }

        void process_bytes(std::vector<uint8_t> &bytes)
        {
            const auto data = next_bytes(count());
            bytes.assign(data.begin(), data.end());
        }

        void process_bytes_fixed(const std::span<uint8_t> bytes)
        {
            const auto data = next_bytes(bytes.size());
            std::copy(data.begin(), data.end(), bytes.begin());
        }

        [[nodiscard]] uint8_t next()
        {
            return next_bytes(1)[0];
        }

        [[nodiscard]] buffer next_bytes(const size_t sz)
        {
            if (sz > _rest.size()) [[unlikely]]
                throw error(fmt::format("binary: requested {} bytes but only {} remain", sz, _rest.size()));
            const auto res = _rest.subbuf(0, sz);
            _rest = _rest.subbuf(sz);
            return res;
        }

        [[nodiscard]] bool empty() const noexcept
        {
            return _rest.empty();
        }

        [[nodiscard]] size_t size() const noexcept
        {
            return _rest.size();
        }
    private:
        buffer _rest;
    };

    template<typename T>
    uint8_vector to_bytes(const T &val)
    {
        encoder enc {};
        enc.process(val);
        return std::move(enc.bytes());
    }

    // Requires the whole buffer to be consumed
    template<typename T>
    T from_bytes(const buffer bytes)
    {
        decoder dec { bytes };
        T res {};
        dec.process(res);
        if (!dec.empty()) [[unlikely]]
            throw error(fmt::format("{} trailing bytes after a {} value", dec.size(), typeid(T).name()));
        return res;
    }
}
