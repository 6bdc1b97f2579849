#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <map>
#include <vector>
#include <boost/container/flat_set.hpp>
#include <btcanchor/common/bytes.hpp>

namespace btcanchor {
    struct byte_sequence_t: uint8_vector {
        using base_type = uint8_vector;
        using base_type::base_type;

        byte_sequence_t() = default;

        byte_sequence_t(const uint8_vector &o):
            base_type { o }
        {
        }

        byte_sequence_t(uint8_vector &&o):
            base_type { std::move(o) }
        {
        }

        void serialize(auto &archive)
        {
            archive.process_bytes(*this);
        }
    };

    template<typename T, size_t MIN=0, size_t MAX=std::numeric_limits<size_t>::max()>
    struct sequence_t: std::vector<T> {
        static constexpr size_t min_size = MIN;
        static constexpr size_t max_size = MAX;
        static_assert(MIN <= MAX);
        using base_type = std::vector<T>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_array(*this, MIN, MAX);
        }
    };

    template<typename T>
    struct set_t: boost::container::flat_set<T> {
        using base_type = boost::container::flat_set<T>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_array(*this);
        }
    };

    template<typename K, typename V>
    struct map_t: std::map<K, V> {
        using base_type = std::map<K, V>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process_map(*this, "key"sv, "value"sv);
        }
    };

    template<size_t SZ>
    struct byte_array_t: byte_array<SZ> {
        using base_type = byte_array<SZ>;
        using base_type::base_type;

        byte_array_t() = default;

        byte_array_t(const base_type &o):
            base_type { o }
        {
        }

        void serialize(auto &archive)
        {
            archive.process_bytes_fixed(*this);
        }
    };
}
