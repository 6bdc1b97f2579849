#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <memory>
#include <optional>
#include <btcanchor/common/bytes.hpp>

namespace btcanchor::storage {
    using value_t = std::optional<uint8_vector>;
    // receives the key and the value of every record in the ascending key order
    using observer_t = std::function<void(const uint8_vector &, const uint8_vector &)>;

    // A key-value store of opaque byte strings, the callers define the layout of keys and values.
    struct db_t {
        virtual ~db_t() = default;

        [[nodiscard]] virtual value_t get(buffer key) const = 0;
        virtual void set(buffer key, buffer val) = 0;
        virtual void erase(buffer key) = 0;
        virtual void clear() = 0;
        virtual void foreach(const observer_t &obs) const = 0;
        [[nodiscard]] virtual size_t size() const = 0;

        [[nodiscard]] bool contains(const buffer key) const
        {
            return get(key).has_value();
        }

        [[nodiscard]] bool empty() const
        {
            return size() == 0;
        }
    };
    using db_ptr_t = std::shared_ptr<db_t>;
}
