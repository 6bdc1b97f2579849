#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <array>
#include <concepts>
#include <limits>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <typeinfo>
#include <variant>
#include <vector>
#include <btcanchor/common/error.hpp>
#include <btcanchor/common/format.hpp>

namespace btcanchor::codec {
    struct archive_t {
    };

    template<typename T>
    T from(auto &archive)
    {
        T res;
        res.serialize(archive);
        return res;
    }

    template<typename T>
    using variant_names_t = std::array<std::string_view, std::variant_size_v<T>>;

    template<typename T, size_t I>
    void variant_set_type(T &val, const size_t requested_type, auto &archive)
    {
        if (requested_type >= std::variant_size_v<T>) [[unlikely]]
            throw error(fmt::format("an unsupported type value {} for {}", requested_type, typeid(T).name()));
        if constexpr (I < std::variant_size_v<T>) {
            if (requested_type > I)
                return variant_set_type<T, I + 1>(val, requested_type, archive);
            if (requested_type < I) [[unlikely]]
                throw error(fmt::format("internal error: an incomplete traversal of type {}", typeid(T).name()));
            val = codec::from<std::variant_alternative_t<I, T>>(archive);
        }
    }

    template<typename T>
    concept has_emplace_c = requires(T t)
    {
        { t.emplace() };
    };

    template<typename T>
    concept optional_c = requires(T t)
    {
        { t.reset() };
        { t.emplace() };
        { t.has_value() } -> std::convertible_to<bool>;
    };

    template<typename T>
    concept serializable_c = requires(T t, archive_t a)
    {
        { t.serialize(a) } -> std::same_as<void>;
    };

    // Renders any serializable value on a single line: {height: 5, hash: #AB01, inputs: [{...}]}
    template<typename OUT_IT>
    struct formatter: archive_t {
        explicit formatter(OUT_IT it):
            _it { std::move(it) }
        {
        }

        template<typename T>
        void format(const T &val)
        {
            _separate();
            _write(val);
        }

        void push(const std::string_view name)
        {
            // a named field turns the enclosing value into an object
            if (!_objects.empty() && !_objects.back()) {
                _open('{');
                _objects.back() = true;
            }
            _separate();
            _it = fmt::format_to(_it, "{}: ", name);
            _attached = true;
        }

        void pop()
        {
        }

        void process(const auto &val)
        {
            format(val);
        }

        void process(const std::string_view name, const auto &val)
        {
            push(name);
            format(val);
        }

        void process_array(const auto &arr, const size_t =0, const size_t =std::numeric_limits<size_t>::max())
        {
            _separate();
            _write_range(arr);
        }

        void process_array_fixed(const auto &arr)
        {
            process_array(arr);
        }

        void process_map(const auto &m, const std::string_view, const std::string_view)
        {
            _separate();
            _open('{');
            for (const auto &[k, v]: m) {
                _separate();
                _write(k);
                _it = fmt::format_to(_it, ": ");
                _write(v);
            }
            _close('}');
        }

        template<typename T>
        void process_variant(const T &val, const codec::variant_names_t<T> &names)
        {
            _separate();
            std::visit([&](const auto &vv) {
                _it = fmt::format_to(_it, "{}(", names.at(val.index()));
                _write(vv);
                _it = fmt::format_to(_it, ")");
            }, static_cast<const T &>(val));
        }

        void process_bytes(const std::span<const uint8_t> bytes)
        {
            _separate();
            _it = fmt::format_to(_it, "#{}", bytes);
        }

        void process_bytes_fixed(const std::span<const uint8_t> bytes)
        {
            process_bytes(bytes);
        }

        OUT_IT it() const
        {
            return _it;
        }
    private:
        OUT_IT _it;
        bool _first = true;
        // the next value completes a preceding "name: "
        bool _attached = false;
        // one entry per serializable value being written, true once its opening brace is written
        std::vector<bool> _objects {};

        void _separate()
        {
            if (_attached) {
                _attached = false;
            } else if (!_first) {
                _it = fmt::format_to(_it, ", ");
            }
            _first = false;
        }

        void _open(const char c)
        {
            _it = fmt::format_to(_it, "{}", c);
            _first = true;
        }

        void _close(const char c)
        {
            _it = fmt::format_to(_it, "{}", c);
            _first = false;
        }

        void _write_range(const auto &items)
        {
            _open('[');
            for (const auto &v: items)
                format(v);
            _close(']');
        }

        template<typename T>
        void _write(const T &val)
        {
            if constexpr (serializable_c<T>) {
                _objects.emplace_back(false);
                const_cast<T &>(val).serialize(*this);
                if (_objects.back())
                    _close('}');
                _objects.pop_back();
            } else if constexpr (optional_c<T>) {
                if (val)
                    _write(*val);
                else
                    _it = fmt::format_to(_it, "none");
            } else if constexpr (std::is_arithmetic_v<T>
                    || std::is_convertible_v<T, std::string_view>
                    || std::is_convertible_v<T, std::span<const uint8_t>>) {
                _it = fmt::format_to(_it, "{}", val);
            } else if constexpr (std::ranges::range<T>) {
                _write_range(val);
            } else {
                throw error(fmt::format("formatting is not supported for type {}", typeid(T).name()));
            }
        }
    };
}

namespace fmt {
    template<btcanchor::codec::serializable_c T>
    struct formatter<T>: formatter<int> {
        template<typename FormatContext>
        auto format(const T &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            btcanchor::codec::formatter<decltype(ctx.out())> frmtr { ctx.out() };
            frmtr.format(v);
            return frmtr.it();
        }
    };
}
