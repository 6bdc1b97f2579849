#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <utility>
#include <vector>
#include <ostream>
#include <boost/json.hpp>
#include <btcanchor/common/bytes.hpp>
#include "serializable.hpp"

namespace btcanchor::codec::json {
    using namespace boost::json;

    template<typename T>
    concept from_json_c = requires(T t, boost::json::value jv)
    {
        { T::from_json(jv) };
    };

    template<typename T>
    concept to_json_c = requires(const T t)
    {
        { t.to_json() } -> std::convertible_to<boost::json::value>;
    };

    // both throw btcanchor::error on malformed input
    extern value parse(const buffer &buf);
    extern value load(const std::string &path);
    // two-space indentation, one member or element per line
    extern void save_pretty(std::ostream &os, const value &jv);
    extern std::string serialize_pretty(const value &jv);
    extern void save_pretty(const std::string &path, const value &jv);

    inline std::string_view strip_hex_prefix(const std::string_view hex)
    {
        if (hex.starts_with("0x"))
            return hex.substr(2);
        return hex;
    }

    // accepts integral JSON values that fit T without a loss
    template<typename T>
    T to_integral(const value &jv)
    {
        if constexpr (std::is_same_v<T, bool>) {
            if (!jv.is_bool()) [[unlikely]]
                throw error(fmt::format("expected a boolean but got: {}", serialize_pretty(jv)));
            return jv.get_bool();
        } else {
            boost::system::error_code ec {};
            const auto x = jv.to_number<T>(ec);
            if (ec) [[unlikely]]
                throw error(fmt::format("expected a {} but got: {}", typeid(T).name(), serialize_pretty(jv)));
            return x;
        }
    }

    inline std::string_view to_string_view(const value &jv)
    {
        if (!jv.is_string()) [[unlikely]]
            throw error(fmt::format("expected a string but got: {}", serialize_pretty(jv)));
        const auto &s = jv.get_string();
        return { s.data(), s.size() };
    }

    // Reads the values produced by the encoder below.
    // A missing member is an error unless the target is an optional.
    struct decoder: archive_t {
        explicit decoder(const value &jv):
            _path { &jv }
        {
        }

        template<typename T>
        static void decode(const value &jv, T &val)
        {
            if constexpr (from_json_c<T>) {
                val = T::from_json(jv);
            } else if constexpr (serializable_c<T>) {
                decoder dec { jv };
                val.serialize(dec);
            } else if constexpr (optional_c<T>) {
                val.reset();
                if (!jv.is_null())
                    decode(jv, val.emplace());
            } else if constexpr (std::is_integral_v<T>) {
                val = to_integral<T>(jv);
            } else if constexpr (std::is_same_v<T, std::string>) {
                val = to_string_view(jv);
            } else {
                throw error(fmt::format("JSON decoding is not supported for type {}", typeid(T).name()));
            }
        }

        void push(const std::string_view name)
        {
            _path.emplace_back(&_member(name));
        }

        void pop()
        {
            if (_path.size() < 2) [[unlikely]]
                throw error("json::decoder: pop without a matching push");
            _path.pop_back();
        }

        void process(auto &val)
        {
            decode(_cur(), val);
        }

        void process(const std::string_view name, auto &val)
        {
            using T = std::decay_t<decltype(val)>;
            if (const auto *jv = _cur_object().if_contains(name); jv) {
                decode(*jv, val);
            } else if constexpr (optional_c<T>) {
                val.reset();
            } else {
                throw error(fmt::format("the required member '{}' is missing", name));
            }
        }

        // maps are arrays of objects with a key member and a value member
        void process_map(auto &m, const std::string_view key_name, const std::string_view val_name)
        {
            using T = std::decay_t<decltype(m)>;
            m.clear();
            for (const auto &item: _cur_array()) {
                decoder item_dec { item };
                typename T::key_type k {};
                item_dec.process(key_name, k);
                typename T::mapped_type v {};
                item_dec.process(val_name, v);
                if (!m.try_emplace(std::move(k), std::move(v)).second) [[unlikely]]
                    throw error(fmt::format("a duplicate key in the map '{}'", key_name));
            }
        }

        void process_array(auto &items, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            using T = std::decay_t<decltype(items)>;
            const auto &ja = _cur_array();
            if (ja.size() < min_sz || ja.size() > max_sz) [[unlikely]]
                throw error(fmt::format("array size {} is outside of [{}, {}]", ja.size(), min_sz, max_sz));
            items.clear();
            items.reserve(ja.size());
            for (const auto &item: ja) {
                typename T::value_type v {};
                decode(item, v);
                if constexpr (codec::has_emplace_c<T>) {
                    if (!items.emplace(std::move(v)).second) [[unlikely]]
                        throw error("a set contains duplicate items");
                } else {
                    items.emplace_back(std::move(v));
                }
            }
        }

        void process_array_fixed(auto &items)
        {
            const auto &ja = _cur_array();
            if (ja.size() != items.size()) [[unlikely]]
                throw error(fmt::format("expected exactly {} items but got {}", items.size(), ja.size()));
            for (size_t i = 0; i < items.size(); ++i)
                decode(ja[i], items[i]);
        }

        void process_optional(auto &val)
        {
            decode(_cur(), val);
        }

        // the alternative is the single member of an object or a bare string for empty alternatives
        template<typename T>
        void process_variant(T &val, const codec::variant_names_t<T> &names)
        {
            std::string_view name {};
            if (_cur().is_object() && _cur_object().size() == 1) {
                const auto key = _cur_object().begin()->key();
                name = std::string_view { key.data(), key.size() };
            } else if (_cur().is_string()) {
                name = to_string_view(_cur());
            }
            const auto it = std::find(names.begin(), names.end(), name);
            if (name.empty() || it == names.end()) [[unlikely]]
                throw error(fmt::format("no alternative of {} matches: {}", typeid(T).name(), serialize_pretty(_cur())));
            const auto idx = static_cast<size_t>(it - names.begin());
            if (_cur().is_object()) {
                push(name);
                variant_set_type<T, 0>(val, idx, *this);
                pop();
            } else {
                variant_set_type<T, 0>(val, idx, *this);
            }
        }

        void process_bytes(std::vector<uint8_t> &bytes)
        {
            const auto hex = strip_hex_prefix(to_string_view(_cur()));
            if (hex.size() % 2 != 0) [[unlikely]]
                throw error(fmt::format("a hex string of odd length: {}", hex));
            bytes.resize(hex.size() / 2);
            init_from_hex(bytes, hex);
        }

        void process_bytes_fixed(const std::span<uint8_t> bytes)
        {
            init_from_hex(bytes, strip_hex_prefix(to_string_view(_cur())));
        }
    private:
        std::vector<const value *> _path;

        const value &_cur() const
        {
            return *_path.back();
        }

        const object &_cur_object() const
        {
            if (!_cur().is_object()) [[unlikely]]
                throw error(fmt::format("expected an object but got: {}", serialize_pretty(_cur())));
            return _cur().get_object();
        }

        const array &_cur_array() const
        {
            if (!_cur().is_array()) [[unlikely]]
                throw error(fmt::format("expected an array but got: {}", serialize_pretty(_cur())));
            return _cur().get_array();
        }

        const value &_member(const std::string_view name) const
        {
            if (const auto *jv = _cur_object().if_contains(name); jv)
                return *jv;
            throw error(fmt::format("the required member '{}' is missing", name));
        }
    };

    // Byte strings are written as lowercase hex without a prefix.
    // Empty optional members are omitted.
    struct encoder: archive_t {
        template<typename T>
        static value encode(const T &val)
        {
            if constexpr (to_json_c<T>) {
                return val.to_json();
            } else if constexpr (serializable_c<T>) {
                encoder enc {};
                // serialize does not modify the value when given an encoder
                const_cast<T &>(val).serialize(enc);
                return std::move(enc).result();
            } else if constexpr (optional_c<T>) {
                return val ? encode(*val) : value {};
            } else if constexpr (std::is_same_v<T, bool>) {
                return value(val);
            } else if constexpr (std::is_unsigned_v<T>) {
                return value(static_cast<uint64_t>(val));
            } else if constexpr (std::is_integral_v<T>) {
                return value(static_cast<int64_t>(val));
            } else if constexpr (std::is_convertible_v<T, std::string_view>) {
                const std::string_view sv { val };
                return value(string_view { sv.data(), sv.size() });
            } else {
                throw error(fmt::format("JSON encoding is not supported for type {}", typeid(T).name()));
            }
        }

        void push(const std::string_view name)
        {
            _parents.emplace_back(std::string { name }, std::move(_cur));
            _cur = {};
        }

        void pop()
        {
            if (_parents.empty()) [[unlikely]]
                throw error("json::encoder: pop without a matching push");
            auto [name, parent] = std::move(_parents.back());
            _parents.pop_back();
            if (!parent.is_object())
                parent.emplace_object();
            parent.get_object()[name] = std::move(_cur);
            _cur = std::move(parent);
        }

        void process(const auto &val)
        {
            _cur = encode(val);
        }

        void process(const std::string_view name, const auto &val)
        {
            using T = std::decay_t<decltype(val)>;
            if (!_cur.is_object())
                _cur.emplace_object();
            if constexpr (optional_c<T>) {
                if (!val)
                    return;
            }
            _cur.get_object()[name] = encode(val);
        }

        void process_map(const auto &m, const std::string_view key_name, const std::string_view val_name)
        {
            array ja {};
            ja.reserve(m.size());
            for (const auto &[k, v]: m) {
                object jo {};
                jo[key_name] = encode(k);
                jo[val_name] = encode(v);
                ja.emplace_back(std::move(jo));
            }
            _cur = std::move(ja);
        }

        void process_array(const auto &items, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            if (items.size() < min_sz || items.size() > max_sz) [[unlikely]]
                throw error(fmt::format("array size {} is outside of [{}, {}]", items.size(), min_sz, max_sz));
            array ja {};
            ja.reserve(items.size());
            for (const auto &v: items)
                ja.emplace_back(encode(v));
            _cur = std::move(ja);
        }

        void process_array_fixed(const auto &items)
        {
            process_array(items);
        }

        void process_optional(const auto &val)
        {
            _cur = encode(val);
        }

        template<typename T>
        void process_variant(const T &val, const codec::variant_names_t<T> &names)
        {
            std::visit([&](const auto &alt) {
                object jo {};
                jo[names.at(val.index())] = encode(alt);
                _cur = std::move(jo);
            }, static_cast<const T &>(val));
        }

        void process_bytes(const buffer bytes)
        {
            _cur = encode(to_hex(bytes));
        }

        void process_bytes_fixed(const buffer bytes)
        {
            process_bytes(bytes);
        }

        // a value that never received a member is an empty object
        value result() &&
        {
            if (_cur.is_null())
                _cur.emplace_object();
            return std::move(_cur);
        }
    private:
        value _cur {};
        std::vector<std::pair<std::string, value>> _parents {};
    };

    template<typename T>
    value to_json(const T &val)
    {
        return encoder::encode(val);
    }

    template<typename T>
    T from_json(const value &jv)
    {
        T val {};
        decoder::decode(jv, val);
        return val;
    }

    template<typename T>
    T load_obj(const std::string &path)
    {
        return from_json<T>(load(path));
    }
}
