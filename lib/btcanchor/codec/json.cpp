/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <sstream>
#include <boost/json.hpp>
#include <btcanchor/common/file.hpp>
#include "json.hpp"

namespace btcanchor::codec::json {
    namespace {
        struct pretty_printer_t {
            static constexpr size_t indent_step = 2;

            explicit pretty_printer_t(std::ostream &os):
                _os { os }
            {
            }

            void print(const value &jv)
            {
                switch (jv.kind()) {
                    case kind::object:
                        _container('{', '}', jv.get_object(), [&](const auto &item) {
                            _os << serialize(item.key()) << ": ";
                            print(item.value());
                        });
                        break;
                    case kind::array:
                        _container('[', ']', jv.get_array(), [&](const auto &item) {
                            print(item);
                        });
                        break;
                    default:
                        // scalars have a single canonical representation
                        _os << serialize(jv);
                        break;
                }
            }
        private:
            std::ostream &_os;
            size_t _depth = 0;

            template<typename C, typename F>
            void _container(const char open, const char close, const C &items, const F &print_item)
            {
                _os << open;
                if (!items.empty()) {
                    ++_depth;
                    bool first = true;
                    for (const auto &item: items) {
                        _os << (first ? "\n" : ",\n");
                        first = false;
                        _indent();
                        print_item(item);
                    }
                    --_depth;
                    _os << '\n';
                    _indent();
                }
                _os << close;
            }

            void _indent()
            {
                for (size_t i = 0; i < _depth * indent_step; ++i)
                    _os << ' ';
            }
        };
    }

    value parse(const buffer &buf)
    {
        boost::system::error_code ec {};
        auto jv = boost::json::parse(static_cast<std::string_view>(buf), ec);
        if (ec) [[unlikely]]
            throw error(fmt::format("invalid JSON: {}", ec.message()));
        return jv;
    }

    value load(const std::string &path)
    {
        try {
            return parse(file::read(path));
        } catch (const error &ex) {
            throw error(fmt::format("failed to load {}: {}", path, ex.what()));
        }
    }

    void save_pretty(std::ostream &os, const value &jv)
    {
        pretty_printer_t { os }.print(jv);
    }

    std::string serialize_pretty(const value &jv)
    {
        std::ostringstream ss {};
        save_pretty(ss, jv);
        return ss.str();
    }

    void save_pretty(const std::string &path, const value &jv)
    {
        file::write(path, serialize_pretty(jv));
    }
}
