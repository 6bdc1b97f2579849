#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include <source_location>
#include <typeinfo>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "file.hpp"
#include "format.hpp"
#include "logger.hpp"

namespace btcanchor {
    using namespace boost::ut;

    // prints byte sequences in hex and routes the reporter's output to stderr
    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer &operator<<(T &&t)
        {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>)
                std::cerr << fmt::format("{}", std::span<const uint8_t> { t });
            else
                std::cerr << std::forward<T>(t);
            return *this;
        }
    };

    template<typename X, typename Y>
    bool expect_equal(const X &expected, const Y &actual, const std::source_location &loc=std::source_location::current())
    {
        const bool res = expected == actual;
        if (!res)
            expect(res, loc) << fmt::format("expected: {} actual: {}", expected, actual);
        else
            expect(res, loc);
        return res;
    }

    // the action must fail with exactly E and not with another error of the library
    template<typename E>
    bool expect_error(const auto &action, const std::source_location &loc=std::source_location::current())
    {
        std::string what {};
        try {
            action();
        } catch (const E &) {
            expect(true, loc);
            return true;
        } catch (const std::exception &ex) {
            what = ex.what();
        }
        expect(false, loc) << fmt::format("expected {} but got: {}", typeid(E).name(), what.empty() ? "no error" : what);
        return false;
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<btcanchor::test_printer>> {};
