/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/common/test.hpp>
#include "logger.hpp"

using namespace btcanchor;

suite btcanchor_common_logger_suite = [] {
    "btcanchor::common::logger"_test = [] {
        "formatted output"_test = [] {
            expect(nothrow([] {
                logger::trace("height {} trace", 1);
                logger::debug("height {} debug", 2);
                logger::info("txid {} info", uint8_vector::from_hex("AABB"));
                logger::warn("{} of {} signatures", 2, 4);
                logger::error("plain error");
            }));
        };
        "level"_test = [] {
            expect(logger::get().level() == logger::log_level());
            expect(logger::log_level() <= logger::level::debug);
        };
        "run_log_errors"_test = [] {
            size_t calls = 0;
            expect(!logger::run_log_errors("counting", [&] { ++calls; }));
            expect_equal(size_t { 1 }, calls);
            // rethrow_exception requires a non-null pointer
            const auto own = logger::run_log_errors("own error", [] { throw error("relay is down"); });
            expect(static_cast<bool>(own));
            if (own) {
                expect(throws<error>([&] { std::rethrow_exception(own); }));
            }
            const auto std_ex = logger::run_log_errors("std error", [] { throw std::runtime_error("bad"); });
            expect(static_cast<bool>(std_ex));
            if (std_ex) {
                std::string what {};
                try {
                    std::rethrow_exception(std_ex);
                } catch (const std::runtime_error &ex) {
                    what = ex.what();
                }
                expect_equal(std::string { "bad" }, what);
            }
            const auto other = logger::run_log_errors("other", [] { throw 42; });
            expect(static_cast<bool>(other));
            if (other) {
                expect(throws<int>([&] { std::rethrow_exception(other); }));
            }
        };
    };
};
