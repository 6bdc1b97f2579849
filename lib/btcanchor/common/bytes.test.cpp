/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test.hpp"
#include "bytes.hpp"

namespace {
    using namespace btcanchor;
    using namespace std::string_view_literals;
}

suite btcanchor_common_bytes_suite = [] {
    "btcanchor::common::bytes"_test = [] {
        "from_hex"_test = [] {
            const auto v = uint8_vector::from_hex("00ff10Ab");
            expect_equal(size_t { 4 }, v.size());
            expect_equal(uint8_t { 0xAB }, v[3]);
            expect(throws([] { uint8_vector::from_hex("abc"); }));
            expect(throws([] { uint8_vector::from_hex("zz"); }));
            expect(throws([] { byte_array<2>::from_hex("001122"); }));
        };
        "to_hex"_test = [] {
            expect_equal(std::string { "00ff10ab" }, to_hex(uint8_vector::from_hex("00FF10AB")));
            expect_equal(std::string { "00FF10AB" }, fmt::format("{}", uint8_vector::from_hex("00ff10ab")));
            expect_equal(std::string { "00ff10ab" }, fmt::format("{:x}", uint8_vector::from_hex("00FF10AB")));
            expect_equal(std::string { "0A0B" }, fmt::format("{}", byte_array<2> { 0x0A, 0x0B }));
            expect_equal(std::string {}, to_hex(buffer {}));
        };
        "ordering"_test = [] {
            expect(uint8_vector::from_hex("00") < uint8_vector::from_hex("0000"));
            expect(uint8_vector::from_hex("01") > uint8_vector::from_hex("0011"));
            expect(uint8_vector {} == buffer {});
            expect(buffer {} < buffer { "A"sv });
        };
        "subbuf"_test = [] {
            const buffer b { "abcd"sv };
            expect_equal(buffer { "bc"sv }, b.subbuf(1, 2));
            expect_equal(buffer {}, b.subbuf(4));
            expect(throws([&] { b.subbuf(3, 2); }));
            expect(throws([&] { b.subbuf(5); }));
        };
        "secure_byte_array"_test = [] {
            const auto sk = secure_byte_array<2>::from_hex("beef");
            expect_equal(uint8_t { 0xEF }, sk[1]);
        };
        "append"_test = [] {
            uint8_vector v {};
            v << uint8_t { 1 } << buffer { "AB"sv };
            expect_equal(uint8_vector::from_hex("014142"), v);
        };
    };
};
