/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <btcanchor/common/test.hpp>
#include "sha256.hpp"

namespace {
    using namespace btcanchor;
    using namespace crypto::sha256;
}

suite btcanchor_crypto_sha256_suite = [] {
    "btcanchor::crypto::sha256"_test = [] {
        "digest"_test = [] {
            expect_equal(hash_t::from_hex("E3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855"), digest(buffer {}));
            expect_equal(hash_t::from_hex("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"), digest(std::string_view { "abc" }));
        };
        "double_digest"_test = [] {
            expect_equal(hash_t::from_hex("5DF6E0E2761359D30A8275058E299FCC0381534545F55CF43E41983F5D4C9456"), double_digest(buffer {}));
        };
    };
};
