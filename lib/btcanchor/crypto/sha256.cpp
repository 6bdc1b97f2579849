/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <openssl/evp.h>
#include "sha256.hpp"

namespace btcanchor::crypto::sha256 {
    void digest(const hash_span_t &out, const buffer &in)
    {
        unsigned int out_sz = 0;
        if (EVP_Digest(in.data(), in.size(), out.data(), &out_sz, EVP_sha256(), nullptr) != 1 || out_sz != out.size()) [[unlikely]]
            throw error("openssl error: can't compute a sha256 hash!");
    }
}
