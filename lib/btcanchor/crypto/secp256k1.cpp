/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#define OPENSSL_SUPPRESS_DEPRECATED 1
#include <memory>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>
#include "secp256k1.hpp"

namespace btcanchor::crypto::secp256k1 {
    namespace {
        using ec_key_ptr = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>;
        using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
        using bn_ptr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
        using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

        ec_key_ptr new_key()
        {
            ec_key_ptr key { EC_KEY_new_by_curve_name(NID_secp256k1), EC_KEY_free };
            if (!key) [[unlikely]]
                throw error("openssl error: can't allocate a secp256k1 key!");
            return key;
        }

        bn_ptr half_order(const EC_KEY *key)
        {
            bn_ptr half { BN_new(), BN_clear_free };
            if (!half || !BN_rshift1(half.get(), EC_GROUP_get0_order(EC_KEY_get0_group(key)))) [[unlikely]]
                throw error("openssl error: can't compute the half of the curve order!");
            return half;
        }

        ec_key_ptr private_key(const skey_t &sk)
        {
            auto key = new_key();
            bn_ptr priv { BN_bin2bn(sk.data(), sk.size(), nullptr), BN_clear_free };
            if (!priv) [[unlikely]]
                throw error("openssl error: can't parse a private key!");
            if (BN_is_zero(priv.get()) || BN_cmp(priv.get(), EC_GROUP_get0_order(EC_KEY_get0_group(key.get()))) >= 0) [[unlikely]]
                throw error("a secp256k1 private key is out of range!");
            if (!EC_KEY_set_private_key(key.get(), priv.get())) [[unlikely]]
                throw error("openssl error: can't set a private key!");
            const auto *group = EC_KEY_get0_group(key.get());
            ec_point_ptr pub { EC_POINT_new(group), EC_POINT_free };
            if (!pub || !EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, nullptr) || !EC_KEY_set_public_key(key.get(), pub.get())) [[unlikely]]
                throw error("openssl error: can't derive a public key!");
            return key;
        }

        ec_key_ptr parse_public_key(const buffer &vk)
        {
            auto key = new_key();
            const auto *group = EC_KEY_get0_group(key.get());
            ec_point_ptr pub { EC_POINT_new(group), EC_POINT_free };
            if (!pub || !EC_POINT_oct2point(group, pub.get(), vk.data(), vk.size(), nullptr))
                return { nullptr, EC_KEY_free };
            if (!EC_KEY_set_public_key(key.get(), pub.get()))
                return { nullptr, EC_KEY_free };
            return key;
        }
    }

    vkey_t public_key(const skey_t &sk)
    {
        const auto key = private_key(sk);
        vkey_t vk;
        const auto sz = EC_POINT_point2oct(EC_KEY_get0_group(key.get()), EC_KEY_get0_public_key(key.get()),
            POINT_CONVERSION_COMPRESSED, vk.data(), vk.size(), nullptr);
        if (sz != vk.size()) [[unlikely]]
            throw error("openssl error: can't serialize a public key!");
        return vk;
    }

    key_pair_t create()
    {
        key_pair_t kp;
        for (;;) {
            if (RAND_bytes(kp.sk.data(), static_cast<int>(kp.sk.size())) != 1) [[unlikely]]
                throw error("openssl error: can't generate random bytes!");
            try {
                kp.vk = public_key(kp.sk);
                return kp;
            } catch (const error &) {
                // an out-of-range scalar, retry with a fresh one
            }
        }
    }

    signature_t sign(const digest_t &digest, const skey_t &sk)
    {
        const auto key = private_key(sk);
        ecdsa_sig_ptr sig { ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()), key.get()), ECDSA_SIG_free };
        if (!sig) [[unlikely]]
            throw error("openssl error: can't produce an ECDSA signature!");
        const BIGNUM *r = nullptr;
        const BIGNUM *s = nullptr;
        ECDSA_SIG_get0(sig.get(), &r, &s);
        if (BN_cmp(s, half_order(key.get()).get()) > 0) {
            bn_ptr low_s { BN_new(), BN_clear_free };
            bn_ptr r_copy { BN_dup(r), BN_clear_free };
            if (!low_s || !r_copy || !BN_sub(low_s.get(), EC_GROUP_get0_order(EC_KEY_get0_group(key.get())), s)) [[unlikely]]
                throw error("openssl error: can't normalize an ECDSA signature!");
            if (ECDSA_SIG_set0(sig.get(), r_copy.get(), low_s.get()) != 1) [[unlikely]]
                throw error("openssl error: can't normalize an ECDSA signature!");
            // ownership has been transferred to sig
            r_copy.release();
            low_s.release();
        }
        unsigned char *der = nullptr;
        const auto der_len = i2d_ECDSA_SIG(sig.get(), &der);
        if (der_len <= 0) [[unlikely]]
            throw error("openssl error: can't DER-encode an ECDSA signature!");
        signature_t res { buffer { der, static_cast<size_t>(der_len) } };
        OPENSSL_free(der);
        return res;
    }

    bool verify(const buffer &sig, const digest_t &digest, const vkey_t &vk)
    {
        const auto key = parse_public_key(vk);
        if (!key)
            return false;
        const unsigned char *p = sig.data();
        ecdsa_sig_ptr parsed { d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(sig.size())), ECDSA_SIG_free };
        if (!parsed)
            return false;
        // reject trailing data and non-minimal encodings
        unsigned char *der = nullptr;
        const auto der_len = i2d_ECDSA_SIG(parsed.get(), &der);
        if (der_len <= 0)
            return false;
        const bool canonical = static_cast<size_t>(der_len) == sig.size() && memcmp(der, sig.data(), sig.size()) == 0;
        OPENSSL_free(der);
        if (!canonical)
            return false;
        const BIGNUM *s = nullptr;
        ECDSA_SIG_get0(parsed.get(), nullptr, &s);
        if (BN_cmp(s, half_order(key.get()).get()) > 0)
            return false;
        return ECDSA_do_verify(digest.data(), static_cast<int>(digest.size()), parsed.get(), key.get()) == 1;
    }

    bool valid_public_key(const buffer &vk)
    {
        if (vk.size() != sizeof(vkey_t) || (vk[0] != 0x02 && vk[0] != 0x03))
            return false;
        return static_cast<bool>(parse_public_key(vk));
    }
}
