#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <variant>
#include <btcanchor/btc/errors.hpp>
#include <btcanchor/codec/serializable.hpp>

namespace btcanchor::anchoring {
    struct err_zero_frequency_t final: error {
        err_zero_frequency_t(): error { "err_zero_frequency_t" } {}
        bool operator==(const err_zero_frequency_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_activation_height_t final: error {
        err_invalid_activation_height_t(): error { "err_invalid_activation_height_t" } {}
        bool operator==(const err_invalid_activation_height_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_missing_funding_transaction_t final: error {
        err_missing_funding_transaction_t(): error { "err_missing_funding_transaction_t" } {}
        bool operator==(const err_missing_funding_transaction_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_no_funding_transaction_t final: error {
        err_no_funding_transaction_t(): error { "err_no_funding_transaction_t" } {}
        bool operator==(const err_no_funding_transaction_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_unsuitable_funding_tx_t final: error {
        err_unsuitable_funding_tx_t(): error { "err_unsuitable_funding_tx_t" } {}
        bool operator==(const err_unsuitable_funding_tx_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_insufficient_funds_t final: error {
        err_insufficient_funds_t(): error { "err_insufficient_funds_t" } {}
        bool operator==(const err_insufficient_funds_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_insufficient_confirmations_t final: error {
        err_insufficient_confirmations_t(): error { "err_insufficient_confirmations_t" } {}
        bool operator==(const err_insufficient_confirmations_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_duplicate_proposal_signature_t final: error {
        err_duplicate_proposal_signature_t(): error { "err_duplicate_proposal_signature_t" } {}
        bool operator==(const err_duplicate_proposal_signature_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_no_private_key_t final: error {
        err_no_private_key_t(): error { "err_no_private_key_t" } {}
        bool operator==(const err_no_private_key_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_unexpected_proposal_t final: error {
        err_unexpected_proposal_t(): error { "err_unexpected_proposal_t" } {}
        bool operator==(const err_unexpected_proposal_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_input_t final: error {
        err_invalid_input_t(): error { "err_invalid_input_t" } {}
        bool operator==(const err_invalid_input_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_unknown_validator_t final: error {
        err_unknown_validator_t(): error { "err_unknown_validator_t" } {}
        bool operator==(const err_unknown_validator_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_signature_t final: error {
        err_invalid_signature_t(): error { "err_invalid_signature_t" } {}
        bool operator==(const err_invalid_signature_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_duplicate_signature_t final: error {
        err_duplicate_signature_t(): error { "err_duplicate_signature_t" } {}
        bool operator==(const err_duplicate_signature_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_decoding_t final: error {
        err_decoding_t(): error { "err_decoding_t" } {}
        bool operator==(const err_decoding_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_unauthorized_t final: error {
        err_unauthorized_t(): error { "err_unauthorized_t" } {}
        bool operator==(const err_unauthorized_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_relay_unavailable_t final: error {
        err_relay_unavailable_t(): error { "err_relay_unavailable_t" } {}
        bool operator==(const err_relay_unavailable_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_ledger_corruption_t final: error {
        err_ledger_corruption_t(): error { "err_ledger_corruption_t" } {}
        bool operator==(const err_ledger_corruption_t &) const { return true; }
        void serialize(auto &) {}
    };

    template<typename BASE_T, typename BASE_V>
    struct err_group_t: BASE_V {
        using base_type = BASE_V;
        using base_type::base_type;

        static void catch_into(const std::function<void()> &action, const std::function<void(BASE_T)> &on_error)
        {
            if constexpr (std::variant_size_v<BASE_V> > 0) {
                catch_into_impl<std::variant_size_v<BASE_V> - 1>(action, on_error);
            }
        }
    private:
        template<size_t I>
        static void catch_into_impl(const std::function<void()> &action, const std::function<void(BASE_T)> &on_error)
        {
            if constexpr (I == 0) {
                try {
                    action();
                } catch (std::variant_alternative_t<I, BASE_V> &err) {
                    on_error(std::move(err));
                }
            } else {
                try {
                    catch_into_impl<I - 1>(action, on_error);
                } catch (std::variant_alternative_t<I, BASE_V> &err) {
                    on_error(std::move(err));
                }
            }
        }
    };

    // rejected when a configuration is accepted into the epoch log
    using config_error_base_t = std::variant<
        btc::err_empty_key_set_t,
        btc::err_invalid_threshold_t,
        btc::err_too_many_keys_t,
        btc::err_duplicate_key_t,
        btc::err_invalid_public_key_t,
        err_zero_frequency_t,
        err_invalid_activation_height_t
    >;

    struct config_error_t: err_group_t<config_error_t, config_error_base_t> {
        using base_type = err_group_t<config_error_t, config_error_base_t>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            static codec::variant_names_t<config_error_base_t> names {
                "empty_key_set"sv,
                "invalid_threshold"sv,
                "too_many_keys"sv,
                "duplicate_key"sv,
                "invalid_public_key"sv,
                "zero_frequency"sv,
                "invalid_activation_height"sv
            };
            archive.template process_variant<config_error_base_t>(*this, names);
        }
    };

    // the chain cannot advance yet, a validator retries on a later block
    using precondition_error_base_t = std::variant<
        err_missing_funding_transaction_t,
        err_no_funding_transaction_t,
        err_unsuitable_funding_tx_t,
        err_insufficient_funds_t,
        err_insufficient_confirmations_t,
        err_duplicate_proposal_signature_t,
        err_no_private_key_t,
        err_relay_unavailable_t
    >;

    struct precondition_error_t: err_group_t<precondition_error_t, precondition_error_base_t> {
        using base_type = err_group_t<precondition_error_t, precondition_error_base_t>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            static codec::variant_names_t<precondition_error_base_t> names {
                "missing_funding_transaction"sv,
                "no_funding_transaction"sv,
                "unsuitable_funding_tx"sv,
                "insufficient_funds"sv,
                "insufficient_confirmations"sv,
                "duplicate_proposal_signature"sv,
                "no_private_key"sv,
                "relay_unavailable"sv
            };
            archive.template process_variant<precondition_error_base_t>(*this, names);
        }
    };

    // a message that violates the protocol, rejected without any effect on the ledger
    using protocol_error_base_t = std::variant<
        err_unexpected_proposal_t,
        err_invalid_input_t,
        err_unknown_validator_t,
        err_invalid_signature_t,
        err_duplicate_signature_t,
        err_decoding_t,
        err_unauthorized_t
    >;

    struct protocol_error_t: err_group_t<protocol_error_t, protocol_error_base_t> {
        using base_type = err_group_t<protocol_error_t, protocol_error_base_t>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            static codec::variant_names_t<protocol_error_base_t> names {
                "unexpected_proposal"sv,
                "invalid_input"sv,
                "unknown_validator"sv,
                "invalid_signature"sv,
                "duplicate_signature"sv,
                "decoding"sv,
                "unauthorized"sv
            };
            archive.template process_variant<protocol_error_base_t>(*this, names);
        }
    };
}
