/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstring>
#include <typeinfo>
#include "error.hpp"
#include "format.hpp"

namespace btcanchor {
    error::error(const std::string_view msg):
        _msg { msg }
    {
    }

    error::error(const std::string_view msg, const std::exception &cause):
        error { fmt::format("{} caused by {}: {}", msg, typeid(cause).name(), cause.what()) }
    {
    }

    const char *error::what() const noexcept
    {
        return _msg.c_str();
    }

    error_sys::error_sys(const std::string_view msg, const int err):
        error { fmt::format("{}: {} (errno {})", msg, std::strerror(err), err) },
        _code { err }
    {
    }
}
