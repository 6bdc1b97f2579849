#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cerrno>
#include <stdexcept>
#include <string>
#include <string_view>

namespace btcanchor {
    // The root of all exceptions thrown by the library.
    // Specific error kinds derive from it so that callers can catch either the kind or any library error.
    struct error: std::exception {
        explicit error(std::string_view msg);
        // wraps a foreign exception and keeps its type and message in the description
        explicit error(std::string_view msg, const std::exception &cause);
        const char *what() const noexcept override;
    private:
        std::string _msg;
    };

    // an operating system call has failed, the description includes the errno value
    struct error_sys: error {
        explicit error_sys(std::string_view msg, int err=errno);

        int code() const noexcept
        {
            return _code;
        }
    private:
        int _code;
    };
}
