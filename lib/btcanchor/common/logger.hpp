#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <exception>
#include <functional>
#include <source_location>

#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Warray-bounds"
#   pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif
#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic pop
#endif
#include "error.hpp"
#include "format.hpp"

namespace btcanchor::logger {
    using level = spdlog::level::level_enum;

    // BTCANCHOR_LOG or ./log/btcanchor.log under the installation directory
    extern std::string log_path();
    // BTCANCHOR_LOG_LEVEL when set to a valid spdlog level name, trace with BTCANCHOR_DEBUG, debug otherwise
    extern level log_level();
    extern spdlog::logger create(const std::string &path);

    inline spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }

    // the message is formatted only when the level is enabled
    template<typename... Args>
    void log(const level lev, const std::string_view fmt_str, Args&&... a)
    {
        if (auto &l = get(); l.should_log(lev))
            l.log(lev, btcanchor::format(fmt_str, std::forward<Args>(a)...));
    }

    template<typename... Args> void trace(const std::string_view fmt_str, Args&&... a) { log(level::trace, fmt_str, std::forward<Args>(a)...); }
    template<typename... Args> void debug(const std::string_view fmt_str, Args&&... a) { log(level::debug, fmt_str, std::forward<Args>(a)...); }
    template<typename... Args> void info(const std::string_view fmt_str, Args&&... a) { log(level::info, fmt_str, std::forward<Args>(a)...); }
    template<typename... Args> void warn(const std::string_view fmt_str, Args&&... a) { log(level::warn, fmt_str, std::forward<Args>(a)...); }
    template<typename... Args> void error(const std::string_view fmt_str, Args&&... a) { log(level::err, fmt_str, std::forward<Args>(a)...); }

    using action = std::function<void()>;

    // Runs the task and logs the exception it fails with instead of propagating it.
    // The library's own errors are expected at runtime and logged as warnings.
    // Returns the captured exception or nullptr on success.
    inline std::exception_ptr run_log_errors(const std::string_view task, const action &main,
        const std::source_location &loc=std::source_location::current())
    {
        std::exception_ptr cur_ex {};
        try {
            main();
        } catch (const btcanchor::error &ex) {
            cur_ex = std::current_exception();
            warn("{} failed at {}:{}: {}", task, loc.file_name(), loc.line(), ex.what());
        } catch (const std::exception &ex) {
            cur_ex = std::current_exception();
            error("{} failed at {}:{} with std::exception: {}", task, loc.file_name(), loc.line(), ex.what());
        } catch (...) {
            cur_ex = std::current_exception();
            error("{} failed at {}:{} with an unknown error", task, loc.file_name(), loc.line());
        }
        return cur_ex;
    }
}
