/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "error.hpp"
#include "file.hpp"
#include "logger.hpp"

namespace btcanchor::logger {
    std::string log_path()
    {
        const char *env_log_path = std::getenv("BTCANCHOR_LOG");
        return file::install_path(env_log_path ? env_log_path : "log/btcanchor.log");
    }

    level log_level()
    {
        if (const char *name = std::getenv("BTCANCHOR_LOG_LEVEL"); name) {
            // spdlog maps unknown names to off
            if (const auto lev = spdlog::level::from_str(name); lev != level::off || std::string_view { name } == "off")
                return lev;
            std::cerr << fmt::format("INIT: ignoring an unknown log level: {}\n", name);
        }
        return std::getenv("BTCANCHOR_DEBUG") ? level::trace : level::debug;
    }

    spdlog::logger create(const std::string &path)
    {
        std::cerr << fmt::format("INIT: log path: {}\n", path);
        if (const auto dir = std::filesystem::path { path }.parent_path(); !dir.empty())
            std::filesystem::create_directories(dir);
        if (std::ofstream os { path, std::ios_base::app }; !os) {
            std::cerr << fmt::format("INIT: unable to write to the log file: {}; terminating.\n", path);
            std::terminate();
        }

        std::vector<spdlog::sink_ptr> sinks {};
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        file_sink->set_level(level::trace);
        file_sink->set_pattern("[%Y-%m-%d %T.%e %z] [%P:%t] [%l] %v");
        sinks.emplace_back(std::move(file_sink));
        if (!std::getenv("BTCANCHOR_LOG_NO_CONSOLE")) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        spdlog::logger logger { "btcanchor", sinks.begin(), sinks.end() };
        logger.set_level(log_level());
        logger.flush_on(level::warn);
        logger.log(level::debug, fmt::format("log level: {} installation directory: {}",
            spdlog::level::to_string_view(logger.level()), file::install_path("")));
        return logger;
    }
}
