/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <chrono>
#include <iostream>
#include <btcanchor/common/test.hpp>

int main(const int argc, const char **argv)
{
    using namespace btcanchor;
    const auto start = std::chrono::steady_clock::now();
    if (argc >= 2) {
        std::cerr << fmt::format("using test-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool res = boost::ut::cfg<boost::ut::override>.run();
    const std::chrono::duration<double> took = std::chrono::steady_clock::now() - start;
    logger::info("run-test: finished in {:0.3f} secs", took.count());
    return res ? 1 : 0;
}
