/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef PRAOS_CRYPTO_BENCHMARK_HPP
#define PRAOS_CRYPTO_BENCHMARK_HPP

#include <chrono>
#include <cmath>
#include <iostream>
#include <source_location>
#include <string>
#include <pc/common/test.hpp>

namespace praos_crypto {
    template<typename T>
    concept Countable = requires(T a) {
        { a() + 1 };
    };

    inline std::string humanize_rate(const double rate)
    {
        struct scale {
            double norm;
            const char *suffix;
        };
        static const std::vector<scale> scales { { 1e15, "P" }, { 1e12, "T" }, { 1e9, "G" }, { 1e6, "M" }, { 1e3, "K" } };
        const auto abs_rate = std::fabs(rate);
        for (const auto &[norm, suff]: scales) {
            if (abs_rate >= norm)
                return fmt::format("{:.3f}{}", rate / norm, suff);
        }
        return fmt::format("{:.3f}", rate);
    }

    template<Countable T>
    static double benchmark_rate(const std::string_view name, const size_t num_iter, const T &action)
    {
        const auto start = std::chrono::high_resolution_clock::now();
        uint64_t total_iters = 0;
        for (size_t i = 0; i < num_iter; ++i) {
            total_iters += action();
        }
        const auto stop = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> sec = stop - start;
        const double rate = static_cast<double>(total_iters) / sec.count();
        std::clog << fmt::format("[{}] {}iters/sec, total iters: {}\n", name, humanize_rate(rate), total_iters);
        return rate;
    };

    template<typename T>
    static double benchmark_rate(const std::string_view name, const size_t num_iter, const T &action)
    {
        return benchmark_rate(name, num_iter, [&] {
            action();
            return 1;
        });
    };

    template<typename T>
    static void benchmark_r(const std::string_view name, const double min_rate, const size_t num_iter, const T &action, const std::source_location &src_loc=std::source_location::current())
    {
        boost::ut::test(name) = [=] {
            const double rate = benchmark_rate(name, num_iter, action);
            boost::ut::expect(rate >= min_rate, src_loc) << rate << " < " << min_rate;
        };
    }
}

#endif // !PRAOS_CRYPTO_BENCHMARK_HPP
