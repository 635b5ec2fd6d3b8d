#pragma once

/**
 * @file benchmark.hxx
 * @brief Simple benchmarking framework with statistical output, per-iteration counters and colored reporting.
 * @version 1.1.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

// ─────────────────────────────────────────────────────────────────────────────
// ANSI colors  (mirrors testing::color)
// ─────────────────────────────────────────────────────────────────────────────
namespace mjvote::benchmark::color {

inline auto enabled() -> bool {
#ifdef _WIN32
    return false;
#else
    static bool val = (isatty(fileno(stdout)) != 0);
    return val;
#endif
}

inline auto paint(std::string_view code, std::string_view s) -> std::string {
    return enabled() ? std::string(code) + std::string(s) + "\033[0m" : std::string(s);
}

inline auto green(std::string_view s) -> std::string { return paint("\033[32m", s); }
inline auto yellow(std::string_view s) -> std::string { return paint("\033[33m", s); }
inline auto cyan(std::string_view s) -> std::string { return paint("\033[36m", s); }
inline auto bold(std::string_view s) -> std::string { return paint("\033[1m", s); }
inline auto dim(std::string_view s) -> std::string { return paint("\033[2m", s); }

}  // namespace mjvote::benchmark::color

namespace mjvote::benchmark {

// ─────────────────────────────────────────────────────────────────────────────
// benchmark_result — plain data, computed after a run
// ─────────────────────────────────────────────────────────────────────────────

struct benchmark_result {
    std::string suite;
    std::string name;
    std::size_t iterations{};
    double mean_ns{};
    double median_ns{};
    double stddev_ns{};
    double min_ns{};
    double max_ns{};
    std::map<std::string, double> counters;  // per-iteration averages
};

// ─────────────────────────────────────────────────────────────────────────────
// DoNotOptimize — keeps the compiler from discarding the benchmarked
// expression (Google Benchmark / nanobench pattern).
// ─────────────────────────────────────────────────────────────────────────────

#if defined(__GNUC__) || defined(__clang__)
template <typename T>
inline void DoNotOptimize(T const& val) {
    asm volatile("" : : "r,m"(val) : "memory");
}
template <typename T>
inline void DoNotOptimize(T& val) {
    asm volatile("" : "+r,m"(val) : : "memory");
}
#else
template <typename T>
inline void DoNotOptimize(T const& val) {
    const volatile T* ptr = &val;
    (void)ptr;
}
#endif

// ─────────────────────────────────────────────────────────────────────────────
// bench_state — passed into every benchmark function.
//
//   BENCH_CASE("my bench") {
//       for ([[maybe_unused]] auto _ : state) {
//           auto outcome = vote.find_majority(values);
//           state.add_counter("cmp", outcome.metrics.comparisons);
//       }
//   }
//
// Counters are summed over the measured loop and reported as a per-iteration
// average next to the timing columns.
// ─────────────────────────────────────────────────────────────────────────────

class bench_state {
   public:
    explicit bench_state(std::size_t iters) : iters_(iters) { samples_ns_.reserve(iters); }

    struct iterator {
        bench_state* state;
        std::size_t index;

        auto operator!=(const iterator& other) const -> bool { return index != other.index; }
        auto operator++() -> iterator& {
            state->lap();
            ++index;
            return *this;
        }
        // `auto _` only needs something to bind to.
        auto operator*() const -> int { return 0; }
    };

    auto begin() -> iterator {
        start_ = clock::now();
        return {this, 0};
    }

    auto end() -> iterator { return {this, iters_}; }

    void add_counter(const std::string& name, double value) { counters_[name] += value; }
    template <typename I>
        requires std::is_integral_v<I>
    void add_counter(const std::string& name, I value) {
        add_counter(name, static_cast<double>(value));
    }

    [[nodiscard]] auto samples() const -> const std::vector<double>& { return samples_ns_; }
    [[nodiscard]] auto iterations() const -> std::size_t { return iters_; }
    [[nodiscard]] auto counters() const -> const std::map<std::string, double>& { return counters_; }

   private:
    using clock = std::chrono::steady_clock;

    std::size_t iters_;
    clock::time_point start_;
    std::vector<double> samples_ns_;
    std::map<std::string, double> counters_;

    void lap() {
        auto now = clock::now();
        samples_ns_.push_back(std::chrono::duration<double, std::nano>(now - start_).count());
        start_ = clock::now();
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Statistics helpers
// ─────────────────────────────────────────────────────────────────────────────

namespace detail {

inline auto compute_result(std::string suite, std::string name, const bench_state& state) -> benchmark_result {
    std::vector<double> samples = state.samples();
    std::sort(samples.begin(), samples.end());

    benchmark_result res{.suite = std::move(suite), .name = std::move(name), .iterations = samples.size()};
    if (samples.empty()) {
        return res;
    }

    const std::size_t n = samples.size();
    double sum = 0;
    for (double s : samples) sum += s;
    const double mean = sum / static_cast<double>(n);

    double acc = 0;
    for (double s : samples) acc += (s - mean) * (s - mean);

    res.mean_ns = mean;
    res.median_ns = (n % 2 == 0) ? (samples[n / 2 - 1] + samples[n / 2]) / 2.0 : samples[n / 2];
    res.stddev_ns = std::sqrt(acc / static_cast<double>(n));
    res.min_ns = samples.front();
    res.max_ns = samples.back();
    for (const auto& [key, total] : state.counters()) {
        res.counters[key] = total / static_cast<double>(n);
    }
    return res;
}

// Picks the most readable unit: ns / µs / ms / s.
inline auto fmt_time(double ns) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (ns < 1'000.0) {
        oss << ns << " ns";
    } else if (ns < 1'000'000.0) {
        oss << ns / 1e3 << " µs";
    } else if (ns < 1'000'000'000.0) {
        oss << ns / 1e6 << " ms";
    } else {
        oss << ns / 1e9 << "  s";
    }
    return oss.str();
}

}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// bench_case / bench_registry
// ─────────────────────────────────────────────────────────────────────────────

struct bench_case {
    std::string suite;
    std::string name;
    std::function<void(bench_state&)> fn;
    std::size_t iterations;
    std::size_t warmup;
};

class bench_registry {
   public:
    static auto instance() -> bench_registry& {
        static bench_registry reg;
        return reg;
    }

    auto register_bench(bench_case bcase) -> void { benches_.push_back(std::move(bcase)); }

    /**
     * @brief Run every registered benchmark whose suite or name contains @p filter.
     * @return 0, or 1 when the filter matched nothing.
     */
    auto run_all(std::string_view filter = {}) -> int {
        print_header();

        std::vector<benchmark_result> results;
        std::string current_suite;

        for (auto& bcase : benches_) {
            if (!filter.empty() && bcase.name.find(filter) == std::string::npos && bcase.suite.find(filter) == std::string::npos) {
                continue;
            }
            if (bcase.suite != current_suite) {
                current_suite = bcase.suite;
                std::cout << "\n  " << color::bold(color::yellow("SUITE: " + current_suite)) << "\n";
            }

            // Warmup runs go through a throwaway state so their counters are dropped.
            if (bcase.warmup > 0) {
                bench_state warmup_state(bcase.warmup);
                bcase.fn(warmup_state);
            }

            bench_state state(bcase.iterations);
            bcase.fn(state);

            auto res = detail::compute_result(bcase.suite, bcase.name, state);
            print_result(res);
            results.push_back(std::move(res));
        }

        print_footer(results);
        return (!filter.empty() && results.empty()) ? 1 : 0;
    }

   private:
    std::vector<bench_case> benches_;

    static void print_header() {
        std::cout << color::bold("\n+-------------------------------------+\n");
        std::cout << color::bold("|  mjvote benchmark runner            |\n");
        std::cout << color::bold("+-------------------------------------+\n");
    }

    static void print_result(const benchmark_result& r) {
        constexpr int NAME_WIDTH = 60;
        std::cout << "    " << color::green("v") << "  " << std::left << std::setw(NAME_WIDTH) << r.name << color::cyan(detail::fmt_time(r.mean_ns))
                  << color::dim("  med " + detail::fmt_time(r.median_ns)) << color::dim("  σ " + detail::fmt_time(r.stddev_ns))
                  << color::dim("  [" + detail::fmt_time(r.min_ns) + " … " + detail::fmt_time(r.max_ns) + "]")
                  << color::dim("  ×" + std::to_string(r.iterations));
        for (const auto& [key, avg] : r.counters) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1) << "  " << key << "=" << avg;
            std::cout << color::dim(oss.str());
        }
        std::cout << "\n";
    }

    static void print_footer(const std::vector<benchmark_result>& results) {
        constexpr int SEPARATOR_WIDTH = 42;
        std::cout << "\n" << std::string(SEPARATOR_WIDTH, '-') << "\n";
        std::cout << "  " << color::green(std::to_string(results.size()) + " benchmarks completed") << "\n";
        std::cout << std::string(SEPARATOR_WIDTH, '-') << "\n\n";
    }
};

// Registers a benchmark at static-init time.
struct auto_bench_registrar {
    auto_bench_registrar(const char* suite, const char* name, void (*func)(bench_state&), std::size_t iters, std::size_t warmup) {
        bench_registry::instance().register_bench({
            .suite = suite,
            .name = name,
            .fn = func,
            .iterations = iters,
            .warmup = warmup,
        });
    }
};

}  // namespace mjvote::benchmark

// ─────────────────────────────────────────────────────────────────────────────
// Macro helpers
// ─────────────────────────────────────────────────────────────────────────────
#define MJV_BM_CAT2(a, b) a##b
#define MJV_BM_CAT(a, b) MJV_BM_CAT2(a, b)

namespace {
inline const char* mjv_bm_current_suite_ = "<unset>";
}

#define BENCH_SUITE(name)                                             \
    static const char* MJV_BM_CAT(mjv_bm_suite_str_, __LINE__) = name; \
    static int MJV_BM_CAT(mjv_bm_suite_set_, __LINE__) = (mjv_bm_current_suite_ = MJV_BM_CAT(mjv_bm_suite_str_, __LINE__), 0);

// ─────────────────────────────────────────────────────────────────────────────
// BENCH_CASE     — 1000 iterations, 10 warmup
// BENCH_CASE_N   — explicit iteration count
// BENCH_CASE_NW  — explicit iteration and warmup counts
// ─────────────────────────────────────────────────────────────────────────────

#define MJV_BM_DEFINE(test_name, iters, warmup)                                                                                       \
    static void MJV_BM_CAT(mjv_bm_fn_, __LINE__)(::mjvote::benchmark::bench_state & state);                                           \
    static ::mjvote::benchmark::auto_bench_registrar MJV_BM_CAT(mjv_bm_reg_, __LINE__)(mjv_bm_current_suite_, test_name,              \
                                                                                        MJV_BM_CAT(mjv_bm_fn_, __LINE__), (iters), (warmup)); \
    static void MJV_BM_CAT(mjv_bm_fn_, __LINE__)(::mjvote::benchmark::bench_state & state)

#define BENCH_CASE(test_name) MJV_BM_DEFINE(test_name, 1000, 10)
#define BENCH_CASE_N(test_name, iters) MJV_BM_DEFINE(test_name, iters, 10)
#define BENCH_CASE_NW(test_name, iters, w) MJV_BM_DEFINE(test_name, iters, w)
