#pragma once

/**
 * @file bench_runner.hxx
 * @brief Trial loop, aggregation and CSV output for the majority vote benchmark driver.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * For every requested size the driver generates one input, runs a few untimed
 * warmup calls and then the measured iterations, each on a fresh copy of the
 * input. Per-call metrics come straight from the VoteOutcome of that call.
 */

#include <array>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../logger/logger.hxx"
#include "../majority_vote/majority_vote.hxx"
#include "input_generator.hxx"

namespace mjvote::bench {

// ─────────────────────────────────────────────────────────────────────────────
// Algorithm selection
// ─────────────────────────────────────────────────────────────────────────────

enum class Algorithm : std::uint8_t { Standard, Optimized, Positions };

inline constexpr std::array ALL_ALGORITHMS{Algorithm::Standard, Algorithm::Optimized, Algorithm::Positions};

constexpr auto algorithm_name(Algorithm algo) -> std::string_view {
    switch (algo) {
        case Algorithm::Standard:
            return "standard";
        case Algorithm::Optimized:
            return "optimized";
        case Algorithm::Positions:
            return "positions";
    }
    return "unknown";
}

/** @throws std::invalid_argument for anything but standard, optimized or positions. */
inline auto parse_algorithm(std::string_view text) -> Algorithm {
    for (Algorithm algo : ALL_ALGORITHMS) {
        if (text == algorithm_name(algo)) {
            return algo;
        }
    }
    throw std::invalid_argument("unknown algorithm: " + std::string(text));
}

// ─────────────────────────────────────────────────────────────────────────────
// Run configuration
// ─────────────────────────────────────────────────────────────────────────────

struct RunConfig {
    Algorithm algorithm = Algorithm::Standard;
    InputType input = InputType::ClearMajority;
    std::vector<std::size_t> sizes{100, 1'000, 10'000, 100'000};
    int warmup = 5;
    int iterations = 10;
    std::uint32_t seed = 42;
};

/**
 * Parses a comma-separated size list such as "100,1k,2.5k,1m".
 * A trailing k/K multiplies by 1e3, m/M by 1e6. Empty items are skipped.
 *
 * @throws std::invalid_argument on malformed or negative items, or when no size remains.
 */
inline auto parse_sizes(std::string_view text) -> std::vector<std::size_t> {
    std::vector<std::size_t> sizes;
    std::stringstream stream{std::string(text)};
    std::string token;

    while (std::getline(stream, token, ',')) {
        if (token.empty()) {
            continue;
        }
        const std::string original = token;
        double multiplier = 1.0;
        if (token.back() == 'k' || token.back() == 'K') {
            multiplier = 1e3;
            token.pop_back();
        } else if (token.back() == 'm' || token.back() == 'M') {
            multiplier = 1e6;
            token.pop_back();
        }

        double value = 0.0;
        std::size_t consumed = 0;
        try {
            value = std::stod(token, &consumed);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("malformed size: '" + original + "'");
        }
        if (consumed != token.size() || value < 0.0 || !std::isfinite(value)) {
            throw std::invalid_argument("malformed size: '" + original + "'");
        }
        sizes.push_back(static_cast<std::size_t>(value * multiplier));
    }

    if (sizes.empty()) {
        throw std::invalid_argument("size list is empty");
    }
    return sizes;
}

/**
 * Parses a generator seed over the full 32-bit unsigned range.
 *
 * @throws std::invalid_argument on signs, trailing text or values above 4294967295.
 */
inline auto parse_seed(std::string_view text) -> std::uint32_t {
    const std::string token(text);
    if (token.empty() || !std::isdigit(static_cast<unsigned char>(token.front()))) {
        throw std::invalid_argument("malformed seed: '" + token + "'");
    }
    unsigned long long value = 0;
    std::size_t consumed = 0;
    try {
        value = std::stoull(token, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("malformed seed: '" + token + "'");
    }
    if (consumed != token.size() || value > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("malformed seed: '" + token + "'");
    }
    return static_cast<std::uint32_t>(value);
}

// ─────────────────────────────────────────────────────────────────────────────
// Interactive menu
// ─────────────────────────────────────────────────────────────────────────────

namespace runner_detail {

// Reads one menu choice in [1, count]; nullopt on bad input or end of stream.
inline auto read_choice(std::istream& in, std::ostream& out, std::size_t count) -> std::optional<std::size_t> {
    out << "\nEnter choice: " << std::flush;
    std::size_t choice = 0;
    if (!(in >> choice) || choice < 1 || choice > count) {
        return std::nullopt;
    }
    return choice - 1;
}

}  // namespace runner_detail

/**
 * @brief Numbered menus for algorithm and input type, read from @p in.
 *
 * Only the two menu answers are taken from the user; sizes, iterations and
 * seed keep the values already in @p config.
 *
 * @return false when a choice is out of range or unreadable; @p config is then untouched.
 */
inline auto prompt_config(std::istream& in, std::ostream& out, RunConfig& config) -> bool {
    out << "=== Boyer-Moore Majority Vote Benchmark ===\n\n";
    out << "Select algorithm:\n";
    for (std::size_t i = 0; i < ALL_ALGORITHMS.size(); ++i) {
        out << (i + 1) << ". " << algorithm_name(ALL_ALGORITHMS[i]) << "\n";
    }
    auto algo = runner_detail::read_choice(in, out, ALL_ALGORITHMS.size());
    if (!algo) {
        out << "Invalid choice!\n";
        return false;
    }

    out << "\nSelect input type:\n";
    for (std::size_t i = 0; i < ALL_INPUT_TYPES.size(); ++i) {
        out << (i + 1) << ". " << input_type_label(ALL_INPUT_TYPES[i]) << "\n";
    }
    auto input = runner_detail::read_choice(in, out, ALL_INPUT_TYPES.size());
    if (!input) {
        out << "Invalid choice!\n";
        return false;
    }

    config.algorithm = ALL_ALGORITHMS[*algo];
    config.input = ALL_INPUT_TYPES[*input];
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// SampleStats
// ─────────────────────────────────────────────────────────────────────────────

/** Welford running mean and population variance of per-iteration times (ms). */
struct SampleStats {
    std::size_t count = 0;
    double mean = 0.0;
    double M2 = 0.0;

    void record(double sample) {
        ++count;
        double delta = sample - mean;
        mean += delta / static_cast<double>(count);
        M2 += delta * (sample - mean);
    }

    [[nodiscard]] auto variance() const -> double { return count < 2 ? 0.0 : M2 / static_cast<double>(count); }
    [[nodiscard]] auto stddev() const -> double { return std::sqrt(variance()); }
};

// ─────────────────────────────────────────────────────────────────────────────
// BenchRow
// ─────────────────────────────────────────────────────────────────────────────

inline constexpr std::string_view CSV_HEADER = "InputSize,InputType,AvgTimeMs,StdDevMs,Comparisons,Assignments,ArrayAccesses,MemoryBytes,Result";

/** One aggregated line of the results table. Counters are integer averages. */
struct BenchRow {
    std::size_t input_size = 0;
    InputType input_type = InputType::ClearMajority;
    double avg_ms = 0.0;
    double stddev_ms = 0.0;
    std::int64_t comparisons = 0;
    std::int64_t assignments = 0;
    std::int64_t accesses = 0;
    std::int64_t memory_bytes = 0;
    std::string result = "none";

    [[nodiscard]] auto to_csv() const -> std::string {
        return std::format("{},{},{:.4f},{:.4f},{},{},{},{},{}", input_size, input_type_name(input_type), avg_ms, stddev_ms, comparisons, assignments,
                           accesses, memory_bytes, result);
    }

    [[nodiscard]] auto to_console() const -> std::string {
        return std::format("Size: {:>8} | Time: {:>10.4f} ms | Comparisons: {:>10} | Result: {}", input_size, avg_ms, comparisons, result);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Trials
// ─────────────────────────────────────────────────────────────────────────────

namespace runner_detail {

struct Measured {
    PerfMetrics metrics;
    std::string rendered;
};

// Runs one call of the selected algorithm on a private copy of the input.
inline auto run_once(MajorityVote<int>& vote, const std::vector<int>& input, Algorithm algo) -> Measured {
    std::vector<int> copy = input;
    switch (algo) {
        case Algorithm::Standard: {
            auto outcome = vote.find_majority(copy);
            return {.metrics = outcome.metrics, .rendered = outcome.value ? std::to_string(*outcome.value) : "none"};
        }
        case Algorithm::Optimized: {
            auto outcome = vote.find_majority_optimized(copy);
            return {.metrics = outcome.metrics, .rendered = outcome.value ? std::to_string(*outcome.value) : "none"};
        }
        case Algorithm::Positions: {
            auto outcome = vote.find_majority_with_positions(copy);
            std::string rendered = outcome.value ? std::format("{} x {}", outcome.value->element, outcome.value->count) : "none";
            return {.metrics = outcome.metrics, .rendered = std::move(rendered)};
        }
    }
    throw std::invalid_argument("unknown algorithm");
}

}  // namespace runner_detail

/**
 * @brief Warmup plus measured iterations of one algorithm on one input.
 *
 * @throws InvalidInput when @p input is empty.
 * @throws std::invalid_argument when @p iterations is not positive or @p warmup is negative.
 */
inline auto run_trial(const std::vector<int>& input, InputType type, Algorithm algo, int warmup, int iterations) -> BenchRow {
    if (iterations <= 0) {
        throw std::invalid_argument("iterations must be positive");
    }
    if (warmup < 0) {
        throw std::invalid_argument("warmup cannot be negative");
    }

    MajorityVote<int> vote;
    for (int i = 0; i < warmup; ++i) {
        (void)runner_detail::run_once(vote, input, algo);
    }

    SampleStats times;
    std::int64_t total_comparisons = 0;
    std::int64_t total_assignments = 0;
    std::int64_t total_accesses = 0;
    std::int64_t total_memory = 0;
    std::string last_result = "none";

    for (int i = 0; i < iterations; ++i) {
        auto [metrics, rendered] = runner_detail::run_once(vote, input, algo);
        times.record(metrics.elapsed_ms());
        total_comparisons += metrics.comparisons;
        total_assignments += metrics.assignments;
        total_accesses += metrics.accesses;
        total_memory += static_cast<std::int64_t>(metrics.memory_delta);
        last_result = std::move(rendered);
    }

    return BenchRow{
        .input_size = input.size(),
        .input_type = type,
        .avg_ms = times.mean,
        .stddev_ms = times.stddev(),
        .comparisons = total_comparisons / iterations,
        .assignments = total_assignments / iterations,
        .accesses = total_accesses / iterations,
        .memory_bytes = total_memory / iterations,
        .result = std::move(last_result),
    };
}

/**
 * @brief One trial per configured size, in order.
 *
 * Sizes the core rejects (zero) are logged and skipped. Every finished row is
 * echoed to @p console as it completes.
 */
inline auto run_benchmark(const RunConfig& config, std::ostream& console = std::cout) -> std::vector<BenchRow> {
    MJV_LOG_INFO << "benchmark: algorithm=" << algorithm_name(config.algorithm) << " input=" << input_type_name(config.input)
                 << " warmup=" << config.warmup << " iterations=" << config.iterations << " seed=" << config.seed;

    std::vector<BenchRow> rows;
    rows.reserve(config.sizes.size());

    for (std::size_t size : config.sizes) {
        std::vector<int> input = generate_input(size, config.input, config.seed);
        try {
            BenchRow row = run_trial(input, config.input, config.algorithm, config.warmup, config.iterations);
            console << row.to_console() << '\n';
            MJV_LOG_HERE << "size " << size << ": " << row.to_csv();
            rows.push_back(std::move(row));
        } catch (const InvalidInput& e) {
            MJV_LOG_WARN << "skipping size " << size << ": " << e.what();
        }
    }

    MJV_LOG_INFO << "benchmark finished: " << rows.size() << "/" << config.sizes.size() << " sizes measured";
    return rows;
}

/**
 * @brief Metrics of a single call at @p size, for the detailed summary.
 * @throws InvalidInput when @p size is zero.
 */
inline auto measure_once(const RunConfig& config, std::size_t size) -> PerfMetrics {
    MajorityVote<int> vote;
    std::vector<int> input = generate_input(size, config.input, config.seed);
    return runner_detail::run_once(vote, input, config.algorithm).metrics;
}

// ─────────────────────────────────────────────────────────────────────────────
// CSV output
// ─────────────────────────────────────────────────────────────────────────────

inline void write_csv(std::ostream& out, const std::vector<BenchRow>& rows) {
    out << CSV_HEADER << '\n';
    for (const auto& row : rows) {
        out << row.to_csv() << '\n';
    }
}

/** @throws std::runtime_error when @p path cannot be written. */
inline void write_csv(const std::filesystem::path& path, const std::vector<BenchRow>& rows) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open CSV output: " + path.string());
    }
    write_csv(file, rows);
    file.flush();
    if (!file) {
        throw std::runtime_error("failed writing CSV output: " + path.string());
    }
}

}  // namespace mjvote::bench
