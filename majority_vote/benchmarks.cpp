/**
 * @file benchmarks.cpp
 * @brief Benchmarks for majority_vote.hxx — variants, input shapes and instrumentation cost.
 *
 * Structure
 * ─────────
 *  0  Raw baselines      — a plain linear scan and an uninstrumented vote (NullSink)
 *  1  Standard           — find_majority across input shapes
 *  2  Optimized          — find_majority_optimized across the same shapes
 *  3  Positions          — find_majority_with_positions
 *  4  Instrumentation    — PerfTracker vs NullSink on the same scan
 *
 * Each tracked case reports the per-iteration comparison and access counts next
 * to the timings, so the early-exit savings are visible without a profiler.
 */

#include <algorithm>
#include <cstddef>
#include <random>
#include <span>
#include <utility>
#include <vector>

#include "../benchmarking/bench_main.hpp"
#include "majority_vote.hxx"

using mjvote::benchmark::DoNotOptimize;

namespace {

constexpr std::size_t N = 100'000;

// Fixed-seed inputs, built once; every case reads the same data.
auto shuffled(std::vector<int> values) -> std::vector<int> {
    std::mt19937 rng{12345};
    std::ranges::shuffle(values, rng);
    return values;
}

auto clear_majority() -> const std::vector<int>& {
    static const std::vector<int> data = [] {
        std::vector<int> values(N, 7);
        for (std::size_t i = N * 6 / 10; i < N; ++i) {
            values[i] = static_cast<int>(i % 97) + 100;
        }
        return shuffled(std::move(values));
    }();
    return data;
}

auto slim_majority() -> const std::vector<int>& {
    static const std::vector<int> data = [] {
        std::vector<int> values(N, 7);
        for (std::size_t i = N / 2 + 1; i < N; ++i) {
            values[i] = static_cast<int>(i % 97) + 100;
        }
        return shuffled(std::move(values));
    }();
    return data;
}

auto no_majority() -> const std::vector<int>& {
    static const std::vector<int> data = [] {
        std::vector<int> values(N);
        for (std::size_t i = 0; i < N; ++i) {
            values[i] = static_cast<int>(i % (N / 3 + 1));
        }
        return values;
    }();
    return data;
}

auto unanimous() -> const std::vector<int>& {
    static const std::vector<int> data(N, 42);
    return data;
}

template <typename Outcome>
void record(mjvote::benchmark::bench_state& state, const Outcome& outcome) {
    state.add_counter("cmp", outcome.metrics.comparisons);
    state.add_counter("acc", outcome.metrics.accesses);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// 0  Raw baselines
// ─────────────────────────────────────────────────────────────────────────────
BENCH_SUITE("0 - raw baselines")

BENCH_CASE_N("std::count over 100k ints", 200) {
    std::span<const int> values = clear_majority();
    for ([[maybe_unused]] auto _ : state) {
        auto hits = std::count(values.begin(), values.end(), 7);
        DoNotOptimize(hits);
    }
}

BENCH_CASE_N("vote::find_majority<NullSink> clear majority", 200) {
    std::span<const int> values = clear_majority();
    mjvote::NullSink sink;
    for ([[maybe_unused]] auto _ : state) {
        auto majority = mjvote::vote::find_majority(values, sink);
        DoNotOptimize(majority);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// 1  Standard
// ─────────────────────────────────────────────────────────────────────────────
BENCH_SUITE("1 - find_majority")

BENCH_CASE_N("standard clear majority (60%)", 200) {
    mjvote::MajorityVote<int> vote;
    for ([[maybe_unused]] auto _ : state) {
        auto outcome = vote.find_majority(clear_majority());
        DoNotOptimize(outcome.value);
        record(state, outcome);
    }
}

BENCH_CASE_N("standard slim majority (51%)", 200) {
    mjvote::MajorityVote<int> vote;
    for ([[maybe_unused]] auto _ : state) {
        auto outcome = vote.find_majority(slim_majority());
        DoNotOptimize(outcome.value);
        record(state, outcome);
    }
}

BENCH_CASE_N("standard no majority", 200) {
    mjvote::MajorityVote<int> vote;
    for ([[maybe_unused]] auto _ : state) {
        auto outcome = vote.find_majority(no_majority());
        DoNotOptimize(outcome.value);
        record(state, outcome);
    }
}

BENCH_CASE_N("standard unanimous", 200) {
    mjvote::MajorityVote<int> vote;
    for ([[maybe_unused]] auto _ : state) {
        auto outcome = vote.find_majority(unanimous());
        DoNotOptimize(outcome.value);
        record(state, outcome);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// 2  Optimized
// ─────────────────────────────────────────────────────────────────────────────
BENCH_SUITE("2 - find_majority_optimized")

BENCH_CASE_N("optimized clear majority (60%)", 200) {
    mjvote::MajorityVote<int> vote;
    for ([[maybe_unused]] auto _ : state) {
        auto outcome = vote.find_majority_optimized(clear_majority());
        DoNotOptimize(outcome.value);
        record(state, outcome);
    }
}

BENCH_CASE_N("optimized slim majority (51%)", 200) {
    mjvote::MajorityVote<int> vote;
    for ([[maybe_unused]] auto _ : state) {
        auto outcome = vote.find_majority_optimized(slim_majority());
        DoNotOptimize(outcome.value);
        record(state, outcome);
    }
}

BENCH_CASE_N("optimized no majority", 200) {
    mjvote::MajorityVote<int> vote;
    for ([[maybe_unused]] auto _ : state) {
        auto outcome = vote.find_majority_optimized(no_majority());
        DoNotOptimize(outcome.value);
        record(state, outcome);
    }
}

// Exits after n/2 + 1 elements.
BENCH_CASE_N("optimized unanimous", 200) {
    mjvote::MajorityVote<int> vote;
    for ([[maybe_unused]] auto _ : state) {
        auto outcome = vote.find_majority_optimized(unanimous());
        DoNotOptimize(outcome.value);
        record(state, outcome);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// 3  Positions
// ─────────────────────────────────────────────────────────────────────────────
BENCH_SUITE("3 - find_majority_with_positions")

BENCH_CASE_N("positions clear majority (60%)", 100) {
    mjvote::MajorityVote<int> vote;
    for ([[maybe_unused]] auto _ : state) {
        auto outcome = vote.find_majority_with_positions(clear_majority());
        DoNotOptimize(outcome.value->count);
        record(state, outcome);
    }
}

BENCH_CASE_N("positions no majority", 100) {
    mjvote::MajorityVote<int> vote;
    for ([[maybe_unused]] auto _ : state) {
        auto outcome = vote.find_majority_with_positions(no_majority());
        DoNotOptimize(outcome.value.has_value());
        record(state, outcome);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// 4  Instrumentation
// ─────────────────────────────────────────────────────────────────────────────
BENCH_SUITE("4 - instrumentation overhead")

BENCH_CASE_N("candidate pass, NullSink", 500) {
    std::span<const int> values = slim_majority();
    mjvote::NullSink sink;
    for ([[maybe_unused]] auto _ : state) {
        auto candidate = mjvote::vote::find_candidate(values, sink);
        DoNotOptimize(candidate);
    }
}

BENCH_CASE_N("candidate pass, PerfTracker", 500) {
    std::span<const int> values = slim_majority();
    for ([[maybe_unused]] auto _ : state) {
        mjvote::PerfTracker tracker;
        auto candidate = mjvote::vote::find_candidate(values, tracker);
        DoNotOptimize(candidate);
        state.add_counter("cmp", tracker.comparisons());
    }
}

// start()/stop() cost alone: two memory readings and two clock reads.
BENCH_CASE("PerfTracker start/stop") {
    mjvote::PerfTracker tracker;
    for ([[maybe_unused]] auto _ : state) {
        tracker.start(N);
        tracker.stop();
        DoNotOptimize(tracker.elapsed_ns());
    }
}
