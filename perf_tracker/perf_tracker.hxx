#pragma once

/**
 * @file perf_tracker.hxx
 * @brief Operation counters, stopwatch and memory readings for instrumented algorithms.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef _WIN32
#include <unistd.h>
#endif

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace mjvote {

// ─────────────────────────────────────────────────────────────────────────────
// Internal helpers
// ─────────────────────────────────────────────────────────────────────────────

namespace perf_detail {

using clock = std::chrono::steady_clock;
using time_point = clock::time_point;

inline auto to_ns(clock::duration dur) -> double { return static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count()); }

constexpr double NANOS_PER_MILLI = 1e6;

}  // namespace perf_detail

// ─────────────────────────────────────────────────────────────────────────────
// Memory reading
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Resident set size of the current process in bytes, read from /proc/self/statm.
 * Returns -1 when the platform offers no reading.
 */
[[nodiscard]]
inline auto current_memory_usage() noexcept -> std::ptrdiff_t {
#if defined(__linux__)
    std::FILE* statm = std::fopen("/proc/self/statm", "r");
    if (statm == nullptr) {
        return -1;
    }
    long total_pages = 0;
    long resident_pages = 0;
    const int matched = std::fscanf(statm, "%ld %ld", &total_pages, &resident_pages);
    std::fclose(statm);
    if (matched != 2) {
        return -1;
    }
    const long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0) {
        return -1;
    }
    return static_cast<std::ptrdiff_t>(resident_pages) * static_cast<std::ptrdiff_t>(page_size);
#else
    return -1;
#endif
}

// ─────────────────────────────────────────────────────────────────────────────
// OperationSink
// ─────────────────────────────────────────────────────────────────────────────

// Receiver of the primitive operations an instrumented scan performs.
template <typename S>
concept OperationSink = requires(S& sink, std::int64_t n) {
    sink.count_comparison(n);
    sink.count_assignment(n);
    sink.count_access(n);
};

/** Sink that discards every event. Lets the compiler strip instrumentation entirely. */
struct NullSink {
    constexpr void count_comparison(std::int64_t /*n*/ = 1) noexcept {}
    constexpr void count_assignment(std::int64_t /*n*/ = 1) noexcept {}
    constexpr void count_access(std::int64_t /*n*/ = 1) noexcept {}
};

// ─────────────────────────────────────────────────────────────────────────────
// PerfMetrics
// ─────────────────────────────────────────────────────────────────────────────

/** Snapshot of one measured invocation. Plain data, safe to copy around. */
struct PerfMetrics {
    std::size_t input_size = 0;
    std::int64_t comparisons = 0;
    std::int64_t assignments = 0;
    std::int64_t accesses = 0;
    double elapsed_ns = 0.0;
    std::ptrdiff_t memory_delta = 0;  // bytes; 0 when no reading was available

    [[nodiscard]] auto elapsed_ms() const -> double { return elapsed_ns / perf_detail::NANOS_PER_MILLI; }

    /** One-line form: `n=9, time=0.002ms, cmp=17, assign=3, access=18, mem=0B`. */
    [[nodiscard]] auto to_string() const -> std::string {
        std::ostringstream oss;
        oss << "n=" << input_size << ", time=" << std::fixed << std::setprecision(3) << elapsed_ms() << "ms, cmp=" << comparisons
            << ", assign=" << assignments << ", access=" << accesses << ", mem=" << memory_delta << "B";
        return oss.str();
    }

    void print_summary(std::string_view name, std::ostream& out = std::cout) const {
        constexpr int SEPARATOR_WIDTH = 42;
        out << "\n=== Performance Metrics for " << name << " ===\n";
        out << "Input Size:     " << input_size << "\n";
        out << "Execution Time: " << std::fixed << std::setprecision(4) << elapsed_ms() << " ms\n";
        out << "Comparisons:    " << comparisons << "\n";
        out << "Assignments:    " << assignments << "\n";
        out << "Array Accesses: " << accesses << "\n";
        out << "Memory Used:    " << memory_delta << " bytes\n";
        out << std::string(SEPARATOR_WIDTH, '=') << "\n\n";
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// PerfTracker
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Counting sink plus a wall-clock stopwatch and before/after memory readings.
 *
 * One tracker measures one invocation: start() clears the counters, stop()
 * freezes the clock and takes the second memory reading.
 *
 * Thread safety: not thread-safe. Create one tracker per invocation.
 */
class PerfTracker {
   public:
    PerfTracker() = default;

    void reset() {
        running_ = false;
        input_size_ = 0;
        comparisons_ = 0;
        assignments_ = 0;
        accesses_ = 0;
        elapsed_ns_ = 0.0;
        memory_before_ = -1;
        memory_after_ = -1;
        start_tp_ = {};
    }

    void start(std::size_t input_size) {
        reset();
        input_size_ = input_size;
        memory_before_ = current_memory_usage();
        running_ = true;
        start_tp_ = perf_detail::clock::now();
    }

    void stop() {
        if (!running_) {
            return;
        }
        elapsed_ns_ = perf_detail::to_ns(perf_detail::clock::now() - start_tp_);
        running_ = false;
        memory_after_ = current_memory_usage();
    }

    void count_comparison(std::int64_t n = 1) noexcept { comparisons_ += n; }
    void count_assignment(std::int64_t n = 1) noexcept { assignments_ += n; }
    void count_access(std::int64_t n = 1) noexcept { accesses_ += n; }

    [[nodiscard]] auto is_running() const -> bool { return running_; }
    [[nodiscard]] auto comparisons() const -> std::int64_t { return comparisons_; }
    [[nodiscard]] auto assignments() const -> std::int64_t { return assignments_; }
    [[nodiscard]] auto accesses() const -> std::int64_t { return accesses_; }

    /** Elapsed nanoseconds. Counts live time if still running. */
    [[nodiscard]] auto elapsed_ns() const -> double {
        if (running_) {
            return perf_detail::to_ns(perf_detail::clock::now() - start_tp_);
        }
        return elapsed_ns_;
    }

    [[nodiscard]] auto memory_delta() const -> std::ptrdiff_t {
        if (memory_before_ < 0 || memory_after_ < 0) {
            return 0;
        }
        return memory_after_ - memory_before_;
    }

    [[nodiscard]] auto metrics() const -> PerfMetrics {
        return PerfMetrics{
            .input_size = input_size_,
            .comparisons = comparisons_,
            .assignments = assignments_,
            .accesses = accesses_,
            .elapsed_ns = elapsed_ns(),
            .memory_delta = memory_delta(),
        };
    }

   private:
    bool running_ = false;
    std::size_t input_size_ = 0;
    std::int64_t comparisons_ = 0;
    std::int64_t assignments_ = 0;
    std::int64_t accesses_ = 0;
    double elapsed_ns_ = 0.0;
    std::ptrdiff_t memory_before_ = -1;
    std::ptrdiff_t memory_after_ = -1;
    perf_detail::time_point start_tp_;
};

static_assert(OperationSink<PerfTracker>);
static_assert(OperationSink<NullSink>);

}  // namespace mjvote
