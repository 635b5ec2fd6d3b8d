/**
 * test.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Test suite for the operation counters and stopwatch (perf_tracker.hxx).
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <thread>

#include "../testing/test_main.hpp"
#include "perf_tracker.hxx"

using mjvote::NullSink;
using mjvote::PerfMetrics;
using mjvote::PerfTracker;

// ═════════════════════════════════════════════════════════════════════════════
// COUNTERS
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("counters")

TEST_CASE("fresh tracker is all zero and stopped") {
    PerfTracker tracker;
    expect(tracker.is_running()).to_be_false();
    expect(tracker.comparisons()).to_equal(std::int64_t{0});
    expect(tracker.assignments()).to_equal(std::int64_t{0});
    expect(tracker.accesses()).to_equal(std::int64_t{0});
    expect(tracker.elapsed_ns()).to_equal(0.0);
}

TEST_CASE("each counter advances independently") {
    PerfTracker tracker;
    tracker.count_comparison();
    tracker.count_comparison(4);
    tracker.count_assignment();
    tracker.count_access(7);
    expect(tracker.comparisons()).to_equal(std::int64_t{5});
    expect(tracker.assignments()).to_equal(std::int64_t{1});
    expect(tracker.accesses()).to_equal(std::int64_t{7});
}

TEST_CASE("start clears counters from a previous measurement") {
    PerfTracker tracker;
    tracker.start(3);
    tracker.count_comparison(10);
    tracker.stop();

    tracker.start(5);
    expect(tracker.comparisons()).to_equal(std::int64_t{0});
    tracker.stop();
    expect(tracker.metrics().input_size).to_equal(std::size_t{5});
}

TEST_CASE("reset returns to the initial state") {
    PerfTracker tracker;
    tracker.start(8);
    tracker.count_access(3);
    tracker.reset();
    expect(tracker.is_running()).to_be_false();
    expect(tracker.accesses()).to_equal(std::int64_t{0});
    expect(tracker.memory_delta()).to_equal(std::ptrdiff_t{0});
}

TEST_CASE("null sink accepts every event") {
    NullSink sink;
    sink.count_comparison();
    sink.count_assignment(3);
    sink.count_access(9);
    expect(mjvote::OperationSink<NullSink>).to_be_true();
}

// ═════════════════════════════════════════════════════════════════════════════
// STOPWATCH
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("stopwatch")

TEST_CASE("elapsed time covers the measured region") {
    PerfTracker tracker;
    tracker.start(1);
    expect(tracker.is_running()).to_be_true();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    tracker.stop();
    expect(tracker.is_running()).to_be_false();
    expect(tracker.elapsed_ns()).to_be_greater_or_equal(5e6);
}

TEST_CASE("elapsed time is frozen after stop") {
    PerfTracker tracker;
    tracker.start(1);
    tracker.stop();
    const double frozen = tracker.elapsed_ns();
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    expect(tracker.elapsed_ns()).to_equal(frozen);
}

TEST_CASE("stop without start is a no-op") {
    PerfTracker tracker;
    tracker.stop();
    expect(tracker.elapsed_ns()).to_equal(0.0);
    expect(tracker.memory_delta()).to_equal(std::ptrdiff_t{0});
}

TEST_CASE("running tracker reports live time") {
    PerfTracker tracker;
    tracker.start(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    expect(tracker.elapsed_ns()).to_be_greater_than(0.0);
    tracker.stop();
}

// ═════════════════════════════════════════════════════════════════════════════
// MEMORY
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("memory")

TEST_CASE("resident size is readable on linux") {
#if defined(__linux__)
    expect(mjvote::current_memory_usage()).to_be_greater_than(std::ptrdiff_t{0});
#else
    expect(mjvote::current_memory_usage()).to_equal(std::ptrdiff_t{-1});
#endif
}

// ═════════════════════════════════════════════════════════════════════════════
// METRICS SNAPSHOT
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("metrics")

TEST_CASE("snapshot copies every counter") {
    PerfTracker tracker;
    tracker.start(9);
    tracker.count_comparison(17);
    tracker.count_assignment(2);
    tracker.count_access(18);
    tracker.stop();

    PerfMetrics metrics = tracker.metrics();
    expect(metrics.input_size).to_equal(std::size_t{9});
    expect(metrics.comparisons).to_equal(std::int64_t{17});
    expect(metrics.assignments).to_equal(std::int64_t{2});
    expect(metrics.accesses).to_equal(std::int64_t{18});
    expect(metrics.elapsed_ns).to_equal(tracker.elapsed_ns());
}

TEST_CASE("elapsed_ms converts from nanoseconds") {
    PerfMetrics metrics{.elapsed_ns = 2'500'000.0};
    expect(metrics.elapsed_ms()).to_approx_equal(2.5);
}

TEST_CASE("one-line form") {
    PerfMetrics metrics{.input_size = 9, .comparisons = 17, .assignments = 2, .accesses = 18, .elapsed_ns = 2'000.0, .memory_delta = 0};
    expect(metrics.to_string()).to_equal(std::string("n=9, time=0.002ms, cmp=17, assign=2, access=18, mem=0B"));
}

TEST_CASE("summary block lists every field") {
    PerfMetrics metrics{.input_size = 100, .comparisons = 200, .assignments = 3, .accesses = 201, .elapsed_ns = 1'234'000.0, .memory_delta = 4096};
    std::ostringstream out;
    metrics.print_summary("find_majority", out);
    const std::string text = out.str();
    expect(text).to_contain("=== Performance Metrics for find_majority ===");
    expect(text).to_contain("Input Size:     100");
    expect(text).to_contain("Execution Time: 1.2340 ms");
    expect(text).to_contain("Comparisons:    200");
    expect(text).to_contain("Assignments:    3");
    expect(text).to_contain("Array Accesses: 201");
    expect(text).to_contain("Memory Used:    4096 bytes");
}
