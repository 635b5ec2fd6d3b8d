/**
 * test.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Test suite for the Boyer-Moore majority vote (majority_vote.hxx).
 *
 * Compile (C++20):
 *   g++ -std=c++20 -O2 -pthread test.cpp -o test_majority_vote && ./test_majority_vote
 */

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "../testing/test_main.hpp"
#include "majority_vote.hxx"

using mjvote::InvalidInput;
using mjvote::MajorityResult;
using mjvote::MajorityVote;
using mjvote::NullSink;
using mjvote::PerfTracker;

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

namespace {

// Reference answer by counting every value.
inline auto brute_force_majority(const std::vector<int>& values) -> std::optional<int> {
    std::map<int, std::size_t> counts;
    for (int v : values) ++counts[v];
    for (const auto& [value, count] : counts)
        if (count > values.size() / 2) return value;
    return std::nullopt;
}

inline auto filled(std::size_t n, int value) -> std::vector<int> { return std::vector<int>(n, value); }

}  // namespace

// ═════════════════════════════════════════════════════════════════════════════
// CANDIDATE PASS
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("candidate pass")

TEST_CASE("single element is adopted without any comparison") {
    std::vector<int> v{42};
    PerfTracker sink;
    auto candidate = mjvote::vote::find_candidate(std::span<const int>(v), sink);
    expect(candidate).to_equal(42);
    expect(sink.comparisons()).to_equal(static_cast<std::int64_t>(0));
    expect(sink.assignments()).to_equal(static_cast<std::int64_t>(1));
    expect(sink.accesses()).to_equal(static_cast<std::int64_t>(1));
}

TEST_CASE("majority element is always the final candidate") {
    std::vector<int> v{3, 3, 4, 2, 4, 4, 2, 4, 4};
    NullSink sink;
    expect(mjvote::vote::find_candidate(std::span<const int>(v), sink)).to_equal(4);
}

TEST_CASE("candidate is never empty for non-empty input without a majority") {
    std::vector<int> v{1, 2, 3, 4};
    NullSink sink;
    expect(mjvote::vote::find_candidate(std::span<const int>(v), sink)).to_have_value();
}

TEST_CASE("every element is accessed once and re-adoptions count as assignments") {
    // votes: 1 0 1 0 1 -> three adoptions, two comparisons
    std::vector<int> v{1, 2, 3, 4, 5};
    PerfTracker sink;
    auto candidate = mjvote::vote::find_candidate(std::span<const int>(v), sink);
    expect(candidate).to_equal(5);
    expect(sink.accesses()).to_equal(static_cast<std::int64_t>(5));
    expect(sink.assignments()).to_equal(static_cast<std::int64_t>(3));
    expect(sink.comparisons()).to_equal(static_cast<std::int64_t>(2));
}

// ═════════════════════════════════════════════════════════════════════════════
// VERIFICATION PASS
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("verification pass")

TEST_CASE("missing candidate is rejected without touching the sequence") {
    std::vector<int> v{1, 1, 1};
    PerfTracker sink;
    expect(mjvote::vote::verify_candidate(std::span<const int>(v), std::optional<int>{}, sink)).to_be_false();
    expect(sink.accesses()).to_equal(static_cast<std::int64_t>(0));
    expect(sink.comparisons()).to_equal(static_cast<std::int64_t>(0));
}

TEST_CASE("exactly n/2 occurrences is not a majority") {
    std::vector<int> v{1, 1, 2, 2};
    NullSink sink;
    expect(mjvote::vote::verify_candidate(std::span<const int>(v), std::optional<int>{1}, sink)).to_be_false();
}

TEST_CASE("n/2 + 1 occurrences is a majority") {
    std::vector<int> v{1, 1, 1, 2, 2};
    NullSink sink;
    expect(mjvote::vote::verify_candidate(std::span<const int>(v), std::optional<int>{1}, sink)).to_be_true();
}

TEST_CASE("closing threshold test is counted as one extra comparison") {
    std::vector<int> v{7, 8, 7};
    PerfTracker sink;
    expect(mjvote::vote::verify_candidate(std::span<const int>(v), std::optional<int>{7}, sink)).to_be_true();
    expect(sink.comparisons()).to_equal(static_cast<std::int64_t>(4));
    expect(sink.accesses()).to_equal(static_cast<std::int64_t>(3));
    expect(sink.assignments()).to_equal(static_cast<std::int64_t>(0));
}

// ═════════════════════════════════════════════════════════════════════════════
// find_majority
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("find_majority")

TEST_CASE("single element array") {
    MajorityVote<int> vote;
    expect(vote.find_majority(std::vector<int>{42}).value).to_equal(42);
}

TEST_CASE("two identical elements") {
    MajorityVote<int> vote;
    expect(vote.find_majority(std::vector<int>{5, 5}).value).to_equal(5);
}

TEST_CASE("two different elements have no majority") {
    MajorityVote<int> vote;
    expect(vote.find_majority(std::vector<int>{1, 2}).value).to_be_none();
}

TEST_CASE("clear majority element") {
    MajorityVote<int> vote;
    expect(vote.find_majority(std::vector<int>{3, 3, 4, 2, 4, 4, 2, 4, 4}).value).to_equal(4);
}

TEST_CASE("exactly half is not a majority") {
    MajorityVote<int> vote;
    expect(vote.find_majority(std::vector<int>{1, 1, 2, 2}).value).to_be_none();
}

TEST_CASE("just over half is a majority") {
    MajorityVote<int> vote;
    expect(vote.find_majority(std::vector<int>{1, 1, 1, 2, 2}).value).to_equal(1);
}

TEST_CASE("majority at the beginning and at the end") {
    MajorityVote<int> vote;
    expect(vote.find_majority(std::vector<int>{7, 7, 7, 7, 3, 2, 1}).value).to_equal(7);
    expect(vote.find_majority(std::vector<int>{1, 2, 3, 5, 5, 5, 5}).value).to_equal(5);
}

TEST_CASE("all distinct values have no majority") {
    MajorityVote<int> vote;
    expect(vote.find_majority(std::vector<int>{1, 2, 3, 4, 5}).value).to_be_none();
}

TEST_CASE("negative, mixed and zero majorities") {
    MajorityVote<int> vote;
    expect(vote.find_majority(std::vector<int>{-1, -1, -1, 2, 3}).value).to_equal(-1);
    expect(vote.find_majority(std::vector<int>{-5, -5, -5, 10, 10}).value).to_equal(-5);
    expect(vote.find_majority(std::vector<int>{0, 0, 0, 1, 2}).value).to_equal(0);
}

TEST_CASE("table of small inputs") {
    struct Row {
        std::vector<int> values;
        std::optional<int> expected;
    };
    const std::vector<Row> rows{
        {{2, 2, 1, 1, 1, 2, 2}, 2},
        {{1, 1, 1, 1, 3, 4, 5}, 1},
        {{1, 1, 1, 2, 3, 4, 5}, std::nullopt},
        {{5, 5, 5, 5, 1, 2, 3}, 5},
        {{1, 2, 1, 2, 1, 2}, std::nullopt},
        {{9, 9, 9, 9, 9}, 9},
    };
    MajorityVote<int> vote;
    for (const auto& row : rows) expect(vote.find_majority(row.values).value).to_equal(row.expected);
}

TEST_CASE("three of seven is not a majority") {
    const std::vector<int> values{1, 1, 1, 2, 3, 4, 5};
    MajorityVote<int> vote;
    expect(vote.find_majority(values).value).to_be_none();
    expect(vote.find_majority_optimized(values).value).to_be_none();
    expect(vote.find_majority_with_positions(values).value).to_be_none();
    expect(vote.find_majority(std::vector<int>{1, 1, 1, 1, 3, 4, 5}).value).to_equal(1);
}

TEST_CASE("large array with a majority of 5001 out of 10001") {
    std::vector<int> v(10001);
    std::fill_n(v.begin(), 5001, 42);
    for (int i = 5001; i < 10001; ++i) v[static_cast<std::size_t>(i)] = i;
    MajorityVote<int> vote;
    expect(vote.find_majority(v).value).to_equal(42);
}

TEST_CASE("large array split evenly has no majority") {
    std::vector<int> v(10000, 1);
    std::fill(v.begin() + 5000, v.end(), 2);
    MajorityVote<int> vote;
    expect(vote.find_majority(v).value).to_be_none();
}

TEST_CASE("works for any equality-comparable type") {
    MajorityVote<std::string> vote;
    std::vector<std::string> words{"red", "blue", "red", "red", "green"};
    expect(vote.find_majority(words).value).to_equal(std::string("red"));
}

// ═════════════════════════════════════════════════════════════════════════════
// VALIDATION
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("validation")

TEST_CASE("empty sequence throws InvalidInput") {
    MajorityVote<int> vote;
    std::vector<int> empty;
    expect_throws(InvalidInput, vote.find_majority(empty));
    expect_throws(InvalidInput, vote.find_majority_optimized(empty));
    expect_throws(InvalidInput, vote.find_majority_with_positions(empty));
}

TEST_CASE("null sequence throws InvalidInput") {
    MajorityVote<int> vote;
    const int* missing = nullptr;
    expect_throws(InvalidInput, vote.find_majority(missing, 3));
    expect_throws(InvalidInput, vote.find_majority_optimized(missing, 3));
    expect_throws(InvalidInput, vote.find_majority_with_positions(missing, 3));
}

TEST_CASE("InvalidInput is a std::invalid_argument") {
    MajorityVote<int> vote;
    expect_throws(std::invalid_argument, vote.find_majority(std::vector<int>{}));
}

TEST_CASE("rejected input leaves metrics unpopulated") {
    MajorityVote<int> vote;
    try {
        (void)vote.find_majority(std::vector<int>{});
    } catch (const InvalidInput&) {
    }
    expect(vote.metrics().comparisons).to_equal(static_cast<std::int64_t>(0));
    expect(vote.metrics().assignments).to_equal(static_cast<std::int64_t>(0));
    expect(vote.metrics().accesses).to_equal(static_cast<std::int64_t>(0));
    expect(vote.metrics().input_size).to_equal(static_cast<std::size_t>(0));
    expect(vote.metrics().elapsed_ns).to_approx_equal(0.0);
}

TEST_CASE("rejected input keeps the metrics of the previous call") {
    MajorityVote<int> vote;
    (void)vote.find_majority(std::vector<int>{1, 1, 2});
    const auto before = vote.metrics();
    try {
        (void)vote.find_majority(nullptr, 0);
    } catch (const InvalidInput&) {
    }
    expect(vote.metrics().comparisons).to_equal(before.comparisons);
    expect(vote.metrics().input_size).to_equal(static_cast<std::size_t>(3));
}

TEST_CASE("pointer overload accepts valid data") {
    const int raw[] = {4, 4, 1};
    MajorityVote<int> vote;
    expect(vote.find_majority(raw, 3).value).to_equal(4);
}

// ═════════════════════════════════════════════════════════════════════════════
// POSITIONS
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("find_majority_with_positions")

TEST_CASE("reports element, count and ascending positions") {
    MajorityVote<int> vote;
    auto result = vote.find_majority_with_positions(std::vector<int>{3, 3, 4, 2, 4, 4, 2, 4, 4}).value;
    expect(result).to_have_value();
    expect(result->element).to_equal(4);
    expect(result->count).to_equal(static_cast<std::size_t>(5));
    expect(result->positions).to_equal(std::vector<std::size_t>{2, 4, 5, 7, 8});
}

TEST_CASE("no majority gives nullopt") {
    MajorityVote<int> vote;
    expect(vote.find_majority_with_positions(std::vector<int>{1, 2, 3, 4, 5}).value).to_be_none();
}

TEST_CASE("position pass is skipped when verification fails") {
    MajorityVote<int> vote;
    auto outcome = vote.find_majority_with_positions(std::vector<int>{1, 1, 2, 2});
    // two scans of four elements, no third
    expect(outcome.metrics.accesses).to_equal(static_cast<std::int64_t>(8));
}

TEST_CASE("position pass is counted when it runs") {
    MajorityVote<int> vote;
    auto outcome = vote.find_majority_with_positions(std::vector<int>{3, 3, 4, 2, 4, 4, 2, 4, 4});
    expect(outcome.metrics.accesses).to_equal(static_cast<std::int64_t>(27));
    expect(outcome.metrics.comparisons).to_equal(static_cast<std::int64_t>(26));
    expect(outcome.metrics.assignments).to_equal(static_cast<std::int64_t>(2));
}

TEST_CASE("single element has position zero") {
    MajorityVote<int> vote;
    auto result = vote.find_majority_with_positions(std::vector<int>{8}).value;
    expect(result).to_equal(MajorityResult<int>{.element = 8, .count = 1, .positions = {0}});
}

TEST_CASE("to_string names the element and its count") {
    MajorityResult<int> res{.element = 4, .count = 5, .positions = {2, 4, 5, 7, 8}};
    expect(res.to_string()).to_equal(std::string("Majority Element: 4 (appears 5 times)"));
}

TEST_CASE("positions agree with find_majority on random inputs") {
    std::mt19937 rng{7};
    std::uniform_int_distribution<int> len_dist(1, 40);
    std::uniform_int_distribution<int> val_dist(0, 2);
    MajorityVote<int> vote;
    for (int trial = 0; trial < 200; ++trial) {
        std::vector<int> v(static_cast<std::size_t>(len_dist(rng)));
        for (int& x : v) x = val_dist(rng);

        auto plain = vote.find_majority(v).value;
        auto with_pos = vote.find_majority_with_positions(v).value;
        expect(with_pos.has_value()).to_equal(plain.has_value());
        if (!with_pos) continue;

        expect(with_pos->element).to_equal(*plain);
        expect(with_pos->positions.size()).to_equal(with_pos->count);
        expect(std::is_sorted(with_pos->positions.begin(), with_pos->positions.end())).to_be_true();
        expect(std::adjacent_find(with_pos->positions.begin(), with_pos->positions.end()) == with_pos->positions.end()).to_be_true();
        for (std::size_t idx : with_pos->positions) expect(v[idx]).to_equal(with_pos->element);
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// EARLY EXIT
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("find_majority_optimized")

TEST_CASE("front-loaded majority exits early with fewer than 2n comparisons") {
    std::vector<int> v(1000);
    std::fill_n(v.begin(), 501, 99);
    for (int i = 501; i < 1000; ++i) v[static_cast<std::size_t>(i)] = i;

    MajorityVote<int> vote;
    auto outcome = vote.find_majority_optimized(v);
    expect(outcome.value).to_equal(99);
    expect(outcome.metrics.comparisons).to_be_less_than(static_cast<std::int64_t>(2000));
    expect(outcome.metrics.comparisons).to_equal(static_cast<std::int64_t>(500));
}

TEST_CASE("unanimous array stops at the middle") {
    MajorityVote<int> vote;
    auto outcome = vote.find_majority_optimized(filled(1000, 42));
    expect(outcome.value).to_equal(42);
    expect(outcome.metrics.comparisons).to_be_less_than(static_cast<std::int64_t>(1000));
    expect(outcome.metrics.accesses).to_equal(static_cast<std::int64_t>(501));
}

TEST_CASE("single element falls through to verification") {
    MajorityVote<int> vote;
    auto outcome = vote.find_majority_optimized(std::vector<int>{3});
    expect(outcome.value).to_equal(3);
    expect(outcome.metrics.accesses).to_equal(static_cast<std::int64_t>(2));
}

TEST_CASE("no early exit costs the same as the two-pass version") {
    std::vector<int> v{3, 3, 4, 2, 4, 4, 2, 4, 4};
    MajorityVote<int> vote;
    auto standard = vote.find_majority(v);
    auto optimized = vote.find_majority_optimized(v);
    expect(optimized.value).to_equal(standard.value);
    expect(optimized.metrics.comparisons).to_equal(standard.metrics.comparisons);
    expect(optimized.metrics.accesses).to_equal(standard.metrics.accesses);
}

TEST_CASE("exactly half is not a majority") {
    MajorityVote<int> vote;
    expect(vote.find_majority_optimized(std::vector<int>{2, 2, 1, 1}).value).to_be_none();
}

TEST_CASE("agrees with the two-pass version and never compares more") {
    std::mt19937 rng{2024};
    std::uniform_int_distribution<int> len_dist(1, 80);
    std::uniform_int_distribution<int> val_dist(0, 3);
    MajorityVote<int> vote;
    for (int trial = 0; trial < 300; ++trial) {
        std::vector<int> v(static_cast<std::size_t>(len_dist(rng)));
        for (int& x : v) x = val_dist(rng);

        auto standard = vote.find_majority(v);
        auto optimized = vote.find_majority_optimized(v);
        expect(optimized.value).to_equal(standard.value);
        expect(optimized.metrics.comparisons).to_be_less_or_equal(standard.metrics.comparisons);
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// PROPERTIES
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("properties")

TEST_CASE("a planted majority is always found") {
    std::mt19937 rng{42};
    MajorityVote<int> vote;
    for (int trial = 0; trial < 100; ++trial) {
        const int n = 10 + static_cast<int>(rng() % 90);
        const int majority = static_cast<int>(rng() % 100);
        const int majority_count = n / 2 + 1 + static_cast<int>(rng() % static_cast<unsigned>(n / 2));

        std::vector<int> v(static_cast<std::size_t>(n));
        for (int i = 0; i < n; ++i) v[static_cast<std::size_t>(i)] = i < majority_count ? majority : static_cast<int>(rng() % 100);
        std::shuffle(v.begin(), v.end(), rng);

        expect(vote.find_majority(v).value).to_equal(majority);
    }
}

TEST_CASE("result matches a brute-force count") {
    std::mt19937 rng{123};
    MajorityVote<int> vote;
    for (int trial = 0; trial < 100; ++trial) {
        const int n = 10 + static_cast<int>(rng() % 40);
        const int distinct = std::max(3, n / 3);
        std::vector<int> v(static_cast<std::size_t>(n));
        for (int i = 0; i < n; ++i) v[static_cast<std::size_t>(i)] = i % distinct;
        std::shuffle(v.begin(), v.end(), rng);

        expect(vote.find_majority(v).value).to_equal(brute_force_majority(v));
    }
}

TEST_CASE("NullSink and PerfTracker give the same answer") {
    std::vector<int> v{6, 1, 6, 2, 6, 6, 3};
    NullSink null_sink;
    PerfTracker tracker;
    expect(mjvote::vote::find_majority(std::span<const int>(v), null_sink)).to_equal(mjvote::vote::find_majority(std::span<const int>(v), tracker));
}

// ═════════════════════════════════════════════════════════════════════════════
// METRICS
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("metrics")

TEST_CASE("two-pass counts on the reference input") {
    MajorityVote<int> vote;
    auto outcome = vote.find_majority(std::vector<int>{3, 3, 4, 2, 4, 4, 2, 4, 4});
    expect(outcome.metrics.comparisons).to_equal(static_cast<std::int64_t>(17));
    expect(outcome.metrics.assignments).to_equal(static_cast<std::int64_t>(2));
    expect(outcome.metrics.accesses).to_equal(static_cast<std::int64_t>(18));
    expect(outcome.metrics.input_size).to_equal(static_cast<std::size_t>(9));
}

TEST_CASE("operation counts are linear in n") {
    MajorityVote<int> vote;
    auto outcome = vote.find_majority(filled(10000, 42));
    expect(outcome.metrics.accesses).to_equal(static_cast<std::int64_t>(20000));
    expect(outcome.metrics.comparisons).to_equal(static_cast<std::int64_t>(20000));
}

TEST_CASE("returned metrics match the metrics() snapshot") {
    MajorityVote<int> vote;
    auto outcome = vote.find_majority(std::vector<int>{1, 2, 1});
    expect(vote.metrics().comparisons).to_equal(outcome.metrics.comparisons);
    expect(vote.metrics().accesses).to_equal(outcome.metrics.accesses);
    expect(vote.metrics().elapsed_ns).to_approx_equal(outcome.metrics.elapsed_ns);
}

TEST_CASE("each call starts from zero") {
    MajorityVote<int> vote;
    (void)vote.find_majority(filled(100, 1));
    auto second = vote.find_majority(std::vector<int>{1, 1, 2});
    expect(second.metrics.accesses).to_equal(static_cast<std::int64_t>(6));
}

TEST_CASE("elapsed time is non-negative") {
    MajorityVote<int> vote;
    auto outcome = vote.find_majority(filled(5000, 3));
    expect(outcome.metrics.elapsed_ns >= 0.0).to_be_true();
    expect(outcome.metrics.elapsed_ms() >= 0.0).to_be_true();
}

TEST_CASE("memory delta does not scale with input size") {
    MajorityVote<int> vote;
    auto small = vote.find_majority(filled(100, 42));
    auto large = vote.find_majority(filled(10000, 42));
    const auto diff = large.metrics.memory_delta - small.metrics.memory_delta;
    expect(diff < 100000 && diff > -100000).to_be_true();
}

TEST_CASE("independent instances run concurrently") {
    constexpr int THREADS = 4;
    std::vector<std::optional<int>> results(THREADS);
    std::vector<std::int64_t> comparisons(THREADS);
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([t, &results, &comparisons] {
            MajorityVote<int> vote;
            auto outcome = vote.find_majority(filled(2000, t));
            results[static_cast<std::size_t>(t)] = outcome.value;
            comparisons[static_cast<std::size_t>(t)] = outcome.metrics.comparisons;
        });
    }
    for (auto& th : threads) th.join();
    for (int t = 0; t < THREADS; ++t) {
        expect(results[static_cast<std::size_t>(t)]).to_equal(t);
        expect(comparisons[static_cast<std::size_t>(t)]).to_equal(static_cast<std::int64_t>(4000));
    }
}

TEST_CASE("to_string renders the one-line summary") {
    mjvote::PerfMetrics m{.input_size = 9, .comparisons = 17, .assignments = 2, .accesses = 18, .elapsed_ns = 2000.0, .memory_delta = 0};
    expect(m.to_string()).to_equal(std::string("n=9, time=0.002ms, cmp=17, assign=2, access=18, mem=0B"));
}
