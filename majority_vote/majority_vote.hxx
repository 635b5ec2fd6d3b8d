#pragma once

/**
 * @file majority_vote.hxx
 * @brief Boyer-Moore majority vote with operation counting and an early-exit variant.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * A majority element occurs in strictly more than n/2 positions of a sequence.
 * Finding it takes two linear passes and O(1) extra space:
 *
 *   1. candidate pass    — a vote counter keeps the last surviving value
 *   2. verification pass — count the candidate and compare against n/2
 *
 * Every scan reports its primitive operations (element accesses, equality
 * comparisons, candidate assignments) to an OperationSink. The public entry
 * points measure with a fresh PerfTracker per call and hand the metrics back
 * next to the result, so two calls never share counters.
 */

#include <concepts>
#include <cstddef>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../perf_tracker/perf_tracker.hxx"

namespace mjvote {

/** Thrown for null or empty sequences, before any scanning or measurement. */
struct InvalidInput : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

template <typename T>
concept VoteElement = std::equality_comparable<T> && std::copyable<T>;

/** A verified majority together with every index it occupies (ascending). */
template <VoteElement T>
struct MajorityResult {
    T element;
    std::size_t count = 0;
    std::vector<std::size_t> positions;

    auto operator==(const MajorityResult&) const -> bool = default;

    [[nodiscard]] auto to_string() const -> std::string {
        std::ostringstream oss;
        oss << "Majority Element: " << element << " (appears " << count << " times)";
        return oss.str();
    }
};

template <VoteElement T>
auto operator<<(std::ostream& out, const MajorityResult<T>& res) -> std::ostream& {
    return out << res.to_string();
}

/** Result of one measured call plus the metrics of exactly that call. */
template <typename R>
struct VoteOutcome {
    R value;
    PerfMetrics metrics;
};

// ─────────────────────────────────────────────────────────────────────────────
// Scan procedures — usable with any OperationSink
// ─────────────────────────────────────────────────────────────────────────────

namespace vote {

/**
 * Candidate pass. Returns the last value left standing by the vote counter;
 * for a non-empty sequence this is never nullopt. If a majority exists it is
 * the returned candidate, otherwise the candidate is meaningless until verified.
 */
template <VoteElement T, OperationSink Sink>
auto find_candidate(std::span<const T> seq, Sink& sink) -> std::optional<T> {
    std::optional<T> candidate;
    std::size_t votes = 0;

    for (const T& current : seq) {
        sink.count_access();
        if (votes == 0) {
            candidate = current;
            sink.count_assignment();
            votes = 1;
        } else {
            sink.count_comparison();
            if (current == *candidate) {
                ++votes;
            } else {
                --votes;
            }
        }
    }
    return candidate;
}

/**
 * Verification pass. True iff @p candidate occurs strictly more than n/2 times.
 * The closing `> n/2` test is reported as one extra comparison.
 */
template <VoteElement T, OperationSink Sink>
auto verify_candidate(std::span<const T> seq, const std::optional<T>& candidate, Sink& sink) -> bool {
    if (!candidate) {
        return false;
    }

    std::size_t occurrences = 0;
    for (const T& current : seq) {
        sink.count_access();
        sink.count_comparison();
        if (current == *candidate) {
            ++occurrences;
        }
    }

    sink.count_comparison();
    return occurrences > seq.size() / 2;
}

/**
 * Candidate pass that returns as soon as the running vote exceeds n/2.
 *
 * The vote only grows on a match and every decrement cancels one earlier
 * occurrence, so votes > n/2 already proves occurrences > n/2. Without an early
 * exit the regular verification pass decides.
 */
template <VoteElement T, OperationSink Sink>
auto find_majority_early_exit(std::span<const T> seq, Sink& sink) -> std::optional<T> {
    const std::size_t threshold = seq.size() / 2;
    std::optional<T> candidate;
    std::size_t votes = 0;

    for (const T& current : seq) {
        sink.count_access();
        if (votes == 0) {
            candidate = current;
            sink.count_assignment();
            votes = 1;
        } else {
            sink.count_comparison();
            if (current == *candidate) {
                ++votes;
                if (votes > threshold) {
                    return candidate;
                }
            } else {
                --votes;
            }
        }
    }

    if (verify_candidate(seq, candidate, sink)) {
        return candidate;
    }
    return std::nullopt;
}

/** Position pass: every index holding @p element, ascending. */
template <VoteElement T, OperationSink Sink>
auto collect_positions(std::span<const T> seq, const T& element, Sink& sink) -> MajorityResult<T> {
    MajorityResult<T> result{.element = element, .count = 0, .positions = {}};
    for (std::size_t i = 0; i < seq.size(); ++i) {
        sink.count_access();
        sink.count_comparison();
        if (seq[i] == element) {
            result.positions.push_back(i);
        }
    }
    result.count = result.positions.size();
    return result;
}

/** Both passes, no early exit. */
template <VoteElement T, OperationSink Sink>
auto find_majority(std::span<const T> seq, Sink& sink) -> std::optional<T> {
    std::optional<T> candidate = find_candidate(seq, sink);
    if (verify_candidate(seq, candidate, sink)) {
        return candidate;
    }
    return std::nullopt;
}

template <VoteElement T>
void validate(std::span<const T> seq) {
    if (seq.empty()) {
        throw InvalidInput("sequence cannot be empty");
    }
}

}  // namespace vote

// ─────────────────────────────────────────────────────────────────────────────
// MajorityVote — measured entry points
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Measured Boyer-Moore majority vote over a caller-owned sequence.
 *
 * Each call validates, starts a fresh PerfTracker, runs the scans and returns
 * the answer together with that call's metrics. The most recent successful
 * call's metrics are also kept for metrics(); a rejected call leaves them as
 * they were.
 *
 * Thread safety: the find_* calls share nothing but the metrics() snapshot.
 * Use one instance per thread if metrics() is read.
 *
 * @code
 *   mjvote::MajorityVote<int> vote;
 *   auto [majority, metrics] = vote.find_majority(values);
 *   if (majority) { ... *majority ... }
 * @endcode
 */
template <VoteElement T>
class MajorityVote {
   public:
    using value_type = T;

    auto find_majority(std::span<const T> seq) -> VoteOutcome<std::optional<T>> {
        vote::validate(seq);

        PerfTracker tracker;
        tracker.start(seq.size());
        std::optional<T> majority = vote::find_majority(seq, tracker);
        tracker.stop();

        return remember(std::move(majority), tracker);
    }

    auto find_majority(const T* data, std::size_t size) -> VoteOutcome<std::optional<T>> { return find_majority(checked_span(data, size)); }

    auto find_majority_with_positions(std::span<const T> seq) -> VoteOutcome<std::optional<MajorityResult<T>>> {
        vote::validate(seq);

        PerfTracker tracker;
        tracker.start(seq.size());
        std::optional<MajorityResult<T>> result;
        if (std::optional<T> majority = vote::find_majority(seq, tracker)) {
            result = vote::collect_positions(seq, *majority, tracker);
        }
        tracker.stop();

        return remember(std::move(result), tracker);
    }

    auto find_majority_with_positions(const T* data, std::size_t size) -> VoteOutcome<std::optional<MajorityResult<T>>> {
        return find_majority_with_positions(checked_span(data, size));
    }

    auto find_majority_optimized(std::span<const T> seq) -> VoteOutcome<std::optional<T>> {
        vote::validate(seq);

        PerfTracker tracker;
        tracker.start(seq.size());
        std::optional<T> majority = vote::find_majority_early_exit(seq, tracker);
        tracker.stop();

        return remember(std::move(majority), tracker);
    }

    auto find_majority_optimized(const T* data, std::size_t size) -> VoteOutcome<std::optional<T>> {
        return find_majority_optimized(checked_span(data, size));
    }

    /** Metrics of the most recent successful call; all zero before the first one. */
    [[nodiscard]] auto metrics() const -> const PerfMetrics& { return last_metrics_; }

   private:
    PerfMetrics last_metrics_{};

    static auto checked_span(const T* data, std::size_t size) -> std::span<const T> {
        if (data == nullptr) {
            throw InvalidInput("sequence cannot be null");
        }
        return {data, size};
    }

    template <typename R>
    auto remember(R value, const PerfTracker& tracker) -> VoteOutcome<R> {
        last_metrics_ = tracker.metrics();
        return {.value = std::move(value), .metrics = last_metrics_};
    }
};

}  // namespace mjvote
