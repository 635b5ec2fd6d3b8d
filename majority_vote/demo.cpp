/**
 * demo.cpp — majority_vote.hxx usage examples
 *
 * Walks through the public API using a small election as a running example:
 * ballots are candidate numbers, and a candidate wins outright only with a
 * strict majority of the ballots cast.
 */

#include <iostream>
#include <span>
#include <string>
#include <vector>

#include "majority_vote.hxx"

// ─────────────────────────────────────────────────────────────────────────────
// 1. find_majority — answer plus the metrics of that call
// ─────────────────────────────────────────────────────────────────────────────

void demo_find_majority() {
    std::cout << "── 1. find_majority ─────────────────────────────────────────\n";

    mjvote::MajorityVote<int> vote;
    const std::vector<int> ballots{3, 3, 4, 2, 4, 4, 2, 4, 4};

    auto [winner, metrics] = vote.find_majority(ballots);
    if (winner) {
        std::cout << "  Winner: candidate " << *winner << "\n";
    }
    std::cout << "  " << metrics.to_string() << "\n\n";

    // A split vote has no majority; the answer is simply empty.
    const std::vector<int> split{3, 3, 4, 2, 4, 4, 2, 4};
    auto outcome = vote.find_majority(split);
    std::cout << "  Split vote: " << (outcome.value ? std::to_string(*outcome.value) : "no majority") << "\n\n";
}

// ─────────────────────────────────────────────────────────────────────────────
// 2. find_majority_with_positions — where the winner's ballots sit
// ─────────────────────────────────────────────────────────────────────────────

void demo_positions() {
    std::cout << "── 2. find_majority_with_positions ──────────────────────────\n";

    mjvote::MajorityVote<int> vote;
    const std::vector<int> ballots{2, 2, 1, 1, 1, 2, 2};

    auto outcome = vote.find_majority_with_positions(ballots);
    if (outcome.value) {
        std::cout << "  " << *outcome.value << "\n  Ballot indices:";
        for (std::size_t pos : outcome.value->positions) {
            std::cout << ' ' << pos;
        }
        std::cout << "\n";
    }
    outcome.metrics.print_summary("find_majority_with_positions");
}

// ─────────────────────────────────────────────────────────────────────────────
// 3. find_majority_optimized — stops once the vote count settles it
// ─────────────────────────────────────────────────────────────────────────────

void demo_optimized() {
    std::cout << "── 3. find_majority_optimized ───────────────────────────────\n";

    mjvote::MajorityVote<int> vote;
    const std::vector<int> landslide(1000, 1);

    auto standard = vote.find_majority(landslide);
    auto optimized = vote.find_majority_optimized(landslide);

    std::cout << "  standard : " << standard.metrics.to_string() << "\n";
    std::cout << "  optimized: " << optimized.metrics.to_string() << "\n";
    std::cout << "  metrics() holds the last call: access=" << vote.metrics().accesses << "\n\n";
}

// ─────────────────────────────────────────────────────────────────────────────
// 4. Rejected input
// ─────────────────────────────────────────────────────────────────────────────

void demo_invalid_input() {
    std::cout << "── 4. Rejected input ────────────────────────────────────────\n";

    mjvote::MajorityVote<int> vote;
    try {
        (void)vote.find_majority(std::span<const int>{});
    } catch (const mjvote::InvalidInput& e) {
        std::cout << "  empty ballot box: " << e.what() << "\n";
    }
    try {
        (void)vote.find_majority(nullptr, 0);
    } catch (const mjvote::InvalidInput& e) {
        std::cout << "  missing ballot box: " << e.what() << "\n\n";
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// 5. Any equality-comparable type
// ─────────────────────────────────────────────────────────────────────────────

void demo_strings() {
    std::cout << "── 5. Non-integer ballots ───────────────────────────────────\n";

    mjvote::MajorityVote<std::string> vote;
    const std::vector<std::string> ballots{"alice", "bob", "alice", "carol", "alice"};

    auto outcome = vote.find_majority_with_positions(ballots);
    if (outcome.value) {
        std::cout << "  " << *outcome.value << "\n\n";
    }
}

auto main() -> int {
    demo_find_majority();
    demo_positions();
    demo_optimized();
    demo_invalid_input();
    demo_strings();
    return 0;
}
