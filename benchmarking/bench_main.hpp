#pragma once

// Include this header in exactly ONE .cpp file per benchmark executable.
// It defines main() and hands control to the benchmark registry.
//
//   ./majority_vote_benchmarks             # run everything
//   ./majority_vote_benchmarks optimized   # only suites/cases containing "optimized"

#include "benchmark.hxx"

auto main(int argc, char* argv[]) -> int {
    std::string_view filter = argc > 1 ? std::string_view(argv[1]) : std::string_view{};
    return ::mjvote::benchmark::bench_registry::instance().run_all(filter);
}
