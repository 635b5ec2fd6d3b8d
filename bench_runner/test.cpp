/**
 * test.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Test suite for the benchmark driver (input_generator.hxx, bench_runner.hxx).
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../testing/test_main.hpp"
#include "bench_runner.hxx"

using mjvote::bench::Algorithm;
using mjvote::bench::BenchRow;
using mjvote::bench::InputType;
using mjvote::bench::RunConfig;

namespace {

auto count_of(const std::vector<int>& values, int needle) -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count(values, needle));
}

}  // namespace

// ═════════════════════════════════════════════════════════════════════════════
// INPUT GENERATION
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("input generation")

TEST_CASE("clear majority holds 60 percent ones") {
    auto values = mjvote::bench::generate_input(1000, InputType::ClearMajority, 42);
    expect(values.size()).to_equal(std::size_t{1000});
    expect(count_of(values, 1)).to_equal(std::size_t{600});
    expect(std::ranges::all_of(values, [](int v) { return v == 1 || (v >= 2 && v <= 101); })).to_be_true();
}

TEST_CASE("slim majority holds n/2 + 1 ones") {
    auto values = mjvote::bench::generate_input(1001, InputType::SlimMajority, 42);
    expect(count_of(values, 1)).to_equal(std::size_t{501});
}

TEST_CASE("no-majority values cycle below n/3 + 1") {
    auto values = mjvote::bench::generate_input(999, InputType::NoMajority, 42);
    expect(std::ranges::all_of(values, [](int v) { return v >= 0 && v <= 333; })).to_be_true();
    expect(count_of(values, 0)).to_equal(std::size_t{3});
}

TEST_CASE("unanimous is all 42") {
    auto values = mjvote::bench::generate_input(50, InputType::Unanimous, 7);
    expect(count_of(values, 42)).to_equal(std::size_t{50});
}

TEST_CASE("random values are digits") {
    auto values = mjvote::bench::generate_input(500, InputType::Random, 3);
    expect(std::ranges::all_of(values, [](int v) { return v >= 0 && v <= 9; })).to_be_true();
}

TEST_CASE("same seed gives the same sequence") {
    auto first = mjvote::bench::generate_input(200, InputType::ClearMajority, 99);
    auto second = mjvote::bench::generate_input(200, InputType::ClearMajority, 99);
    expect(first == second).to_be_true();
}

TEST_CASE("inputs are shuffled") {
    auto values = mjvote::bench::generate_input(1000, InputType::ClearMajority, 42);
    // Unshuffled, the first 600 entries would all be 1.
    expect(count_of(std::vector<int>(values.begin(), values.begin() + 600), 1)).to_be_less_than(std::size_t{600});
}

TEST_CASE("zero size gives an empty input") {
    expect(mjvote::bench::generate_input(0, InputType::SlimMajority, 42).empty()).to_be_true();
}

TEST_CASE("input type names") {
    expect(std::string(mjvote::bench::input_type_name(InputType::ClearMajority))).to_equal(std::string("ClearMajority60%"));
    expect(std::string(mjvote::bench::input_type_name(InputType::Random))).to_equal(std::string("Custom"));
    expect(mjvote::bench::parse_input_type("unanimous") == InputType::Unanimous).to_be_true();
    expect_throws(std::invalid_argument, (void)mjvote::bench::parse_input_type("sparse"));
}

// ═════════════════════════════════════════════════════════════════════════════
// SIZE LISTS
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("size lists")

TEST_CASE("plain and suffixed sizes") {
    auto sizes = mjvote::bench::parse_sizes("100,1k,2.5K,1m");
    expect(sizes).to_equal(std::vector<std::size_t>{100, 1'000, 2'500, 1'000'000});
}

TEST_CASE("empty items are skipped") {
    expect(mjvote::bench::parse_sizes(",10,,20,")).to_equal(std::vector<std::size_t>{10, 20});
}

TEST_CASE("malformed items are rejected") {
    expect_throws(std::invalid_argument, (void)mjvote::bench::parse_sizes("10,abc"));
    expect_throws(std::invalid_argument, (void)mjvote::bench::parse_sizes("10x"));
    expect_throws(std::invalid_argument, (void)mjvote::bench::parse_sizes("-5"));
    expect_throws(std::invalid_argument, (void)mjvote::bench::parse_sizes(",,"));
}

TEST_CASE("seeds cover the whole unsigned 32-bit range") {
    expect(mjvote::bench::parse_seed("0")).to_equal(std::uint32_t{0});
    expect(mjvote::bench::parse_seed("42")).to_equal(std::uint32_t{42});
    expect(mjvote::bench::parse_seed("3000000000")).to_equal(std::uint32_t{3'000'000'000U});
    expect(mjvote::bench::parse_seed("4294967295")).to_equal(std::uint32_t{4'294'967'295U});
}

TEST_CASE("out-of-range and malformed seeds are rejected") {
    expect_throws(std::invalid_argument, (void)mjvote::bench::parse_seed("4294967296"));
    expect_throws(std::invalid_argument, (void)mjvote::bench::parse_seed("-1"));
    expect_throws(std::invalid_argument, (void)mjvote::bench::parse_seed("+7"));
    expect_throws(std::invalid_argument, (void)mjvote::bench::parse_seed("12ab"));
    expect_throws(std::invalid_argument, (void)mjvote::bench::parse_seed(""));
}

// ═════════════════════════════════════════════════════════════════════════════
// TRIALS
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("trials")

TEST_CASE("standard trial averages deterministic counters") {
    auto input = mjvote::bench::generate_input(1000, InputType::Unanimous, 42);
    BenchRow row = mjvote::bench::run_trial(input, InputType::Unanimous, Algorithm::Standard, 2, 4);
    expect(row.input_size).to_equal(std::size_t{1000});
    expect(row.comparisons).to_equal(std::int64_t{999 + 1000 + 1});
    expect(row.assignments).to_equal(std::int64_t{1});
    expect(row.accesses).to_equal(std::int64_t{2000});
    expect(row.result).to_equal(std::string("42"));
    expect(row.avg_ms).to_be_greater_or_equal(0.0);
    expect(row.stddev_ms).to_be_greater_or_equal(0.0);
}

TEST_CASE("optimized trial stops after n/2 + 1 accesses on unanimous input") {
    auto input = mjvote::bench::generate_input(1000, InputType::Unanimous, 42);
    BenchRow row = mjvote::bench::run_trial(input, InputType::Unanimous, Algorithm::Optimized, 0, 3);
    expect(row.accesses).to_equal(std::int64_t{501});
    expect(row.result).to_equal(std::string("42"));
}

TEST_CASE("positions trial renders element and count") {
    auto input = mjvote::bench::generate_input(1000, InputType::ClearMajority, 42);
    BenchRow row = mjvote::bench::run_trial(input, InputType::ClearMajority, Algorithm::Positions, 1, 2);
    expect(row.result).to_equal(std::string("1 x 600"));
}

TEST_CASE("no majority renders none") {
    auto input = mjvote::bench::generate_input(999, InputType::NoMajority, 42);
    BenchRow row = mjvote::bench::run_trial(input, InputType::NoMajority, Algorithm::Standard, 0, 1);
    expect(row.result).to_equal(std::string("none"));
}

TEST_CASE("empty input is rejected") {
    expect_throws(mjvote::InvalidInput, (void)mjvote::bench::run_trial({}, InputType::Random, Algorithm::Standard, 1, 1));
}

TEST_CASE("non-positive iteration count is rejected") {
    std::vector<int> input{1, 1, 2};
    expect_throws(std::invalid_argument, (void)mjvote::bench::run_trial(input, InputType::Random, Algorithm::Standard, 0, 0));
    expect_throws(std::invalid_argument, (void)mjvote::bench::run_trial(input, InputType::Random, Algorithm::Standard, -1, 1));
}

TEST_CASE("run_benchmark skips zero sizes and keeps order") {
    RunConfig config{
        .algorithm = Algorithm::Standard,
        .input = InputType::SlimMajority,
        .sizes = {10, 0, 100},
        .warmup = 0,
        .iterations = 2,
        .seed = 42,
    };
    std::ostringstream console;
    auto rows = mjvote::bench::run_benchmark(config, console);
    expect(rows.size()).to_equal(std::size_t{2});
    expect(rows[0].input_size).to_equal(std::size_t{10});
    expect(rows[1].input_size).to_equal(std::size_t{100});
    expect(rows[1].result).to_equal(std::string("1"));
    expect(console.str()).to_contain("Size:      100");
}

TEST_CASE("measure_once reports the requested size") {
    RunConfig config{};
    config.algorithm = Algorithm::Optimized;
    auto metrics = mjvote::bench::measure_once(config, 500);
    expect(metrics.input_size).to_equal(std::size_t{500});
    expect(metrics.accesses).to_be_greater_than(std::int64_t{0});
}

// ═════════════════════════════════════════════════════════════════════════════
// CSV
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("csv output")

TEST_CASE("row format uses four decimals") {
    BenchRow row{
        .input_size = 100,
        .input_type = InputType::SlimMajority,
        .avg_ms = 0.0123456,
        .stddev_ms = 0.5,
        .comparisons = 200,
        .assignments = 3,
        .accesses = 200,
        .memory_bytes = 0,
        .result = "1",
    };
    expect(row.to_csv()).to_equal(std::string("100,SlimMajority51%,0.0123,0.5000,200,3,200,0,1"));
}

TEST_CASE("header comes first") {
    std::ostringstream out;
    mjvote::bench::write_csv(out, {BenchRow{}});
    std::istringstream lines(out.str());
    std::string header;
    std::getline(lines, header);
    expect(header).to_equal(std::string("InputSize,InputType,AvgTimeMs,StdDevMs,Comparisons,Assignments,ArrayAccesses,MemoryBytes,Result"));
}

TEST_CASE("file output round trip") {
    auto path = std::filesystem::temp_directory_path() / "mjvote_bench_runner_test.csv";
    BenchRow row{.input_size = 5, .input_type = InputType::Unanimous, .result = "42"};
    mjvote::bench::write_csv(path, {row});

    std::ifstream in(path);
    std::string header;
    std::string line;
    std::getline(in, header);
    std::getline(in, line);
    expect(line).to_equal(std::string("5,Unanimous100%,0.0000,0.0000,0,0,0,0,42"));
}

TEST_CASE("unwritable path throws") {
    expect_throws(std::runtime_error, mjvote::bench::write_csv(std::filesystem::path("/nonexistent/dir/out.csv"), {}));
}

// ═════════════════════════════════════════════════════════════════════════════
// INTERACTIVE MENU
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("interactive menu")

TEST_CASE("valid choices update the config") {
    std::istringstream in("2\n3\n");
    std::ostringstream out;
    RunConfig config{};
    expect(mjvote::bench::prompt_config(in, out, config)).to_be_true();
    expect(config.algorithm == Algorithm::Optimized).to_be_true();
    expect(config.input == InputType::NoMajority).to_be_true();
    expect(out.str()).to_contain("Select input type:");
}

TEST_CASE("out of range choice leaves the config untouched") {
    std::istringstream in("1\n9\n");
    std::ostringstream out;
    RunConfig config{};
    expect(mjvote::bench::prompt_config(in, out, config)).to_be_false();
    expect(config.input == InputType::ClearMajority).to_be_true();
    expect(out.str()).to_contain("Invalid choice!");
}

TEST_CASE("non-numeric choice is rejected") {
    std::istringstream in("abc\n");
    std::ostringstream out;
    RunConfig config{};
    expect(mjvote::bench::prompt_config(in, out, config)).to_be_false();
}

TEST_SUITE("algorithm names")

TEST_CASE("parse and print agree") {
    for (Algorithm algo : mjvote::bench::ALL_ALGORITHMS) {
        expect(mjvote::bench::parse_algorithm(mjvote::bench::algorithm_name(algo)) == algo).to_be_true();
    }
    expect_throws(std::invalid_argument, (void)mjvote::bench::parse_algorithm("fast"));
}
