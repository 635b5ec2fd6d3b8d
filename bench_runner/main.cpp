/**
 * @file main.cpp
 * @brief mjvote_bench — command-line benchmark driver for the majority vote.
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 *   ./mjvote_bench --algorithm optimized --input slim --sizes 1k,10k,100k
 *   ./mjvote_bench --config bench_runner/example.toml --summary
 *   ./mjvote_bench --interactive
 */

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "../argparser/argparser.hxx"
#include "../logger/logger.hxx"
#include "bench_runner.hxx"

namespace fs = std::filesystem;

namespace {

void register_arguments(mjvote::cli::ArgParser& parser) {
    parser.add<std::string>("algorithm")
        .shorthand('a')
        .description("Majority vote variant to measure")
        .default_val("standard")
        .allow({"standard", "optimized", "positions"});
    parser.add<std::string>("input")
        .shorthand('i')
        .description("Input shape")
        .default_val("clear")
        .allow({"clear", "slim", "none", "unanimous", "random"});
    parser.add<std::string>("sizes").shorthand('s').description("Comma-separated sizes, k/m suffixes allowed").default_val("100,1000,10000,100000");
    parser.add<int>("warmup").shorthand('w').description("Untimed calls per size").default_val(5).min(0);
    parser.add<int>("iterations").shorthand('n').description("Measured calls per size").default_val(10).min(1);
    parser.add<std::string>("seed").description("Input generator seed, 0..4294967295").default_val("42");
    parser.add<fs::path>("output").shorthand('o').description("CSV results file").default_val("boyer_moore_results.csv");
    parser.add<fs::path>("log-file").description("Write log lines to this file instead of the console").default_val("");
    parser.add<std::string>("log-level")
        .description("Minimum log severity")
        .default_val("info")
        .allow({"debug", "info", "warning", "error"});
    parser.add<bool>("summary").description("Print detailed metrics for the last measured size").default_val(false);
    parser.add<bool>("interactive").description("Choose algorithm and input from a menu").default_val(false);
}

auto build_config(const mjvote::cli::ArgParser& parser) -> mjvote::bench::RunConfig {
    return mjvote::bench::RunConfig{
        .algorithm = mjvote::bench::parse_algorithm(parser.get<std::string>("algorithm")),
        .input = mjvote::bench::parse_input_type(parser.get<std::string>("input")),
        .sizes = mjvote::bench::parse_sizes(parser.get<std::string>("sizes")),
        .warmup = parser.get<int>("warmup"),
        .iterations = parser.get<int>("iterations"),
        .seed = mjvote::bench::parse_seed(parser.get<std::string>("seed")),
    };
}

void init_logger(const mjvote::cli::ArgParser& parser) {
    const auto level_name = parser.get<std::string>("log-level");
    auto level = mjvote::Logger::parse_level(level_name);
    if (!level) {
        throw std::invalid_argument("unknown log level: " + level_name);
    }
    const fs::path log_file = parser.get<fs::path>("log-file");
    mjvote::Logger::get_instance().initialize(log_file.string(), true, *level);
}

auto run(const mjvote::cli::ArgParser& parser) -> int {
    init_logger(parser);
    mjvote::bench::RunConfig config = build_config(parser);

    if (parser.get<bool>("interactive") && !mjvote::bench::prompt_config(std::cin, std::cout, config)) {
        MJV_LOG_ERROR << "invalid menu choice";
        return 1;
    }

    std::cout << "\nRunning " << mjvote::bench::algorithm_name(config.algorithm) << " on " << mjvote::bench::input_type_name(config.input)
              << " (warmup " << config.warmup << ", iterations " << config.iterations << ")\n\n";

    auto rows = mjvote::bench::run_benchmark(config);
    if (rows.empty()) {
        MJV_LOG_ERROR << "no size could be measured";
        return 1;
    }

    const fs::path output = parser.get<fs::path>("output");
    mjvote::bench::write_csv(output, rows);
    MJV_LOG_SUCCESS << "Results saved to " << output.string();

    if (parser.get<bool>("summary")) {
        const std::size_t size = rows.back().input_size;
        auto metrics = mjvote::bench::measure_once(config, size);
        metrics.print_summary(std::string(mjvote::bench::algorithm_name(config.algorithm)) + " @ " + std::to_string(size));
    }
    return 0;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
    mjvote::cli::ArgParser parser("mjvote_bench", "Boyer-Moore majority vote benchmark driver");
    register_arguments(parser);

    try {
        if (!parser.parse(argc, argv)) {
            return 0;
        }
    } catch (const mjvote::cli::ParseError& e) {
        std::cerr << "error: " << e.what() << "\n\n";
        parser.print_help(std::cerr);
        return 2;
    }

    try {
        return run(parser);
    } catch (const mjvote::InvalidInput& e) {
        MJV_LOG_ERROR << "invalid input: " << e.what();
    } catch (const std::invalid_argument& e) {
        MJV_LOG_ERROR << "bad configuration: " << e.what();
    } catch (const std::runtime_error& e) {
        MJV_LOG_ERROR << e.what();
    }
    mjvote::Logger::get_instance().flush();
    return 1;
}
