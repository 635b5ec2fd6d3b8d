/**
 * test.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Test suite for the command-line / TOML parser (argparser.hxx).
 */

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "../testing/test_main.hpp"
#include "argparser.hxx"

using mjvote::cli::ArgParser;
using mjvote::cli::ParseError;

namespace {

// Parser with the same shape as the benchmark driver's.
auto make_parser() -> ArgParser {
    ArgParser parser("mjvote_bench", "test parser");
    parser.add<std::string>("algorithm").shorthand('a').default_val("standard").allow({"standard", "optimized", "positions"});
    parser.add<int>("iterations").shorthand('n').default_val(10).min(1).max(1000);
    parser.add<bool>("summary").default_val(false);
    parser.add<std::filesystem::path>("output").default_val("results.csv");
    return parser;
}

// Writes @p body to a fresh file in the temp directory and returns its path.
auto write_toml(const std::string& name, const std::string& body) -> std::string {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << body;
    return path.string();
}

}  // namespace

// ═════════════════════════════════════════════════════════════════════════════
// DEFAULTS AND CLI
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("command line")

TEST_CASE("defaults apply when nothing is given") {
    auto parser = make_parser();
    expect(parser.parse(std::vector<std::string>{})).to_be_true();
    expect(parser.get<std::string>("algorithm")).to_equal(std::string("standard"));
    expect(parser.get<int>("iterations")).to_equal(10);
    expect(parser.get<bool>("summary")).to_be_false();
    expect(parser.get<std::filesystem::path>("output")).to_equal(std::filesystem::path("results.csv"));
}

TEST_CASE("long and short flags override defaults") {
    auto parser = make_parser();
    expect(parser.parse({"--algorithm", "optimized", "-n", "25", "--summary"})).to_be_true();
    expect(parser.get<std::string>("algorithm")).to_equal(std::string("optimized"));
    expect(parser.get<int>("iterations")).to_equal(25);
    expect(parser.get<bool>("summary")).to_be_true();
}

TEST_CASE("bool flag accepts an explicit value") {
    auto parser = make_parser();
    expect(parser.parse({"--summary", "no"})).to_be_true();
    expect(parser.get<bool>("summary")).to_be_false();
}

TEST_CASE("--help prints usage and reports it") {
    auto parser = make_parser();
    expect(parser.parse({"--help"})).to_be_false();

    std::ostringstream out;
    parser.print_help(out);
    expect(out.str()).to_contain("--iterations, -n <int>");
    expect(out.str()).to_contain("[choices: standard|optimized|positions]");
    expect(out.str()).to_contain("[range: 1..1000]");
}

TEST_SUITE("command line errors")

TEST_CASE("unknown argument") {
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse({"--bogus", "1"}));
}

TEST_CASE("value outside the allowed choices") {
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse({"--algorithm", "quick"}));
}

TEST_CASE("integer below the minimum") {
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse({"--iterations", "0"}));
}

TEST_CASE("integer with trailing characters") {
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse({"--iterations", "12x"}));
}

TEST_CASE("non-numeric integer") {
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse({"--iterations", "many"}));
}

TEST_CASE("missing value") {
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse({"--iterations"}));
}

TEST_CASE("flag repeated on the command line") {
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse({"-n", "2", "--iterations", "3"}));
}

TEST_CASE("required argument missing") {
    ArgParser parser("prog");
    parser.add<int>("seed").require();
    expect_throws(ParseError, parser.parse(std::vector<std::string>{}));
}

TEST_CASE("type mismatch on get") {
    auto parser = make_parser();
    parser.parse(std::vector<std::string>{});
    expect_throws(ParseError, (void)parser.get<int>("algorithm"));
}

TEST_CASE("duplicate registration") {
    auto parser = make_parser();
    expect_throws(ParseError, parser.add<int>("iterations"));
}

TEST_CASE("reserved short names") {
    ArgParser parser("prog");
    expect_throws(ParseError, parser.add<int>("height").shorthand('h'));
}

// ═════════════════════════════════════════════════════════════════════════════
// TOML CONFIG
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("toml config")

TEST_CASE("config values override defaults") {
    auto path = write_toml("mjvote_argparser_basic.toml",
                           "# benchmark settings\n"
                           "[bench]\n"
                           "algorithm = \"positions\"   # trailing comment\n"
                           "iterations = 40\n"
                           "summary = true\n");
    auto parser = make_parser();
    expect(parser.parse({"--config", path})).to_be_true();
    expect(parser.get<std::string>("algorithm")).to_equal(std::string("positions"));
    expect(parser.get<int>("iterations")).to_equal(40);
    expect(parser.get<bool>("summary")).to_be_true();
}

TEST_CASE("cli overrides config regardless of order") {
    auto path = write_toml("mjvote_argparser_order.toml", "iterations = 40\n");
    auto parser = make_parser();
    expect(parser.parse({"-n", "5", "-C", path})).to_be_true();
    expect(parser.get<int>("iterations")).to_equal(5);
}

TEST_CASE("hash inside quotes is kept") {
    auto path = write_toml("mjvote_argparser_hash.toml", "output = \"out#1.csv\"\n");
    auto parser = make_parser();
    parser.parse({"--config", path});
    expect(parser.get<std::filesystem::path>("output")).to_equal(std::filesystem::path("out#1.csv"));
}

TEST_CASE("unknown key is rejected") {
    auto path = write_toml("mjvote_argparser_unknown.toml", "threads = 4\n");
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse({"--config", path}));
}

TEST_CASE("config values are validated") {
    auto path = write_toml("mjvote_argparser_range.toml", "iterations = 5000\n");
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse({"--config", path}));
}

TEST_CASE("line without '=' is rejected") {
    auto path = write_toml("mjvote_argparser_syntax.toml", "iterations 5\n");
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse({"--config", path}));
}

TEST_CASE("missing config file") {
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse({"--config", "/nonexistent/mjvote.toml"}));
}

TEST_CASE("--config without a path") {
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse({"--config"}));
}
