/**
 * test.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Test suite for the Logger (logger.hxx).
 *
 * The Logger is a process-wide singleton, so every case shares one log file
 * in the temp directory and reads back what it appended.
 */

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../testing/test_main.hpp"
#include "logger.hxx"

using mjvote::Logger;

namespace {

auto log_path() -> const std::filesystem::path& {
    static const std::filesystem::path path = std::filesystem::temp_directory_path() / "mjvote_logger_test.log";
    return path;
}

// Initializes the singleton on first use, writing to a fresh file.
auto logger() -> Logger& {
    static Logger& instance = []() -> Logger& {
        std::filesystem::remove(log_path());
        Logger::get_instance().initialize(log_path().string(), false, Logger::level::DEBUG);
        return Logger::get_instance();
    }();
    return instance;
}

auto log_contents() -> std::string {
    logger().flush();
    std::ifstream in(log_path());
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

}  // namespace

TEST_SUITE("levels")

TEST_CASE("parse_level accepts every level name") {
    expect(Logger::parse_level("basic") == Logger::level::BASIC).to_be_true();
    expect(Logger::parse_level("debug") == Logger::level::DEBUG).to_be_true();
    expect(Logger::parse_level("info") == Logger::level::INFO).to_be_true();
    expect(Logger::parse_level("warning") == Logger::level::WARNING).to_be_true();
    expect(Logger::parse_level("error") == Logger::level::ERROR).to_be_true();
    expect(Logger::parse_level("verbose").has_value()).to_be_false();
}

TEST_SUITE("file output")

TEST_CASE("stream messages are tagged with their level") {
    logger();
    MJV_LOG_INFO << "size " << 100 << " done";
    MJV_LOG_DEBUG << "candidate=" << 4;
    const std::string text = log_contents();
    expect(text).to_contain("[  INFO ] size 100 done");
    expect(text).to_contain("[ DEBUG ] candidate=4");
}

TEST_CASE("located debug lines carry file and line") {
    logger();
    MJV_LOG_HERE << "size " << 10;
    const std::string text = log_contents();
    expect(text).to_contain("[ DEBUG ] ");
    expect(text).to_contain("test.cpp:");
    expect(text).to_contain(" | size 10");
}

TEST_CASE("basic lines have no level tag") {
    logger().set_min_level(Logger::level::BASIC);
    logger().log() << "plain line";
    logger().set_min_level(Logger::level::DEBUG);
    expect(log_contents()).to_contain("] plain line");
}

TEST_CASE("error is logged and execution continues") {
    logger();
    MJV_LOG_ERROR << "cannot open results.csv";
    MJV_LOG_INFO << "still running";
    const std::string text = log_contents();
    expect(text).to_contain("[ ERROR ] cannot open results.csv");
    expect(text).to_contain("still running");
}

TEST_CASE("messages below the minimum level are dropped") {
    logger().set_min_level(Logger::level::WARNING);
    MJV_LOG_INFO << "filtered out";
    MJV_LOG_WARN << "kept warning";
    logger().set_min_level(Logger::level::DEBUG);

    const std::string text = log_contents();
    expect(text.find("filtered out") == std::string::npos).to_be_true();
    expect(text).to_contain("[WARNING] kept warning");
}

TEST_CASE("empty stream writes nothing") {
    const std::string before = log_contents();
    { auto stream = logger().info(); }
    expect(log_contents()).to_equal(before);
}

TEST_CASE("initialize twice throws") {
    logger();
    expect(logger().is_initialized()).to_be_true();
    expect_throws(std::runtime_error, logger().initialize());
}
