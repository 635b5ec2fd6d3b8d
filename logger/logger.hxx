#pragma once

/**
 * @file logger.hxx
 * @brief Logger class and MJV_LOG_* macros
 * @version 1.1.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace mjvote {

// ── Internal clock ────────────────────────────────────────────────────────────

namespace logger_detail {
/// Seconds elapsed since the first call (program-relative wall time).
inline auto elapsed_seconds() noexcept -> double {
    using clock = std::chrono::steady_clock;
    using dseconds = std::chrono::duration<double>;
    static const auto start = clock::now();
    return std::chrono::duration_cast<dseconds>(clock::now() - start).count();
}
}  // namespace logger_detail

// ── ANSI color constants ──────────────────────────────────────────────────────

struct Colors {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *white = "\033[37m";
    static constexpr const char *blue = "\033[34m";
    static constexpr const char *cyan = "\033[36m";
    static constexpr const char *bright_red = "\033[91m";
    static constexpr const char *bright_green = "\033[92m";
    static constexpr const char *bright_yellow = "\033[93m";
    static constexpr const char *bright_blue = "\033[94m";
};

// ── Logger ───────────────────────────────────────────────────────────────────

/**
 * @brief Singleton, thread-safe, synchronous Logger.
 *
 * Supports:
 *  - Runtime-configurable minimum log level.
 *  - stdout/stderr console output, or a plain-text log file instead.
 *  - ANSI color codes on the console.
 *  - Stream-style log_stream objects (RAII flush on destruction).
 *
 * Logging an ERROR never ends the process; the caller picks the exit code.
 * Using the logger before initialize() applies the default settings.
 */
class Logger {
   public:
    /**
     * @brief Severity levels, ordered from least to most severe.
     *
     * A minimum_level filter checks `incoming_level >= minimum_level`.
     */
    enum class level : int { BASIC = 0, DEBUG = 1, INFO = 2, SUCCESS = 3, WARNING = 4, ERROR = 5 };

    // ── log_stream ────────────────────────────────────────────────────────────

    /**
     * @brief Accumulates tokens via `operator<<` and hands the full message to
     *        the Logger on destruction.
     *
     * @code
     *   MJV_LOG_INFO << "size " << n << " done";
     * @endcode
     */
    class log_stream {
       public:
        log_stream(Logger &logger_obj, level lvl) : lg_(logger_obj), level_(lvl) {}

        log_stream(log_stream &&logstr) noexcept : lg_(logstr.lg_), level_(logstr.level_), buf_(std::move(logstr.buf_)) { logstr.moved_ = true; }

        log_stream(const log_stream &) = delete;
        auto operator=(const log_stream &) -> log_stream & = delete;
        auto operator=(log_stream &&) -> log_stream & = delete;

        template <typename T>
        auto operator<<(const T &val) -> log_stream & {
            buf_ << val;
            return *this;
        }

        ~log_stream() {
            if (moved_) {
                return;
            }
            std::string msg = buf_.str();
            if (msg.empty()) {
                return;
            }
            lg_.emit(msg, level_);
        }

       private:
        Logger &lg_;
        level level_;
        std::ostringstream buf_;
        bool moved_ = false;
    };

    // ── Singleton access ──────────────────────────────────────────────────────

    static auto get_instance() -> Logger & {
        static Logger instance;
        return instance;
    }

    Logger(const Logger &) = delete;
    auto operator=(const Logger &) -> Logger & = delete;

    // ── Initialization ────────────────────────────────────────────────────────

    /**
     * @brief Configure the Logger. Call once, before the first message.
     *
     * @param file_path   When non-empty, log lines are appended to this file
     *                    instead of the console.
     * @param use_colors  Emit ANSI escape codes on console output.
     * @param min_level   Discard messages below this severity.
     *
     * @throws std::runtime_error if called twice, or if the file cannot be opened.
     */
    void initialize(const std::string &file_path = "", bool use_colors = true, level min_level = level::INFO) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            throw std::runtime_error("Logger already initialized!");
        }

        if (!file_path.empty()) {
            file_.open(file_path, std::ios::app);
            if (!file_.is_open()) {
                throw std::runtime_error("Failed to open log file: " + file_path);
            }
        }

        use_colors_ = use_colors;
        min_level_.store(min_level, std::memory_order_relaxed);
        initialized_ = true;
    }

    [[nodiscard]] auto is_initialized() const -> bool {
        std::lock_guard lock(mutex_);
        return initialized_;
    }

    // ── Runtime controls ─────────────────────────────────────────────────────

    void set_colors(bool flag) {
        std::lock_guard lock(mutex_);
        use_colors_ = flag;
    }

    void set_min_level(level lvl) { min_level_.store(lvl, std::memory_order_relaxed); }
    [[nodiscard]] auto min_level() const -> level { return min_level_.load(std::memory_order_relaxed); }

    void flush() {
        std::lock_guard lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
        if (file_.is_open()) {
            file_.flush();
        }
    }

    /// Parses "basic", "debug", "info", "success", "warning" or "error".
    static auto parse_level(std::string_view name) -> std::optional<level> {
        if (name == "basic") {
            return level::BASIC;
        }
        if (name == "debug") {
            return level::DEBUG;
        }
        if (name == "info") {
            return level::INFO;
        }
        if (name == "success") {
            return level::SUCCESS;
        }
        if (name == "warning") {
            return level::WARNING;
        }
        if (name == "error") {
            return level::ERROR;
        }
        return std::nullopt;
    }

    // ── String overloads ─────────────────────────────────────────────────────

    void log(const std::string &msg) { emit(msg, level::BASIC); }
    void debug(const std::string &msg) { emit(msg, level::DEBUG); }
    void info(const std::string &msg) { emit(msg, level::INFO); }
    void success(const std::string &msg) { emit(msg, level::SUCCESS); }
    void warning(const std::string &msg) { emit(msg, level::WARNING); }
    void error(const std::string &msg) { emit(msg, level::ERROR); }

    // ── Stream-style factory methods ─────────────────────────────────────────

    log_stream log() { return {*this, level::BASIC}; }
    log_stream debug() { return {*this, level::DEBUG}; }
    log_stream info() { return {*this, level::INFO}; }
    log_stream success() { return {*this, level::SUCCESS}; }
    log_stream warning() { return {*this, level::WARNING}; }
    log_stream error() { return {*this, level::ERROR}; }

    ~Logger() {
        std::lock_guard lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
    }

    friend class log_stream;

   private:
    Logger() = default;

    struct level_meta {
        const char *label;  // fixed-width, 7 chars
        const char *color;
        bool use_err;  // route to stderr?
    };

    static auto meta_of(level lvl) noexcept -> level_meta {
        switch (lvl) {
            case level::BASIC:
                return {.label = "       ", .color = Colors::white, .use_err = false};
            case level::DEBUG:
                return {.label = " DEBUG ", .color = Colors::blue, .use_err = false};
            case level::INFO:
                return {.label = "  INFO ", .color = Colors::bright_blue, .use_err = false};
            case level::SUCCESS:
                return {.label = "SUCCESS", .color = Colors::bright_green, .use_err = false};
            case level::WARNING:
                return {.label = "WARNING", .color = Colors::bright_yellow, .use_err = true};
            case level::ERROR:
                return {.label = " ERROR ", .color = Colors::bright_red, .use_err = true};
        }
        return {.label = "       ", .color = Colors::white, .use_err = false};
    }

    static auto format_time(double elapsed) -> std::string {
        constexpr int MS_PER_SECOND = 1000;
        constexpr int MS_PER_MINUTE = 60000;
        constexpr int MS_PER_HOUR = 3600000;
        constexpr int TIME_BUFFER_SIZE = 32;

        int total_ms = static_cast<int>(elapsed * MS_PER_SECOND);
        int hours = total_ms / MS_PER_HOUR;
        int minutes = (total_ms % MS_PER_HOUR) / MS_PER_MINUTE;
        int seconds = (total_ms % MS_PER_MINUTE) / MS_PER_SECOND;
        int millis = total_ms % MS_PER_SECOND;

        char buf[TIME_BUFFER_SIZE];
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", hours, minutes, seconds, millis);
        return buf;
    }

    // Called with mutex_ held.
    void write_line(const std::string &message, level lvl, double elapsed) {
        const auto [label, color, use_err] = meta_of(lvl);
        std::ostream &ostr = use_err ? std::cerr : std::cout;

        std::string time_tag = "[" + format_time(elapsed) + "] ";
        std::string level_tag = lvl == level::BASIC ? "" : std::string("[") + label + "] ";

        if (file_.is_open()) {
            file_ << time_tag << level_tag << message << '\n';
            file_.flush();
        } else if (use_colors_) {
            ostr << Colors::cyan << time_tag << Colors::reset << color << level_tag << Colors::reset << message << '\n';
        } else {
            ostr << time_tag << level_tag << message << '\n';
        }
    }

    void emit(const std::string &message, level lvl) {
        if (lvl < min_level_.load(std::memory_order_relaxed)) {
            return;
        }
        const double elapsed = logger_detail::elapsed_seconds();

        std::lock_guard lock(mutex_);
        initialized_ = true;
        write_line(message, lvl, elapsed);
    }

    mutable std::mutex mutex_;
    bool initialized_ = false;
    bool use_colors_ = true;
    std::atomic<level> min_level_{level::INFO};
    std::ofstream file_;
};

}  // namespace mjvote

// ── Convenience macros ────────────────────────────────────────────────────────

#define MJV_LOG_DEBUG ::mjvote::Logger::get_instance().debug()
#define MJV_LOG_INFO ::mjvote::Logger::get_instance().info()
#define MJV_LOG_SUCCESS ::mjvote::Logger::get_instance().success()
#define MJV_LOG_WARN ::mjvote::Logger::get_instance().warning()
#define MJV_LOG_ERROR ::mjvote::Logger::get_instance().error()

/// Stamp the current source location then continue the stream.
#define MJV_LOG_HERE MJV_LOG_DEBUG << __FILE__ ":" << __LINE__ << " | "
