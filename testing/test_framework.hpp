#pragma once

/**
 * @file test_framework.hpp
 * @brief Minimal self-registering test framework with fluent assertions and colored output.
 * @version 1.1.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cmath>
#include <cstddef>
#include <functional>
#include <iostream>
#include <optional>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

// ─────────────────────────────────────────────────────────────────────────────
// ANSI colors
// ─────────────────────────────────────────────────────────────────────────────
namespace mjvote::testing::color {

inline auto enabled() -> bool {
#ifdef _WIN32
    return false;
#else
    static bool val = (isatty(fileno(stdout)) != 0);
    return val;
#endif
}

inline auto paint(std::string_view code, std::string_view str) -> std::string {
    if (!enabled()) {
        return std::string(str);
    }
    return std::string(code) + std::string(str) + "\033[0m";
}

inline auto green(std::string_view str) -> std::string { return paint("\033[32m", str); }
inline auto red(std::string_view str) -> std::string { return paint("\033[31m", str); }
inline auto yellow(std::string_view str) -> std::string { return paint("\033[33m", str); }
inline auto bold(std::string_view str) -> std::string { return paint("\033[1m", str); }
inline auto dim(std::string_view str) -> std::string { return paint("\033[2m", str); }

}  // namespace mjvote::testing::color

namespace mjvote::testing {

// ─────────────────────────────────────────────────────────────────────────────
// assertion_error
// ─────────────────────────────────────────────────────────────────────────────

struct assertion_error : std::exception {
    std::string message;
    std::string file;
    int line{};

    assertion_error(std::string msg, std::string file_path, int line_num) : message(std::move(msg)), file(std::move(file_path)), line(line_num) {}

    [[nodiscard]] auto what() const noexcept -> const char* override { return message.c_str(); }
};

// ─────────────────────────────────────────────────────────────────────────────
// Value printing
//
// Optionals print as the contained value or "nullopt", ranges print as
// "[a, b, c]", everything else goes through operator<<.
// ─────────────────────────────────────────────────────────────────────────────

namespace detail {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
concept streamable = requires(std::ostream& out, const T& val) { out << val; };

template <typename T>
void print_value(std::ostream& out, const T& val) {
    if constexpr (is_optional<T>::value) {
        if (val.has_value()) {
            print_value(out, *val);
        } else {
            out << "nullopt";
        }
    } else if constexpr (std::is_convertible_v<T, std::string_view>) {
        out << std::string_view(val);
    } else if constexpr (std::ranges::input_range<T> && !streamable<T>) {
        out << '[';
        bool first = true;
        for (const auto& item : val) {
            if (!first) {
                out << ", ";
            }
            first = false;
            print_value(out, item);
        }
        out << ']';
    } else if constexpr (streamable<T>) {
        out << val;
    } else {
        out << "<" << typeid(T).name() << ">";
    }
}

template <typename U>
auto to_str(const U& val) -> std::string {
    std::ostringstream oss;
    print_value(oss, val);
    return oss.str();
}

}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// expectation<T>
// ─────────────────────────────────────────────────────────────────────────────

namespace {
constexpr double DEFAULT_TOLERANCE = 1e-5;
}

template <typename T>
class expectation {
   public:
    expectation(const T& value, const char* file, int line) : value_(value), file_(file), line_(line) {}

    auto to_equal(const T& expected) -> expectation& {
        if (!(value_ == expected)) {
            std::ostringstream oss;
            oss << "expected: " << detail::to_str(expected) << "\n"
                << "           got:      " << detail::to_str(value_);
            fail(oss.str());
        }
        return *this;
    }

    auto not_to_equal(const T& expected) -> expectation& {
        if (value_ == expected) {
            fail("expected value to differ from: " + detail::to_str(expected));
        }
        return *this;
    }

    auto to_be_true() -> expectation& {
        if (!static_cast<bool>(value_)) {
            fail("expected: true\n           got:      false");
        }
        return *this;
    }

    auto to_be_false() -> expectation& {
        if (static_cast<bool>(value_)) {
            fail("expected: false\n           got:      true");
        }
        return *this;
    }

    auto to_have_value() -> expectation&
        requires detail::is_optional<T>::value
    {
        if (!value_.has_value()) {
            fail("expected: a value\n           got:      nullopt");
        }
        return *this;
    }

    auto to_be_none() -> expectation&
        requires detail::is_optional<T>::value
    {
        if (value_.has_value()) {
            fail("expected: nullopt\n           got:      " + detail::to_str(*value_));
        }
        return *this;
    }

    auto to_be_greater_than(const T& threshold) -> expectation& {
        if (!(value_ > threshold)) {
            fail(detail::to_str(value_) + " is not greater than " + detail::to_str(threshold));
        }
        return *this;
    }

    auto to_be_less_than(const T& threshold) -> expectation& {
        if (!(value_ < threshold)) {
            fail(detail::to_str(value_) + " is not less than " + detail::to_str(threshold));
        }
        return *this;
    }

    auto to_be_greater_or_equal(const T& threshold) -> expectation& {
        if (!(value_ >= threshold)) {
            fail(detail::to_str(value_) + " is not >= " + detail::to_str(threshold));
        }
        return *this;
    }

    auto to_be_less_or_equal(const T& threshold) -> expectation& {
        if (!(value_ <= threshold)) {
            fail(detail::to_str(value_) + " is not <= " + detail::to_str(threshold));
        }
        return *this;
    }

    auto to_approx_equal(const T& expected, const T& tolerance = static_cast<T>(DEFAULT_TOLERANCE)) -> expectation& {
        static_assert(std::is_floating_point_v<T>, "to_approx_equal() requires a floating point type");
        if (std::abs(value_ - expected) > tolerance) {
            std::ostringstream oss;
            oss << std::fixed << "expected: ~" << expected << " (+-" << tolerance << ")\n"
                << "           got:       " << value_;
            fail(oss.str());
        }
        return *this;
    }

    auto to_contain(std::string_view substr) -> expectation&
        requires std::is_convertible_v<T, std::string_view>
    {
        std::string_view str(value_);
        if (str.find(substr) == std::string_view::npos) {
            fail("\"" + detail::to_str(value_) + "\" does not contain \"" + std::string(substr) + "\"");
        }
        return *this;
    }

   private:
    const T& value_;
    const char* file_;
    int line_;

    [[noreturn]] void fail(const std::string& msg) const { throw assertion_error(msg, file_, line_); }
};

// ─────────────────────────────────────────────────────────────────────────────
// Exception helpers
// ─────────────────────────────────────────────────────────────────────────────

template <typename ExceptionType, typename Callable>
void check_throws(Callable&& func, const char* file, int line) {
    bool caught = false;
    try {
        std::forward<Callable>(func)();
    } catch (const ExceptionType&) {
        caught = true;
    } catch (const std::exception& e) {
        throw assertion_error(std::string("expected exception '") + typeid(ExceptionType).name() + "' but got: " + e.what(), file, line);
    } catch (...) {
        throw assertion_error(std::string("expected exception '") + typeid(ExceptionType).name() + "' but a non-std exception was thrown", file,
                              line);
    }
    if (!caught) {
        throw assertion_error(std::string("expected exception '") + typeid(ExceptionType).name() + "' but no exception was thrown", file, line);
    }
}

template <typename Callable>
void check_no_throw(Callable&& func, const char* file, int line) {
    try {
        std::forward<Callable>(func)();
    } catch (const std::exception& e) {
        throw assertion_error(std::string("expected no exception but got: ") + e.what(), file, line);
    } catch (...) {
        throw assertion_error("expected no exception but an unknown exception was thrown", file, line);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// test_registry
// ─────────────────────────────────────────────────────────────────────────────

struct test_case {
    std::string suite;
    std::string name;
    std::function<void()> fn;
};

class test_registry {
   public:
    static auto instance() -> test_registry& {
        static test_registry reg;
        return reg;
    }

    auto register_test(test_case tcase) -> void { tests_.push_back(std::move(tcase)); }

    auto run_all() -> int {
        print_header();

        int passed = 0;
        int failed = 0;
        std::string current_suite;

        for (const auto& tcase : tests_) {
            if (tcase.suite != current_suite) {
                current_suite = tcase.suite;
                std::cout << "\n  " << color::bold(color::yellow("SUITE: " + current_suite)) << "\n";
            }

            if (run_one(tcase)) {
                ++passed;
            } else {
                ++failed;
            }
        }

        print_footer(passed, failed);
        return (failed > 0) ? 1 : 0;
    }

   private:
    std::vector<test_case> tests_;

    // Runs one case and reports it. Returns false on any failure.
    static auto run_one(const test_case& tcase) -> bool {
        try {
            tcase.fn();
            std::cout << "    " << color::green("v") << "  " << tcase.name << "\n";
            return true;
        } catch (const assertion_error& e) {
            report_failure(tcase.name, e.message);
            std::cout << color::dim("         at: " + short_path(e.file) + ":" + std::to_string(e.line)) << "\n";
        } catch (const std::exception& e) {
            report_failure(tcase.name, std::string("unexpected exception: ") + e.what());
        } catch (...) {
            report_failure(tcase.name, "unknown exception thrown");
        }
        return false;
    }

    static void report_failure(const std::string& name, const std::string& detail) {
        std::cout << "    " << color::red("x") << "  " << name << "\n";
        std::cout << color::dim("         " + detail) << "\n";
    }

    static void print_header() {
        std::cout << color::bold("\n+-------------------------------------+\n");
        std::cout << color::bold("|  mjvote test runner                 |\n");
        std::cout << color::bold("+-------------------------------------+\n");
    }

    static void print_footer(int passed, int failed) {
        constexpr int SEPARATOR_WIDTH = 42;
        std::cout << "\n" << std::string(SEPARATOR_WIDTH, '-') << "\n";
        std::cout << "  Results:  " << color::green(std::to_string(passed) + " passed") << "  |  "
                  << (failed > 0 ? color::red(std::to_string(failed) + " failed") : color::dim("0 failed")) << "  |  "
                  << std::to_string(passed + failed) << " total\n";
        std::cout << std::string(SEPARATOR_WIDTH, '-') << "\n\n";
    }

    static auto short_path(const std::string& path) -> std::string {
        auto pos = path.find_last_of("/\\");
        return (pos == std::string::npos) ? path : path.substr(pos + 1);
    }
};

// Registers a test at static-init time.
struct auto_registrar {
    auto_registrar(const char* suite, const char* name, void (*func)()) {
        test_registry::instance().register_test({.suite = suite, .name = name, .fn = func});
    }
};

}  // namespace mjvote::testing

// ─────────────────────────────────────────────────────────────────────────────
// Macro helpers — paste two tokens together
// ─────────────────────────────────────────────────────────────────────────────
#define MJV_CAT2(a, b) a##b
#define MJV_CAT(a, b) MJV_CAT2(a, b)

// ─────────────────────────────────────────────────────────────────────────────
// TEST_SUITE — sets the suite name for every TEST_CASE that follows in the
// translation unit. Each call keeps its literal in a __LINE__-named static so
// the shared pointer always refers to valid storage.
// ─────────────────────────────────────────────────────────────────────────────

namespace {
inline const char* mjv_current_suite_ = "<unset>";
}

#define TEST_SUITE(name)                                          \
    static const char* MJV_CAT(mjv_suite_str_, __LINE__) = name; \
    static int MJV_CAT(mjv_suite_set_, __LINE__) = (mjv_current_suite_ = MJV_CAT(mjv_suite_str_, __LINE__), 0);

// ─────────────────────────────────────────────────────────────────────────────
// TEST_CASE — one per line; expands to a function plus its static registrar.
// ─────────────────────────────────────────────────────────────────────────────
#define TEST_CASE(test_name)                                                                                                           \
    static void MJV_CAT(mjv_test_fn_, __LINE__)();                                                                                     \
    static ::mjvote::testing::auto_registrar MJV_CAT(mjv_test_reg_, __LINE__)(mjv_current_suite_, test_name, MJV_CAT(mjv_test_fn_, __LINE__)); \
    static void MJV_CAT(mjv_test_fn_, __LINE__)()

// ─────────────────────────────────────────────────────────────────────────────
// Assertion macros
// ─────────────────────────────────────────────────────────────────────────────

#define expect(val) ::mjvote::testing::expectation((val), __FILE__, __LINE__)

#define expect_throws(ExType, ...) ::mjvote::testing::check_throws<ExType>([&] { __VA_ARGS__; }, __FILE__, __LINE__)

#define expect_no_throw(...) ::mjvote::testing::check_no_throw([&] { __VA_ARGS__; }, __FILE__, __LINE__)
