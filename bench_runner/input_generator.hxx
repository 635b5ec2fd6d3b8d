#pragma once

/**
 * @file input_generator.hxx
 * @brief Seeded input shapes for the majority vote benchmark driver.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mjvote::bench {

enum class InputType : std::uint8_t { ClearMajority, SlimMajority, NoMajority, Unanimous, Random };

inline constexpr std::array ALL_INPUT_TYPES{InputType::ClearMajority, InputType::SlimMajority, InputType::NoMajority, InputType::Unanimous,
                                            InputType::Random};

// Value every majority-carrying shape is built around.
inline constexpr int MAJORITY_VALUE = 1;
inline constexpr int UNANIMOUS_VALUE = 42;

/** Name written to the CSV InputType column. */
constexpr auto input_type_name(InputType type) -> std::string_view {
    switch (type) {
        case InputType::ClearMajority:
            return "ClearMajority60%";
        case InputType::SlimMajority:
            return "SlimMajority51%";
        case InputType::NoMajority:
            return "NoMajority";
        case InputType::Unanimous:
            return "Unanimous100%";
        case InputType::Random:
            return "Custom";
    }
    return "Unknown";
}

/** Human-readable label used by the interactive menu. */
constexpr auto input_type_label(InputType type) -> std::string_view {
    switch (type) {
        case InputType::ClearMajority:
            return "Clear Majority (60%)";
        case InputType::SlimMajority:
            return "Slim Majority (51%)";
        case InputType::NoMajority:
            return "No Majority (uniform distribution)";
        case InputType::Unanimous:
            return "Unanimous (100%)";
        case InputType::Random:
            return "Custom test (random digits)";
    }
    return "Unknown";
}

/**
 * Parses the short CLI spelling: clear, slim, none, unanimous or random.
 * @throws std::invalid_argument for anything else.
 */
inline auto parse_input_type(std::string_view text) -> InputType {
    if (text == "clear") {
        return InputType::ClearMajority;
    }
    if (text == "slim") {
        return InputType::SlimMajority;
    }
    if (text == "none") {
        return InputType::NoMajority;
    }
    if (text == "unanimous") {
        return InputType::Unanimous;
    }
    if (text == "random") {
        return InputType::Random;
    }
    throw std::invalid_argument("unknown input type: " + std::string(text));
}

/**
 * Builds @p size integers of the requested shape, then shuffles them.
 *
 *   ClearMajority  floor(0.6 * size) ones, the rest uniform in [2, 101]
 *   SlimMajority   size/2 + 1 ones, the rest uniform in [2, 101]
 *   NoMajority     i % (size/3 + 1)
 *   Unanimous      all 42
 *   Random         uniform in [0, 9]
 *
 * The same (size, type, seed) always yields the same sequence.
 */
inline auto generate_input(std::size_t size, InputType type, std::uint32_t seed) -> std::vector<int> {
    std::mt19937 rng{seed};
    std::uniform_int_distribution<int> filler{2, 101};
    std::vector<int> values(size);

    auto fill_majority = [&](std::size_t majority_count) {
        std::fill_n(values.begin(), majority_count, MAJORITY_VALUE);
        for (std::size_t i = majority_count; i < size; ++i) {
            values[i] = filler(rng);
        }
    };

    switch (type) {
        case InputType::ClearMajority:
            fill_majority(size * 6 / 10);
            break;
        case InputType::SlimMajority:
            fill_majority(size == 0 ? 0 : size / 2 + 1);
            break;
        case InputType::NoMajority:
            for (std::size_t i = 0; i < size; ++i) {
                values[i] = static_cast<int>(i % (size / 3 + 1));
            }
            break;
        case InputType::Unanimous:
            std::ranges::fill(values, UNANIMOUS_VALUE);
            break;
        case InputType::Random: {
            std::uniform_int_distribution<int> digit{0, 9};
            for (int& value : values) {
                value = digit(rng);
            }
            break;
        }
    }

    std::ranges::shuffle(values, rng);
    return values;
}

}  // namespace mjvote::bench
