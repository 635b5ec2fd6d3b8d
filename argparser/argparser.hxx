#pragma once

/**
 * @file argparser.hxx
 * @brief CLI argument parser with optional TOML config support
 * @version 1.1.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * TOML config support
 * -------------------
 * Pass --config <path/to/file.toml> (or -C) to load parameters from a TOML file.
 *
 * Precedence (lowest → highest):
 *   1. Defaults registered with .default_val()
 *   2. Values from the TOML config file
 *   3. Values from the CLI
 *
 * Only flat `key = value` lines are read. Table headers such as [bench] are
 * accepted and ignored, `#` starts a comment outside of quotes. Example:
 *
 *   [bench]
 *   algorithm  = "optimized"
 *   sizes      = "100,1k,10k"
 *   iterations = 20
 *   summary    = true
 *
 * Supported value types: int, bool, std::string, std::filesystem::path.
 */

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <variant>
#include <vector>

namespace mjvote::cli {

namespace fs = std::filesystem;

using Value = std::variant<int, bool, std::string, fs::path>;

struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ── Argument descriptor ────────────────────────────────────────────────────

struct Arg {
    std::string name;    // long name, e.g. "iterations"
    char shortName = 0;  // short name, e.g. 'n'  (0 = none)
    std::string help;
    bool required = false;

    std::type_index type{typeid(void)};

    std::optional<Value> defaultValue;
    std::optional<int> minValue;  // inclusive, int only
    std::optional<int> maxValue;  // inclusive, int only
    std::vector<Value> choices;

    // ── fluent builders ────────────────────────────────────────────────
    auto shorthand(char short_name) -> Arg& {
        if (short_name == 'h' || short_name == 'C') {
            throw ParseError(std::format("-{} is reserved", short_name));
        }
        shortName = short_name;
        return *this;
    }

    auto description(std::string_view text) -> Arg& {
        help = text;
        return *this;
    }

    auto require() -> Arg& {
        required = true;
        return *this;
    }

    template <typename T>
    auto default_val(T value) -> Arg& {
        defaultValue = to_value(value);
        return *this;
    }

    auto min(int value) -> Arg& {
        expect_type(typeid(int), "min()");
        minValue = value;
        return *this;
    }

    auto max(int value) -> Arg& {
        expect_type(typeid(int), "max()");
        maxValue = value;
        return *this;
    }

    template <typename T>
    auto allow(std::initializer_list<T> list) -> Arg& {
        for (const auto& v : list) {
            choices.push_back(to_value(v));
        }
        return *this;
    }

   private:
    void expect_type(std::type_index wanted, std::string_view what) const {
        if (type != wanted) {
            throw ParseError(std::format("--{}: {} does not fit the argument type", name, what));
        }
    }

    template <typename T>
    auto to_value(const T& value) const -> Value {
        if constexpr (std::is_same_v<T, bool>) {
            expect_type(typeid(bool), "bool value");
            return Value{value};
        } else if constexpr (std::is_same_v<T, fs::path>) {
            expect_type(typeid(fs::path), "path value");
            return Value{value};
        } else if constexpr (std::is_convertible_v<T, std::string>) {
            if (type == typeid(fs::path)) {
                return Value{fs::path{std::string{value}}};
            }
            expect_type(typeid(std::string), "string value");
            return Value{std::string{value}};
        } else if constexpr (std::is_integral_v<T>) {
            expect_type(typeid(int), "int value");
            return Value{static_cast<int>(value)};
        } else {
            static_assert(sizeof(T) == 0, "unsupported argument type");
        }
    }
};

// ── Parser ─────────────────────────────────────────────────────────────────

class ArgParser {
   public:
    explicit ArgParser(std::string programName, std::string description = "")
        : programName_(std::move(programName)), description_(std::move(description)) {}

    template <typename T>
    auto add(std::string name) -> Arg& {
        static_assert(std::is_same_v<T, int> || std::is_same_v<T, bool> || std::is_same_v<T, std::string> || std::is_same_v<T, fs::path>,
                      "argument type must be int, bool, std::string or std::filesystem::path");
        if (find_arg(name) != nullptr) {
            throw ParseError(std::format("duplicate argument registration: --{}", name));
        }
        args_.push_back(Arg{.name = std::move(name), .type = typeid(T)});
        return args_.back();
    }

    /**
     * @brief Parse the command line.
     * @return false when --help was given (help has been printed), true otherwise.
     * @throws ParseError on unknown, duplicate, malformed or missing arguments.
     */
    auto parse(int argc, char* argv[]) -> bool {
        std::vector<std::string> tokens;
        for (int i = 1; i < argc; ++i) {
            tokens.emplace_back(argv[i]);
        }
        return parse(tokens);
    }

    auto parse(const std::vector<std::string>& tokens) -> bool {
        parsed_.clear();
        for (const auto& arg : args_) {
            if (arg.defaultValue) {
                parsed_[arg.name] = *arg.defaultValue;
            }
        }

        // --config is consumed first so CLI flags can override the file.
        std::vector<std::string> remaining;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (tokens[i] == "--help" || tokens[i] == "-h") {
                print_help();
                return false;
            }
            if (tokens[i] == "--config" || tokens[i] == "-C") {
                if (i + 1 >= tokens.size()) {
                    throw ParseError("--config requires a file path");
                }
                load_toml(tokens[++i]);
            } else {
                remaining.push_back(tokens[i]);
            }
        }

        parse_cli_arguments(remaining);

        for (const auto& arg : args_) {
            if (arg.required && !parsed_.contains(arg.name)) {
                throw ParseError(std::format("required argument missing: --{}", arg.name));
            }
        }
        return true;
    }

    // ── accessors ──────────────────────────────────────────────────────

    [[nodiscard]] auto has(const std::string& name) const -> bool { return parsed_.contains(name); }

    template <typename T>
    auto get(const std::string& name) const -> T {
        const Arg* arg = find_arg(name);
        if (arg == nullptr) {
            throw ParseError(std::format("argument not registered: --{}", name));
        }
        if (arg->type != typeid(T)) {
            throw ParseError(std::format("type mismatch for --{} (registered as {}, requested as {})", name, type_to_string(arg->type),
                                         type_to_string(typeid(T))));
        }
        auto value_it = parsed_.find(name);
        if (value_it == parsed_.end()) {
            throw ParseError(std::format("argument has no value: --{}", name));
        }
        return std::get<T>(value_it->second);
    }

    void print_help(std::ostream& out = std::cout) const {
        constexpr std::size_t HELP_COLUMN_WIDTH = 28;
        out << "Usage: " << programName_ << " [options]\n";
        if (!description_.empty()) {
            out << description_ << "\n";
        }
        out << "\nOptions:\n";
        out << pad("  -h, --help", HELP_COLUMN_WIDTH) << "Show this help message\n";
        out << pad("  -C, --config <file>", HELP_COLUMN_WIDTH) << "Load parameters from a TOML config file\n";

        for (const auto& arg : args_) {
            std::string left = "  --" + arg.name;
            if (arg.shortName != 0) {
                left += std::format(", -{}", arg.shortName);
            }
            if (arg.type != typeid(bool)) {
                left += std::format(" <{}>", type_to_string(arg.type));
            }
            out << pad(left, HELP_COLUMN_WIDTH) << arg.help;

            if (arg.defaultValue) {
                out << std::format(" [default: {}]", value_to_string(*arg.defaultValue));
            }
            if (arg.minValue && arg.maxValue) {
                out << std::format(" [range: {}..{}]", *arg.minValue, *arg.maxValue);
            } else if (arg.minValue) {
                out << std::format(" [min: {}]", *arg.minValue);
            }
            if (!arg.choices.empty()) {
                out << " [choices: ";
                for (std::size_t i = 0; i < arg.choices.size(); ++i) {
                    out << (i == 0 ? "" : "|") << value_to_string(arg.choices[i]);
                }
                out << ']';
            }
            if (arg.required) {
                out << " (required)";
            }
            out << '\n';
        }
    }

   private:
    void parse_cli_arguments(const std::vector<std::string>& remaining) {
        std::set<std::string> seenCli;
        for (std::size_t i = 0; i < remaining.size(); ++i) {
            const auto& tok = remaining[i];

            std::string key;
            if (tok.starts_with("--")) {
                key = tok.substr(2);
            } else if (tok.starts_with("-") && tok.size() == 2) {
                key = expand_short(tok[1]);
            } else {
                throw ParseError(std::format("unexpected token: {}", tok));
            }

            const Arg* arg = find_arg(key);
            if (arg == nullptr) {
                throw ParseError(std::format("unknown argument: --{}", key));
            }
            if (!seenCli.insert(key).second) {
                throw ParseError(std::format("duplicate CLI argument: --{}", key));
            }

            Value value;
            if (arg->type == typeid(bool)) {
                // bool flags may stand alone
                if (i + 1 < remaining.size() && !remaining[i + 1].starts_with("-")) {
                    value = parse_bool(remaining[++i]);
                } else {
                    value = true;
                }
            } else {
                if (i + 1 >= remaining.size()) {
                    throw ParseError(std::format("--{} requires a value", key));
                }
                value = parse_value(*arg, remaining[++i]);
            }
            validate(*arg, value);
            parsed_[key] = std::move(value);
        }
    }

    void load_toml(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            throw ParseError(std::format("cannot open config file: {}", path));
        }

        std::set<std::string> seenToml;
        std::string line;
        std::size_t line_no = 0;
        while (std::getline(file, line)) {
            ++line_no;
            auto stripped = strip_comment(trim(line));
            if (stripped.empty() || stripped[0] == '[') {
                continue;
            }

            auto equal = stripped.find('=');
            if (equal == std::string::npos) {
                throw ParseError(std::format("{}:{}: expected key = value", path, line_no));
            }

            std::string key = trim(stripped.substr(0, equal));
            std::string rawVal = trim(stripped.substr(equal + 1));

            const Arg* arg = find_arg(key);
            if (arg == nullptr) {
                throw ParseError(std::format("{}:{}: unknown key '{}'", path, line_no, key));
            }
            if (!seenToml.insert(key).second) {
                throw ParseError(std::format("{}:{}: duplicate key '{}'", path, line_no, key));
            }

            Value value = parse_value(*arg, rawVal);
            validate(*arg, value);
            parsed_[key] = std::move(value);
        }
    }

    // ── string utilities ───────────────────────────────────────────────

    static auto trim(const std::string& str) -> std::string {
        auto begin = str.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return {};
        }
        auto end = str.find_last_not_of(" \t\r\n");
        return str.substr(begin, end - begin + 1);
    }

    // Drops everything from the first '#' that is not inside quotes.
    static auto strip_comment(const std::string& text) -> std::string {
        bool inDouble = false;
        bool inSingle = false;
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '"' && !inSingle) {
                inDouble = !inDouble;
            } else if (text[i] == '\'' && !inDouble) {
                inSingle = !inSingle;
            } else if (text[i] == '#' && !inDouble && !inSingle) {
                return trim(text.substr(0, i));
            }
        }
        return text;
    }

    static auto pad(std::string text, std::size_t width) -> std::string {
        if (text.size() < width) {
            text.resize(width, ' ');
        } else {
            text += ' ';
        }
        return text;
    }

    [[nodiscard]] auto find_arg(const std::string& key) const -> const Arg* {
        auto it = std::ranges::find(args_, key, &Arg::name);
        return it == args_.end() ? nullptr : &*it;
    }

    [[nodiscard]] auto expand_short(char short_name) const -> std::string {
        auto it = std::ranges::find(args_, short_name, &Arg::shortName);
        if (it == args_.end()) {
            throw ParseError(std::format("unknown short option: -{}", short_name));
        }
        return it->name;
    }

    static auto parse_bool(const std::string& str) -> bool {
        if (str == "true" || str == "1" || str == "yes") {
            return true;
        }
        if (str == "false" || str == "0" || str == "no") {
            return false;
        }
        throw ParseError(std::format("invalid bool value: {}", str));
    }

    static auto parse_int(const std::string& str) -> int {
        std::size_t consumed = 0;
        int value = std::stoi(str, &consumed);
        if (consumed != str.size()) {
            throw ParseError(std::format("trailing characters in integer: {}", str));
        }
        return value;
    }

    static auto parse_value(const Arg& arg, const std::string& raw) -> Value {
        std::string clean = raw;
        if (clean.size() >= 2 && ((clean.front() == '"' && clean.back() == '"') || (clean.front() == '\'' && clean.back() == '\''))) {
            clean = clean.substr(1, clean.size() - 2);
        }

        try {
            if (arg.type == typeid(int)) {
                return Value{parse_int(clean)};
            }
            if (arg.type == typeid(bool)) {
                return Value{parse_bool(clean)};
            }
            if (arg.type == typeid(std::string)) {
                return Value{clean};
            }
            if (arg.type == typeid(fs::path)) {
                return Value{fs::path{clean}};
            }
        } catch (const ParseError& e) {
            throw ParseError(std::format("invalid value for --{}: {}", arg.name, e.what()));
        } catch (const std::logic_error& e) {
            // std::stoi reports through invalid_argument / out_of_range
            throw ParseError(std::format("invalid value for --{}: '{}' ({})", arg.name, clean, e.what()));
        }
        throw ParseError(std::format("--{} has an unsupported type", arg.name));
    }

    static void validate(const Arg& arg, const Value& val) {
        if (!arg.choices.empty() && std::ranges::find(arg.choices, val) == arg.choices.end()) {
            throw ParseError(std::format("--{}: '{}' is not one of the allowed choices", arg.name, value_to_string(val)));
        }
        if (const int* int_value = std::get_if<int>(&val)) {
            if (arg.minValue && *int_value < *arg.minValue) {
                throw ParseError(std::format("--{}: value {} below minimum {}", arg.name, *int_value, *arg.minValue));
            }
            if (arg.maxValue && *int_value > *arg.maxValue) {
                throw ParseError(std::format("--{}: value {} above maximum {}", arg.name, *int_value, *arg.maxValue));
            }
        }
    }

    static auto value_to_string(const Value& value) -> std::string {
        return std::visit(
            [](const auto& val) -> std::string {
                using T = std::decay_t<decltype(val)>;
                if constexpr (std::is_same_v<T, bool>) {
                    return val ? "true" : "false";
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return val;
                } else if constexpr (std::is_same_v<T, fs::path>) {
                    return val.string();
                } else {
                    return std::to_string(val);
                }
            },
            value);
    }

    static auto type_to_string(std::type_index type) -> std::string {
        if (type == typeid(int)) {
            return "int";
        }
        if (type == typeid(bool)) {
            return "bool";
        }
        if (type == typeid(std::string)) {
            return "string";
        }
        if (type == typeid(fs::path)) {
            return "path";
        }
        return "unknown";
    }

    std::string programName_;
    std::string description_;
    std::vector<Arg> args_;
    std::map<std::string, Value> parsed_;
};

}  // namespace mjvote::cli
