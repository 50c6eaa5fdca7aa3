/// @file src/main.cpp
/// @brief aunc CLI entry point.
///
/// Usage:
///   aunc --list                         List the registered operations
///   aunc --eval <op> <operand>...       Evaluate an operation through the dispatcher
///   aunc --help                         Print usage
///
/// Operands are written `n` (a plain number) or `n+/-e` (a value with error).

#include "aunc/dispatch.hpp"
#include "aunc/errors.hpp"
#include "aunc/format.hpp"
#include "aunc/registry.hpp"

#include <fmt/core.h>

#include <charconv>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  aunc --list                      List the registered operations\n"
        "  aunc --eval <op> <operand>...    Evaluate an operation\n"
        "  aunc --help                      Show this help\n"
        "\n"
        "Options for --eval (before <op>):\n"
        "  --precision <n>                  Print with n decimals\n"
        "  --verbose                        Trace dispatch decisions to stderr\n"
        "\n"
        "Operands: n (plain number) or n+/-e (value with error), e.g.\n"
        "  aunc --eval divide 2+/-0.1 2+/-0.1\n"
    );
}

std::optional<double> parse_number(std::string_view text) {
    double value = 0.0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

/// Decimal places accepted by --precision: 0 up to the digits a double can
/// round-trip.
std::optional<int> parse_precision(std::string_view text) {
    int value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    if (value < 0 || value > std::numeric_limits<double>::max_digits10) return std::nullopt;
    return value;
}

/// Parse `n` or `n+/-e`. Returns nullopt on malformed input.
std::optional<aunc::Argument> parse_operand(std::string_view text) {
    const auto sep = text.find("+/-");
    if (sep == std::string_view::npos) {
        const auto v = parse_number(text);
        if (!v) return std::nullopt;
        return aunc::Argument{aunc::NDArray(*v)};
    }
    const auto v = parse_number(text.substr(0, sep));
    const auto e = parse_number(text.substr(sep + 3));
    if (!v || !e) return std::nullopt;
    return aunc::Argument{aunc::Uncertainty(*v, *e)};
}

int run_list(const aunc::OperationRegistry& registry) {
    for (const auto kind : {aunc::CallKind::ufunc, aunc::CallKind::function}) {
        fmt::print("{}:\n", aunc::to_string(kind));
        for (const auto& name : registry.names(kind)) {
            const aunc::Rule* rule = registry.find(kind, name);
            fmt::print("  {:<14} {}\n", name, rule->is_closed_form() ? "closed-form" : "pass-through");
        }
    }
    return 0;
}

/// Evaluate `args` = [options...] <op> <operand>...
/// Returns 0 on success, 1 on error.
int run_eval(const aunc::OperationRegistry& registry, const std::vector<std::string_view>& args) {
    aunc::DispatchConfig   config;
    aunc::DisplayOptions   display;
    std::size_t            i = 0;

    for (; i < args.size() && args[i].starts_with("--"); ++i) {
        if (args[i] == "--verbose") {
            config.verbose = true;
        } else if (args[i] == "--precision" && i + 1 < args.size()) {
            const auto p = parse_precision(args[++i]);
            if (!p) {
                fmt::print(stderr, "Error: invalid precision '{}' (expected 0..{})\n", args[i],
                           std::numeric_limits<double>::max_digits10);
                return 1;
            }
            display.precision = *p;
        } else {
            fmt::print(stderr, "Error: unknown option '{}'\n", args[i]);
            return 1;
        }
    }
    if (i >= args.size()) {
        fmt::print(stderr, "Error: --eval requires an operation name\n");
        return 1;
    }

    const std::string_view op = args[i++];

    // Elementwise names take precedence over free functions of the same name.
    const auto kind = registry.contains(aunc::CallKind::ufunc, op) ? aunc::CallKind::ufunc
                                                                   : aunc::CallKind::function;
    const aunc::Dispatcher dispatcher(registry, config);
    try {
        std::vector<aunc::Argument> operands;
        for (; i < args.size(); ++i) {
            auto operand = parse_operand(args[i]);
            if (!operand) {
                fmt::print(stderr, "Error: malformed operand '{}'\n", args[i]);
                return 1;
            }
            operands.push_back(std::move(*operand));
        }
        const auto result = dispatcher.invoke(
            aunc::Call{kind, std::string(op), aunc::UfuncMethod::call, std::move(operands), {}});
        fmt::print("{}\n", aunc::to_string(result, display));
    } catch (const aunc::UncertaintyError& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);
    const auto registry = aunc::make_default_registry();

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--list") {
        return run_list(registry);
    }

    if (mode == "--eval") {
        std::vector<std::string_view> rest(argv + 2, argv + argc);
        return run_eval(registry, rest);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
