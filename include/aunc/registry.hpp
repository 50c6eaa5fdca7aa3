#pragma once

/// @file include/aunc/registry.hpp
/// @brief Operation registry: the table of supported propagation rules.
///
/// # Module: Operation Registry
///
/// ## Responsibility
/// Map an operation name, per call kind (free function or ufunc), to a
/// propagation rule. Two rule categories exist:
///   - closed form: computes nominal and error together from the operands
///     (add, multiply, power, elementary functions, reductions)
///   - pass-through: applies the same nominal operation separately to the
///     nominal arguments and to the error arguments (reshape, transpose,
///     concatenate, ...)
///
/// The registry is an ordinary value: build one at start-up (usually with
/// `make_default_registry()`), extend it, and hand it to a Dispatcher.
/// Registering an existing name replaces its rule.

#include "aunc/config.hpp"
#include "aunc/errors.hpp"
#include "aunc/ndarray.hpp"
#include "aunc/propagation.hpp"
#include "aunc/types.hpp"
#include "aunc/uncertainty.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace aunc {

// ─── Call Description ─────────────────────────────────────────────────────────

/// A positional argument of an intercepted call.
using Argument = std::variant<NDArray, Uncertainty>;

/// How an operation was invoked through the generic numeric surface.
enum class CallKind {
    function, ///< A free library function (sum, reshape, concatenate, ...)
    ufunc,    ///< An elementwise universal function (add, sqrt, ...)
};

/// Broadcasting mode of a ufunc invocation. Only `call` is supported.
enum class UfuncMethod {
    call,
    reduce,
    accumulate,
    reduceat,
    outer,
    at,
};

[[nodiscard]] std::string_view to_string(CallKind kind) noexcept;
[[nodiscard]] std::string_view to_string(UfuncMethod method) noexcept;

/// A keyword parameter value.
using Param  = std::variant<bool, Index, double, Shape, std::string>;
using Params = std::map<std::string, Param, std::less<>>;

/// One intercepted call.
struct Call {
    CallKind              kind   = CallKind::function;
    std::string           name;
    UfuncMethod           method = UfuncMethod::call;
    std::vector<Argument> args;
    Params                params;
};

// ─── Rules ────────────────────────────────────────────────────────────────────

/// What a rule sees besides its operands.
struct RuleContext {
    const Params&  params;
    DowncastPolicy downcast = DowncastPolicy::warn;
};

/// Closed-form rule over the resolved operands.
using ClosedFormRule =
    std::function<propagation::Components(std::span<const propagation::Operand>, const RuleContext&)>;

/// Pass-through rule, called once with the nominal arguments and once with
/// the error arguments (zeros for plain operands).
using PassThroughRule = std::function<NDArray(std::span<const NDArray>, const RuleContext&)>;

/// Accepted number of positional arguments, inclusive.
struct Arity {
    std::size_t min = 1;
    std::size_t max = 1;

    [[nodiscard]] bool accepts(std::size_t n) const noexcept { return n >= min && n <= max; }
};

struct Rule {
    std::string                                   name;
    CallKind                                      kind;
    Arity                                         arity;
    std::vector<std::string>                      keywords; ///< Accepted keyword parameters
    std::variant<ClosedFormRule, PassThroughRule> apply;

    [[nodiscard]] bool is_closed_form() const noexcept {
        return std::holds_alternative<ClosedFormRule>(apply);
    }
    [[nodiscard]] bool accepts_keyword(std::string_view key) const noexcept;
};

// ─── OperationRegistry ────────────────────────────────────────────────────────

class OperationRegistry {
public:
    void register_closed_form(CallKind kind, std::string name, Arity arity,
                              std::vector<std::string> keywords, ClosedFormRule rule);

    void register_pass_through(CallKind kind, std::string name, Arity arity,
                               std::vector<std::string> keywords, PassThroughRule rule);

    /// Rule registered for `name` under `kind`, or nullptr.
    [[nodiscard]] const Rule* find(CallKind kind, std::string_view name) const noexcept;

    [[nodiscard]] bool contains(CallKind kind, std::string_view name) const noexcept {
        return find(kind, name) != nullptr;
    }

    /// Registered names for `kind`, sorted.
    [[nodiscard]] std::vector<std::string> names(CallKind kind) const;

    /// Total number of registered rules.
    [[nodiscard]] std::size_t size() const noexcept { return functions_.size() + ufuncs_.size(); }

private:
    using Table = std::map<std::string, Rule, std::less<>>;

    void insert(Rule rule);
    [[nodiscard]] const Table& table(CallKind kind) const noexcept;

    Table functions_;
    Table ufuncs_;
};

/// Registry populated with the first-order rules shipped with the library.
///
/// # Ufuncs
/// add, subtract, multiply, divide, true_divide, negative, positive,
/// absolute, power, square, sqrt, exp, log, log10, sin, cos, tan,
/// floor_divide, remainder
///
/// # Functions
/// Closed form: sum, mean, clip, round.
/// Pass-through: reshape, transpose, ravel, squeeze, expand_dims,
/// concatenate, copy, flip, broadcast_to, real, imag.
[[nodiscard]] OperationRegistry make_default_registry();

// ─── Rule Helpers ─────────────────────────────────────────────────────────────

/// Keyword parameter of type T, or nullopt when absent.
/// Throws TypeMismatch when present with another type.
template <typename T>
[[nodiscard]] std::optional<T> param(const Params& params, std::string_view key) {
    const auto it = params.find(key);
    if (it == params.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<T>(&it->second)) {
        return *value;
    }
    throw TypeMismatch(fmt::format("parameter '{}' has the wrong type", key));
}

/// Numeric keyword parameter; accepts an Index or a double.
[[nodiscard]] std::optional<double> number_param(const Params& params, std::string_view key);

/// Keyword parameter of type T that must be present (TypeMismatch otherwise).
template <typename T>
[[nodiscard]] T require_param(const Params& params, std::string_view key) {
    if (auto value = param<T>(params, key)) {
        return *value;
    }
    throw TypeMismatch(fmt::format("missing required parameter '{}'", key));
}

/// An operand as a nominal/error pair; a plain operand gets a zero error.
[[nodiscard]] propagation::UncertaintyOperand as_uncertain(const propagation::Operand& operand);

/// An operand as a plain array. An uncertain operand is downcast under
/// `policy` (warning, DowncastError or silently).
[[nodiscard]] NDArray as_plain(const propagation::Operand& operand, DowncastPolicy policy);

} // namespace aunc
