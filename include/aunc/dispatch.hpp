#pragma once

/// @file include/aunc/dispatch.hpp
/// @brief Dispatcher: routes generic numeric calls through propagation rules.
///
/// # Module: Operation Dispatcher
///
/// ## Responsibility
/// Accept a `Call` made through the generic numeric surface (a free
/// function or a ufunc) and:
///   1. reject ufunc methods other than a plain call (UnsupportedBroadcastMode)
///   2. find the uncertainty-capable argument types; with none the call is
///      not ours, with more than one it fails (UnsupportedOperation)
///   3. look the operation up in the registry for the call kind
///   4. apply the rule to the nominal and error arguments and reassemble
///      a new Uncertainty
///
/// Operations without a rule are never approximated: `dispatch()` reports
/// them as not implemented (`nullopt`) and `invoke()` throws.
///
/// ## Usage
/// ```cpp
/// const auto registry = aunc::make_default_registry();
/// aunc::Dispatcher dispatcher(registry);
/// auto r = dispatcher.ufunc("sqrt", {aunc::Uncertainty(4.0, 0.4)}); // 2 +/- 0.1
/// ```
///
/// ## Guarantees
/// - The registry is borrowed and must outlive the Dispatcher
/// - const and re-entrant; verbose tracing writes to stderr

#include "aunc/config.hpp"
#include "aunc/registry.hpp"
#include "aunc/uncertainty.hpp"

#include <optional>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <vector>

namespace aunc {

/// True for argument types that carry an uncertainty.
template <typename T>
struct is_uncertainty_capable : std::false_type {};

template <>
struct is_uncertainty_capable<Uncertainty> : std::true_type {};

// ─── Dispatcher ───────────────────────────────────────────────────────────────

class Dispatcher {
public:
    explicit Dispatcher(const OperationRegistry& registry, DispatchConfig config = DispatchConfig{});

    /// Route `call` to its rule.
    ///
    /// # Returns
    /// The propagated result, or `nullopt` ("not implemented") when no
    /// argument carries an uncertainty or no rule is registered.
    ///
    /// # Errors
    /// - UnsupportedBroadcastMode for a ufunc method other than `call`
    /// - UnsupportedOperation when several capable types are mixed
    /// - TypeMismatch for a wrong argument count or an unknown keyword
    /// - whatever the rule raises (ShapeMismatch, ...)
    [[nodiscard]] std::optional<Uncertainty> dispatch(const Call& call) const;

    /// Like `dispatch`, but "not implemented" throws UnsupportedOperation.
    [[nodiscard]] Uncertainty invoke(const Call& call) const;

    /// Shorthand for invoking a ufunc.
    [[nodiscard]] Uncertainty ufunc(std::string_view name, std::vector<Argument> args,
                                    UfuncMethod method = UfuncMethod::call) const;

    /// Shorthand for invoking a free function.
    [[nodiscard]] Uncertainty function(std::string_view name, std::vector<Argument> args,
                                       Params params = {}) const;

    [[nodiscard]] const DispatchConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] static std::vector<std::type_index> capable_types(const Call& call);

    [[nodiscard]] Uncertainty apply(const Rule& rule, const Call& call) const;

    const OperationRegistry& registry_;
    DispatchConfig           config_;
};

} // namespace aunc
