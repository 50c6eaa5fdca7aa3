/// @file src/dispatch/default_rules.cpp
/// @brief The first-order rules installed by make_default_registry().

#include "aunc/registry.hpp"

#include <cmath>
#include <limits>

namespace aunc {

namespace prop = propagation;

namespace {

using Operands = std::span<const prop::Operand>;
using Arrays   = std::span<const NDArray>;

bool is_uncertain(const prop::Operand& operand) {
    return std::holds_alternative<prop::UncertaintyOperand>(operand);
}

/// Two-operand law where either side may be the plain one.
/// `law(x, y)` handles an uncertain x; `reverse(y, x)` an uncertain y with
/// a plain x.
template <typename Law, typename Reverse>
ClosedFormRule binary(Law law, Reverse reverse) {
    return [law, reverse](Operands ops, const RuleContext&) {
        if (is_uncertain(ops[0])) {
            return law(std::get<prop::UncertaintyOperand>(ops[0]), ops[1]);
        }
        return reverse(std::get<prop::UncertaintyOperand>(ops[1]),
                       std::get<prop::ScalarOperand>(ops[0]));
    };
}

template <typename Law>
ClosedFormRule unary(Law law) {
    return [law](Operands ops, const RuleContext&) { return law(as_uncertain(ops[0])); };
}

std::optional<double> bound(Operands ops, std::size_t i, const RuleContext& ctx, std::string_view key) {
    if (ops.size() > i) {
        const NDArray plain = as_plain(ops[i], ctx.downcast);
        if (plain.size() != 1) {
            throw TypeMismatch(fmt::format("clip bound '{}' must be a single number", key));
        }
        const double v = plain.values()(0);
        return std::isnan(v) ? std::nullopt : std::optional<double>(v);
    }
    return number_param(ctx.params, key);
}

void register_ufuncs(OperationRegistry& r) {
    const Arity one{1, 1};
    const Arity two{2, 2};
    const CallKind u = CallKind::ufunc;

    const auto add = binary(
        [](const prop::UncertaintyOperand& x, const prop::Operand& y) { return prop::add(x, y); },
        [](const prop::UncertaintyOperand& y, const prop::ScalarOperand& x) { return prop::add(y, x); });
    const auto multiply = binary(
        [](const prop::UncertaintyOperand& x, const prop::Operand& y) { return prop::multiply(x, y); },
        [](const prop::UncertaintyOperand& y, const prop::ScalarOperand& x) { return prop::multiply(y, x); });
    const auto divide = binary(
        [](const prop::UncertaintyOperand& x, const prop::Operand& y) { return prop::divide(x, y); },
        [](const prop::UncertaintyOperand& y, const prop::ScalarOperand& x) { return prop::reverse_divide(y, x); });

    r.register_closed_form(u, "add", two, {}, add);
    r.register_closed_form(u, "subtract", two, {}, binary(
        [](const prop::UncertaintyOperand& x, const prop::Operand& y) { return prop::subtract(x, y); },
        [](const prop::UncertaintyOperand& y, const prop::ScalarOperand& x) { return prop::reverse_subtract(y, x); }));
    r.register_closed_form(u, "multiply", two, {}, multiply);
    r.register_closed_form(u, "divide", two, {}, divide);
    r.register_closed_form(u, "true_divide", two, {}, divide);
    r.register_closed_form(u, "floor_divide", two, {}, binary(
        [](const prop::UncertaintyOperand& x, const prop::Operand& y) { return prop::floor_divide(x, y); },
        [](const prop::UncertaintyOperand& y, const prop::ScalarOperand& x) { return prop::reverse_floor_divide(y, x); }));
    r.register_closed_form(u, "remainder", two, {}, binary(
        [](const prop::UncertaintyOperand& x, const prop::Operand& y) { return prop::modulo(x, y); },
        [](const prop::UncertaintyOperand& y, const prop::ScalarOperand& x) { return prop::reverse_modulo(y, x); }));
    r.register_closed_form(u, "power", two, {}, [](Operands ops, const RuleContext&) {
        return prop::power_first_order(ops[0], ops[1]);
    });

    r.register_closed_form(u, "negative", one, {}, unary([](const auto& x) { return prop::negate(x); }));
    r.register_closed_form(u, "positive", one, {}, unary([](const auto& x) { return prop::positive(x); }));
    r.register_closed_form(u, "absolute", one, {}, unary([](const auto& x) { return prop::absolute(x); }));
    r.register_closed_form(u, "square", one, {}, unary([](const auto& x) { return prop::square(x); }));
    r.register_closed_form(u, "sqrt", one, {}, unary([](const auto& x) { return prop::sqrt(x); }));
    r.register_closed_form(u, "exp", one, {}, unary([](const auto& x) { return prop::exp(x); }));
    r.register_closed_form(u, "log", one, {}, unary([](const auto& x) { return prop::log(x); }));
    r.register_closed_form(u, "log10", one, {}, unary([](const auto& x) { return prop::log10(x); }));
    r.register_closed_form(u, "sin", one, {}, unary([](const auto& x) { return prop::sin(x); }));
    r.register_closed_form(u, "cos", one, {}, unary([](const auto& x) { return prop::cos(x); }));
    r.register_closed_form(u, "tan", one, {}, unary([](const auto& x) { return prop::tan(x); }));
}

void register_closed_form_functions(OperationRegistry& r) {
    const CallKind f = CallKind::function;

    r.register_closed_form(f, "sum", {1, 1}, {"axis"}, [](Operands ops, const RuleContext& ctx) {
        return prop::sum(as_uncertain(ops[0]), param<Index>(ctx.params, "axis"));
    });
    r.register_closed_form(f, "mean", {1, 1}, {"axis"}, [](Operands ops, const RuleContext& ctx) {
        return prop::mean(as_uncertain(ops[0]), param<Index>(ctx.params, "axis"));
    });
    r.register_closed_form(f, "clip", {1, 3}, {"a_min", "a_max"}, [](Operands ops, const RuleContext& ctx) {
        const auto lo = bound(ops, 1, ctx, "a_min");
        const auto hi = bound(ops, 2, ctx, "a_max");
        return prop::clip(as_uncertain(ops[0]), lo, hi);
    });
    r.register_closed_form(f, "round", {1, 1}, {"decimals"}, [](Operands ops, const RuleContext& ctx) {
        const Index decimals = param<Index>(ctx.params, "decimals").value_or(0);
        return prop::round(as_uncertain(ops[0]), static_cast<int>(decimals));
    });
}

void register_pass_through_functions(OperationRegistry& r) {
    const CallKind f = CallKind::function;
    const Arity    one{1, 1};

    r.register_pass_through(f, "reshape", one, {"shape"}, [](Arrays a, const RuleContext& ctx) {
        return a[0].reshape(require_param<Shape>(ctx.params, "shape"));
    });
    r.register_pass_through(f, "transpose", one, {"axes"}, [](Arrays a, const RuleContext& ctx) {
        const auto axes = param<Shape>(ctx.params, "axes");
        return axes ? a[0].transpose(*axes) : a[0].transpose();
    });
    r.register_pass_through(f, "ravel", one, {}, [](Arrays a, const RuleContext&) {
        return a[0].ravel();
    });
    r.register_pass_through(f, "squeeze", one, {}, [](Arrays a, const RuleContext&) {
        return a[0].squeeze();
    });
    r.register_pass_through(f, "expand_dims", one, {"axis"}, [](Arrays a, const RuleContext& ctx) {
        return a[0].expand_dims(require_param<Index>(ctx.params, "axis"));
    });
    r.register_pass_through(f, "concatenate", {1, std::numeric_limits<std::size_t>::max()}, {"axis"}, [](Arrays a, const RuleContext& ctx) {
        return NDArray::concatenate(a, param<Index>(ctx.params, "axis").value_or(0));
    });
    r.register_pass_through(f, "copy", one, {}, [](Arrays a, const RuleContext&) {
        return a[0].copy();
    });
    r.register_pass_through(f, "flip", one, {"axis"}, [](Arrays a, const RuleContext& ctx) {
        return a[0].flip(param<Index>(ctx.params, "axis"));
    });
    r.register_pass_through(f, "broadcast_to", one, {"shape"}, [](Arrays a, const RuleContext& ctx) {
        return a[0].broadcast_to(require_param<Shape>(ctx.params, "shape"));
    });
    r.register_pass_through(f, "real", one, {}, [](Arrays a, const RuleContext&) {
        return a[0].copy();
    });
    r.register_pass_through(f, "imag", one, {}, [](Arrays a, const RuleContext&) {
        return NDArray::zeros_like(a[0]);
    });
}

} // namespace

OperationRegistry make_default_registry() {
    OperationRegistry registry;
    register_ufuncs(registry);
    register_closed_form_functions(registry);
    register_pass_through_functions(registry);
    return registry;
}

} // namespace aunc
