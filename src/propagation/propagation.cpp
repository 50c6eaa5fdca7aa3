/// @file src/propagation/propagation.cpp
/// @brief Implementation of the first-order propagation laws.

#include "aunc/propagation.hpp"

#include <cmath>
#include <numbers>

namespace aunc::propagation {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Fresh error buffer broadcast to the nominal's shape, so results never
/// alias the storage of their inputs.
NDArray fit(const NDArray& error, const NDArray& nominal) {
    return error.broadcast_to(nominal.shape());
}

Components zero_error(NDArray nominal) {
    NDArray error = NDArray::zeros_like(nominal);
    return Components{std::move(nominal), std::move(error)};
}

/// Floor of the quotient.
double floored_quotient(double a, double b) {
    return std::floor(a / b);
}

/// Floored modulo: the result takes the sign of the divisor.
double floored_mod(double a, double b) {
    double r = std::fmod(a, b);
    if (r != 0.0 && ((r < 0.0) != (b < 0.0))) {
        r += b;
    }
    return r;
}

/// Apply a unary law: nominal f(x), error |f'(x)|·ex. An exact element
/// (ex == 0) keeps error 0 even where f' diverges.
template <typename F, typename D>
Components unary(const UncertaintyOperand& x, F f, D derivative) {
    NDArray nominal = x.nominal.map(f);
    NDArray error   = NDArray::zip(x.nominal, x.error, [derivative](double v, double e) {
        return e != 0.0 ? std::abs(derivative(v)) * e : 0.0;
    });
    NDArray fitted  = fit(error, nominal);
    return Components{std::move(nominal), std::move(fitted)};
}

} // namespace

// ─── Operands ─────────────────────────────────────────────────────────────────

NDArray nominal_of(const Operand& operand) {
    if (const auto* u = std::get_if<UncertaintyOperand>(&operand)) {
        return u->nominal;
    }
    return std::get<ScalarOperand>(operand).value;
}

NDArray error_of(const Operand& operand) {
    if (const auto* u = std::get_if<UncertaintyOperand>(&operand)) {
        return u->error;
    }
    return NDArray::zeros_like(std::get<ScalarOperand>(operand).value);
}

NDArray quadrature(const NDArray& a, const NDArray& b) {
    return NDArray::zip(a, b, [](double x, double y) { return std::hypot(x, y); });
}

// ─── Operator Laws ────────────────────────────────────────────────────────────

Components add(const UncertaintyOperand& x, const Operand& y) {
    if (const auto* u = std::get_if<UncertaintyOperand>(&y)) {
        NDArray nominal = x.nominal + u->nominal;
        return Components{nominal, fit(quadrature(x.error, u->error), nominal)};
    }
    NDArray nominal = x.nominal + std::get<ScalarOperand>(y).value;
    return Components{nominal, fit(x.error, nominal)};
}

Components subtract(const UncertaintyOperand& x, const Operand& y) {
    if (const auto* u = std::get_if<UncertaintyOperand>(&y)) {
        NDArray nominal = x.nominal - u->nominal;
        return Components{nominal, fit(quadrature(x.error, u->error), nominal)};
    }
    NDArray nominal = x.nominal - std::get<ScalarOperand>(y).value;
    return Components{nominal, fit(x.error, nominal)};
}

Components reverse_subtract(const UncertaintyOperand& x, const ScalarOperand& y) {
    NDArray nominal = y.value - x.nominal;
    return Components{nominal, fit(x.error, nominal)};
}

Components multiply(const UncertaintyOperand& x, const Operand& y) {
    if (const auto* u = std::get_if<UncertaintyOperand>(&y)) {
        NDArray nominal = x.nominal * u->nominal;
        NDArray error   = quadrature(x.error * u->nominal, x.nominal * u->error);
        return Components{nominal, fit(error, nominal)};
    }
    const NDArray& k = std::get<ScalarOperand>(y).value;
    NDArray nominal = x.nominal * k;
    NDArray error   = NDArray::zip(x.error, k, [](double e, double s) { return e * std::abs(s); });
    return Components{nominal, fit(error, nominal)};
}

Components divide(const UncertaintyOperand& x, const Operand& y) {
    if (const auto* u = std::get_if<UncertaintyOperand>(&y)) {
        NDArray nominal = x.nominal / u->nominal;
        // σ = √((ex/y)² + (x·ey/y²)²)
        NDArray from_x  = x.error / u->nominal;
        NDArray from_y  = (x.nominal * u->error) / (u->nominal * u->nominal);
        return Components{nominal, fit(quadrature(from_x, from_y), nominal)};
    }
    const NDArray& k = std::get<ScalarOperand>(y).value;
    NDArray nominal = x.nominal / k;
    NDArray error   = NDArray::zip(x.error, k, [](double e, double s) { return e / std::abs(s); });
    return Components{nominal, fit(error, nominal)};
}

Components reverse_divide(const UncertaintyOperand& x, const ScalarOperand& y) {
    NDArray nominal = y.value / x.nominal;
    // |k/x|·|ex/x| == |k|·ex / x²
    NDArray scale = NDArray::zip(y.value, x.nominal, [](double k, double v) {
        return std::abs(k) / (v * v);
    });
    return Components{nominal, fit(scale * x.error, nominal)};
}

Components negate(const UncertaintyOperand& x) {
    NDArray nominal = -x.nominal;
    return Components{nominal, fit(x.error, nominal)};
}

Components positive(const UncertaintyOperand& x) {
    NDArray nominal = x.nominal.copy();
    return Components{nominal, fit(x.error, nominal)};
}

Components absolute(const UncertaintyOperand& x) {
    NDArray nominal = x.nominal.map([](double v) { return std::abs(v); });
    return Components{nominal, fit(x.error, nominal)};
}

Components round(const UncertaintyOperand& x, int ndigits) {
    const double scale = std::pow(10.0, ndigits);
    NDArray nominal = x.nominal.map([scale](double v) {
        // nearbyint honours the default round-half-to-even mode.
        return std::nearbyint(v * scale) / scale;
    });
    return Components{nominal, fit(x.error, nominal)};
}

Components power(const UncertaintyOperand& x, const Operand& y) {
    return zero_error(NDArray::zip(x.nominal, nominal_of(y),
                                   [](double a, double b) { return std::pow(a, b); }));
}

Components reverse_power(const UncertaintyOperand& x, const ScalarOperand& y) {
    return zero_error(NDArray::zip(y.value, x.nominal,
                                   [](double a, double b) { return std::pow(a, b); }));
}

Components floor_divide(const UncertaintyOperand& x, const Operand& y) {
    return zero_error(NDArray::zip(x.nominal, nominal_of(y), [](double a, double b) { return floored_quotient(a, b); }));
}

Components reverse_floor_divide(const UncertaintyOperand& x, const ScalarOperand& y) {
    return zero_error(NDArray::zip(y.value, x.nominal, [](double a, double b) { return floored_quotient(a, b); }));
}

Components modulo(const UncertaintyOperand& x, const Operand& y) {
    return zero_error(NDArray::zip(x.nominal, nominal_of(y), [](double a, double b) { return floored_mod(a, b); }));
}

Components reverse_modulo(const UncertaintyOperand& x, const ScalarOperand& y) {
    return zero_error(NDArray::zip(y.value, x.nominal, [](double a, double b) { return floored_mod(a, b); }));
}

// ─── First-Order Function Laws ────────────────────────────────────────────────

Components power_first_order(const Operand& x, const Operand& y) {
    const NDArray base_nom = nominal_of(x);
    const NDArray base_err = error_of(x);
    const NDArray exp_nom  = nominal_of(y);
    const NDArray exp_err  = error_of(y);

    const Shape out = broadcast_shapes(base_nom.shape(), exp_nom.shape());
    const NDArray bx = base_nom.broadcast_to(out);
    const NDArray ex = base_err.broadcast_to(out);
    const NDArray by = exp_nom.broadcast_to(out);
    const NDArray ey = exp_err.broadcast_to(out);

    Eigen::ArrayXd nominal(bx.size());
    Eigen::ArrayXd error(bx.size());
    for (Index i = 0; i < bx.size(); ++i) {
        const double a = bx.values()(i);
        const double b = by.values()(i);
        const double p = std::pow(a, b);
        // d/da a^b = b·a^(b−1). A term with a zero factor contributes 0, which
        // avoids 0·inf at a = 0.
        const double from_base = (ex.values()(i) != 0.0 && b != 0.0)
                                     ? b * std::pow(a, b - 1.0) * ex.values()(i)
                                     : 0.0;
        const double from_exp  = ey.values()(i) != 0.0 ? p * std::log(a) * ey.values()(i) : 0.0;
        nominal(i) = p;
        error(i)   = std::hypot(from_base, from_exp);
    }
    return Components{NDArray(out, std::move(nominal)), NDArray(out, std::move(error))};
}

Components square(const UncertaintyOperand& x) {
    return unary(x, [](double v) { return v * v; }, [](double v) { return 2.0 * v; });
}

Components sqrt(const UncertaintyOperand& x) {
    return unary(x, [](double v) { return std::sqrt(v); },
                 [](double v) { return 0.5 / std::sqrt(v); });
}

Components exp(const UncertaintyOperand& x) {
    return unary(x, [](double v) { return std::exp(v); }, [](double v) { return std::exp(v); });
}

Components log(const UncertaintyOperand& x) {
    return unary(x, [](double v) { return std::log(v); }, [](double v) { return 1.0 / v; });
}

Components log10(const UncertaintyOperand& x) {
    return unary(x, [](double v) { return std::log10(v); },
                 [](double v) { return 1.0 / (v * std::numbers::ln10); });
}

Components sin(const UncertaintyOperand& x) {
    return unary(x, [](double v) { return std::sin(v); }, [](double v) { return std::cos(v); });
}

Components cos(const UncertaintyOperand& x) {
    return unary(x, [](double v) { return std::cos(v); }, [](double v) { return std::sin(v); });
}

Components tan(const UncertaintyOperand& x) {
    return unary(x, [](double v) { return std::tan(v); }, [](double v) {
        const double c = std::cos(v);
        return 1.0 / (c * c);
    });
}

// ─── Reductions ───────────────────────────────────────────────────────────────

Components sum(const UncertaintyOperand& x, std::optional<Index> axis) {
    NDArray nominal  = x.nominal.sum(axis);
    NDArray variance = (x.error * x.error).sum(axis);
    return Components{nominal, variance.map([](double v) { return std::sqrt(v); })};
}

Components mean(const UncertaintyOperand& x, std::optional<Index> axis) {
    const auto n = static_cast<double>(x.nominal.reduced_count(axis));
    NDArray nominal  = x.nominal.mean(axis);
    NDArray variance = (x.error * x.error).sum(axis);
    return Components{nominal, variance.map([n](double v) { return std::sqrt(v) / n; })};
}

Components clip(const UncertaintyOperand& x, std::optional<double> lo, std::optional<double> hi) {
    NDArray nominal = x.nominal.clip(lo, hi);
    return Components{nominal, fit(x.error, nominal)};
}

} // namespace aunc::propagation
