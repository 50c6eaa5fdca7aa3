#pragma once

/// @file include/aunc/propagation.hpp
/// @brief First-order error-propagation laws for independent quantities.
///
/// # Module: Propagation Engine
///
/// ## Responsibility
/// Every law is a pure function from nominal/error components to the
/// components of the result. Operands arrive as a tagged variant, resolved
/// once per call:
///   - `ScalarOperand`     : a plain number or array (error is zero)
///   - `UncertaintyOperand`: a nominal/error pair
///
/// ## Laws (X = first operand, Y = second operand)
///   add / subtract    x ± y        √(ex² + ey²)
///   multiply          x · y        √((ex·y)² + (x·ey)²)   = |xy|·√((ex/x)²+(ey/y)²)
///   divide            x / y        √((ex/y)² + (x·ey/y²)²) = |x/y|·√((ex/x)²+(ey/y)²)
///   reverse divide    k / x        |k|·ex / x²             = |k/x|·|ex/x|
///   negate, absolute  −x, |x|      ex
///   power, floor divide, modulo    error 0 (operator limitation)
///
/// The product/quotient forms are written without dividing by x or y so a
/// zero nominal yields a finite error rather than NaN.
///
/// ## Guarantees
/// - Results always carry an error of the same shape as the nominal
/// - Propagated errors are non-negative (or NaN for NaN inputs)
/// - Operands broadcast under numpy rules; incompatible shapes throw
///   ShapeMismatch
///
/// ## NOT Responsible For
/// - Validation of constructed values (see uncertainty.hpp)
/// - Correlated operands: independence is always assumed

#include "aunc/ndarray.hpp"
#include "aunc/types.hpp"

#include <optional>
#include <variant>

namespace aunc::propagation {

// ─── Operands ─────────────────────────────────────────────────────────────────

/// A plain number or array without an error.
struct ScalarOperand {
    NDArray value;
};

/// A nominal value paired with its (non-negative) error.
struct UncertaintyOperand {
    NDArray nominal;
    NDArray error;
};

using Operand = std::variant<ScalarOperand, UncertaintyOperand>;

/// Result components of a propagation law.
using Components = UncertaintyOperand;

/// Nominal part of an operand.
[[nodiscard]] NDArray nominal_of(const Operand& operand);

/// Error part of an operand; zeros shaped like the value for a ScalarOperand.
[[nodiscard]] NDArray error_of(const Operand& operand);

/// Quadrature sum √(a² + b²), broadcasting.
[[nodiscard]] NDArray quadrature(const NDArray& a, const NDArray& b);

// ─── Operator Laws ────────────────────────────────────────────────────────────

[[nodiscard]] Components add(const UncertaintyOperand& x, const Operand& y);
[[nodiscard]] Components subtract(const UncertaintyOperand& x, const Operand& y);

/// y − x for a plain y.
[[nodiscard]] Components reverse_subtract(const UncertaintyOperand& x, const ScalarOperand& y);

[[nodiscard]] Components multiply(const UncertaintyOperand& x, const Operand& y);
[[nodiscard]] Components divide(const UncertaintyOperand& x, const Operand& y);

/// y / x for a plain y.
[[nodiscard]] Components reverse_divide(const UncertaintyOperand& x, const ScalarOperand& y);

[[nodiscard]] Components negate(const UncertaintyOperand& x);
[[nodiscard]] Components positive(const UncertaintyOperand& x);
[[nodiscard]] Components absolute(const UncertaintyOperand& x);

/// Round the nominal to `ndigits` decimals (half to even); error kept.
[[nodiscard]] Components round(const UncertaintyOperand& x, int ndigits);

/// x ** y with zero error. The operator does not propagate through powers;
/// see `power_first_order` for the propagated form.
[[nodiscard]] Components power(const UncertaintyOperand& x, const Operand& y);

/// y ** x for a plain y, zero error.
[[nodiscard]] Components reverse_power(const UncertaintyOperand& x, const ScalarOperand& y);

/// ⌊x / y⌋ with zero error.
[[nodiscard]] Components floor_divide(const UncertaintyOperand& x, const Operand& y);

/// ⌊y / x⌋ for a plain y, zero error.
[[nodiscard]] Components reverse_floor_divide(const UncertaintyOperand& x, const ScalarOperand& y);

/// x mod y (result takes the sign of y) with zero error.
[[nodiscard]] Components modulo(const UncertaintyOperand& x, const Operand& y);

/// y mod x for a plain y, zero error.
[[nodiscard]] Components reverse_modulo(const UncertaintyOperand& x, const ScalarOperand& y);

// ─── First-Order Function Laws ────────────────────────────────────────────────
//
// Each law scales the input error by |f'(x)|; two-argument laws add the
// per-argument contributions in quadrature.

/// x ** y with σ = √((y·x^(y−1)·ex)² + (x^y·ln x·ey)²).
/// The ln x term only enters where ey ≠ 0.
[[nodiscard]] Components power_first_order(const Operand& x, const Operand& y);

[[nodiscard]] Components square(const UncertaintyOperand& x);
[[nodiscard]] Components sqrt(const UncertaintyOperand& x);
[[nodiscard]] Components exp(const UncertaintyOperand& x);
[[nodiscard]] Components log(const UncertaintyOperand& x);
[[nodiscard]] Components log10(const UncertaintyOperand& x);
[[nodiscard]] Components sin(const UncertaintyOperand& x);
[[nodiscard]] Components cos(const UncertaintyOperand& x);
[[nodiscard]] Components tan(const UncertaintyOperand& x);

// ─── Reductions ───────────────────────────────────────────────────────────────

/// Σx with σ = √(Σ ex²), over everything or one axis.
[[nodiscard]] Components sum(const UncertaintyOperand& x, std::optional<Index> axis);

/// Mean with σ = √(Σ ex²) / n.
[[nodiscard]] Components mean(const UncertaintyOperand& x, std::optional<Index> axis);

/// Clip the nominal to [lo, hi]; the error is carried unchanged.
[[nodiscard]] Components clip(const UncertaintyOperand& x,
                              std::optional<double> lo,
                              std::optional<double> hi);

} // namespace aunc::propagation
