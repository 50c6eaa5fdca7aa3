/// @file src/uncertainty/operators.cpp
/// @brief Arithmetic, in-place and comparison operators for Uncertainty.
///
/// Each operator resolves its operands to propagation::Operand once and
/// hands them to the matching law in propagation.hpp.

#include "aunc/uncertainty.hpp"
#include "aunc/errors.hpp"
#include "aunc/propagation.hpp"

#include <fmt/format.h>

namespace aunc {

namespace prop = propagation;

namespace {

prop::UncertaintyOperand operand(const Uncertainty& u) {
    return prop::UncertaintyOperand{u.value(), u.error()};
}

prop::ScalarOperand plain(const NDArray& a) {
    return prop::ScalarOperand{a};
}

Uncertainty assemble(prop::Components c) {
    return Uncertainty(std::move(c.nominal), std::move(c.error));
}

} // namespace

// ─── Arithmetic ───────────────────────────────────────────────────────────────

Uncertainty operator+(const Uncertainty& x, const Uncertainty& y) {
    return assemble(prop::add(operand(x), operand(y)));
}
Uncertainty operator+(const Uncertainty& x, const NDArray& y) {
    return assemble(prop::add(operand(x), plain(y)));
}
Uncertainty operator+(const NDArray& x, const Uncertainty& y) {
    return assemble(prop::add(operand(y), plain(x)));
}

Uncertainty operator-(const Uncertainty& x, const Uncertainty& y) {
    return assemble(prop::subtract(operand(x), operand(y)));
}
Uncertainty operator-(const Uncertainty& x, const NDArray& y) {
    return assemble(prop::subtract(operand(x), plain(y)));
}
Uncertainty operator-(const NDArray& x, const Uncertainty& y) {
    return assemble(prop::reverse_subtract(operand(y), plain(x)));
}

Uncertainty operator*(const Uncertainty& x, const Uncertainty& y) {
    return assemble(prop::multiply(operand(x), operand(y)));
}
Uncertainty operator*(const Uncertainty& x, const NDArray& y) {
    return assemble(prop::multiply(operand(x), plain(y)));
}
Uncertainty operator*(const NDArray& x, const Uncertainty& y) {
    return assemble(prop::multiply(operand(y), plain(x)));
}

Uncertainty operator/(const Uncertainty& x, const Uncertainty& y) {
    return assemble(prop::divide(operand(x), operand(y)));
}
Uncertainty operator/(const Uncertainty& x, const NDArray& y) {
    return assemble(prop::divide(operand(x), plain(y)));
}
Uncertainty operator/(const NDArray& x, const Uncertainty& y) {
    return assemble(prop::reverse_divide(operand(y), plain(x)));
}

Uncertainty operator%(const Uncertainty& x, const Uncertainty& y) {
    return assemble(prop::modulo(operand(x), operand(y)));
}
Uncertainty operator%(const Uncertainty& x, const NDArray& y) {
    return assemble(prop::modulo(operand(x), plain(y)));
}
Uncertainty operator%(const NDArray& x, const Uncertainty& y) {
    return assemble(prop::reverse_modulo(operand(y), plain(x)));
}

Uncertainty operator-(const Uncertainty& x) {
    return assemble(prop::negate(operand(x)));
}

Uncertainty operator+(const Uncertainty& x) {
    return assemble(prop::positive(operand(x)));
}

Uncertainty pow(const Uncertainty& x, const Uncertainty& y) {
    return assemble(prop::power(operand(x), operand(y)));
}
Uncertainty pow(const Uncertainty& x, const NDArray& y) {
    return assemble(prop::power(operand(x), plain(y)));
}
Uncertainty pow(const NDArray& x, const Uncertainty& y) {
    return assemble(prop::reverse_power(operand(y), plain(x)));
}

Uncertainty floor_divide(const Uncertainty& x, const Uncertainty& y) {
    return assemble(prop::floor_divide(operand(x), operand(y)));
}
Uncertainty floor_divide(const Uncertainty& x, const NDArray& y) {
    return assemble(prop::floor_divide(operand(x), plain(y)));
}
Uncertainty floor_divide(const NDArray& x, const Uncertainty& y) {
    return assemble(prop::reverse_floor_divide(operand(y), plain(x)));
}

Uncertainty mod(const Uncertainty& x, const Uncertainty& y) { return x % y; }
Uncertainty mod(const Uncertainty& x, const NDArray& y) { return x % y; }
Uncertainty mod(const NDArray& x, const Uncertainty& y) { return x % y; }

std::pair<Uncertainty, Uncertainty> divmod(const Uncertainty& x, const Uncertainty& y) {
    return {floor_divide(x, y), x % y};
}
std::pair<Uncertainty, Uncertainty> divmod(const Uncertainty& x, const NDArray& y) {
    return {floor_divide(x, y), x % y};
}
std::pair<Uncertainty, Uncertainty> divmod(const NDArray& x, const Uncertainty& y) {
    return {floor_divide(x, y), x % y};
}

Uncertainty abs(const Uncertainty& x) {
    return assemble(prop::absolute(operand(x)));
}

Uncertainty round(const Uncertainty& x, int ndigits) {
    return assemble(prop::round(operand(x), ndigits));
}

// ─── In-Place Arithmetic ──────────────────────────────────────────────────────

Uncertainty& Uncertainty::update_in_place(Uncertainty result) {
    if (is_scalar()) {
        *this = std::move(result);
        return *this;
    }
    if (result.shape() != shape()) {
        throw ShapeMismatch(fmt::format(
            "in-place result of shape {} does not fit the receiver of shape {}",
            shape_string(result.shape()), shape_string(shape())));
    }
    nominal_.values() = result.nominal_.values();
    error_.values()   = result.error_.values();
    return *this;
}

Uncertainty& Uncertainty::operator+=(const Uncertainty& other) { return update_in_place(*this + other); }
Uncertainty& Uncertainty::operator+=(const NDArray& other) { return update_in_place(*this + other); }
Uncertainty& Uncertainty::operator-=(const Uncertainty& other) { return update_in_place(*this - other); }
Uncertainty& Uncertainty::operator-=(const NDArray& other) { return update_in_place(*this - other); }
Uncertainty& Uncertainty::operator*=(const Uncertainty& other) { return update_in_place(*this * other); }
Uncertainty& Uncertainty::operator*=(const NDArray& other) { return update_in_place(*this * other); }
Uncertainty& Uncertainty::operator/=(const Uncertainty& other) { return update_in_place(*this / other); }
Uncertainty& Uncertainty::operator/=(const NDArray& other) { return update_in_place(*this / other); }
Uncertainty& Uncertainty::operator%=(const Uncertainty& other) { return update_in_place(*this % other); }
Uncertainty& Uncertainty::operator%=(const NDArray& other) { return update_in_place(*this % other); }

// ─── Comparison ───────────────────────────────────────────────────────────────

namespace {

template <typename F>
Mask compare(const NDArray& a, const NDArray& b, F f) {
    return Mask::compare(a, b, f);
}

constexpr auto eq = [](double a, double b) { return a == b; };
constexpr auto ne = [](double a, double b) { return a != b; };
constexpr auto lt = [](double a, double b) { return a < b; };
constexpr auto le = [](double a, double b) { return a <= b; };
constexpr auto gt = [](double a, double b) { return a > b; };
constexpr auto ge = [](double a, double b) { return a >= b; };

} // namespace

Mask operator==(const Uncertainty& x, const Uncertainty& y) { return compare(x.value(), y.value(), eq); }
Mask operator==(const Uncertainty& x, const NDArray& y) { return compare(x.value(), y, eq); }
Mask operator==(const NDArray& x, const Uncertainty& y) { return compare(x, y.value(), eq); }

Mask operator!=(const Uncertainty& x, const Uncertainty& y) { return compare(x.value(), y.value(), ne); }
Mask operator!=(const Uncertainty& x, const NDArray& y) { return compare(x.value(), y, ne); }
Mask operator!=(const NDArray& x, const Uncertainty& y) { return compare(x, y.value(), ne); }

Mask operator<(const Uncertainty& x, const Uncertainty& y) { return compare(x.value(), y.value(), lt); }
Mask operator<(const Uncertainty& x, const NDArray& y) { return compare(x.value(), y, lt); }
Mask operator<(const NDArray& x, const Uncertainty& y) { return compare(x, y.value(), lt); }

Mask operator<=(const Uncertainty& x, const Uncertainty& y) { return compare(x.value(), y.value(), le); }
Mask operator<=(const Uncertainty& x, const NDArray& y) { return compare(x.value(), y, le); }
Mask operator<=(const NDArray& x, const Uncertainty& y) { return compare(x, y.value(), le); }

Mask operator>(const Uncertainty& x, const Uncertainty& y) { return compare(x.value(), y.value(), gt); }
Mask operator>(const Uncertainty& x, const NDArray& y) { return compare(x.value(), y, gt); }
Mask operator>(const NDArray& x, const Uncertainty& y) { return compare(x, y.value(), gt); }

Mask operator>=(const Uncertainty& x, const Uncertainty& y) { return compare(x.value(), y.value(), ge); }
Mask operator>=(const Uncertainty& x, const NDArray& y) { return compare(x.value(), y, ge); }
Mask operator>=(const NDArray& x, const Uncertainty& y) { return compare(x, y.value(), ge); }

// ─── Component Access ─────────────────────────────────────────────────────────

NDArray nominal_values(const Uncertainty& x) { return x.value(); }
NDArray nominal_values(const NDArray& x) { return x; }

NDArray std_devs(const Uncertainty& x) { return x.error(); }
NDArray std_devs(const NDArray& x) { return NDArray::zeros_like(x); }

} // namespace aunc
