/// @file src/uncertainty/array_protocol.cpp
/// @brief Array-protocol methods and the forwarded capability table.

#include "aunc/uncertainty.hpp"
#include "aunc/constants.hpp"
#include "aunc/errors.hpp"
#include "aunc/propagation.hpp"

#include <fmt/format.h>

#include <array>
#include <functional>
#include <utility>

namespace aunc {

// ─── Structural Operations ────────────────────────────────────────────────────

Uncertainty Uncertainty::clip(std::optional<double> lo, std::optional<double> hi) const {
    auto c = propagation::clip(propagation::UncertaintyOperand{nominal_, error_}, lo, hi);
    return Uncertainty(std::move(c.nominal), std::move(c.error));
}

void Uncertainty::fill(double value) {
    if (is_scalar()) {
        throw AttributeUnavailable("a scalar-backed Uncertainty has no fill");
    }
    nominal_.fill(value);
}

void Uncertainty::fill(const Uncertainty& value) {
    if (is_scalar()) {
        throw AttributeUnavailable("a scalar-backed Uncertainty has no fill");
    }
    if (value.size() != 1) {
        throw ShapeMismatch(fmt::format("fill requires a single-element value; got shape {}",
                                        shape_string(value.shape())));
    }
    nominal_.fill(value.nominal_.values()(0));
    error_.fill(value.error_.values()(0));
}

void Uncertainty::fill(const NDArray& /*values*/) {
    throw TypeMismatch("can only fill an Uncertainty with an Uncertainty or a plain number");
}

void Uncertainty::put(std::span<const Index> flat_indices, const Uncertainty& values) {
    if (is_scalar()) {
        throw AttributeUnavailable("a scalar-backed Uncertainty has no put");
    }
    // NDArray::put validates every position before writing, and the error
    // buffer has the nominal's size, so a failure leaves both untouched.
    nominal_.put(flat_indices, values.nominal_);
    error_.put(flat_indices, values.error_);
}

void Uncertainty::put(std::span<const Index> /*flat_indices*/, const NDArray& /*values*/) {
    throw TypeMismatch("can only put Uncertainties into an Uncertainty");
}

Uncertainty Uncertainty::real() const {
    return Uncertainty(nominal_.copy(), error_.copy());
}

Uncertainty Uncertainty::imag() const {
    return Uncertainty(NDArray::zeros_like(nominal_), NDArray::zeros_like(error_));
}

Uncertainty Uncertainty::transpose() const {
    return Uncertainty(nominal_.transpose(), error_.transpose());
}

Index Uncertainty::searchsorted(double v, Side side) const {
    return nominal_.searchsorted(v, side);
}

UncertaintyList Uncertainty::tolist() const {
    if (is_scalar()) {
        return UncertaintyList{copy()};
    }
    std::vector<UncertaintyList> items;
    items.reserve(static_cast<std::size_t>(length()));
    for (const Uncertainty element : *this) {
        items.push_back(element.tolist());
    }
    return UncertaintyList{std::move(items)};
}

// ─── Capability Table ─────────────────────────────────────────────────────────

namespace {

using Capability = std::function<NDArray(const NDArray&)>;

const std::array<std::pair<std::string_view, Capability>, 10>& capabilities() {
    static const std::array<std::pair<std::string_view, Capability>, 10> table{{
        {"sum",     [](const NDArray& a) { return a.sum(); }},
        {"mean",    [](const NDArray& a) { return a.mean(); }},
        {"min",     [](const NDArray& a) { return NDArray(a.min()); }},
        {"max",     [](const NDArray& a) { return NDArray(a.max()); }},
        {"prod",    [](const NDArray& a) { return NDArray(a.prod()); }},
        {"argmin",  [](const NDArray& a) { return NDArray(static_cast<double>(a.argmin())); }},
        {"argmax",  [](const NDArray& a) { return NDArray(static_cast<double>(a.argmax())); }},
        {"cumsum",  [](const NDArray& a) { return a.cumsum(); }},
        {"ravel",   [](const NDArray& a) { return a.ravel(); }},
        {"flatten", [](const NDArray& a) { return a.ravel(); }},
    }};
    return table;
}

} // namespace

NDArray Uncertainty::attribute(std::string_view name) const {
    if (name.starts_with(constants::ARRAY_PROTOCOL_PREFIX)) {
        throw AttributeUnavailable(fmt::format("array protocol attribute {} not available", name));
    }
    for (const auto& [known, apply] : capabilities()) {
        if (known == name) {
            return apply(nominal_);
        }
    }
    throw AttributeUnavailable(fmt::format("method {} is not available on the nominal array", name));
}

} // namespace aunc
