/// @file src/uncertainty/uncertainty.cpp
/// @brief Construction, accessors, conversions, indexing and iteration.

#include "aunc/uncertainty.hpp"
#include "aunc/diagnostics.hpp"
#include "aunc/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>

namespace aunc {

namespace {

void validate(const NDArray& nominal, const NDArray& error) {
    if (nominal.shape() != error.shape()) {
        throw ShapeMismatch(fmt::format("nominal shape {} does not match error shape {}",
                                        shape_string(nominal.shape()),
                                        shape_string(error.shape())));
    }
    // NaN compares false and is tolerated.
    if ((error.values() < 0.0).any()) {
        throw NegativeErrorValue("found negative value for the standard deviation");
    }
}

double single_nominal(const NDArray& nominal, std::string_view target) {
    if (nominal.size() != 1) {
        throw ConversionUnsupported(fmt::format(
            "only single-element values can be converted to {}; got shape {}",
            target, shape_string(nominal.shape())));
    }
    return nominal.values()(0);
}

} // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

Uncertainty::Uncertainty(NDArray nominal, NDArray error)
    : nominal_(std::move(nominal)), error_(std::move(error)) {
    validate(nominal_, error_);
    // In-place updates write both buffers; they must be distinct.
    if (error_.shares_storage_with(nominal_)) {
        error_ = error_.copy();
    }
}

Uncertainty::Uncertainty(double nominal, double error)
    : Uncertainty(NDArray(nominal), NDArray(error)) {}

Uncertainty Uncertainty::from_sequence(std::span<const Uncertainty> items) {
    const auto n = static_cast<Index>(items.size());
    Eigen::ArrayXd nominal(n);
    Eigen::ArrayXd error(n);

    for (Index i = 0; i < n; ++i) {
        const Uncertainty& item = items[static_cast<std::size_t>(i)];
        if (!item.is_scalar()) {
            throw TypeMismatch(fmt::format(
                "from_sequence requires scalar items; item {} has shape {}",
                i, shape_string(item.shape())));
        }
        nominal(i) = item.nominal_.values()(0);
        error(i)   = item.error_.values()(0);
    }
    return Uncertainty(NDArray(Shape{n}, std::move(nominal)), NDArray(Shape{n}, std::move(error)));
}

// ─── Accessors ────────────────────────────────────────────────────────────────

NDArray Uncertainty::relative() const {
    return NDArray::zip(error_, nominal_, [](double e, double v) {
        return v != 0.0 ? e / v : std::numeric_limits<double>::quiet_NaN();
    });
}

void Uncertainty::set_shape(Shape shape) {
    // The nominal validates first; the error has the same size and cannot fail.
    nominal_.set_shape(shape);
    error_.set_shape(std::move(shape));
}

Uncertainty Uncertainty::copy() const {
    return Uncertainty(nominal_.copy(), error_.copy());
}

bool Uncertainty::shares_storage_with(const Uncertainty& other) const noexcept {
    return nominal_.shares_storage_with(other.nominal_) || error_.shares_storage_with(other.error_);
}

// ─── Conversions ──────────────────────────────────────────────────────────────

double Uncertainty::to_double() const {
    return single_nominal(nominal_, "float");
}

long long Uncertainty::to_int() const {
    const double v = single_nominal(nominal_, "int");
    if (!std::isfinite(v)) {
        throw ConversionUnsupported(fmt::format("cannot convert {} to an integer", v));
    }
    return static_cast<long long>(std::trunc(v));
}

std::complex<double> Uncertainty::to_complex() const {
    return {single_nominal(nominal_, "complex"), 0.0};
}

Uncertainty::operator bool() const {
    if (nominal_.size() != 1) {
        throw ConversionUnsupported(
            "the truth value of an array with more than one element is ambiguous");
    }
    return nominal_.values()(0) != 0.0;
}

NDArray Uncertainty::to_array(DowncastPolicy policy) const {
    switch (policy) {
        case DowncastPolicy::raise:
            throw DowncastError("the uncertainty would be stripped by converting to a plain array");
        case DowncastPolicy::warn:
            diagnostics::warn(diagnostics::WarningKind::downcast,
                              "the uncertainty is stripped when downcasting to a plain array");
            break;
        case DowncastPolicy::silent:
            break;
    }
    return nominal_;
}

// ─── Indexing ─────────────────────────────────────────────────────────────────

Uncertainty Uncertainty::get(const Key& key) const {
    return Uncertainty(nominal_.index(key), error_.index(key));
}

Uncertainty Uncertainty::operator[](Index i) const {
    return get(Key{i});
}

void Uncertainty::set(const Key& key, const Uncertainty& value) {
    // Validate the key and the broadcast against the nominal before any write.
    const NDArray selected = nominal_.index(key);
    if (broadcast_shapes(value.shape(), selected.shape()) != selected.shape()) {
        throw ShapeMismatch(fmt::format("cannot assign a value of shape {} to a selection of shape {}",
                                        shape_string(value.shape()),
                                        shape_string(selected.shape())));
    }

    nominal_.assign(key, value.nominal_);
    error_.assign(key, value.error_);
}

void Uncertainty::set(const Key& /*key*/, const NDArray& /*value*/) {
    throw TypeMismatch("only an Uncertainty can be assigned into an Uncertainty");
}

// ─── Iteration ────────────────────────────────────────────────────────────────

Uncertainty::Iterator Uncertainty::begin() const {
    if (is_scalar()) {
        throw IndexingUnsupported("iteration over a scalar-backed Uncertainty");
    }
    return Iterator(this, 0);
}

Uncertainty::Iterator Uncertainty::end() const {
    if (is_scalar()) {
        throw IndexingUnsupported("iteration over a scalar-backed Uncertainty");
    }
    return Iterator(this, length());
}

std::vector<Uncertainty> Uncertainty::flat() const {
    std::vector<Uncertainty> out;
    out.reserve(static_cast<std::size_t>(size()));
    for (Index i = 0; i < size(); ++i) {
        out.emplace_back(nominal_.values()(i), error_.values()(i));
    }
    return out;
}

} // namespace aunc
