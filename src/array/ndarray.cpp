/// @file src/array/ndarray.cpp
/// @brief Implementation of NDArray storage, shape manipulation and reductions.

#include "aunc/ndarray.hpp"
#include "aunc/errors.hpp"

#include "array/strides.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <iterator>
#include <numeric>

namespace aunc {

// ─── Shape Helpers ────────────────────────────────────────────────────────────

Index element_count(const Shape& shape) noexcept {
    return std::accumulate(shape.begin(), shape.end(), Index{1},
                           [](Index acc, Index extent) { return acc * extent; });
}

Shape broadcast_shapes(const Shape& a, const Shape& b) {
    const std::size_t rank = std::max(a.size(), b.size());
    Shape out(rank, 1);

    for (std::size_t i = 0; i < rank; ++i) {
        // Align trailing axes; missing leading axes behave as extent 1.
        const Index da = i < a.size() ? a[a.size() - 1 - i] : 1;
        const Index db = i < b.size() ? b[b.size() - 1 - i] : 1;

        if (da == db || db == 1) {
            out[rank - 1 - i] = da;
        } else if (da == 1) {
            out[rank - 1 - i] = db;
        } else {
            throw ShapeMismatch(fmt::format(
                "operands could not be broadcast together with shapes {} {}",
                shape_string(a), shape_string(b)));
        }
    }
    return out;
}

std::string shape_string(const Shape& shape) {
    if (shape.size() == 1) {
        return fmt::format("({},)", shape.front());
    }
    return fmt::format("({})", fmt::join(shape, ", "));
}

namespace detail {

std::vector<Index> broadcast_offsets(const Shape& from, const Shape& to) {
    const std::size_t rt = to.size();
    const std::size_t rf = from.size();
    const Shape       fs = row_major_strides(from);

    // A broadcast axis (extent 1 in `from`, or absent) never advances.
    Shape step(rt, 0);
    for (std::size_t i = 0; i < rt; ++i) {
        if (i + rf >= rt) {
            const std::size_t j = i + rf - rt;
            step[i] = (from[j] == 1) ? 0 : fs[j];
        }
    }
    return gather_offsets(to, step, 0);
}

Shape row_major_strides(const Shape& shape) {
    Shape strides(shape.size(), 1);
    for (std::size_t d = shape.size(); d-- > 1;) {
        strides[d - 1] = strides[d] * shape[d];
    }
    return strides;
}

std::vector<Index> gather_offsets(const Shape& out_shape, const Shape& steps, Index base) {
    const std::size_t rank = out_shape.size();
    const Index       n    = element_count(out_shape);

    std::vector<Index> offsets(static_cast<std::size_t>(std::max<Index>(n, 0)));
    Shape counter(rank, 0);
    Index offset = base;

    for (Index k = 0; k < n; ++k) {
        offsets[static_cast<std::size_t>(k)] = offset;
        // Odometer increment, innermost axis fastest.
        for (std::size_t d = rank; d-- > 0;) {
            ++counter[d];
            offset += steps[d];
            if (counter[d] < out_shape[d]) break;
            offset -= steps[d] * counter[d];
            counter[d] = 0;
        }
    }
    return offsets;
}

Shape resolve_shape(const Shape& requested, Index size) {
    Shape resolved = requested;
    std::optional<std::size_t> inferred;
    Index known = 1;

    for (std::size_t d = 0; d < resolved.size(); ++d) {
        if (resolved[d] == -1) {
            if (inferred) {
                throw ShapeMismatch("can only specify one unknown dimension");
            }
            inferred = d;
        } else if (resolved[d] < 0) {
            throw ShapeMismatch(fmt::format("negative dimension {} in shape", resolved[d]));
        } else {
            known *= resolved[d];
        }
    }

    if (inferred) {
        if (known == 0 || size % known != 0) {
            throw ShapeMismatch(fmt::format("cannot reshape array of size {} into shape {}",
                                            size, shape_string(requested)));
        }
        resolved[*inferred] = size / known;
    }

    if (element_count(resolved) != size) {
        throw ShapeMismatch(fmt::format("cannot reshape array of size {} into shape {}",
                                        size, shape_string(requested)));
    }
    return resolved;
}

} // namespace detail

// ─── Construction ─────────────────────────────────────────────────────────────

NDArray::NDArray() : NDArray(0.0) {}

NDArray::NDArray(double scalar)
    : storage_(std::make_shared<Storage>(Storage{Shape{}, Eigen::ArrayXd::Constant(1, scalar)})) {}

NDArray::NDArray(std::initializer_list<double> values)
    : storage_(std::make_shared<Storage>()) {
    storage_->shape = Shape{static_cast<Index>(values.size())};
    storage_->data.resize(static_cast<Index>(values.size()));
    std::copy(values.begin(), values.end(), storage_->data.data());
}

NDArray::NDArray(Shape shape, Eigen::ArrayXd data)
    : storage_(std::make_shared<Storage>()) {
    for (const Index extent : shape) {
        if (extent < 0) {
            throw ShapeMismatch(fmt::format("negative dimension {} in shape", extent));
        }
    }
    if (element_count(shape) != data.size()) {
        throw ShapeMismatch(fmt::format("buffer of {} elements does not match shape {}",
                                        data.size(), shape_string(shape)));
    }
    storage_->shape = std::move(shape);
    storage_->data  = std::move(data);
}

NDArray NDArray::zeros(Shape shape) {
    return full(std::move(shape), 0.0);
}

NDArray NDArray::full(Shape shape, double value) {
    const Index n = element_count(shape);
    return NDArray(std::move(shape), Eigen::ArrayXd::Constant(n, value));
}

NDArray NDArray::zeros_like(const NDArray& other) {
    return zeros(other.shape());
}

NDArray NDArray::from_vector(const std::vector<double>& values) {
    Eigen::ArrayXd data(static_cast<Index>(values.size()));
    std::copy(values.begin(), values.end(), data.data());
    return NDArray(Shape{data.size()}, std::move(data));
}

NDArray NDArray::concatenate(std::span<const NDArray> parts, Index axis) {
    if (parts.empty()) {
        throw ShapeMismatch("need at least one array to concatenate");
    }
    const Index rank = parts.front().rank();
    if (rank == 0) {
        throw ShapeMismatch("zero-dimensional arrays cannot be concatenated");
    }
    const Index ax = normalize_axis(axis, rank);

    Shape out = parts.front().shape();
    out[static_cast<std::size_t>(ax)] = 0;
    for (const auto& p : parts) {
        if (p.rank() != rank) {
            throw ShapeMismatch("all input arrays must have the same number of dimensions");
        }
        for (Index d = 0; d < rank; ++d) {
            if (d != ax && p.shape()[static_cast<std::size_t>(d)] != out[static_cast<std::size_t>(d)]) {
                throw ShapeMismatch(fmt::format(
                    "concatenation extents differ along axis {}: {} vs {}",
                    d, shape_string(p.shape()), shape_string(parts.front().shape())));
            }
        }
        out[static_cast<std::size_t>(ax)] += p.shape()[static_cast<std::size_t>(ax)];
    }

    // View every part as (outer, extent_along_axis * inner) row-major blocks.
    const Index outer = std::accumulate(out.begin(), out.begin() + ax, Index{1}, std::multiplies<>());
    const Index inner = std::accumulate(out.begin() + ax + 1, out.end(), Index{1}, std::multiplies<>());

    Eigen::ArrayXd data(element_count(out));
    Index cursor = 0;
    for (Index o = 0; o < outer; ++o) {
        for (const auto& p : parts) {
            const Index block = p.shape()[static_cast<std::size_t>(ax)] * inner;
            data.segment(cursor, block) = p.values().segment(o * block, block);
            cursor += block;
        }
    }
    return NDArray(std::move(out), std::move(data));
}

// ─── Introspection ────────────────────────────────────────────────────────────

const Shape& NDArray::shape() const noexcept { return storage_->shape; }

Index NDArray::rank() const noexcept { return static_cast<Index>(storage_->shape.size()); }

Index NDArray::size() const noexcept { return storage_->data.size(); }

bool NDArray::is_scalar() const noexcept { return storage_->shape.empty(); }

Index NDArray::length() const {
    if (is_scalar()) {
        throw IndexingUnsupported("len() of unsized object");
    }
    return storage_->shape.front();
}

const Eigen::ArrayXd& NDArray::values() const noexcept { return storage_->data; }

Eigen::ArrayXd& NDArray::values() noexcept { return storage_->data; }

double NDArray::at(Index flat) const {
    if (flat < 0 || flat >= size()) {
        throw IndexingUnsupported(fmt::format("flat index {} is out of bounds for size {}",
                                              flat, size()));
    }
    return storage_->data(flat);
}

double NDArray::item() const {
    if (size() != 1) {
        throw ConversionUnsupported(fmt::format(
            "only size-1 arrays can be converted to scalars (size is {})", size()));
    }
    return storage_->data(0);
}

std::vector<double> NDArray::to_vector() const {
    return std::vector<double>(values().data(), values().data() + size());
}

// ─── Storage ──────────────────────────────────────────────────────────────────

NDArray NDArray::copy() const {
    return NDArray(shape(), values());
}

bool NDArray::shares_storage_with(const NDArray& other) const noexcept {
    return storage_ == other.storage_;
}

void NDArray::assign(const NDArray& source) {
    const NDArray expanded = source.broadcast_to(shape());
    storage_->data = expanded.values();
}

// ─── Shape Manipulation ───────────────────────────────────────────────────────

Index NDArray::normalize_axis(Index axis, Index rank) {
    const Index ax = axis < 0 ? axis + rank : axis;
    if (ax < 0 || ax >= rank) {
        throw IndexingUnsupported(fmt::format(
            "axis {} is out of bounds for array of dimension {}", axis, rank));
    }
    return ax;
}

void NDArray::set_shape(Shape shape) {
    storage_->shape = detail::resolve_shape(shape, size());
}

NDArray NDArray::reshape(Shape shape) const {
    NDArray out = copy();
    out.set_shape(std::move(shape));
    return out;
}

NDArray NDArray::ravel() const {
    return reshape(Shape{size()});
}

NDArray NDArray::transpose() const {
    Shape axes(shape().size());
    std::iota(axes.rbegin(), axes.rend(), Index{0});
    return transpose(axes);
}

NDArray NDArray::transpose(const Shape& axes) const {
    const std::size_t r = shape().size();
    if (axes.size() != r) {
        throw ShapeMismatch("axes don't match array");
    }

    std::vector<bool> seen(r, false);
    for (const Index a : axes) {
        if (a < 0 || static_cast<std::size_t>(a) >= r || seen[static_cast<std::size_t>(a)]) {
            throw ShapeMismatch("axes must be a permutation of the array dimensions");
        }
        seen[static_cast<std::size_t>(a)] = true;
    }

    const Shape src = detail::row_major_strides(shape());
    Shape out_shape(r);
    Shape steps(r);
    for (std::size_t k = 0; k < r; ++k) {
        out_shape[k] = shape()[static_cast<std::size_t>(axes[k])];
        steps[k]     = src[static_cast<std::size_t>(axes[k])];
    }

    const auto offsets = detail::gather_offsets(out_shape, steps, 0);
    Eigen::ArrayXd data(static_cast<Index>(offsets.size()));
    for (std::size_t k = 0; k < offsets.size(); ++k) {
        data(static_cast<Index>(k)) = values()(offsets[k]);
    }
    return NDArray(std::move(out_shape), std::move(data));
}

NDArray NDArray::squeeze() const {
    Shape out;
    std::copy_if(shape().begin(), shape().end(), std::back_inserter(out),
                 [](Index extent) { return extent != 1; });
    return NDArray(std::move(out), values());
}

NDArray NDArray::expand_dims(Index axis) const {
    const Index ax = normalize_axis(axis, rank() + 1);
    Shape out = shape();
    out.insert(out.begin() + ax, 1);
    return NDArray(std::move(out), values());
}

NDArray NDArray::flip(std::optional<Index> axis) const {
    const std::optional<Index> only =
        axis ? std::optional<Index>(normalize_axis(*axis, rank())) : std::nullopt;

    const Shape src = detail::row_major_strides(shape());
    Shape steps = src;
    Index base  = 0;

    for (Index d = 0; d < rank(); ++d) {
        const auto ud = static_cast<std::size_t>(d);
        if (!only || *only == d) {
            // Walk the axis backwards from its last element.
            if (shape()[ud] > 0) base += (shape()[ud] - 1) * src[ud];
            steps[ud] = -src[ud];
        }
    }

    const auto offsets = detail::gather_offsets(shape(), steps, base);
    Eigen::ArrayXd data(static_cast<Index>(offsets.size()));
    for (std::size_t k = 0; k < offsets.size(); ++k) {
        data(static_cast<Index>(k)) = values()(offsets[k]);
    }
    return NDArray(shape(), std::move(data));
}

NDArray NDArray::broadcast_to(const Shape& target) const {
    if (broadcast_shapes(shape(), target) != target) {
        throw ShapeMismatch(fmt::format("cannot broadcast array of shape {} to shape {}",
                                        shape_string(shape()), shape_string(target)));
    }
    if (shape() == target) {
        return copy();
    }
    const auto offsets = detail::broadcast_offsets(shape(), target);
    Eigen::ArrayXd data(static_cast<Index>(offsets.size()));
    for (std::size_t k = 0; k < offsets.size(); ++k) {
        data(static_cast<Index>(k)) = values()(offsets[k]);
    }
    return NDArray(target, std::move(data));
}

// ─── Elementwise ──────────────────────────────────────────────────────────────

void NDArray::fill(double value) {
    storage_->data.setConstant(value);
}

NDArray NDArray::clip(std::optional<double> lo, std::optional<double> hi) const {
    return map([lo, hi](double x) {
        if (lo && x < *lo) x = *lo;
        if (hi && x > *hi) x = *hi;
        return x;
    });
}

Index NDArray::searchsorted(double v, Side side) const {
    if (rank() > 1) {
        throw ShapeMismatch("searchsorted requires a one-dimensional array");
    }
    const double* first = values().data();
    const double* last  = first + size();
    const double* pos   = side == Side::left ? std::lower_bound(first, last, v)
                                             : std::upper_bound(first, last, v);
    return static_cast<Index>(pos - first);
}

// ─── Reductions ───────────────────────────────────────────────────────────────

Index NDArray::reduced_count(std::optional<Index> axis) const {
    if (!axis) return size();
    return shape()[static_cast<std::size_t>(normalize_axis(*axis, rank()))];
}

NDArray NDArray::sum(std::optional<Index> axis) const {
    if (!axis) {
        return NDArray(values().sum());
    }

    const Index ax    = normalize_axis(*axis, rank());
    const Index n_ax  = shape()[static_cast<std::size_t>(ax)];
    const Index outer = std::accumulate(shape().begin(), shape().begin() + ax, Index{1}, std::multiplies<>());
    const Index inner = std::accumulate(shape().begin() + ax + 1, shape().end(), Index{1}, std::multiplies<>());

    Shape out = shape();
    out.erase(out.begin() + ax);

    Eigen::ArrayXd data = Eigen::ArrayXd::Zero(outer * inner);
    for (Index o = 0; o < outer; ++o) {
        for (Index a = 0; a < n_ax; ++a) {
            data.segment(o * inner, inner) += values().segment((o * n_ax + a) * inner, inner);
        }
    }
    return NDArray(std::move(out), std::move(data));
}

NDArray NDArray::mean(std::optional<Index> axis) const {
    const auto n = static_cast<double>(reduced_count(axis));
    return sum(axis).map([n](double s) { return s / n; });
}

namespace {

void require_elements(const NDArray& a, const char* what) {
    if (a.size() == 0) {
        throw ShapeMismatch(fmt::format("zero-size array to reduction operation {}", what));
    }
}

} // namespace

double NDArray::min() const {
    require_elements(*this, "minimum");
    return values().minCoeff();
}

double NDArray::max() const {
    require_elements(*this, "maximum");
    return values().maxCoeff();
}

double NDArray::prod() const {
    return values().prod();
}

Index NDArray::argmin() const {
    require_elements(*this, "argmin");
    Index pos = 0;
    values().minCoeff(&pos);
    return pos;
}

Index NDArray::argmax() const {
    require_elements(*this, "argmax");
    Index pos = 0;
    values().maxCoeff(&pos);
    return pos;
}

NDArray NDArray::cumsum() const {
    Eigen::ArrayXd data(size());
    std::partial_sum(values().data(), values().data() + size(), data.data());
    return NDArray(Shape{size()}, std::move(data));
}

// ─── Elementwise Operators ────────────────────────────────────────────────────

NDArray operator+(const NDArray& a, const NDArray& b) {
    return NDArray::zip(a, b, [](double x, double y) { return x + y; });
}

NDArray operator-(const NDArray& a, const NDArray& b) {
    return NDArray::zip(a, b, [](double x, double y) { return x - y; });
}

NDArray operator*(const NDArray& a, const NDArray& b) {
    return NDArray::zip(a, b, [](double x, double y) { return x * y; });
}

NDArray operator/(const NDArray& a, const NDArray& b) {
    return NDArray::zip(a, b, [](double x, double y) { return x / y; });
}

NDArray operator-(const NDArray& a) {
    return a.map([](double x) { return -x; });
}

bool array_equal(const NDArray& a, const NDArray& b) {
    return a.shape() == b.shape() && (a.values() == b.values()).all();
}

bool allclose(const NDArray& a, const NDArray& b, double tol) {
    return a.shape() == b.shape() && ((a.values() - b.values()).abs() <= tol).all();
}

// ─── Mask ─────────────────────────────────────────────────────────────────────

Mask::Mask(Shape shape, Bits bits) : shape_(std::move(shape)), bits_(std::move(bits)) {
    if (element_count(shape_) != bits_.size()) {
        throw ShapeMismatch(fmt::format("mask of {} elements does not match shape {}",
                                        bits_.size(), shape_string(shape_)));
    }
}

bool Mask::operator[](Index flat) const {
    if (flat < 0 || flat >= size()) {
        throw IndexingUnsupported(fmt::format("flat index {} is out of bounds for size {}",
                                              flat, size()));
    }
    return bits_(flat);
}

Mask Mask::operator!() const {
    return Mask(shape_, bits_.unaryExpr([](bool b) { return !b; }).eval());
}

Mask::operator bool() const {
    if (size() != 1) {
        throw ConversionUnsupported(
            "the truth value of an array with more than one element is ambiguous; "
            "use all() or any()");
    }
    return bits_(0);
}

} // namespace aunc
